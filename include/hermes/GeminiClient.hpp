/**
 * GeminiClient.hpp - HTTP client for Gemini API
 */

#pragma once

#include "hermes/AIClient.hpp"

#include <memory>
#include <string>

namespace hermes {

class GeminiClient : public AIClient {
public:
    GeminiClient(const std::string& api_key, const std::string& model = "", bool debug = false);
    ~GeminiClient() override;

    GenerateResponse generateCommand(const GenerateRequest& request) override;
    ExplainResponse explainCommand(const ExplainRequest& request) override;
    std::string name() const override { return "gemini"; }

    // Validate API key and model by making a test request
    bool validate(std::string& error_message);

    static std::string getDefaultModel();
    static std::string buildGeneratePrompt(const std::string& query);
    static std::string buildExplainPrompt(const std::string& command);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hermes
