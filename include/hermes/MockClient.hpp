/**
 * MockClient.hpp - Offline AI provider with canned answers
 */

#pragma once

#include "hermes/AIClient.hpp"

#include <map>
#include <string>

namespace hermes {

class MockClient : public AIClient {
public:
    // static_response, when non-empty, answers every generate and explain call
    explicit MockClient(const std::string& static_response = "", bool debug = false);

    GenerateResponse generateCommand(const GenerateRequest& request) override;
    ExplainResponse explainCommand(const ExplainRequest& request) override;
    std::string name() const override { return "mock"; }

    // Crude substring heuristic standing in for the model's own opinion
    static bool containsDangerousPatterns(const std::string& command);

private:
    std::string static_response_;
    bool debug_;
    std::map<std::string, std::string> responses_;    // query -> command
    std::map<std::string, std::string> explanations_; // command -> explanation
};

} // namespace hermes
