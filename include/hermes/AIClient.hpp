/**
 * AIClient.hpp - Provider-neutral interface for command generation and explanation
 */

#pragma once

#include "hermes/Config.hpp"
#include "hermes/Safety.hpp"

#include <memory>
#include <optional>
#include <string>

namespace hermes {

enum class AIErrorKind {
    None,
    Config,   // missing API key, bad provider setup
    Network,
    Api,      // non-200 from the provider
    Parse,    // response did not match the expected schema
    Empty     // provider answered but produced nothing usable
};

struct GenerateRequest {
    std::string query;
};

struct GenerateResponse {
    bool success = false;
    std::string error;
    AIErrorKind error_kind = AIErrorKind::None;
    std::string command;
    std::optional<SafetyLevel> safety; // absent = model gave no opinion
    std::string reasoning;
};

struct ExplainRequest {
    std::string command;
};

struct ExplainResponse {
    bool success = false;
    std::string error;
    AIErrorKind error_kind = AIErrorKind::None;
    std::string explanation;
};

class AIClient {
public:
    virtual ~AIClient() = default;

    virtual GenerateResponse generateCommand(const GenerateRequest& request) = 0;
    virtual ExplainResponse explainCommand(const ExplainRequest& request) = 0;
    virtual std::string name() const = 0;
};

struct ClientResult {
    std::unique_ptr<AIClient> client;
    std::string error; // set when client is null
};

// Mock provider when mock_response is set, Gemini otherwise.
// Without an API key and without a mock response no client is created.
ClientResult makeAIClient(const Config& config);

} // namespace hermes
