/**
 * AIClient.cpp - Provider selection
 */

#include "hermes/AIClient.hpp"
#include "hermes/GeminiClient.hpp"
#include "hermes/MockClient.hpp"

namespace hermes {

ClientResult makeAIClient(const Config& config) {
    ClientResult result;

    if (!config.mock_response.empty()) {
        result.client = std::make_unique<MockClient>(config.mock_response, config.debug);
        return result;
    }

    if (config.gemini_api_key.empty()) {
        result.error = "Gemini API key is required. Set it via (in priority order):\n"
                       "  - CLI flag: --gemini-api-key\n"
                       "  - Environment variable: GEMINI_API_KEY\n"
                       "  - Keyring: hermes --auth\n"
                       "  - Config file: ~/.config/hermes/config.json";
        return result;
    }

    result.client = std::make_unique<GeminiClient>(config.gemini_api_key, config.model, config.debug);
    return result;
}

} // namespace hermes
