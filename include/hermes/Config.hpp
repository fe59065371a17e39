/**
 * Config.hpp - Runtime configuration for hermes
 *
 * Sources are layered by the caller, lowest priority first:
 *   defaults -> config file -> keyring -> environment -> CLI flags
 */

#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace hermes {

struct Config {
    std::string gemini_api_key;
    std::string model;          // empty = GeminiClient default
    bool debug = false;
    std::string mock_response;  // non-empty selects the mock AI provider
    int mock_exit_code = 0;     // non-zero bypasses classification
    bool explain_generation = false;
};

struct ConfigResult {
    bool success;
    std::string error;
};

// $XDG_CONFIG_HOME/hermes/config.json, else ~/.config/hermes/config.json.
// Empty when neither variable is set.
std::filesystem::path defaultConfigPath();

// A missing file is not an error; a malformed one is.
ConfigResult loadConfigFile(const std::filesystem::path& path, Config& config);

// Keyring entry written by `hermes --auth`
const char* const KEYRING_API_KEY = "api_key";

// Reads the stored API key through `lookup` (getFromKeyring in the CLI).
// An empty answer leaves the config untouched.
void applyKeyring(Config& config, const std::function<std::string(const std::string&)>& lookup);

// GEMINI_API_KEY, HERMES_MODEL, HERMES_DEBUG
void applyEnvironment(Config& config);

// "...abcd" for logs
std::string maskApiKey(const std::string& key);

} // namespace hermes
