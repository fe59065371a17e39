/**
 * Config.cpp - Runtime configuration for hermes
 */

#include "hermes/Config.hpp"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hermes {

namespace {

std::string getEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) return "";
    return value;
}

bool isTruthy(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // anonymous namespace

std::filesystem::path defaultConfigPath() {
    std::string xdg = getEnv("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return std::filesystem::path(xdg) / "hermes" / "config.json";
    }

    std::string home = getEnv("HOME");
    if (!home.empty()) {
        return std::filesystem::path(home) / ".config" / "hermes" / "config.json";
    }

    return {};
}

ConfigResult loadConfigFile(const std::filesystem::path& path, Config& config) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return {true, ""};
    }

    std::ifstream file(path);
    if (!file.good()) {
        return {false, "cannot read config file " + path.string()};
    }

    try {
        json doc = json::parse(file);
        if (!doc.is_object()) {
            return {false, "config file " + path.string() + " must contain a JSON object"};
        }

        if (doc.contains("gemini_api_key")) {
            config.gemini_api_key = doc["gemini_api_key"].get<std::string>();
        }
        if (doc.contains("model")) {
            config.model = doc["model"].get<std::string>();
        }
        if (doc.contains("debug")) {
            config.debug = doc["debug"].get<bool>();
        }
        if (doc.contains("mock_response")) {
            config.mock_response = doc["mock_response"].get<std::string>();
        }
        if (doc.contains("mock_exit_code")) {
            config.mock_exit_code = doc["mock_exit_code"].get<int>();
        }
    } catch (const json::exception& e) {
        return {false, "invalid config file " + path.string() + ": " + e.what()};
    }

    return {true, ""};
}

void applyKeyring(Config& config, const std::function<std::string(const std::string&)>& lookup) {
    std::string key = lookup(KEYRING_API_KEY);
    if (!key.empty()) {
        config.gemini_api_key = key;
    }
}

void applyEnvironment(Config& config) {
    std::string key = getEnv("GEMINI_API_KEY");
    if (!key.empty()) {
        config.gemini_api_key = key;
    }

    std::string model = getEnv("HERMES_MODEL");
    if (!model.empty()) {
        config.model = model;
    }

    std::string debug = getEnv("HERMES_DEBUG");
    if (!debug.empty()) {
        config.debug = isTruthy(debug);
    }
}

std::string maskApiKey(const std::string& key) {
    if (key.empty()) return "(none)";
    if (key.size() <= 4) return "(too short to truncate)";
    return "..." + key.substr(key.size() - 4);
}

} // namespace hermes
