/**
 * main.cpp - hermes CLI entry point
 *
 * Usage:
 *   hermes gen list all files                 # Natural language -> command (exit 0 or 10)
 *   hermes explain "find . -name '*.go'"      # Explain command
 *   hermes check "rm -rf /"                   # Local safety verdict only
 *   hermes init zsh                           # Shell integration script
 *   hermes --auth                             # Store API key securely
 */

#include "hermes/AIClient.hpp"
#include "hermes/Commands.hpp"
#include "hermes/Config.hpp"
#include "hermes/Console.hpp"
#include "hermes/ExitCodes.hpp"
#include "hermes/GeminiClient.hpp"
#include "hermes/Keyring.hpp"
#include "hermes/PatternClassifier.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <termios.h>
#include <unistd.h>
#include <vector>

#ifndef HERMES_VERSION
#define HERMES_VERSION "0.0.0"
#endif

namespace {

using hermes::BOLD;
using hermes::RESET;
using hermes::paint;

// Values given on the command line; they override every other source
struct CliOptions {
    std::optional<std::string> api_key;
    std::optional<std::string> model;
    std::optional<std::string> mock_response;
    std::optional<int> mock_exit_code;
    bool debug = false;
    bool explain_generation = false;
};

void printUsage() {
    std::cout << paint(std::cout, BOLD, "hermes") << " - translate natural language to shell commands\n\n"
              << paint(std::cout, BOLD, "Usage:") << "\n"
              << "  hermes gen|generate <query...>       Generate a shell command\n"
              << "  hermes exp|explain <command...>      Explain what a command does\n"
              << "  hermes check <command...>            Classify a command without the model\n"
              << "  hermes init <zsh|bash|fish>          Print shell integration script\n"
              << "  hermes --auth                        Store API key securely\n"
              << "  hermes --version                     Show version\n"
              << "  hermes --help                        Show this help\n\n"
              << paint(std::cout, BOLD, "Flags:") << "\n"
              << "  --gemini-api-key <key>   Gemini API key\n"
              << "  --model <name>           Gemini model (default " << hermes::GeminiClient::getDefaultModel() << ")\n"
              << "  --debug                  Log safety reason and source to stderr\n"
              << "  --explain-generation     Print the model's reasoning after generation\n"
              << "  --mock-response <text>   Use the offline mock provider\n"
              << "  --mock-exit-code <n>     Force the safety verdict (0 safe, 10 attention)\n"
              << "  --                       End of flags\n\n"
              << paint(std::cout, BOLD, "Exit codes:") << "\n"
              << "  0 safe, 1 error, 2 config error, 3 AI error, 4 usage error, 10 requires attention\n\n"
              << paint(std::cout, BOLD, "Configuration:") << "\n"
              << "  GEMINI_API_KEY, hermes --auth (keyring) or ~/.config/hermes/config.json\n";
}

bool parseInt(const std::string& text, int& value) {
    try {
        size_t pos = 0;
        value = std::stoi(text, &pos);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

// Consumes a known hermes flag at argv[idx]; returns false if it is not one.
// On a malformed value, sets error.
bool parseFlag(int argc, char* argv[], int& idx, CliOptions& opts, std::string& error) {
    std::string arg = argv[idx];

    auto needValue = [&](std::string& out) {
        if (idx + 1 >= argc) {
            error = arg + " requires a value";
            return false;
        }
        out = argv[++idx];
        return true;
    };

    std::string value;
    if (arg == "--debug") {
        opts.debug = true;
    } else if (arg == "--explain-generation") {
        opts.explain_generation = true;
    } else if (arg == "--gemini-api-key") {
        if (needValue(value)) opts.api_key = value;
    } else if (arg == "--model") {
        if (needValue(value)) opts.model = value;
    } else if (arg == "--mock-response") {
        if (needValue(value)) opts.mock_response = value;
    } else if (arg == "--mock-exit-code") {
        if (needValue(value)) {
            int code = 0;
            if (!parseInt(value, code)) {
                error = "--mock-exit-code expects an integer, got '" + value + "'";
            } else {
                opts.mock_exit_code = code;
            }
        }
    } else {
        return false;
    }

    if (!error.empty()) {
        return false;
    }
    ++idx;
    return true;
}

void applyCliOptions(const CliOptions& opts, hermes::Config& config) {
    if (opts.api_key) config.gemini_api_key = *opts.api_key;
    if (opts.model) config.model = *opts.model;
    if (opts.mock_response) config.mock_response = *opts.mock_response;
    if (opts.mock_exit_code) config.mock_exit_code = *opts.mock_exit_code;
    if (opts.debug) config.debug = true;
    if (opts.explain_generation) config.explain_generation = true;
}

std::string joinArgs(const std::vector<std::string>& words) {
    std::string joined;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) joined += " ";
        joined += words[i];
    }
    return joined;
}

int runAuth(const hermes::Config& config) {
    // Prompt for API key without echoing (like password input)
    std::cout << "Paste your API key (hidden input): ";
    std::cout.flush();

    struct termios old_term, new_term;
    bool is_tty = tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (is_tty) {
        new_term = old_term;
        new_term.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    std::string new_key;
    std::getline(std::cin, new_key);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    }
    std::cout << "\n";

    if (new_key.empty()) {
        hermes::printError(std::cerr, "empty API key.");
        return hermes::EXIT_CONFIG;
    }

    std::cout << "Validating API key...\n";
    hermes::GeminiClient test_client(new_key, config.model, config.debug);
    std::string error_msg;
    if (!test_client.validate(error_msg)) {
        hermes::printError(std::cerr, "invalid API key - " + error_msg);
        return hermes::EXIT_API;
    }

    std::string store_error;
    if (!hermes::storeInKeyring(hermes::KEYRING_API_KEY, new_key, "hermes Gemini API Key", store_error)) {
        hermes::printError(std::cerr, "saving to keyring failed: " + store_error);
        return hermes::EXIT_CONFIG;
    }

    std::cout << paint(std::cout, hermes::GREEN, "API key validated and saved!") << "\n";
    return hermes::EXIT_SUCCESS_CODE;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const char* no_color = std::getenv("NO_COLOR");
    const bool color_allowed = no_color == nullptr || *no_color == '\0';
    hermes::setColorEnabled(std::cout, color_allowed && isatty(STDOUT_FILENO));
    hermes::setColorEnabled(std::cerr, color_allowed && isatty(STDERR_FILENO));

    if (argc < 2) {
        printUsage();
        return hermes::EXIT_SUCCESS_CODE;
    }

    CliOptions opts;
    std::string subcommand;
    bool auth_mode = false;
    int idx = 1;

    // Global flags may precede the subcommand
    while (idx < argc) {
        std::string arg = argv[idx];
        std::string error;

        if (arg == "--help" || arg == "-h") {
            printUsage();
            return hermes::EXIT_SUCCESS_CODE;
        }
        if (arg == "--version" || arg == "-v") {
            std::cout << HERMES_VERSION << "\n";
            return hermes::EXIT_SUCCESS_CODE;
        }
        if (arg == "--auth") {
            auth_mode = true;
            ++idx;
            continue;
        }
        if (parseFlag(argc, argv, idx, opts, error)) {
            continue;
        }
        if (!error.empty()) {
            hermes::printError(std::cerr, error);
            return hermes::EXIT_USAGE;
        }
        if (arg.rfind("-", 0) == 0) {
            hermes::printError(std::cerr, "unknown flag '" + arg + "'");
            std::cerr << "Run 'hermes --help' for usage.\n";
            return hermes::EXIT_USAGE;
        }

        subcommand = arg;
        ++idx;
        break;
    }

    if (auth_mode && !subcommand.empty()) {
        hermes::printError(std::cerr, "--auth must be used alone.");
        return hermes::EXIT_USAGE;
    }

    const bool is_generate = subcommand == "gen" || subcommand == "generate";
    const bool is_explain = subcommand == "exp" || subcommand == "explain";
    const bool is_check = subcommand == "check";
    const bool is_init = subcommand == "init";

    if (!auth_mode && !is_generate && !is_explain && !is_check && !is_init) {
        if (subcommand.empty()) {
            printUsage();
            return hermes::EXIT_SUCCESS_CODE;
        }
        hermes::printError(std::cerr, "unknown command '" + subcommand + "'");
        std::cerr << "Run 'hermes --help' for usage.\n";
        return hermes::EXIT_USAGE;
    }

    // After the subcommand: hermes flags until the first word or "--".
    // Explained and checked commands keep their own flags (hermes exp ls -la).
    std::vector<std::string> words;
    while (idx < argc) {
        std::string arg = argv[idx];
        std::string error;
        if (arg == "--") {
            ++idx;
            break;
        }
        if (parseFlag(argc, argv, idx, opts, error)) {
            continue;
        }
        if (!error.empty()) {
            hermes::printError(std::cerr, error);
            return hermes::EXIT_USAGE;
        }
        if (is_generate && arg.rfind("--", 0) == 0) {
            hermes::printError(std::cerr, "unknown flag '" + arg + "'");
            return hermes::EXIT_USAGE;
        }
        break;
    }
    for (; idx < argc; ++idx) {
        words.push_back(argv[idx]);
    }

    // defaults -> config file -> keyring -> environment -> flags
    hermes::Config config;
    auto loaded = hermes::loadConfigFile(hermes::defaultConfigPath(), config);
    if (!loaded.success) {
        hermes::printError(std::cerr, loaded.error);
        return hermes::EXIT_CONFIG;
    }

    const bool needs_model = is_generate || is_explain;
    const char* env_key = std::getenv("GEMINI_API_KEY");
    const bool key_overridden = opts.api_key || (env_key != nullptr && *env_key != '\0');
    const bool mocked = opts.mock_response ? !opts.mock_response->empty()
                                           : !config.mock_response.empty();
    if (needs_model && !key_overridden && !mocked) {
        hermes::applyKeyring(config, hermes::getFromKeyring);
    }

    hermes::applyEnvironment(config);
    applyCliOptions(opts, config);

    if (auth_mode) {
        return runAuth(config);
    }

    hermes::PatternClassifier classifier(hermes::defaultRuleTable());
    hermes::CommandContext ctx{config, classifier, std::cout, std::cerr};

    if (is_init) {
        if (words.size() != 1) {
            hermes::printError(std::cerr, "usage: hermes init <zsh|bash|fish>");
            return hermes::EXIT_USAGE;
        }
        return hermes::runInit(ctx, words[0]);
    }

    if (words.empty()) {
        hermes::printError(std::cerr, "no " + std::string(is_generate ? "query" : "command") + " provided.");
        return hermes::EXIT_USAGE;
    }

    std::string text = joinArgs(words);

    if (is_check) {
        return hermes::runCheck(ctx, text);
    }

    auto made = hermes::makeAIClient(config);
    if (!made.client) {
        hermes::printError(std::cerr, made.error);
        return hermes::EXIT_CONFIG;
    }

    if (is_generate) {
        return hermes::runGenerate(ctx, *made.client, text);
    }
    return hermes::runExplain(ctx, *made.client, text);
}
