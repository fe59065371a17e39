/**
 * test_commands.cpp - Tests for the hermes subcommands end to end
 *
 * Uses a scripted AIClient so no network access is needed.
 */

#include "hermes/Commands.hpp"
#include "hermes/Console.hpp"
#include "hermes/ExitCodes.hpp"
#include "hermes/MockClient.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <sstream>

using hermes::SafetyLevel;

namespace {

class ScriptedClient : public hermes::AIClient {
public:
    hermes::GenerateResponse generate_reply;
    hermes::ExplainResponse explain_reply;
    int calls = 0;

    hermes::GenerateResponse generateCommand(const hermes::GenerateRequest&) override {
        ++calls;
        return generate_reply;
    }

    hermes::ExplainResponse explainCommand(const hermes::ExplainRequest&) override {
        ++calls;
        return explain_reply;
    }

    std::string name() const override { return "scripted"; }
};

hermes::GenerateResponse generated(const std::string& command,
                                   std::optional<SafetyLevel> safety = std::nullopt) {
    hermes::GenerateResponse response;
    response.success = true;
    response.command = command;
    response.safety = safety;
    return response;
}

struct Harness {
    hermes::Config config;
    hermes::PatternClassifier classifier;
    std::ostringstream out;
    std::ostringstream err;

    hermes::CommandContext context() {
        return hermes::CommandContext{config, classifier, out, err};
    }
};

} // anonymous namespace

void test_generate_safe_command() {
    Harness h;
    ScriptedClient client;
    client.generate_reply = generated("ls -la", SafetyLevel::Safe);

    auto ctx = h.context();
    int code = hermes::runGenerate(ctx, client, "list files");

    assert(code == hermes::EXIT_SUCCESS_CODE);
    assert(h.out.str() == "ls -la\n");
    assert(h.err.str().find("Generating command for: 'list files'") != std::string::npos);
    assert(client.calls == 1);

    std::cout << "[PASS] test_generate_safe_command\n";
}

void test_generate_attention_from_pattern() {
    Harness h;
    h.config.mock_response = "rm -rf /";
    hermes::MockClient client(h.config.mock_response);

    auto ctx = h.context();
    int code = hermes::runGenerate(ctx, client, "clean up");

    assert(code == hermes::EXIT_ATTENTION);
    assert(h.out.str() == "rm -rf /\n");

    std::cout << "[PASS] test_generate_attention_from_pattern\n";
}

void test_generate_pattern_wins_over_safe_model() {
    Harness h;
    h.config.debug = true;
    ScriptedClient client;
    client.generate_reply = generated("sudo ls", SafetyLevel::Safe);

    auto ctx = h.context();
    int code = hermes::runGenerate(ctx, client, "list as root");

    assert(code == hermes::EXIT_ATTENTION);
    assert(h.err.str().find("[DEBUG] safety source: attention-pattern") != std::string::npos);
    assert(h.err.str().find("[DEBUG] safety reason: privilege escalation") != std::string::npos);

    std::cout << "[PASS] test_generate_pattern_wins_over_safe_model\n";
}

void test_generate_model_raises_safe_pattern() {
    Harness h;
    h.config.debug = true;
    ScriptedClient client;
    client.generate_reply = generated("ls -la /secret", SafetyLevel::Attention);

    auto ctx = h.context();
    int code = hermes::runGenerate(ctx, client, "peek");

    assert(code == hermes::EXIT_ATTENTION);
    assert(h.out.str() == "ls -la /secret\n");
    assert(h.err.str().find("[DEBUG] model opinion: attention") != std::string::npos);
    assert(h.err.str().find("[DEBUG] safety source: ai-assessment") != std::string::npos);

    std::cout << "[PASS] test_generate_model_raises_safe_pattern\n";
}

void test_generate_without_model_opinion() {
    Harness h;
    h.config.debug = true;
    ScriptedClient client;
    client.generate_reply = generated("make build");

    auto ctx = h.context();
    int code = hermes::runGenerate(ctx, client, "build it");

    assert(code == hermes::EXIT_SUCCESS_CODE);
    assert(h.err.str().find("[DEBUG] model opinion: (none)") != std::string::npos);
    assert(h.err.str().find("[DEBUG] safety source: default-fallback") != std::string::npos);

    std::cout << "[PASS] test_generate_without_model_opinion\n";
}

void test_generate_failure() {
    Harness h;
    ScriptedClient client;
    client.generate_reply.success = false;
    client.generate_reply.error = "gemini network error: timeout";
    client.generate_reply.error_kind = hermes::AIErrorKind::Network;

    auto ctx = h.context();
    int code = hermes::runGenerate(ctx, client, "anything");

    assert(code == hermes::EXIT_API);
    assert(h.out.str().empty());
    assert(h.err.str().find("gemini network error: timeout") != std::string::npos);

    std::cout << "[PASS] test_generate_failure\n";
}

void test_generate_empty_command() {
    Harness h;
    ScriptedClient client;
    client.generate_reply = generated("");

    auto ctx = h.context();
    int code = hermes::runGenerate(ctx, client, "nothing");

    assert(code == hermes::EXIT_API);
    assert(h.out.str().empty());

    std::cout << "[PASS] test_generate_empty_command\n";
}

void test_generate_forced_exit_code() {
    {
        Harness h;
        h.config.mock_exit_code = 10;
        ScriptedClient client;
        client.generate_reply = generated("ls", SafetyLevel::Safe);

        auto ctx = h.context();
        assert(hermes::runGenerate(ctx, client, "list") == hermes::EXIT_ATTENTION);
    }
    {
        Harness h;
        h.config.mock_exit_code = 5;
        h.config.debug = true;
        ScriptedClient client;
        client.generate_reply = generated("rm -rf /", SafetyLevel::Attention);

        auto ctx = h.context();
        assert(hermes::runGenerate(ctx, client, "wipe") == hermes::EXIT_SUCCESS_CODE);
        assert(h.err.str().find("[DEBUG] safety source: mock") != std::string::npos);
        assert(h.err.str().find("forced: default safe") != std::string::npos);
    }

    std::cout << "[PASS] test_generate_forced_exit_code\n";
}

void test_generate_explain_generation() {
    Harness h;
    h.config.explain_generation = true;
    ScriptedClient client;
    client.generate_reply = generated("df -h", SafetyLevel::Safe);
    client.generate_reply.reasoning = "df reports disk usage";

    auto ctx = h.context();
    hermes::runGenerate(ctx, client, "disk usage");

    assert(h.out.str() == "df -h\n");
    assert(h.err.str().find("df reports disk usage") != std::string::npos);

    std::cout << "[PASS] test_generate_explain_generation\n";
}

void test_check_command() {
    Harness h;
    auto ctx = h.context();

    assert(hermes::runCheck(ctx, "sudo reboot") == hermes::EXIT_ATTENTION);
    assert(h.out.str() == "attention: privilege escalation (attention-pattern)\n");

    h.out.str("");
    assert(hermes::runCheck(ctx, "git status") == hermes::EXIT_SUCCESS_CODE);
    assert(h.out.str() == "safe: read-only version control (safe-pattern)\n");

    h.out.str("");
    assert(hermes::runCheck(ctx, "terraform plan") == hermes::EXIT_SUCCESS_CODE);
    assert(h.out.str() == "safe: no rule matched (default-fallback)\n");

    std::cout << "[PASS] test_check_command\n";
}

void test_explain_command() {
    Harness h;
    ScriptedClient client;
    client.explain_reply.success = true;
    client.explain_reply.explanation = "• rm: remove files\n";

    auto ctx = h.context();
    int code = hermes::runExplain(ctx, client, "rm -rf /");

    assert(code == hermes::EXIT_SUCCESS_CODE);
    assert(h.out.str().find("Explaining command: 'rm -rf /'") != std::string::npos);
    assert(h.out.str().find("• rm: remove files") != std::string::npos);
    assert(h.out.str().find("This command requires attention: destructive file operation") != std::string::npos);

    std::cout << "[PASS] test_explain_command\n";
}

void test_explain_failure() {
    Harness h;
    ScriptedClient client;
    client.explain_reply.success = false;
    client.explain_reply.error = "gemini API error: HTTP 403";

    auto ctx = h.context();
    assert(hermes::runExplain(ctx, client, "ls") == hermes::EXIT_API);
    assert(h.err.str().find("HTTP 403") != std::string::npos);

    std::cout << "[PASS] test_explain_failure\n";
}

void test_colour_follows_each_stream() {
    Harness h;
    ScriptedClient client;
    client.explain_reply.success = true;
    client.explain_reply.explanation = "• rm: remove files\n";

    // stderr is a terminal, stdout is a pipe
    hermes::setColorEnabled(h.err, true);

    auto ctx = h.context();
    hermes::runExplain(ctx, client, "rm -rf /");
    assert(h.out.str().find("\033[") == std::string::npos);
    assert(h.out.str().find("📖 Command explanation:") != std::string::npos);

    hermes::printError(h.err, "boom");
    assert(h.err.str().find(hermes::RED + "Error: boom" + hermes::RESET) != std::string::npos);

    hermes::setColorEnabled(h.out, true);
    assert(hermes::paint(h.out, hermes::CYAN, "x") == hermes::CYAN + "x" + hermes::RESET);
    assert(hermes::paint(h.err, hermes::CYAN, "x") == hermes::CYAN + "x" + hermes::RESET);

    hermes::setColorEnabled(h.out, false);
    hermes::setColorEnabled(h.err, false);
    assert(hermes::paint(h.out, hermes::CYAN, "x") == "x");
    assert(!hermes::colorEnabled(h.err));

    std::cout << "[PASS] test_colour_follows_each_stream\n";
}

void test_init_command() {
    Harness h;
    auto ctx = h.context();

    assert(hermes::runInit(ctx, "zsh") == hermes::EXIT_SUCCESS_CODE);
    assert(h.out.str().find("hermes_gen()") != std::string::npos);

    h.out.str("");
    assert(hermes::runInit(ctx, "powershell") == hermes::EXIT_USAGE);
    assert(h.out.str().empty());
    assert(h.err.str().find("unsupported shell: powershell") != std::string::npos);

    std::cout << "[PASS] test_init_command\n";
}

int main() {
    std::cout << "Running command tests...\n\n";

    setenv("HERMES_SUPPRESS_INTEGRATION_TIP", "1", 1);

    test_generate_safe_command();
    test_generate_attention_from_pattern();
    test_generate_pattern_wins_over_safe_model();
    test_generate_model_raises_safe_pattern();
    test_generate_without_model_opinion();
    test_generate_failure();
    test_generate_empty_command();
    test_generate_forced_exit_code();
    test_generate_explain_generation();
    test_check_command();
    test_explain_command();
    test_explain_failure();
    test_colour_follows_each_stream();
    test_init_command();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
