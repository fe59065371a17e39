/**
 * Commands.cpp - The hermes subcommands
 */

#include "hermes/Commands.hpp"
#include "hermes/Console.hpp"
#include "hermes/ExitCodes.hpp"
#include "hermes/ShellIntegration.hpp"

#include <cstdlib>

namespace hermes {

namespace {

std::string getEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

void logVerdict(CommandContext& ctx, const ClassificationResult& result) {
    printDebug(ctx.err, "safety level: " + toString(result.level));
    printDebug(ctx.err, "safety reason: " + result.reason);
    printDebug(ctx.err, "safety source: " + toString(result.source));
}

} // anonymous namespace

ClassificationResult assessCommand(const Config& config, const PatternClassifier& classifier,
                                   const std::string& command,
                                   std::optional<SafetyLevel> model_opinion) {
    if (config.mock_exit_code != 0) {
        return classifyWithForcedCode(command, config.mock_exit_code);
    }

    ClassificationResult pattern = classifier.classify(command);
    if (!model_opinion) {
        return pattern;
    }
    return merge(pattern, *model_opinion);
}

int runGenerate(CommandContext& ctx, AIClient& client, const std::string& query) {
    ctx.err << "└─ Generating command for: '" << query << "'\n";

    if (ctx.config.debug) {
        printDebug(ctx.err, "AI provider: " + client.name());
        if (client.name() != "mock") {
            printDebug(ctx.err, "using API key ending in " + maskApiKey(ctx.config.gemini_api_key));
        }
    }

    GenerateResponse response = client.generateCommand(GenerateRequest{query});
    if (!response.success) {
        printError(ctx.err, "AI command generation failed: " + response.error);
        return EXIT_API;
    }
    if (response.command.empty()) {
        printError(ctx.err, "AI command generation failed: model returned an empty command");
        return EXIT_API;
    }

    ClassificationResult result = assessCommand(ctx.config, ctx.classifier,
                                                response.command, response.safety);

    // Only the command goes to stdout; the shell function captures it verbatim
    ctx.out << response.command << "\n";

    if (ctx.config.explain_generation && !response.reasoning.empty()) {
        printTip(ctx.err, response.reasoning);
    }

    if (ctx.config.debug) {
        printDebug(ctx.err, "generated command: " + response.command);
        printDebug(ctx.err, "model opinion: " +
                   (response.safety ? toString(*response.safety) : std::string("(none)")));
        logVerdict(ctx, result);
    }

    if (shouldShowIntegrationTip(getEnv("HERMES_SHELL_INTEGRATION"),
                                 getEnv("HERMES_SUPPRESS_INTEGRATION_TIP"),
                                 getEnv("SHELL"))) {
        ctx.err << "\n";
        printTip(ctx.err, integrationTip());
        ctx.err << "\n";
    }

    return toExitCode(result.level);
}

int runExplain(CommandContext& ctx, AIClient& client, const std::string& command) {
    ctx.out << "Explaining command: '" << command << "'\n";

    ExplainResponse response = client.explainCommand(ExplainRequest{command});
    if (!response.success) {
        printError(ctx.err, "AI command explanation failed: " + response.error);
        return EXIT_API;
    }

    ctx.out << paint(ctx.out, CYAN, "📖 Command explanation:") << "\n" << response.explanation;
    if (!response.explanation.empty() && response.explanation.back() != '\n') {
        ctx.out << "\n";
    }

    ClassificationResult result = assessCommand(ctx.config, ctx.classifier, command, std::nullopt);
    if (result.level == SafetyLevel::Attention) {
        ctx.out << "\n";
        printWarning(ctx.out, "This command requires attention: " + result.reason);
    }
    if (ctx.config.debug) {
        logVerdict(ctx, result);
    }

    return EXIT_SUCCESS_CODE;
}

int runCheck(CommandContext& ctx, const std::string& command) {
    ClassificationResult result = assessCommand(ctx.config, ctx.classifier, command, std::nullopt);

    ctx.out << toString(result.level) << ": " << result.reason
            << " (" << toString(result.source) << ")\n";

    if (ctx.config.debug) {
        logVerdict(ctx, result);
    }

    return toExitCode(result.level);
}

int runInit(CommandContext& ctx, const std::string& shell) {
    if (!isSupportedShell(shell)) {
        printError(ctx.err, "unsupported shell: " + shell + " (supported: zsh, bash, fish)");
        return EXIT_USAGE;
    }

    ctx.out << initScript(shell);
    return EXIT_SUCCESS_CODE;
}

} // namespace hermes
