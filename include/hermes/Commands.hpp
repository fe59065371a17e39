/**
 * Commands.hpp - The hermes subcommands
 *
 * Each returns the process exit code. Generated commands go to `out` alone
 * so shell integration can capture them; everything else goes to `err`.
 */

#pragma once

#include "hermes/AIClient.hpp"
#include "hermes/Config.hpp"
#include "hermes/PatternClassifier.hpp"
#include "hermes/Safety.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace hermes {

struct CommandContext {
    const Config& config;
    const PatternClassifier& classifier;
    std::ostream& out;
    std::ostream& err;
};

// Forced exit code (testing) wins; otherwise patterns, then the optional
// model opinion merged upgrade-only.
ClassificationResult assessCommand(const Config& config, const PatternClassifier& classifier,
                                   const std::string& command,
                                   std::optional<SafetyLevel> model_opinion);

int runGenerate(CommandContext& ctx, AIClient& client, const std::string& query);
int runExplain(CommandContext& ctx, AIClient& client, const std::string& command);
int runCheck(CommandContext& ctx, const std::string& command);
int runInit(CommandContext& ctx, const std::string& shell);

} // namespace hermes
