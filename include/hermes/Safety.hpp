/**
 * Safety.hpp - Safety verdicts, hybrid merge and exit code mapping
 */

#pragma once

#include <string>

namespace hermes {

enum class SafetyLevel {
    Safe,
    Attention
};

// Which layer produced a verdict
enum class Provenance {
    AttentionPattern,
    SafePattern,
    DefaultFallback,
    AiAssessment,
    Mock
};

struct ClassificationResult {
    const SafetyLevel level;
    const std::string reason;
    const Provenance source;
};

std::string toString(SafetyLevel level);
std::string toString(Provenance source);

// Upgrade-only fusion: a pattern Attention is never lowered, a model
// Attention always raises a Safe pattern verdict.
ClassificationResult merge(const ClassificationResult& pattern, SafetyLevel model_opinion);

int toExitCode(SafetyLevel level);

// Bypasses classification entirely. 0 -> Safe, EXIT_ATTENTION -> Attention,
// anything else -> Safe. Always tagged Provenance::Mock.
ClassificationResult classifyWithForcedCode(const std::string& command, int forced_exit_code);

} // namespace hermes
