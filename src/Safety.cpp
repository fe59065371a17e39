/**
 * Safety.cpp - Safety verdicts, hybrid merge and exit code mapping
 */

#include "hermes/Safety.hpp"
#include "hermes/ExitCodes.hpp"

namespace hermes {

std::string toString(SafetyLevel level) {
    switch (level) {
        case SafetyLevel::Safe:
            return "safe";
        case SafetyLevel::Attention:
            return "attention";
    }
    return "unknown";
}

std::string toString(Provenance source) {
    switch (source) {
        case Provenance::AttentionPattern:
            return "attention-pattern";
        case Provenance::SafePattern:
            return "safe-pattern";
        case Provenance::DefaultFallback:
            return "default-fallback";
        case Provenance::AiAssessment:
            return "ai-assessment";
        case Provenance::Mock:
            return "mock";
    }
    return "unknown";
}

ClassificationResult merge(const ClassificationResult& pattern, SafetyLevel model_opinion) {
    if (pattern.level == SafetyLevel::Attention) {
        return pattern;
    }

    if (model_opinion == SafetyLevel::Attention) {
        return ClassificationResult{
            SafetyLevel::Attention,
            "external judgment flagged as requiring attention",
            Provenance::AiAssessment
        };
    }

    return pattern;
}

int toExitCode(SafetyLevel level) {
    return level == SafetyLevel::Attention ? EXIT_ATTENTION : EXIT_SUCCESS_CODE;
}

ClassificationResult classifyWithForcedCode(const std::string& /*command*/, int forced_exit_code) {
    switch (forced_exit_code) {
        case EXIT_SUCCESS_CODE:
            return ClassificationResult{SafetyLevel::Safe, "forced: safe command", Provenance::Mock};
        case EXIT_ATTENTION:
            return ClassificationResult{SafetyLevel::Attention, "forced: requires attention", Provenance::Mock};
        default:
            return ClassificationResult{SafetyLevel::Safe, "forced: default safe", Provenance::Mock};
    }
}

} // namespace hermes
