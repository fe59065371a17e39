/**
 * test_safety.cpp - Unit tests for verdict merging and exit code mapping
 */

#include "hermes/ExitCodes.hpp"
#include "hermes/PatternClassifier.hpp"
#include "hermes/Safety.hpp"

#include <cassert>
#include <iostream>

using hermes::ClassificationResult;
using hermes::Provenance;
using hermes::SafetyLevel;

void test_to_string() {
    assert(hermes::toString(SafetyLevel::Safe) == "safe");
    assert(hermes::toString(SafetyLevel::Attention) == "attention");

    assert(hermes::toString(Provenance::AttentionPattern) == "attention-pattern");
    assert(hermes::toString(Provenance::SafePattern) == "safe-pattern");
    assert(hermes::toString(Provenance::DefaultFallback) == "default-fallback");
    assert(hermes::toString(Provenance::AiAssessment) == "ai-assessment");
    assert(hermes::toString(Provenance::Mock) == "mock");

    std::cout << "[PASS] test_to_string\n";
}

void test_exit_codes() {
    assert(hermes::toExitCode(SafetyLevel::Safe) == 0);
    assert(hermes::toExitCode(SafetyLevel::Attention) == 10);

    assert(hermes::EXIT_SUCCESS_CODE == 0);
    assert(hermes::EXIT_ERROR == 1);
    assert(hermes::EXIT_CONFIG == 2);
    assert(hermes::EXIT_API == 3);
    assert(hermes::EXIT_USAGE == 4);
    assert(hermes::EXIT_ATTENTION == 10);

    std::cout << "[PASS] test_exit_codes\n";
}

void test_merge_keeps_pattern_attention() {
    ClassificationResult pattern{SafetyLevel::Attention, "privilege escalation", Provenance::AttentionPattern};

    auto with_safe = hermes::merge(pattern, SafetyLevel::Safe);
    assert(with_safe.level == SafetyLevel::Attention);
    assert(with_safe.reason == "privilege escalation");
    assert(with_safe.source == Provenance::AttentionPattern);

    auto with_attention = hermes::merge(pattern, SafetyLevel::Attention);
    assert(with_attention.level == SafetyLevel::Attention);
    assert(with_attention.reason == "privilege escalation");
    assert(with_attention.source == Provenance::AttentionPattern);

    std::cout << "[PASS] test_merge_keeps_pattern_attention\n";
}

void test_merge_model_raises_safe() {
    ClassificationResult safe_pattern{SafetyLevel::Safe, "directory listing", Provenance::SafePattern};
    ClassificationResult fallback{SafetyLevel::Safe, "no rule matched", Provenance::DefaultFallback};

    for (const auto& pattern : {safe_pattern, fallback}) {
        auto merged = hermes::merge(pattern, SafetyLevel::Attention);
        assert(merged.level == SafetyLevel::Attention);
        assert(merged.reason == "external judgment flagged as requiring attention");
        assert(merged.source == Provenance::AiAssessment);
    }

    std::cout << "[PASS] test_merge_model_raises_safe\n";
}

void test_merge_both_safe() {
    ClassificationResult pattern{SafetyLevel::Safe, "directory listing", Provenance::SafePattern};

    auto merged = hermes::merge(pattern, SafetyLevel::Safe);
    assert(merged.level == SafetyLevel::Safe);
    assert(merged.reason == "directory listing");
    assert(merged.source == Provenance::SafePattern);

    std::cout << "[PASS] test_merge_both_safe\n";
}

void test_merge_never_lowers() {
    hermes::PatternClassifier classifier;

    for (const std::string cmd : {"sudo ls", "rm -rf /", "ls -la", "some_custom_tool", ""}) {
        auto pattern = classifier.classify(cmd);
        for (auto opinion : {SafetyLevel::Safe, SafetyLevel::Attention}) {
            auto merged = hermes::merge(pattern, opinion);
            if (pattern.level == SafetyLevel::Attention || opinion == SafetyLevel::Attention) {
                assert(merged.level == SafetyLevel::Attention);
            } else {
                assert(merged.level == SafetyLevel::Safe);
            }
        }
    }

    std::cout << "[PASS] test_merge_never_lowers\n";
}

void test_model_flags_unmatched_command() {
    hermes::PatternClassifier classifier;

    // Pattern layer has no opinion on this one, the model does
    auto pattern = classifier.classify("kubectl delete namespace production");
    assert(pattern.source == Provenance::DefaultFallback);

    auto merged = hermes::merge(pattern, SafetyLevel::Attention);
    assert(merged.level == SafetyLevel::Attention);
    assert(merged.source == Provenance::AiAssessment);
    assert(hermes::toExitCode(merged.level) == 10);

    std::cout << "[PASS] test_model_flags_unmatched_command\n";
}

void test_forced_exit_codes() {
    auto safe = hermes::classifyWithForcedCode("rm -rf /", 0);
    assert(safe.level == SafetyLevel::Safe);
    assert(safe.reason == "forced: safe command");
    assert(safe.source == Provenance::Mock);

    auto attention = hermes::classifyWithForcedCode("ls", 10);
    assert(attention.level == SafetyLevel::Attention);
    assert(attention.reason == "forced: requires attention");
    assert(attention.source == Provenance::Mock);

    for (int code : {1, 3, 999, -1}) {
        auto other = hermes::classifyWithForcedCode("ls", code);
        assert(other.level == SafetyLevel::Safe);
        assert(other.reason == "forced: default safe");
        assert(other.source == Provenance::Mock);
    }

    std::cout << "[PASS] test_forced_exit_codes\n";
}

int main() {
    std::cout << "Running Safety tests...\n\n";

    test_to_string();
    test_exit_codes();
    test_merge_keeps_pattern_attention();
    test_merge_model_raises_safe();
    test_merge_both_safe();
    test_merge_never_lowers();
    test_model_flags_unmatched_command();
    test_forced_exit_codes();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
