/**
 * PatternClassifier.cpp - Rule-table driven command safety classification
 */

#include "hermes/PatternClassifier.hpp"

#include <stdexcept>
#include <utility>

namespace hermes {

static const std::string FALLBACK_REASON = "no rule matched";

PatternClassifier::PatternClassifier(RuleTable rules) : rules_(std::move(rules)) {}

// A search that exceeds Boost's complexity limit counts as a hit for
// attention rules and as a miss for safe rules.
bool PatternClassifier::matches(const RuleTable::Entry& entry, const std::string& raw,
                                const std::string& command_text) const {
    try {
        if (entry.rule.match == MatchKind::CommandName) {
            if (command_text.empty()) return false;
            return boost::regex_search(command_text, entry.regex, boost::match_continuous);
        }
        return boost::regex_search(raw, entry.regex);
    } catch (const std::runtime_error&) {
        return entry.rule.level == SafetyLevel::Attention;
    }
}

ClassificationResult PatternClassifier::classify(const std::string& command) const {
    ParsedCommand parsed = parser_.parse(command);

    for (const auto& entry : rules_.entries()) {
        if (entry.rule.level != SafetyLevel::Attention) continue;
        if (matches(entry, command, parsed.command_text)) {
            return ClassificationResult{SafetyLevel::Attention, entry.rule.category,
                                        Provenance::AttentionPattern};
        }
    }

    for (const auto& entry : rules_.entries()) {
        if (entry.rule.level != SafetyLevel::Safe) continue;
        if (matches(entry, command, parsed.command_text)) {
            return ClassificationResult{SafetyLevel::Safe, entry.rule.category,
                                        Provenance::SafePattern};
        }
    }

    return ClassificationResult{SafetyLevel::Safe, FALLBACK_REASON, Provenance::DefaultFallback};
}

} // namespace hermes
