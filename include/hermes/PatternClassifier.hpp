/**
 * PatternClassifier.hpp - Rule-table driven command safety classification
 */

#pragma once

#include "hermes/CommandParser.hpp"
#include "hermes/RuleTable.hpp"
#include "hermes/Safety.hpp"

#include <string>

namespace hermes {

class PatternClassifier {
public:
    explicit PatternClassifier(RuleTable rules = defaultRuleTable());

    // Total: every input, including "" and garbage, yields a verdict.
    // Attention rules are tried first in table order and the first hit wins;
    // safe rules are tried next; anything unmatched falls back to Safe.
    ClassificationResult classify(const std::string& command) const;

    const RuleTable& rules() const { return rules_; }

private:
    RuleTable rules_;
    CommandParser parser_;

    bool matches(const RuleTable::Entry& entry, const std::string& raw,
                 const std::string& command_text) const;
};

} // namespace hermes
