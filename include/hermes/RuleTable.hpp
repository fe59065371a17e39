/**
 * RuleTable.hpp - Declarative safety rule tables
 *
 * Rules are data: a category, a regular expression, where it is matched and
 * the verdict it produces. Tables are built once and are read-only while a
 * classifier uses them. Boost.Regex matches without recursing per character,
 * so command length does not bound the stack.
 */

#pragma once

#include "hermes/Safety.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <boost/regex.hpp>

namespace hermes {

enum class MatchKind {
    CommandName, // anchored at the first command-like token
    Anywhere     // searched over the whole command line
};

struct Rule {
    std::string category;
    std::string pattern;
    MatchKind match;
    SafetyLevel level;
};

class RuleTable {
public:
    struct Entry {
        Rule rule;
        boost::regex regex;
    };

    RuleTable() = default;

    // Returns false (and leaves the table unchanged) if the pattern
    // is not a valid Perl-style regular expression.
    bool add(const Rule& rule);

    // Removes every rule of the given category, returns how many were dropped.
    size_t remove(const std::string& category);

    const std::vector<Entry>& entries() const { return entries_; }
    std::vector<Rule> rules() const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

// Built-in attention signatures followed by built-in safe signatures.
RuleTable defaultRuleTable();

} // namespace hermes
