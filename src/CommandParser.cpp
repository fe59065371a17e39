/**
 * CommandParser.cpp - Split shell command lines into executable, flags and args
 */

#include "hermes/CommandParser.hpp"

#include <algorithm>
#include <cctype>

namespace hermes {

struct CommandParser::Impl {
    struct Token {
        std::string text;
        size_t offset = 0;
        bool quoted = false;
    };

    std::vector<std::string> control_operators = {
        "|", "||", "&", "&&", ";"
    };

    bool isControlOperator(const Token& token) const {
        if (token.quoted) return false;
        return std::find(control_operators.begin(), control_operators.end(), token.text)
               != control_operators.end();
    }

    // Whitespace-separated words; quotes group, backslash escapes one character.
    std::vector<Token> tokenize(const std::string& input) const {
        std::vector<Token> tokens;
        size_t i = 0;

        while (i < input.size()) {
            while (i < input.size() && std::isspace(static_cast<unsigned char>(input[i]))) {
                ++i;
            }
            if (i >= input.size()) break;

            Token token;
            token.offset = i;
            char quote = 0;

            while (i < input.size()) {
                char c = input[i];
                if (quote) {
                    if (c == quote) {
                        quote = 0;
                    } else {
                        token.text += c;
                    }
                } else if (c == '"' || c == '\'') {
                    quote = c;
                    token.quoted = true;
                } else if (c == '\\' && i + 1 < input.size()) {
                    token.text += input[++i];
                } else if (std::isspace(static_cast<unsigned char>(c))) {
                    break;
                } else {
                    token.text += c;
                }
                ++i;
            }

            tokens.push_back(token);
        }

        return tokens;
    }
};

CommandParser::CommandParser() : impl_(std::make_unique<Impl>()) {}

CommandParser::~CommandParser() = default;

CommandParser::CommandParser(const CommandParser& other)
    : impl_(std::make_unique<Impl>(*other.impl_)) {}

CommandParser& CommandParser::operator=(const CommandParser& other) {
    if (this != &other) {
        impl_ = std::make_unique<Impl>(*other.impl_);
    }
    return *this;
}

bool CommandParser::isAssignment(const std::string& word) {
    size_t eq = word.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }

    if (!std::isalpha(static_cast<unsigned char>(word[0])) && word[0] != '_') {
        return false;
    }

    for (size_t i = 1; i < eq; ++i) {
        char c = word[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }

    return true;
}

ParsedCommand CommandParser::parse(const std::string& input) const {
    ParsedCommand result;
    result.raw_input = input;

    auto tokens = impl_->tokenize(input);

    size_t i = 0;
    while (i < tokens.size() && isAssignment(tokens[i].text)) {
        result.assignments.push_back(tokens[i].text);
        ++i;
    }

    if (i >= tokens.size()) {
        return result;
    }

    result.executable = tokens[i].text;
    result.command_text = input.substr(tokens[i].offset);

    // Only the first simple command contributes flags and args
    for (size_t j = i + 1; j < tokens.size(); ++j) {
        const auto& token = tokens[j];
        if (impl_->isControlOperator(token)) {
            break;
        }
        if (token.text.size() > 1 && token.text.front() == '-' && !token.quoted) {
            result.flags.push_back(token.text);
        } else {
            result.args.push_back(token.text);
        }
    }

    return result;
}

} // namespace hermes
