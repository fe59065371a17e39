/**
 * CommandParser.hpp - Split shell command lines into executable, flags and args
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace hermes {

struct ParsedCommand {
    std::string executable;
    std::vector<std::string> args;
    std::vector<std::string> flags;
    std::vector<std::string> assignments; // leading NAME=value words
    std::string raw_input;
    std::string command_text;             // raw_input from the executable onward
};

class CommandParser {
public:
    CommandParser();
    ~CommandParser();
    CommandParser(const CommandParser& other);
    CommandParser& operator=(const CommandParser& other);

    ParsedCommand parse(const std::string& input) const;

    static bool isAssignment(const std::string& word);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hermes
