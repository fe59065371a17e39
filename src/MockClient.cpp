/**
 * MockClient.cpp - Offline AI provider with canned answers
 */

#include "hermes/MockClient.hpp"
#include "hermes/Console.hpp"

#include <iostream>
#include <vector>

namespace hermes {

MockClient::MockClient(const std::string& static_response, bool debug)
    : static_response_(static_response), debug_(debug) {
    responses_ = {
        {"list files", "ls -la"},
        {"list all files", "ls -la"},
        {"delete everything", "rm -rf /"},
        {"install vim", "sudo apt install vim"},
        {"check disk usage", "df -h"},
        {"show processes", "ps aux"},
        {"find python files", "find . -name '*.py'"},
    };

    explanations_ = {
        {"ls -la", "List all files and directories in long format, including hidden files"},
        {"rm -rf /", "DANGEROUS: Recursively remove all files starting from root directory"},
        {"sudo apt install vim", "Install vim text editor using apt package manager with sudo privileges"},
        {"df -h", "Display filesystem disk usage in human-readable format"},
        {"ps aux", "Show all running processes with detailed information"},
        {"find . -name '*.py'", "Find all Python files in current directory and subdirectories"},
    };
}

bool MockClient::containsDangerousPatterns(const std::string& command) {
    static const std::vector<std::string> dangerous_patterns = {
        "rm -rf",
        "sudo",
        "dd if=",
        "mkfs",
        "fdisk",
        "systemctl start",
        "systemctl stop",
        "apt install",
        "yum install",
        "pacman -S",
    };

    for (const auto& pattern : dangerous_patterns) {
        if (command.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

GenerateResponse MockClient::generateCommand(const GenerateRequest& request) {
    if (debug_) {
        printDebug(std::cerr, "mock AI generating command for: " + request.query);
    }

    GenerateResponse response;
    response.success = true;

    if (!static_response_.empty()) {
        response.command = static_response_;
        response.reasoning = "Mock static response for: " + request.query;
    } else {
        auto it = responses_.find(request.query);
        if (it != responses_.end()) {
            response.command = it->second;
            response.reasoning = "Mock reasoning for: " + request.query;
        } else {
            response.command = "echo 'Mock command for: " + request.query + "'";
            response.reasoning = "Mock default response";
            response.safety = SafetyLevel::Safe;
            return response;
        }
    }

    response.safety = containsDangerousPatterns(response.command) ? SafetyLevel::Attention
                                                                  : SafetyLevel::Safe;
    return response;
}

ExplainResponse MockClient::explainCommand(const ExplainRequest& request) {
    if (debug_) {
        printDebug(std::cerr, "mock AI explaining command: " + request.command);
    }

    ExplainResponse response;
    response.success = true;

    if (!static_response_.empty()) {
        response.explanation = static_response_;
        return response;
    }

    auto it = explanations_.find(request.command);
    if (it != explanations_.end()) {
        response.explanation = it->second;
    } else {
        response.explanation = "Mock explanation for command: " + request.command;
    }
    return response;
}

} // namespace hermes
