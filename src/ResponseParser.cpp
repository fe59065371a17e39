/**
 * ResponseParser.cpp - Decode the JSON the model is asked to answer with
 */

#include "hermes/ResponseParser.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hermes {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Models sometimes wrap the object in prose; fall back to the outermost braces.
json parseObject(const std::string& text) {
    std::string cleaned = cleanJSONResponse(text);
    try {
        return json::parse(cleaned);
    } catch (const json::parse_error&) {
        size_t start = cleaned.find('{');
        size_t end = cleaned.rfind('}');
        if (start == std::string::npos || end == std::string::npos || end <= start) {
            throw;
        }
        return json::parse(cleaned.substr(start, end - start + 1));
    }
}

SafetyLevel safetyFromString(std::string value) {
    value = trim(value);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (value == "SAFE") {
        return SafetyLevel::Safe;
    }
    return SafetyLevel::Attention;
}

} // anonymous namespace

std::string cleanJSONResponse(const std::string& text) {
    std::string result = trim(text);

    if (startsWith(result, "```json")) {
        result = trim(result.substr(7));
    }
    if (startsWith(result, "```")) {
        result = trim(result.substr(3));
    }
    if (endsWith(result, "```")) {
        result = trim(result.substr(0, result.size() - 3));
    }

    return result;
}

GenerateResponse parseGenerateText(const std::string& text) {
    GenerateResponse response;

    if (trim(text).empty()) {
        response.error_kind = AIErrorKind::Empty;
        response.error = "empty response text";
        return response;
    }

    try {
        json doc = parseObject(text);
        if (!doc.is_object() || !doc.contains("command") || !doc["command"].is_string()) {
            response.error_kind = AIErrorKind::Parse;
            response.error = "response has no \"command\" string";
            return response;
        }

        response.command = trim(doc["command"].get<std::string>());
        if (response.command.empty()) {
            response.error_kind = AIErrorKind::Empty;
            response.error = "model returned an empty command";
            return response;
        }

        if (doc.contains("safety") && !doc["safety"].is_null()) {
            if (doc["safety"].is_string()) {
                response.safety = safetyFromString(doc["safety"].get<std::string>());
            } else {
                response.safety = SafetyLevel::Attention;
            }
        }

        if (doc.contains("explanation") && doc["explanation"].is_string()) {
            response.reasoning = doc["explanation"].get<std::string>();
        }

        response.success = true;
    } catch (const json::exception& e) {
        response.error_kind = AIErrorKind::Parse;
        response.error = std::string("failed to parse JSON response: ") + e.what();
    }

    return response;
}

ExplainResponse parseExplainText(const std::string& text) {
    ExplainResponse response;

    if (trim(text).empty()) {
        response.error_kind = AIErrorKind::Empty;
        response.error = "empty response text";
        return response;
    }

    try {
        json doc = parseObject(text);
        if (!doc.is_object() || !doc.contains("explanation") || !doc["explanation"].is_array()) {
            response.error_kind = AIErrorKind::Parse;
            response.error = "response has no \"explanation\" array";
            return response;
        }

        std::vector<ExplanationSection> sections;
        for (const auto& item : doc["explanation"]) {
            ExplanationSection section;
            section.text = item.value("text", "");
            if (item.contains("details") && item["details"].is_array()) {
                for (const auto& detail : item["details"]) {
                    section.details.push_back(detail.get<std::string>());
                }
            }
            sections.push_back(section);
        }

        response.explanation = formatExplanation(sections);
        response.success = true;
    } catch (const json::exception& e) {
        response.error_kind = AIErrorKind::Parse;
        response.error = std::string("failed to parse JSON response: ") + e.what();
    }

    return response;
}

std::string formatExplanation(const std::vector<ExplanationSection>& sections) {
    std::string result;
    for (const auto& section : sections) {
        result += "• " + section.text + "\n";
        for (const auto& detail : section.details) {
            result += "  • " + detail + "\n";
        }
    }
    return result;
}

} // namespace hermes
