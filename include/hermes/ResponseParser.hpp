/**
 * ResponseParser.hpp - Decode the JSON the model is asked to answer with
 */

#pragma once

#include "hermes/AIClient.hpp"

#include <string>
#include <vector>

namespace hermes {

struct ExplanationSection {
    std::string text;
    std::vector<std::string> details;
};

// Strips surrounding whitespace and ```json / ``` fences.
std::string cleanJSONResponse(const std::string& text);

// {"command": "...", "safety": "SAFE|ATTENTION", "explanation": "..."}
// Unknown safety values map to Attention, a missing one to no opinion.
GenerateResponse parseGenerateText(const std::string& text);

// {"explanation": [{"text": "...", "details": ["..."]}]}
ExplainResponse parseExplainText(const std::string& text);

// "• text\n  • detail\n" per section
std::string formatExplanation(const std::vector<ExplanationSection>& sections);

} // namespace hermes
