/**
 * Console.cpp - Coloured diagnostics on the terminal
 */

#include "hermes/Console.hpp"

#include <set>

namespace hermes {

static std::set<const std::ostream*> colored_streams;

void setColorEnabled(const std::ostream& out, bool enabled) {
    if (enabled) {
        colored_streams.insert(&out);
    } else {
        colored_streams.erase(&out);
    }
}

bool colorEnabled(const std::ostream& out) {
    return colored_streams.count(&out) > 0;
}

std::string paint(const std::ostream& out, const std::string& color, const std::string& text) {
    if (!colorEnabled(out)) return text;
    return color + text + RESET;
}

void printError(std::ostream& out, const std::string& message) {
    out << paint(out, RED, "Error: " + message) << "\n";
}

void printWarning(std::ostream& out, const std::string& message) {
    out << paint(out, RED, "⚠️  " + message) << "\n";
}

void printTip(std::ostream& out, const std::string& message) {
    out << paint(out, YELLOW, "💡 ") << message << "\n";
}

void printDebug(std::ostream& out, const std::string& message) {
    out << "[DEBUG] " << message << "\n";
}

} // namespace hermes
