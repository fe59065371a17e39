/**
 * Console.hpp - Coloured diagnostics on the terminal
 */

#pragma once

#include <ostream>
#include <string>

namespace hermes {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string YELLOW = "\033[33m";
const std::string GREEN = "\033[32m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

// Colour is decided per stream. Streams that were never enabled stay plain;
// main enables stdout and stderr separately when each one is a terminal.
void setColorEnabled(const std::ostream& out, bool enabled);
bool colorEnabled(const std::ostream& out);

// Wraps text in an escape sequence when colours are enabled for `out`
std::string paint(const std::ostream& out, const std::string& color, const std::string& text);

void printError(std::ostream& out, const std::string& message);
void printWarning(std::ostream& out, const std::string& message);
void printTip(std::ostream& out, const std::string& message);
void printDebug(std::ostream& out, const std::string& message);

} // namespace hermes
