/**
 * ShellIntegration.hpp - Shell functions that act on the hermes exit code
 */

#pragma once

#include <string>
#include <vector>

namespace hermes {

std::vector<std::string> supportedShells();
bool isSupportedShell(const std::string& shell);

// Script for `hermes init <shell>`; empty for unsupported shells.
std::string initScript(const std::string& shell);

// Tip is shown only outside the integration function, for zsh users who
// have not suppressed it.
bool shouldShowIntegrationTip(const std::string& integration_env,
                              const std::string& suppress_env,
                              const std::string& shell_path);

std::string integrationTip();

} // namespace hermes
