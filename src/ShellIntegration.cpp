/**
 * ShellIntegration.cpp - Shell functions that act on the hermes exit code
 *
 * Every script follows the exit code contract: 0 puts the command in the
 * input buffer, 10 prints a review warning first, anything else is a tool
 * error and leaves the buffer alone.
 */

#include "hermes/ShellIntegration.hpp"

#include <algorithm>
#include <filesystem>

namespace hermes {

namespace {

const char* ZSH_SCRIPT = R"sh(# hermes shell integration for zsh
# Add to ~/.zshrc:  eval "$(hermes init zsh)"
hermes_gen() {
  local cmd rc
  cmd="$(HERMES_SHELL_INTEGRATION=1 command hermes gen "$@")"
  rc=$?
  case $rc in
    0)
      print -z -- "$cmd"
      ;;
    10)
      print -P "%F{red}⚠️  hermes: review this command before running it%f" >&2
      print -z -- "$cmd"
      ;;
    *)
      return $rc
      ;;
  esac
}
alias h='hermes_gen'
)sh";

const char* BASH_SCRIPT = R"sh(# hermes shell integration for bash
# Add to ~/.bashrc:  eval "$(hermes init bash)"
hermes_gen() {
  local cmd rc
  cmd="$(HERMES_SHELL_INTEGRATION=1 command hermes gen "$@")"
  rc=$?
  case $rc in
    0)
      ;;
    10)
      printf '\033[31m⚠️  hermes: review this command before running it\033[0m\n' >&2
      ;;
    *)
      return $rc
      ;;
  esac
  history -s -- "$cmd"
  printf '%s\n' "$cmd"
  printf '(press Up to edit and run)\n' >&2
}
alias h='hermes_gen'
)sh";

const char* FISH_SCRIPT = R"sh(# hermes shell integration for fish
# Add to ~/.config/fish/config.fish:  hermes init fish | source
function hermes_gen
    set -l cmd (env HERMES_SHELL_INTEGRATION=1 hermes gen $argv)
    set -l rc $status
    switch $rc
        case 0
        case 10
            set_color red
            echo "⚠️  hermes: review this command before running it" >&2
            set_color normal
        case '*'
            return $rc
    end
    set -g __hermes_pending "$cmd"
end

function __hermes_fill_commandline --on-event fish_prompt
    if set -q __hermes_pending
        commandline -r -- $__hermes_pending
        set -e __hermes_pending
    end
end

alias h='hermes_gen'
)sh";

} // anonymous namespace

std::vector<std::string> supportedShells() {
    return {"zsh", "bash", "fish"};
}

bool isSupportedShell(const std::string& shell) {
    auto shells = supportedShells();
    return std::find(shells.begin(), shells.end(), shell) != shells.end();
}

std::string initScript(const std::string& shell) {
    if (shell == "zsh") return ZSH_SCRIPT;
    if (shell == "bash") return BASH_SCRIPT;
    if (shell == "fish") return FISH_SCRIPT;
    return "";
}

bool shouldShowIntegrationTip(const std::string& integration_env,
                              const std::string& suppress_env,
                              const std::string& shell_path) {
    if (integration_env == "1") return false;
    if (suppress_env == "1") return false;
    if (shell_path.empty()) return false;

    return std::filesystem::path(shell_path).filename() == "zsh";
}

std::string integrationTip() {
    return "TIP: Enable shell integration for the best experience!\n"
           "   Run: echo 'eval \"$(hermes init zsh)\"' >> ~/.zshrc && source ~/.zshrc\n"
           "   This allows hermes to put commands directly in your shell buffer.\n"
           "   To suppress this tip: export HERMES_SUPPRESS_INTEGRATION_TIP=1";
}

} // namespace hermes
