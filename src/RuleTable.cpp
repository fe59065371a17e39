/**
 * RuleTable.cpp - Declarative safety rule tables
 */

#include "hermes/RuleTable.hpp"

#include <algorithm>

namespace hermes {

namespace {

// Block devices that dd/redirect rules protect
const std::string DISK_DEVICES = "(sd|hd|vd|xvd|nvme|mmcblk|disk|md|dm-)";

// Shell interpreters that remote scripts get fed into
const std::string SHELLS = "(ba|z|da|k|fi)?sh";

std::vector<Rule> attentionRules() {
    return {
        {"privilege escalation", R"re(\bsudo\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"privilege escalation", R"re((^|[;&|(]|\$\()\s*(doas|su|pkexec)(\s|$))re",
         MatchKind::Anywhere, SafetyLevel::Attention},

        // rm with -r/-f/--recursive/--force aimed at /, /*, ~, $HOME or a top-level directory
        {"destructive file operation",
         R"re(\brm\b(?=[^;&|]*\s(-[a-zA-Z]*[rRf]|--recursive|--force))[^;&|]*\s(/\*?|~/?\*?|\$HOME/?\*?|/[^/\s;&|]+/?\*?)(?=\s|$|[;&|]))re",
         MatchKind::Anywhere, SafetyLevel::Attention},

        {"disk-level write", R"re(\bdd\b[^;&|]*\bof=/dev/)re" + DISK_DEVICES,
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"disk-level write", R"re(>\s*/dev/)re" + DISK_DEVICES,
         MatchKind::Anywhere, SafetyLevel::Attention},

        {"filesystem formatting",
         R"re(\b(mkfs(\.[a-z0-9]+)?|mke2fs|fdisk|sfdisk|cfdisk|gdisk|parted|wipefs|mkswap)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"secure erase", R"re(\b(shred|wipe|srm)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"world-writable permissions",
         R"re(\bchmod\s+(-{1,2}[a-zA-Z-]+\s+)*(0?777|a\+rwx|ugo\+rwx|a\+w|o\+w)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},

        {"pipe-to-shell", R"re(\b(curl|wget)\b[^|]*\|\s*(sudo\s+)?)re" + SHELLS + R"re(\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"pipe-to-shell",
         R"re(\b()re" + SHELLS + R"re(\s+-c|eval)\s+["']?\$\(\s*(curl|wget)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"pipe-to-shell",
         R"re((\b()re" + SHELLS + R"re(|source)|(^|\s)\.)\s+<\(\s*(curl|wget)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},

        {"service management",
         R"re(\bsystemctl\s+(--[a-z-]+\s+)*(start|stop|restart|reload|enable|disable|mask|kill|isolate)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"service management", R"re(\bservice\s+\S+\s+(start|stop|restart|reload)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"package management",
         R"re(\b(apt|apt-get)\s+(-[a-zA-Z-]+\s+)*(install|remove|purge|autoremove|update|upgrade|dist-upgrade|full-upgrade)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"package management",
         R"re(\b(yum|dnf)\s+(-[a-zA-Z-]+\s+)*(install|remove|erase|update|upgrade|downgrade)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"package management", R"re(\bpacman\s+(-[a-zA-Z-]+\s+)*-(S|R|U)[a-zA-Z]*\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},

        {"kernel module loading", R"re(\b(modprobe|insmod|rmmod)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"filesystem mount", R"re(\b(mount|umount)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
        {"firewall change", R"re(\b(iptables|ip6tables|nft|ufw)\b)re",
         MatchKind::Anywhere, SafetyLevel::Attention},
    };
}

std::vector<Rule> safeRules() {
    return {
        {"directory listing", R"re(ls\b)re", MatchKind::CommandName, SafetyLevel::Safe},
        {"navigation", R"re((cd|pwd)\b)re", MatchKind::CommandName, SafetyLevel::Safe},
        {"echo", R"re(echo\b)re", MatchKind::CommandName, SafetyLevel::Safe},
        {"file viewing", R"re((cat|head|tail|less|more)\b)re", MatchKind::CommandName, SafetyLevel::Safe},
        {"search", R"re((grep|egrep|fgrep|find)\b)re", MatchKind::CommandName, SafetyLevel::Safe},
        {"read-only version control", R"re(git\s+(status|log|diff|branch|show)\b)re",
         MatchKind::CommandName, SafetyLevel::Safe},
        {"process listing", R"re(ps\b)re", MatchKind::CommandName, SafetyLevel::Safe},
        {"command lookup", R"re((which|whereis)\b)re", MatchKind::CommandName, SafetyLevel::Safe},
        {"documentation", R"re((man|help)\b)re", MatchKind::CommandName, SafetyLevel::Safe},
        {"service status", R"re(systemctl\s+status\b)re", MatchKind::CommandName, SafetyLevel::Safe},
    };
}

} // anonymous namespace

bool RuleTable::add(const Rule& rule) {
    try {
        boost::regex compiled(rule.pattern, boost::regex::perl);
        entries_.push_back({rule, std::move(compiled)});
    } catch (const boost::regex_error&) {
        return false;
    }
    return true;
}

size_t RuleTable::remove(const std::string& category) {
    auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry& e) { return e.rule.category == category; }),
                   entries_.end());
    return before - entries_.size();
}

std::vector<Rule> RuleTable::rules() const {
    std::vector<Rule> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.rule);
    }
    return out;
}

RuleTable defaultRuleTable() {
    RuleTable table;
    for (const auto& rule : attentionRules()) {
        table.add(rule);
    }
    for (const auto& rule : safeRules()) {
        table.add(rule);
    }
    return table;
}

} // namespace hermes
