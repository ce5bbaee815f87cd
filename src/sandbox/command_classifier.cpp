#include "sandbox/command_classifier.hpp"

#include "utils/logging.hpp"

namespace rampart::sandbox {
namespace {

DangerousPattern Make(const char* name, const char* description, const char* source,
                      bool icase = false) {
    auto flags = std::regex::ECMAScript;
    if (icase) {
        flags |= std::regex::icase;
    }
    return DangerousPattern{name, description, std::regex(source, flags)};
}

}  // namespace

std::vector<DangerousPattern> BaselineDangerousPatterns() {
    std::vector<DangerousPattern> patterns;
    patterns.push_back(Make(
        "recursive-delete", "Recursive or forced delete (rm -r / rm -rf)",
        R"((^|[\s;&|(`])rm\s+(-[a-zA-Z]*[rR][a-zA-Z]*|--recursive)(\s|$))"));
    patterns.push_back(Make(
        "privilege-escalation", "Privilege escalation (sudo/su/doas)",
        R"((^|[\s;&|(`])(sudo|su|doas)(\s|$))"));
    patterns.push_back(Make(
        "disk-write", "Raw disk device write (dd of=/dev, mkfs, > /dev/sd*)",
        R"((\bdd\b[^\n]*\bof=/dev/)|(\bmkfs(\.[a-z0-9]+)?\b)|(>\s*/dev/(sd|hd|nvme|disk|mmcblk)))"));
    patterns.push_back(Make(
        "pipe-to-shell", "Remote script piped to a shell",
        R"(\b(curl|wget)\b[^|]*\|\s*(sudo\s+)?(ba|z|da|k)?sh\b)"));
    patterns.push_back(Make(
        "fork-bomb", "Fork bomb",
        R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)"));
    patterns.push_back(Make(
        "chmod-777", "World-writable permissions (chmod 777)",
        R"(\bchmod\s+(-[a-zA-Z]+\s+)*0?777\b)"));
    patterns.push_back(Make(
        "chown-root", "Ownership change to root",
        R"(\bchown\s+(-[a-zA-Z]+\s+)*root\b)"));
    patterns.push_back(Make(
        "force-push-protected", "Force push to main/master",
        R"(^(?=[\s\S]*\bgit\s+push\b)(?=[\s\S]*(\s--force(-with-lease)?\b|\s-[a-zA-Z]*f\b))(?=[\s\S]*\b(main|master)\b))"));
    patterns.push_back(Make(
        "drop-database", "Database or table drop",
        R"(\bdrop\s+(database|table|schema)\b)", true));
    return patterns;
}

CommandClassifier::CommandClassifier(const std::vector<std::string>& custom_patterns)
    : patterns_(BaselineDangerousPatterns()) {
    for (const auto& source : custom_patterns) {
        if (source.empty()) {
            continue;
        }
        try {
            patterns_.push_back(DangerousPattern{
                "custom", "Matches custom pattern: " + source,
                std::regex(source, std::regex::ECMAScript)});
        } catch (const std::regex_error& ex) {
            utils::LogWarn("sandbox", "skipping invalid dangerous pattern " + source + ": " + ex.what());
        }
    }
}

CommandClassification CommandClassifier::Classify(const std::string& command) const {
    CommandClassification result;
    for (const auto& pattern : patterns_) {
        if (std::regex_search(command, pattern.regex)) {
            result.matched.push_back(pattern.description);
        }
    }
    result.dangerous = !result.matched.empty();
    return result;
}

bool CommandClassifier::NeedsApproval(const std::string& command,
                                      bool sandbox_disabled,
                                      bool require_dangerous_approval) const {
    if (sandbox_disabled) {
        return true;
    }
    return require_dangerous_approval && Classify(command).dangerous;
}

}  // namespace rampart::sandbox
