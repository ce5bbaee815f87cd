#pragma once

#include <regex>
#include <string>
#include <vector>

namespace rampart::sandbox {

struct DangerousPattern {
    std::string name;
    std::string description;
    std::regex regex;
};

struct CommandClassification {
    bool dangerous = false;
    std::vector<std::string> matched;
};

// Advisory only: flags commands that should pause for human approval. Nothing
// here blocks execution.
class CommandClassifier {
public:
    // Invalid custom patterns are logged and skipped.
    explicit CommandClassifier(const std::vector<std::string>& custom_patterns = {});

    CommandClassification Classify(const std::string& command) const;

    // Dangerous (when approval is required) or explicitly unsandboxed commands
    // need approval.
    bool NeedsApproval(const std::string& command,
                       bool sandbox_disabled,
                       bool require_dangerous_approval = true) const;

    const std::vector<DangerousPattern>& Patterns() const { return patterns_; }

private:
    std::vector<DangerousPattern> patterns_;
};

std::vector<DangerousPattern> BaselineDangerousPatterns();

}  // namespace rampart::sandbox
