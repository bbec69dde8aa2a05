#pragma once

#include <string>
#include <vector>

struct SafetyDecision {
    bool runs_for_real = false;
    std::string command;  // text actually handed to the shell
};

/// Decides whether a resolved command may touch the host, or must be
/// replaced by an echo of what would have run.
class SafetyClassifier {
public:
    SafetyClassifier();
    explicit SafetyClassifier(std::vector<std::string> extra_safe_commands);

    /// Read-only inspection commands that run without an explicit safe flag
    static const std::vector<std::string>& default_allow_list();

    /// True if the command matches the allow-list on whole-token boundaries
    /// and contains no sequencing, redirection or substitution.
    /// Pipelines are allowed when every segment is allow-listed.
    bool is_inherently_safe(const std::string& command) const;

    SafetyDecision classify(const std::string& command, bool marked_safe) const;

    /// The echo command used for simulation; prints "Would run: <command>"
    static std::string simulated(const std::string& command);

    const std::vector<std::string>& allow_list() const { return allow_list_; }

private:
    std::vector<std::string> allow_list_;

    bool segment_matches(const std::string& segment) const;
};

/// Wrap s in single quotes for /bin/sh
std::string shell_quote(const std::string& s);
