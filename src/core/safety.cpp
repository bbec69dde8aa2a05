#include "core/safety.hpp"

#include <initializer_list>

std::string shell_quote(const std::string& s) {
    std::string result = "'";
    for (char c : s) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

static std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

const std::vector<std::string>& SafetyClassifier::default_allow_list() {
    static const std::vector<std::string> list = {
        "uname", "hostname", "whoami", "id", "pwd", "date", "df", "free", "nproc",
        "ip route", "ip addr", "ls", "echo", "cat /etc/os-release",
        "systemctl list-units", "which", "test", "head", "tail", "wc",
    };
    return list;
}

SafetyClassifier::SafetyClassifier() : allow_list_(default_allow_list()) {}

SafetyClassifier::SafetyClassifier(std::vector<std::string> extra_safe_commands)
    : allow_list_(default_allow_list()) {
    for (auto& cmd : extra_safe_commands) {
        std::string trimmed = trim_copy(cmd);
        if (!trimmed.empty()) allow_list_.push_back(std::move(trimmed));
    }
}

static std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < s.size()) {
        size_t start = s.find_first_not_of(" \t", i);
        if (start == std::string::npos) break;
        size_t end = s.find_first_of(" \t", start);
        words.push_back(s.substr(start, end == std::string::npos ? std::string::npos : end - start));
        i = end == std::string::npos ? s.size() : end;
    }
    return words;
}

static bool in_list(const std::string& word, std::initializer_list<const char*> list) {
    for (const char* w : list) {
        if (word == w) return true;
    }
    return false;
}

// Built-in entries that can also change the host: only their read-only
// argument shapes are accepted. Other entries take any arguments.
static bool arguments_read_only(const std::string& entry, const std::string& rest) {
    auto args = split_words(rest);
    if (args.empty()) return true;

    if (entry == "ip route" || entry == "ip addr") {
        return in_list(args[0], {"show", "list", "ls"});
    }
    if (entry == "hostname") {
        for (const auto& a : args) {
            if (!in_list(a, {"-f", "-s", "-d", "-i", "-I", "-A", "--fqdn", "--long", "--short",
                             "--domain", "--ip-address", "--all-ip-addresses", "--all-fqdns"})) {
                return false;
            }
        }
        return true;
    }
    if (entry == "date") {
        for (const auto& a : args) {
            bool format = a[0] == '+' || a.compare(0, 2, "'+") == 0 || a.compare(0, 2, "\"+") == 0;
            bool flag = in_list(a, {"-u", "--utc", "--universal", "-R", "--rfc-email", "-I"}) ||
                        a.compare(0, 11, "--iso-8601=") == 0 || a == "--iso-8601";
            if (!format && !flag) return false;
        }
        return true;
    }
    return true;
}

bool SafetyClassifier::segment_matches(const std::string& segment) const {
    std::string cmd = trim_copy(segment);
    if (cmd.empty()) return false;
    for (const auto& entry : allow_list_) {
        if (cmd == entry) return true;
        if (cmd.size() > entry.size() &&
            cmd.compare(0, entry.size(), entry) == 0 &&
            (cmd[entry.size()] == ' ' || cmd[entry.size()] == '\t') &&
            arguments_read_only(entry, cmd.substr(entry.size()))) {
            return true;
        }
    }
    return false;
}

bool SafetyClassifier::is_inherently_safe(const std::string& command) const {
    // Anything that could chain a second command or write a file disqualifies
    static const char* forbidden[] = {";", "&", ">", "<", "`", "$(", "\n", "\r"};
    for (const char* f : forbidden) {
        if (command.find(f) != std::string::npos) return false;
    }

    size_t start = 0;
    while (true) {
        size_t bar = command.find('|', start);
        std::string segment = command.substr(start, bar == std::string::npos ? std::string::npos : bar - start);
        if (!segment_matches(segment)) return false;
        if (bar == std::string::npos) break;
        start = bar + 1;
    }
    return true;
}

std::string SafetyClassifier::simulated(const std::string& command) {
    return "echo " + shell_quote("Would run: " + command);
}

SafetyDecision SafetyClassifier::classify(const std::string& command, bool marked_safe) const {
    SafetyDecision d;
    if (marked_safe || is_inherently_safe(command)) {
        d.runs_for_real = true;
        d.command = command;
    } else {
        d.runs_for_real = false;
        d.command = simulated(command);
    }
    return d;
}
