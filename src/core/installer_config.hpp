#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/// Thrown when the installer document is missing, unreadable or malformed
class ConfigLoadError : public std::runtime_error {
public:
    explicit ConfigLoadError(const std::string& msg) : std::runtime_error(msg) {}
};

// ── Document model ─────────────────────────────────────────────

struct InstallerInfo {
    std::string name;
    std::string version;
    std::string description;
};

struct PreCheck {
    std::string name;
    std::string command;
    std::string expected_pattern;   // empty = no pattern
    bool has_expected_exit_code = false;
    int expected_exit_code = 0;
    std::string min_required;       // advisory threshold, e.g. "10GB"
    std::string type;               // "diskSpace", "memory", "cpu" or empty
    std::string error_message;
    bool safe = false;
    std::string capture_as;
};

struct FieldOption {
    std::string value;
    std::string label;
    bool selected = false;
};

struct ConfigField {
    std::string id;
    std::string label;
    std::string type = "text";      // text, password, number, boolean, select
    bool required = false;
    std::string placeholder;
    std::string validation;         // regex, empty = none
    std::string description;
    int min_length = -1;            // -1 = unset
    int max_length = -1;
    bool has_min = false;
    double min = 0;
    bool has_max = false;
    double max = 0;
    nlohmann::json default_value;   // null = none
    std::vector<FieldOption> options;
};

enum class CommandKind { Command, Prompt, Display };

struct InstallCommand {
    CommandKind kind = CommandKind::Command;
    std::string description;
    std::string condition;

    // command
    std::string cmd;
    bool safe = false;
    bool sensitive = false;
    int timeout_ms = 0;             // 0 = executor default
    std::string capture_as;
    bool has_default_value = false;
    std::string default_value;
    bool has_expected_exit_code = false;
    int expected_exit_code = 0;

    // prompt
    std::string prompt_type = "input";  // input, password, confirm, select, multiselect
    std::string message;
    std::vector<FieldOption> options;
    nlohmann::json prompt_default;      // null = none
    std::string validation;
    bool allow_empty = false;
    bool required = false;

    // display
    std::string title;
    std::vector<std::string> content;
};

struct InstallStep {
    std::string name;
    std::string description;
    std::string condition;
    std::vector<InstallCommand> commands;
};

struct PostInstallCommand {
    std::string name;
    std::string command;
    bool safe = false;
};

struct InstallerConfig {
    InstallerInfo installer;
    std::vector<PreCheck> pre_checks;
    std::vector<ConfigField> config_fields;
    std::vector<InstallStep> install_steps;
    std::vector<PostInstallCommand> post_install;

    /// Parse a JSON document; throws ConfigLoadError
    static InstallerConfig parse(const std::string& json_text);
    static InstallerConfig from_json(const nlohmann::json& root);

    /// Read and parse a file; throws ConfigLoadError
    static InstallerConfig load_file(const std::string& path);

    /// Locate the document in a directory: the advanced document first,
    /// then the basic one. Returns empty if neither exists.
    static std::string locate(const std::string& dir);

    static constexpr const char* kAdvancedFileName = "installer-config-advanced.json";
    static constexpr const char* kBasicFileName = "installer-config.json";
};

/// Readable name of a command variant ("command", "prompt", "display")
const char* command_kind_name(CommandKind kind);
