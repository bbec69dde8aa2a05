#include "core/installer_config.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

static constexpr int kMaxExitCode = 255;

// ════════════════════════════════════════════════════════════════
// Field helpers
// ════════════════════════════════════════════════════════════════

static std::string get_string(const json& obj, const char* key, const std::string& context) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number() || it->is_boolean()) return it->dump();
    throw ConfigLoadError(context + ": '" + key + "' must be a string");
}

static bool get_bool(const json& obj, const char* key, const std::string& context) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return false;
    if (it->is_boolean()) return it->get<bool>();
    throw ConfigLoadError(context + ": '" + key + "' must be a boolean");
}

/// Returns true and sets out when the key holds a number
static bool get_number(const json& obj, const char* key, const std::string& context, double& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return false;
    if (!it->is_number()) {
        throw ConfigLoadError(context + ": '" + key + "' must be a number");
    }
    out = it->get<double>();
    return true;
}

/// Returns true and sets out when the key holds a whole number in [lo, hi]
static bool get_int(const json& obj, const char* key, const std::string& context,
                    int lo, int hi, int& out) {
    double n = 0;
    if (!get_number(obj, key, context, n)) return false;
    if (!(n >= lo && n <= hi) || n != std::floor(n)) {
        throw ConfigLoadError(context + ": '" + key + "' must be a whole number between " +
                              std::to_string(lo) + " and " + std::to_string(hi));
    }
    out = static_cast<int>(n);
    return true;
}

static const json& get_array(const json& obj, const char* key, const std::string& context) {
    static const json empty = json::array();
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return empty;
    if (!it->is_array()) {
        throw ConfigLoadError(context + ": '" + key + "' must be an array");
    }
    return *it;
}

static void require_object(const json& j, const std::string& context) {
    if (!j.is_object()) {
        throw ConfigLoadError(context + " must be an object");
    }
}

static std::vector<FieldOption> parse_options(const json& obj, const std::string& context) {
    std::vector<FieldOption> options;
    for (const auto& o : get_array(obj, "options", context)) {
        FieldOption opt;
        if (o.is_string()) {
            opt.value = o.get<std::string>();
            opt.label = opt.value;
        } else {
            require_object(o, context + " option");
            opt.value = get_string(o, "value", context + " option");
            opt.label = get_string(o, "label", context + " option");
            if (opt.label.empty()) opt.label = opt.value;
            opt.selected = get_bool(o, "selected", context + " option");
        }
        options.push_back(std::move(opt));
    }
    return options;
}

// ════════════════════════════════════════════════════════════════
// Section parsers
// ════════════════════════════════════════════════════════════════

static PreCheck parse_pre_check(const json& j, size_t index) {
    std::string ctx = "preChecks[" + std::to_string(index) + "]";
    require_object(j, ctx);

    PreCheck c;
    c.name = get_string(j, "name", ctx);
    c.command = get_string(j, "command", ctx);
    if (c.command.empty()) {
        throw ConfigLoadError(ctx + ": 'command' is required");
    }
    c.expected_pattern = get_string(j, "expectedPattern", ctx);
    c.has_expected_exit_code = get_int(j, "expectedExitCode", ctx, 0, kMaxExitCode, c.expected_exit_code);
    c.min_required = get_string(j, "minRequired", ctx);
    c.type = get_string(j, "type", ctx);
    if (!c.type.empty() && c.type != "diskSpace" && c.type != "memory" && c.type != "cpu") {
        throw ConfigLoadError(ctx + ": unknown type '" + c.type + "'");
    }
    c.error_message = get_string(j, "errorMessage", ctx);
    c.safe = get_bool(j, "safe", ctx);
    c.capture_as = get_string(j, "captureAs", ctx);
    return c;
}

static ConfigField parse_field(const json& j, size_t index) {
    std::string ctx = "configFields[" + std::to_string(index) + "]";
    require_object(j, ctx);

    ConfigField f;
    f.id = get_string(j, "id", ctx);
    if (f.id.empty()) {
        throw ConfigLoadError(ctx + ": 'id' is required");
    }
    f.label = get_string(j, "label", ctx);
    if (f.label.empty()) f.label = f.id;
    std::string type = get_string(j, "type", ctx);
    if (!type.empty()) f.type = type;
    if (f.type != "text" && f.type != "password" && f.type != "number" &&
        f.type != "boolean" && f.type != "select") {
        throw ConfigLoadError(ctx + ": unknown field type '" + f.type + "'");
    }
    f.required = get_bool(j, "required", ctx);
    f.placeholder = get_string(j, "placeholder", ctx);
    f.validation = get_string(j, "validation", ctx);
    f.description = get_string(j, "description", ctx);

    get_int(j, "minLength", ctx, 0, std::numeric_limits<int>::max(), f.min_length);
    get_int(j, "maxLength", ctx, 0, std::numeric_limits<int>::max(), f.max_length);
    f.has_min = get_number(j, "min", ctx, f.min);
    f.has_max = get_number(j, "max", ctx, f.max);

    auto def = j.find("default");
    if (def != j.end()) f.default_value = *def;
    f.options = parse_options(j, ctx);
    return f;
}

static InstallCommand parse_command(const json& j, const std::string& ctx) {
    require_object(j, ctx);

    InstallCommand c;
    std::string type = get_string(j, "type", ctx);
    if (type.empty() || type == "command") {
        c.kind = CommandKind::Command;
    } else if (type == "prompt") {
        c.kind = CommandKind::Prompt;
    } else if (type == "display") {
        c.kind = CommandKind::Display;
    } else {
        throw ConfigLoadError(ctx + ": unknown command type '" + type + "'");
    }

    c.description = get_string(j, "description", ctx);
    c.condition = get_string(j, "condition", ctx);
    c.capture_as = get_string(j, "captureAs", ctx);

    // command
    c.cmd = get_string(j, "cmd", ctx);
    c.safe = get_bool(j, "safe", ctx);
    c.sensitive = get_bool(j, "sensitive", ctx);
    get_int(j, "timeout", ctx, 0, std::numeric_limits<int>::max(), c.timeout_ms);
    if (j.contains("defaultValue") && !j.at("defaultValue").is_null()) {
        c.has_default_value = true;
        c.default_value = get_string(j, "defaultValue", ctx);
    }
    c.has_expected_exit_code = get_int(j, "expectedExitCode", ctx, 0, kMaxExitCode, c.expected_exit_code);

    // prompt
    std::string prompt_type = get_string(j, "promptType", ctx);
    if (!prompt_type.empty()) c.prompt_type = prompt_type;
    if (c.kind == CommandKind::Prompt &&
        c.prompt_type != "input" && c.prompt_type != "password" && c.prompt_type != "confirm" &&
        c.prompt_type != "select" && c.prompt_type != "multiselect") {
        throw ConfigLoadError(ctx + ": unknown promptType '" + c.prompt_type + "'");
    }
    c.message = get_string(j, "message", ctx);
    c.options = parse_options(j, ctx);
    auto def = j.find("default");
    if (def != j.end()) c.prompt_default = *def;
    c.validation = get_string(j, "validation", ctx);
    c.allow_empty = get_bool(j, "allowEmpty", ctx);
    c.required = get_bool(j, "required", ctx);

    // display
    c.title = get_string(j, "title", ctx);
    for (const auto& line : get_array(j, "content", ctx)) {
        c.content.push_back(line.is_string() ? line.get<std::string>() : line.dump());
    }
    return c;
}

static InstallStep parse_step(const json& j, size_t index) {
    std::string ctx = "installSteps[" + std::to_string(index) + "]";
    require_object(j, ctx);

    InstallStep s;
    s.name = get_string(j, "name", ctx);
    s.description = get_string(j, "description", ctx);
    s.condition = get_string(j, "condition", ctx);
    const auto& commands = get_array(j, "commands", ctx);
    for (size_t i = 0; i < commands.size(); ++i) {
        s.commands.push_back(parse_command(commands[i], ctx + ".commands[" + std::to_string(i) + "]"));
    }
    return s;
}

static PostInstallCommand parse_post_install(const json& j, size_t index) {
    std::string ctx = "postInstall[" + std::to_string(index) + "]";
    require_object(j, ctx);

    PostInstallCommand p;
    p.name = get_string(j, "name", ctx);
    p.command = get_string(j, "command", ctx);
    p.safe = get_bool(j, "safe", ctx);
    return p;
}

// ════════════════════════════════════════════════════════════════
// Public API
// ════════════════════════════════════════════════════════════════

const char* command_kind_name(CommandKind kind) {
    switch (kind) {
        case CommandKind::Command: return "command";
        case CommandKind::Prompt: return "prompt";
        case CommandKind::Display: return "display";
    }
    return "command";
}

InstallerConfig InstallerConfig::from_json(const json& root) {
    require_object(root, "Installer config");

    InstallerConfig cfg;
    if (root.contains("installer") && !root.at("installer").is_null()) {
        const auto& info = root.at("installer");
        require_object(info, "installer");
        cfg.installer.name = get_string(info, "name", "installer");
        cfg.installer.version = get_string(info, "version", "installer");
        cfg.installer.description = get_string(info, "description", "installer");
    }

    const auto& checks = get_array(root, "preChecks", "Installer config");
    for (size_t i = 0; i < checks.size(); ++i) {
        cfg.pre_checks.push_back(parse_pre_check(checks[i], i));
    }
    const auto& fields = get_array(root, "configFields", "Installer config");
    for (size_t i = 0; i < fields.size(); ++i) {
        cfg.config_fields.push_back(parse_field(fields[i], i));
    }
    const auto& steps = get_array(root, "installSteps", "Installer config");
    for (size_t i = 0; i < steps.size(); ++i) {
        cfg.install_steps.push_back(parse_step(steps[i], i));
    }
    const auto& post = get_array(root, "postInstall", "Installer config");
    for (size_t i = 0; i < post.size(); ++i) {
        cfg.post_install.push_back(parse_post_install(post[i], i));
    }
    return cfg;
}

InstallerConfig InstallerConfig::parse(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigLoadError(std::string("Invalid JSON: ") + e.what());
    }
    return from_json(root);
}

InstallerConfig InstallerConfig::load_file(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        throw ConfigLoadError("Installer config not found: " + path);
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigLoadError("Cannot open installer config: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    try {
        return parse(buf.str());
    } catch (const ConfigLoadError& e) {
        throw ConfigLoadError(path + ": " + e.what());
    }
}

std::string InstallerConfig::locate(const std::string& dir) {
    fs::path base = dir.empty() ? fs::current_path() : fs::path(dir);
    std::error_code ec;
    for (const char* name : {kAdvancedFileName, kBasicFileName}) {
        fs::path candidate = base / name;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return "";
}
