#include "core/cli.hpp"
#include "core/orchestrator.hpp"
#include "core/precheck.hpp"
#include "core/template.hpp"
#include "core/validation.hpp"

#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>
#include <filesystem>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace fs = std::filesystem;

using json = nlohmann::json;

namespace {

const char* line_prefix(LogLineType type) {
    switch (type) {
        case LogLineType::Command: return "";
        case LogLineType::Output: return "  ";
        case LogLineType::Error: return "  ! ";
        case LogLineType::Success: return "";
        case LogLineType::Info: return "  ";
        case LogLineType::Step: return "\n==> ";
        case LogLineType::Variable: return "  ";
    }
    return "";
}

/// Mirrors the run log to the terminal as it grows
class ConsoleObserver : public RunObserver {
public:
    void on_log_line(const LogLine& line) override {
        std::ostream& os = line.type == LogLineType::Error ? std::cerr : std::cout;
        os << line_prefix(line.type) << line.content << "\n";
    }

    void on_display(const DisplayContent& display) override {
        std::cout << "  +-- " << (display.title.empty() ? "Information" : display.title) << "\n";
        for (const auto& line : display.lines) {
            std::cout << "  | " << line << "\n";
        }
        std::cout << "  +--\n";
    }
};

std::string prompt_question(const PromptRequest& prompt) {
    const InstallCommand& cmd = prompt.command;
    std::string q = prompt.message;
    if (cmd.prompt_type == "confirm") {
        json initial = prompt_initial_value(cmd);
        q += (initial.is_boolean() && initial.get<bool>()) ? " [Y/n]" : " [y/N]";
    } else if (cmd.prompt_type == "select" || cmd.prompt_type == "multiselect") {
        for (size_t i = 0; i < cmd.options.size(); ++i) {
            const auto& opt = cmd.options[i];
            q += "\n    " + std::to_string(i + 1) + ") " + (opt.label.empty() ? opt.value : opt.label);
        }
        if (cmd.prompt_type == "multiselect") q += "\n  (comma-separated)";
    }
    json initial = prompt_initial_value(cmd);
    if (cmd.prompt_type != "confirm" && cmd.prompt_type != "password" && !initial.is_null()) {
        std::string shown = format_value(initial, TemplateMode::Display);
        if (!shown.empty()) q += " [" + shown + "]";
    }
    return q + ": ";
}

/// Option numbers typed at a select/multiselect prompt map to option values
json answer_for(const InstallCommand& cmd, const std::string& text) {
    if (text.empty()) return json();
    if (cmd.prompt_type != "select" && cmd.prompt_type != "multiselect") return text;

    auto pick = [&](const std::string& token) -> std::string {
        // Option numbers are small; longer digit runs are taken as literal values
        if (!token.empty() && token.size() <= 9 &&
            token.find_first_not_of("0123456789") == std::string::npos) {
            size_t n = std::stoul(token);
            if (n >= 1 && n <= cmd.options.size()) return cmd.options[n - 1].value;
        }
        return token;
    };

    if (cmd.prompt_type == "select") return pick(text);

    json arr = json::array();
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string token = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        size_t b = token.find_first_not_of(" \t");
        size_t e = token.find_last_not_of(" \t");
        if (b != std::string::npos) arr.push_back(pick(token.substr(b, e - b + 1)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return arr;
}

}  // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → launch TUI

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }

    bool known = std::strcmp(cmd, "run") == 0 || std::strcmp(cmd, "check") == 0 ||
                 std::strcmp(cmd, "steps") == 0 || std::strcmp(cmd, "validate") == 0;
    if (!known) {
        std::cerr << "Unknown command: " << cmd << "\n";
        std::cerr << "Run 'setuptui-cpp help' for usage.\n";
        return 1;
    }

    Options opts;
    try {
        opts = parse_options(argc, argv, 2);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Run 'setuptui-cpp help' for usage.\n";
        return 1;
    }

    if (std::strcmp(cmd, "run") == 0) return cmd_run(opts);
    if (std::strcmp(cmd, "check") == 0) return cmd_check(opts);
    if (std::strcmp(cmd, "steps") == 0) return cmd_steps(opts);
    return cmd_validate(opts);
}

// ── Options ─────────────────────────────────────────────────

CLI::Options CLI::parse_options(int argc, char* argv[], int first) {
    Options opts;

    auto value_of = [&](int& i, const char* flag) -> std::string {
        if (i + 1 >= argc) throw UsageError(std::string(flag) + " requires a value");
        return argv[++i];
    };

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            opts.config_path = value_of(i, "--config");
        } else if (arg == "--dir") {
            opts.dir = value_of(i, "--dir");
        } else if (arg == "--set") {
            std::string kv = value_of(i, "--set");
            size_t eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw UsageError("--set expects key=value, got '" + kv + "'");
            }
            opts.sets.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        } else if (arg == "--values") {
            opts.values_file = value_of(i, "--values");
        } else if (arg == "--log") {
            opts.log_path = value_of(i, "--log");
        } else if (arg == "-y" || arg == "--yes") {
            opts.yes = true;
        } else if (arg == "--skip-checks") {
            opts.skip_checks = true;
        } else {
            throw UsageError("unknown option '" + arg + "'");
        }
    }
    return opts;
}

std::string CLI::resolve_config_path(const Options& opts) {
    if (!opts.config_path.empty()) return Config::expand_home(opts.config_path);
    return InstallerConfig::locate(Config::expand_home(opts.dir));
}

json CLI::yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) arr.push_back(yaml_to_json(item));
            return arr;
        }
        case YAML::NodeType::Scalar:
            return node.as<std::string>();
        default:
            return json();
    }
}

json CLI::provided_values(const Options& opts) {
    json values = json::object();

    if (!opts.values_file.empty()) {
        std::string path = Config::expand_home(opts.values_file);
        json loaded;
        try {
            loaded = yaml_to_json(YAML::LoadFile(path));
        } catch (const YAML::Exception& e) {
            throw UsageError("cannot read values file " + path + ": " + e.what());
        }
        if (!loaded.is_object()) throw UsageError("values file " + path + " must be a mapping");
        for (auto it = loaded.begin(); it != loaded.end(); ++it) values[it.key()] = it.value();
    }

    for (const auto& kv : opts.sets) {
        values[kv.first] = kv.second;
    }
    return values;
}

json CLI::collect_values(const InstallerConfig& config, const Options& opts) {
    json values = default_values(config.config_fields);

    json given = provided_values(opts);
    for (auto it = given.begin(); it != given.end(); ++it) values[it.key()] = it.value();

    // Text from the command line or a YAML file carries no type; the field does
    for (const auto& field : config.config_fields) {
        auto it = values.find(field.id);
        if (it != values.end() && it->is_string()) {
            *it = parse_field_input(field, it->get<std::string>());
        }
    }
    return values;
}

CommandRunner::Options CLI::runner_options(const AppConfig& settings) {
    CommandRunner::Options o;
    o.default_timeout_ms = settings.default_timeout_ms;
    o.precheck_timeout_ms = settings.precheck_timeout_ms;
    o.shell = settings.shell;
    o.extra_safe_commands = settings.extra_safe_commands;
    return o;
}

std::string CLI::log_export_path(const Options& opts, const AppConfig& settings) {
    if (!opts.log_path.empty()) return Config::expand_home(opts.log_path);
    if (settings.log_export_dir.empty()) return "";

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm_buf);
    return (fs::path(Config::expand_home(settings.log_export_dir)) / ("setuptui-" + std::string(stamp) + ".log")).string();
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "setuptui-cpp - interactive installer driven by a JSON document\n"
        "\n"
        "Usage:\n"
        "  setuptui-cpp                      Launch TUI (default)\n"
        "  setuptui-cpp run [options]        Run the installation headless\n"
        "  setuptui-cpp check [options]      Run pre-checks only\n"
        "  setuptui-cpp steps [options]      List the steps that would run\n"
        "  setuptui-cpp validate [options]   Validate the document and values\n"
        "  setuptui-cpp version              Show version\n"
        "  setuptui-cpp help                 Show this help\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>   Installer document\n"
        "  --dir <dir>           Look for installer-config-advanced.json or\n"
        "                        installer-config.json here (default: .)\n"
        "  --set key=value       Set a configuration value (repeatable)\n"
        "  --values <file>       Read configuration values from YAML/JSON\n"
        "  -y, --yes             Accept defaults, never ask questions\n"
        "  --skip-checks         Skip pre-checks before running\n"
        "  --log <file>          Write the run log to a file\n"
        "\n"
        "Settings: " << Config::config_path() << "\n"
        "\n"
        "Keyboard shortcuts (TUI mode):\n"
        "  Tab/Arrows  Move between fields\n"
        "  Enter       Confirm\n"
        "  E           Export log (after the run)\n"
        "  Q           Quit\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "setuptui-cpp " << APP_VERSION << "\n";
    return 0;
}

// ── Shared steps ────────────────────────────────────────────

bool CLI::load_document(const Options& opts, InstallerConfig& out) {
    std::string path = resolve_config_path(opts);
    if (path.empty()) {
        std::cerr << "Error: no " << InstallerConfig::kAdvancedFileName << " or "
                  << InstallerConfig::kBasicFileName << " in " << opts.dir << "\n";
        return false;
    }
    try {
        out = InstallerConfig::load_file(path);
    } catch (const ConfigLoadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }
    return true;
}

std::string CLI::read_answer(const std::string& question, bool& eof) {
    std::cout << question << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        eof = true;
        std::cout << "\n";
        return "";
    }
    eof = false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

bool CLI::ask_missing_fields(const InstallerConfig& config, const json& given, json& values) {
    for (const auto& field : config.config_fields) {
        if (given.contains(field.id) &&
            validate_field(field, values.contains(field.id) ? values[field.id] : json()).empty()) {
            continue;
        }
        for (;;) {
            json current = values.contains(field.id) ? values[field.id] : json();
            std::string question = field.label.empty() ? field.id : field.label;
            if (!field.description.empty()) std::cout << "  " << field.description << "\n";
            if (field.type == "select") {
                for (const auto& opt : field.options) {
                    std::cout << "    - " << opt.value;
                    if (!opt.label.empty() && opt.label != opt.value) std::cout << " (" << opt.label << ")";
                    std::cout << "\n";
                }
            }
            if (field.type != "password" && !current.is_null()) {
                std::string shown = format_value(current, TemplateMode::Display);
                if (!shown.empty()) question += " [" + shown + "]";
            }

            bool eof = false;
            std::string text = read_answer(question + ": ", eof);
            if (!text.empty()) values[field.id] = parse_field_input(field, text);

            std::string error = validate_field(field, values.contains(field.id) ? values[field.id] : json());
            if (error.empty()) break;
            std::cerr << "  " << error << "\n";
            if (eof) return false;
        }
    }
    return true;
}

// ── run ─────────────────────────────────────────────────────

int CLI::cmd_run(const Options& opts) {
    Config settings;
    settings.load();

    InstallerConfig config;
    if (!load_document(opts, config)) return 1;

    json values;
    json given;
    try {
        given = provided_values(opts);
        values = collect_values(config, opts);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!opts.yes && !config.config_fields.empty()) {
        std::cout << "Configuration for " << config.installer.name << "\n";
        if (!ask_missing_fields(config, given, values)) return 1;
    }

    auto errors = validate_fields(config.config_fields, values);
    if (!errors.empty()) {
        for (const auto& kv : errors) std::cerr << "Error: " << kv.first << ": " << kv.second << "\n";
        return 1;
    }

    Orchestrator::Options run_opts;
    run_opts.display_delay_ms = opts.yes ? 0 : settings.data().display_delay_ms;
    Orchestrator orch(config, CommandRunner(runner_options(settings.data())), run_opts);
    orch.save_user_config(values);

    if (!opts.skip_checks && !config.pre_checks.empty()) {
        std::cout << "Running pre-checks...\n";
        auto results = orch.run_prechecks();
        for (const auto& r : results) {
            std::cout << "  [" << precheck_status_name(r.status) << "] " << r.name << ": " << r.message << "\n";
        }
        if (!PreCheckRunner::all_passed(results)) {
            std::cerr << "Error: pre-checks failed\n";
            return 1;
        }
    }

    ConsoleObserver console;
    orch.add_observer(&console);
    orch.start();

    while (orch.state() == RunState::Suspended) {
        const PromptRequest* prompt = orch.pending_prompt();
        if (!prompt) break;
        const InstallCommand cmd = prompt->command;

        json answer;
        bool eof = opts.yes;
        if (!opts.yes) {
            if (!prompt->error.empty()) std::cerr << "  " << prompt->error << "\n";
            answer = answer_for(cmd, read_answer(prompt_question(*prompt), eof));
        }

        ResumeResult res = orch.resume(answer);
        if (!res.accepted && eof) {
            std::cerr << "Error: no usable answer for '" << prompt->message << "': " << res.error << "\n";
            break;
        }
    }
    orch.remove_observer(&console);

    std::string log_path = log_export_path(opts, settings.data());
    if (!log_path.empty()) {
        if (orch.log().export_to(log_path)) {
            std::cout << "Log written to " << log_path << "\n";
        } else {
            std::cerr << "Warning: could not write log to " << log_path << "\n";
        }
    }

    return orch.state() == RunState::Completed ? 0 : 1;
}

// ── check ───────────────────────────────────────────────────

int CLI::cmd_check(const Options& opts) {
    Config settings;
    settings.load();

    InstallerConfig config;
    if (!load_document(opts, config)) return 1;

    json values;
    try {
        values = collect_values(config, opts);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    Orchestrator orch(config, CommandRunner(runner_options(settings.data())));
    orch.save_user_config(values);

    auto results = orch.run_prechecks();
    for (const auto& r : results) {
        std::cout << "[" << precheck_status_name(r.status) << "] " << r.name << ": " << r.message << "\n";
    }
    bool passed = PreCheckRunner::all_passed(results);
    std::cout << (passed ? "All checks passed" : "Some checks failed") << "\n";
    return passed ? 0 : 1;
}

// ── steps ───────────────────────────────────────────────────

int CLI::cmd_steps(const Options& opts) {
    InstallerConfig config;
    if (!load_document(opts, config)) return 1;

    json values;
    try {
        values = collect_values(config, opts);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    Orchestrator orch(config, CommandRunner());
    orch.save_user_config(values);

    auto steps = orch.install_steps();
    for (size_t i = 0; i < steps.size(); ++i) {
        const auto& s = steps[i];
        std::cout << (i + 1) << ". " << s.name;
        if (!s.description.empty()) std::cout << " - " << s.description;
        std::cout << " (" << s.commands.size() << (s.commands.size() == 1 ? " command" : " commands") << ")\n";
    }
    size_t skipped = config.install_steps.size() - steps.size();
    if (skipped > 0) std::cout << skipped << " step(s) skipped by condition\n";
    return 0;
}

// ── validate ────────────────────────────────────────────────

int CLI::cmd_validate(const Options& opts) {
    InstallerConfig config;
    if (!load_document(opts, config)) return 1;

    size_t commands = 0;
    for (const auto& s : config.install_steps) commands += s.commands.size();
    std::cout << config.installer.name << " " << config.installer.version << ": "
              << config.pre_checks.size() << " pre-checks, "
              << config.config_fields.size() << " fields, "
              << config.install_steps.size() << " steps, "
              << commands << " commands, "
              << config.post_install.size() << " post-install\n";

    json values;
    try {
        values = collect_values(config, opts);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto errors = validate_fields(config.config_fields, values);
    for (const auto& kv : errors) std::cerr << "Error: " << kv.first << ": " << kv.second << "\n";
    if (errors.empty()) std::cout << "Document and values are valid\n";
    return errors.empty() ? 0 : 1;
}
