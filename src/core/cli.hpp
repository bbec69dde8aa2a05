#pragma once

#include "core/command_runner.hpp"
#include "core/config.hpp"
#include "core/installer_config.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/// Bad command line or value file
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -1 if no subcommand (caller should launch TUI).
    static int run(int argc, char* argv[]);

    struct Options {
        std::string config_path;   // explicit document, overrides dir lookup
        std::string dir = ".";
        std::vector<std::pair<std::string, std::string>> sets;
        std::string values_file;
        bool yes = false;          // accept defaults, never read stdin
        bool skip_checks = false;
        std::string log_path;
    };

    /// Parse the options following the subcommand (argv[first..]); throws UsageError
    static Options parse_options(int argc, char* argv[], int first);

    /// --config when given, otherwise the document found in --dir
    static std::string resolve_config_path(const Options& opts);

    /// Values named on the command line: --values, then --set, untyped; throws UsageError
    static nlohmann::json provided_values(const Options& opts);

    /// Field defaults, then --values, then --set, typed per field; throws UsageError
    static nlohmann::json collect_values(const InstallerConfig& config, const Options& opts);

    /// Maps become objects, sequences arrays, scalars strings
    static nlohmann::json yaml_to_json(const YAML::Node& node);

    static CommandRunner::Options runner_options(const AppConfig& settings);

    /// --log when given, else a timestamped file in export_dir, else empty
    static std::string log_export_path(const Options& opts, const AppConfig& settings);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_run(const Options& opts);
    static int cmd_check(const Options& opts);
    static int cmd_steps(const Options& opts);
    static int cmd_validate(const Options& opts);

    static bool load_document(const Options& opts, InstallerConfig& out);
    /// Ask for each field not given on the command line, or given but invalid
    static bool ask_missing_fields(const InstallerConfig& config,
                                   const nlohmann::json& given,
                                   nlohmann::json& values);
    static std::string read_answer(const std::string& question, bool& eof);
};
