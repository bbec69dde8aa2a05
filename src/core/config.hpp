#pragma once

#include <string>
#include <vector>

struct AppConfig {
    // Runner
    int default_timeout_ms = 30000;
    int precheck_timeout_ms = 10000;
    int display_delay_ms = 3000;
    std::string shell = "/bin/sh";
    std::vector<std::string> extra_safe_commands;  // appended to the built-in allow-list

    // Log
    std::string log_export_dir;  // empty = don't export automatically
};

class Config {
public:
    Config();
    ~Config();

    /// Load from config_path(); false (defaults kept) if missing or malformed
    bool load();
    bool load_from(const std::string& path);

    bool save();
    bool save_to(const std::string& path) const;

    AppConfig& data();
    const AppConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
