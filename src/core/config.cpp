#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/setuptui-cpp";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/setuptui-cpp";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

bool Config::load() {
    return load_from(config_path());
}

bool Config::load_from(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    AppConfig loaded = config_;
    try {
        YAML::Node root = YAML::LoadFile(path);

        // Runner section
        if (auto runner = root["runner"]) {
            loaded.default_timeout_ms = runner["default_timeout_ms"].as<int>(loaded.default_timeout_ms);
            loaded.precheck_timeout_ms = runner["precheck_timeout_ms"].as<int>(loaded.precheck_timeout_ms);
            loaded.display_delay_ms = runner["display_delay_ms"].as<int>(loaded.display_delay_ms);
            loaded.shell = runner["shell"].as<std::string>(loaded.shell);

            if (auto extra = runner["extra_safe_commands"]) {
                loaded.extra_safe_commands.clear();
                for (const auto& cmd : extra) {
                    std::string s = cmd.as<std::string>("");
                    if (!s.empty()) loaded.extra_safe_commands.push_back(s);
                }
            }
        }

        // Log section
        if (auto log = root["log"]) {
            loaded.log_export_dir = expand_home(log["export_dir"].as<std::string>(loaded.log_export_dir));
        }
    } catch (const YAML::Exception& e) {
        std::cerr << "Warning: ignoring malformed settings " << path << ": " << e.what() << "\n";
        return false;
    }

    if (loaded.default_timeout_ms <= 0) loaded.default_timeout_ms = AppConfig{}.default_timeout_ms;
    if (loaded.precheck_timeout_ms <= 0) loaded.precheck_timeout_ms = AppConfig{}.precheck_timeout_ms;
    if (loaded.display_delay_ms < 0) loaded.display_delay_ms = 0;
    if (loaded.shell.empty()) loaded.shell = AppConfig{}.shell;

    config_ = std::move(loaded);
    return true;
}

bool Config::save() {
    return save_to(config_path());
}

bool Config::save_to(const std::string& path) const {
    if (path.empty()) return false;

    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Runner section
        out << YAML::Key << "runner" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "default_timeout_ms" << YAML::Value << config_.default_timeout_ms;
        out << YAML::Key << "precheck_timeout_ms" << YAML::Value << config_.precheck_timeout_ms;
        out << YAML::Key << "display_delay_ms" << YAML::Value << config_.display_delay_ms;
        out << YAML::Key << "shell" << YAML::Value << config_.shell;
        out << YAML::Key << "extra_safe_commands" << YAML::Value << YAML::BeginSeq;
        for (const auto& cmd : config_.extra_safe_commands) {
            out << cmd;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        // Log section
        out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "export_dir" << YAML::Value << config_.log_export_dir;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return fout.good();
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Warning: could not save settings: " << e.what() << "\n";
        return false;
    } catch (const YAML::Exception& e) {
        std::cerr << "Warning: could not save settings: " << e.what() << "\n";
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
