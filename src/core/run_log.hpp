#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

enum class LogLineType { Command, Output, Error, Success, Info, Step, Variable };

struct LogLine {
    LogLineType type;
    std::string content;
    std::chrono::system_clock::time_point timestamp;
};

const char* log_line_type_name(LogLineType type);

/// Append-only audit trail of one run. Safe to read from a UI thread
/// while the run appends.
class RunLog {
public:
    RunLog() = default;

    /// Stamps the line with the current time and returns a copy of it
    LogLine append(LogLineType type, const std::string& content);

    std::vector<LogLine> lines() const;
    size_t size() const;

    /// Lines appended after the first `from` ones
    std::vector<LogLine> lines_since(size_t from) const;

    /// Write "[HH:MM:SS] [type] content" lines; false if the file can't be written
    bool export_to(const std::string& path) const;

private:
    mutable std::mutex mtx_;
    std::vector<LogLine> lines_;
};
