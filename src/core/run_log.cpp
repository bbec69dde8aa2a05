#include "core/run_log.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

const char* log_line_type_name(LogLineType type) {
    switch (type) {
        case LogLineType::Command: return "command";
        case LogLineType::Output: return "output";
        case LogLineType::Error: return "error";
        case LogLineType::Success: return "success";
        case LogLineType::Info: return "info";
        case LogLineType::Step: return "step";
        case LogLineType::Variable: return "variable";
    }
    return "info";
}

LogLine RunLog::append(LogLineType type, const std::string& content) {
    LogLine line{type, content, std::chrono::system_clock::now()};
    std::lock_guard<std::mutex> lock(mtx_);
    lines_.push_back(line);
    return line;
}

std::vector<LogLine> RunLog::lines() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lines_;
}

size_t RunLog::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lines_.size();
}

std::vector<LogLine> RunLog::lines_since(size_t from) const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (from >= lines_.size()) return {};
    return std::vector<LogLine>(lines_.begin() + static_cast<std::ptrdiff_t>(from), lines_.end());
}

bool RunLog::export_to(const std::string& path) const {
    auto snapshot = lines();

    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    std::ofstream out(path);
    if (!out.is_open()) return false;
    for (const auto& line : snapshot) {
        std::time_t t = std::chrono::system_clock::to_time_t(line.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);
        out << "[" << std::put_time(&tm, "%H:%M:%S") << "] "
            << "[" << log_line_type_name(line.type) << "] "
            << line.content << "\n";
    }
    return out.good();
}
