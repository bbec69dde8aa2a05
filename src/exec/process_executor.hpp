#pragma once

#include <functional>
#include <string>

enum class OutputStream { Stdout, Stderr };

/// Receives each chunk of child output as soon as it is read
using OutputSink = std::function<void(OutputStream stream, const std::string& chunk)>;

/// Uniform outcome of one executed command. Never thrown, always returned.
struct ExecutionResult {
    bool success = false;
    std::string output;      // stdout and stderr chunks in arrival order
    int exit_code = -1;      // -1 when the process never exited normally
    std::string error;       // empty on success
    std::string command;     // as executed, or "[REDACTED]"
    bool timed_out = false;
};

/// Runs one shell command at a time in its own process group.
class ProcessExecutor {
public:
    static constexpr int kDefaultTimeoutMs = 30000;

    explicit ProcessExecutor(std::string shell = "/bin/sh");

    /// Spawn `<shell> -c command`, stream output to sink, and wait for exit.
    /// On timeout the whole process group is killed and reaped.
    /// timeout_ms <= 0 selects kDefaultTimeoutMs.
    ExecutionResult run(const std::string& command,
                        int timeout_ms = kDefaultTimeoutMs,
                        const OutputSink& sink = nullptr) const;

    const std::string& shell() const { return shell_; }

private:
    std::string shell_;
};
