#pragma once

#include "core/installer_config.hpp"
#include "core/safety.hpp"
#include "core/variable_store.hpp"
#include "exec/process_executor.hpp"

#include <functional>
#include <string>
#include <vector>

/// One chunk of streamed output, tagged with the command's description
struct CommandOutput {
    OutputStream stream;
    std::string data;
    std::string command;
};

using CommandOutputSink = std::function<void(const CommandOutput&)>;

struct PreCheckOutcome {
    bool success = false;
    std::string output;
    std::string warning;   // empty = none
    std::string error;     // empty = none
};

/// Resolves, classifies and executes commands. Stateless between calls.
class CommandRunner {
public:
    struct Options {
        int default_timeout_ms = 30000;
        int precheck_timeout_ms = 10000;
        std::string shell = "/bin/sh";
        std::vector<std::string> extra_safe_commands;
    };

    CommandRunner();
    explicit CommandRunner(Options options);

    /// Resolve {{vars}} in cmd, simulate it unless safe, and run it
    ExecutionResult run_command(const InstallCommand& command, const VariableStore& vars) const;

    /// Same as run_command, forwarding output chunks to sink as they arrive
    ExecutionResult stream_command(const InstallCommand& command,
                                   const VariableStore& vars,
                                   const CommandOutputSink& sink) const;

    /// Run an already resolved command line (used for post-install hooks)
    ExecutionResult run_resolved(const std::string& resolved,
                                 const std::string& description,
                                 bool safe,
                                 bool sensitive,
                                 int timeout_ms,
                                 const CommandOutputSink& sink) const;

    /// Run one diagnostic check; pattern and threshold rules applied
    PreCheckOutcome run_precheck(const PreCheck& check, const VariableStore& vars) const;

    const SafetyClassifier& classifier() const { return classifier_; }
    const Options& options() const { return options_; }

    static constexpr const char* kRedacted = "[REDACTED]";

private:
    Options options_;
    SafetyClassifier classifier_;
    ProcessExecutor executor_;
};
