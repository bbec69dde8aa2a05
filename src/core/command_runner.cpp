#include "core/command_runner.hpp"
#include "core/template.hpp"

#include <regex>

CommandRunner::CommandRunner() : CommandRunner(Options{}) {}

CommandRunner::CommandRunner(Options options)
    : options_(std::move(options)),
      classifier_(options_.extra_safe_commands),
      executor_(options_.shell) {}

ExecutionResult CommandRunner::run_resolved(const std::string& resolved,
                                            const std::string& description,
                                            bool safe,
                                            bool sensitive,
                                            int timeout_ms,
                                            const CommandOutputSink& sink) const {
    SafetyDecision decision = classifier_.classify(resolved, safe);

    OutputSink chunk_sink;
    if (sink) {
        chunk_sink = [&sink, &description](OutputStream stream, const std::string& chunk) {
            sink(CommandOutput{stream, chunk, description});
        };
    }

    int timeout = timeout_ms > 0 ? timeout_ms : options_.default_timeout_ms;
    ExecutionResult result = executor_.run(decision.command, timeout, chunk_sink);

    if (!result.success && result.error.empty() && result.exit_code >= 0) {
        result.error = "Command exited with code " + std::to_string(result.exit_code);
    }
    result.command = sensitive ? kRedacted : decision.command;
    return result;
}

ExecutionResult CommandRunner::stream_command(const InstallCommand& command,
                                              const VariableStore& vars,
                                              const CommandOutputSink& sink) const {
    std::string resolved = resolve_template(command.cmd, vars, TemplateMode::Command);
    ExecutionResult result = run_resolved(resolved, command.description, command.safe,
                                          command.sensitive, command.timeout_ms, sink);

    if (command.has_expected_exit_code && !result.timed_out && result.exit_code >= 0) {
        result.success = (result.exit_code == command.expected_exit_code);
        if (result.success) {
            result.error.clear();
        } else {
            result.error = "Expected exit code " + std::to_string(command.expected_exit_code) +
                           ", got " + std::to_string(result.exit_code);
        }
    }
    return result;
}

ExecutionResult CommandRunner::run_command(const InstallCommand& command, const VariableStore& vars) const {
    return stream_command(command, vars, nullptr);
}

PreCheckOutcome CommandRunner::run_precheck(const PreCheck& check, const VariableStore& vars) const {
    PreCheckOutcome outcome;

    std::string resolved = resolve_template(check.command, vars, TemplateMode::Command);
    ExecutionResult result = run_resolved(resolved, check.name, check.safe, false,
                                          options_.precheck_timeout_ms, nullptr);
    outcome.output = result.output;

    if (check.has_expected_exit_code && !result.timed_out && result.exit_code >= 0) {
        if (result.exit_code != check.expected_exit_code) {
            outcome.error = "Expected exit code " + std::to_string(check.expected_exit_code) +
                            ", got " + std::to_string(result.exit_code);
            return outcome;
        }
    } else if (!result.success) {
        outcome.error = result.error;
        if (outcome.output.empty()) outcome.output = result.error;
        return outcome;
    }

    if (!check.expected_pattern.empty()) {
        bool matched = false;
        try {
            std::regex re(check.expected_pattern, std::regex::ECMAScript | std::regex::icase);
            matched = std::regex_search(outcome.output, re);
        } catch (const std::regex_error& e) {
            outcome.error = "Invalid expected pattern '" + check.expected_pattern + "': " + e.what();
            return outcome;
        }
        if (!matched) {
            outcome.error = "Output doesn't match expected pattern: " + check.expected_pattern;
            return outcome;
        }
    }

    outcome.success = true;
    if (!check.min_required.empty()) {
        outcome.warning = "Ensure at least " + check.min_required + " is available";
    }
    return outcome;
}
