#include "core/orchestrator.hpp"
#include "core/condition.hpp"
#include "core/template.hpp"
#include "core/validation.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

static const char* kMasked = "********";

static std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::Running: return "running";
        case RunState::Suspended: return "suspended";
        case RunState::Completed: return "completed";
        case RunState::Failed: return "failed";
    }
    return "idle";
}

Orchestrator::Orchestrator(InstallerConfig config, CommandRunner runner)
    : Orchestrator(std::move(config), std::move(runner), Options{}) {}

Orchestrator::Orchestrator(InstallerConfig config, CommandRunner runner, Options options)
    : config_(std::move(config)), runner_(std::move(runner)), options_(options) {
    for (const auto& field : config_.config_fields) {
        if (field.type == "password") vars_.mark_sensitive(field.id);
    }
}

void Orchestrator::add_observer(RunObserver* observer) {
    if (!observer) return;
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void Orchestrator::remove_observer(RunObserver* observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

// ── Before the run ─────────────────────────────────────────────

bool Orchestrator::save_user_config(const nlohmann::json& values) {
    if (state() != RunState::Idle || !values.is_object()) return false;
    vars_.merge(values);
    return true;
}

std::vector<InstallStep> Orchestrator::install_steps() const {
    std::vector<InstallStep> steps;
    for (const auto& step : config_.install_steps) {
        bool include = true;
        if (!step.condition.empty()) {
            try {
                include = evaluate_condition(step.condition, vars_);
            } catch (const ConditionEvalError&) {
                include = false;
            }
        }
        if (include) steps.push_back(step);
    }
    return steps;
}

std::vector<PreCheckResult> Orchestrator::run_prechecks(const PreCheckRunner::UpdateCallback& on_update) {
    PreCheckRunner checker(runner_);
    auto results = checker.run_all(config_.pre_checks, vars_, on_update);
    if (state() == RunState::Idle) {
        for (const auto& r : results) {
            if (!r.capture_as.empty() && r.status != PreCheckStatus::Error) {
                vars_.set(r.capture_as, r.captured);
            }
        }
    }
    return results;
}

// ── Running ────────────────────────────────────────────────────

bool Orchestrator::start() {
    if (state() != RunState::Idle) return false;

    set_state(RunState::Running);
    std::string title = config_.installer.name.empty() ? "installation" : config_.installer.name;
    append_line(LogLineType::Info, "Starting " + title);
    advance();
    return true;
}

ResumeResult Orchestrator::resume(const nlohmann::json& value) {
    ResumeResult result;
    if (state() != RunState::Suspended || !has_pending_) {
        result.error = "No prompt is waiting for input";
        return result;
    }

    const InstallCommand& prompt = pending_.command;
    nlohmann::json answer;
    try {
        answer = coerce_prompt_answer(prompt, value);
    } catch (const PromptValidationError& e) {
        pending_.error = e.what();
        result.error = e.what();
        PromptRequest again = pending_;
        notify([&](RunObserver& o) { o.on_prompt(again); });
        return result;
    }

    if (!prompt.capture_as.empty()) {
        capture(prompt.capture_as, std::move(answer), prompt.prompt_type == "password");
    }

    has_pending_ = false;
    pending_ = PromptRequest{};
    ++command_index_;
    result.accepted = true;

    set_state(RunState::Running);
    advance();
    return result;
}

bool Orchestrator::finished() const {
    RunState s = state();
    return s == RunState::Completed || s == RunState::Failed;
}

const PromptRequest* Orchestrator::pending_prompt() const {
    return has_pending_ ? &pending_ : nullptr;
}

RunResult Orchestrator::result() const {
    RunResult r;
    r.success = state() == RunState::Completed;
    r.error = failure_;
    r.log = log_.lines();
    r.records = records_;
    return r;
}

// ── Step loop ──────────────────────────────────────────────────

void Orchestrator::advance() {
    while (phase_ == Phase::Steps && step_index_ < config_.install_steps.size()) {
        const InstallStep& step = config_.install_steps[step_index_];

        if (!step_started_) {
            if (!condition_holds(step.condition)) {
                append_line(LogLineType::Info, "Skipping step: " + step.name + " (condition not met)");
                notify([&](RunObserver& o) { o.on_step_skipped(step.name); });
                ++step_index_;
                continue;
            }
            step_started_ = true;
            command_index_ = 0;
            append_line(LogLineType::Step, step.name);
            if (!step.description.empty()) append_line(LogLineType::Info, step.description);
            notify([&](RunObserver& o) { o.on_step_start(step.name, step.description); });
        }

        while (command_index_ < step.commands.size()) {
            Outcome outcome = process_command(step, step.commands[command_index_]);
            if (outcome != Outcome::Continue) return;
            ++command_index_;
        }

        notify([&](RunObserver& o) { o.on_step_complete(step.name); });
        step_started_ = false;
        ++step_index_;
    }

    if (phase_ == Phase::Steps) {
        phase_ = Phase::PostInstall;
        run_post_install();
        complete();
    }
}

Orchestrator::Outcome Orchestrator::process_command(const InstallStep& step, const InstallCommand& command) {
    if (!condition_holds(command.condition)) {
        append_line(LogLineType::Info, "Skipping: " + command.description + " (condition not met)");
        return Outcome::Continue;
    }

    switch (command.kind) {
        case CommandKind::Display: {
            DisplayContent display;
            display.step = step.name;
            display.title = mask(resolve_template(command.title, vars_, TemplateMode::Display));
            for (const auto& line : command.content) {
                display.lines.push_back(mask(resolve_template(line, vars_, TemplateMode::Display)));
            }
            append_line(LogLineType::Info,
                        "Displaying: " + (display.title.empty() ? std::string("Information") : display.title));
            notify([&](RunObserver& o) { o.on_display(display); });
            if (options_.display_delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(options_.display_delay_ms));
            }
            return Outcome::Continue;
        }

        case CommandKind::Prompt: {
            std::string what = command.description.empty() ? command.message : command.description;
            append_line(LogLineType::Info, "User input required: " + what);

            pending_ = PromptRequest{};
            pending_.step = step.name;
            pending_.command = command;
            pending_.message = mask(resolve_template(
                command.message.empty() ? command.description : command.message, vars_, TemplateMode::Display));
            has_pending_ = true;
            set_state(RunState::Suspended);

            // Last thing before returning: an observer may resume synchronously.
            PromptRequest request = pending_;
            notify([&](RunObserver& o) { o.on_prompt(request); });
            return Outcome::Suspend;
        }

        case CommandKind::Command:
            return run_shell_command(step, command);
    }
    return Outcome::Continue;
}

Orchestrator::Outcome Orchestrator::run_shell_command(const InstallStep& step, const InstallCommand& command) {
    if (trim_copy(command.cmd).empty()) {
        append_line(LogLineType::Error, "No command specified for: " + command.description);
        return Outcome::Continue;
    }

    append_line(LogLineType::Command, "$ " + command.description);

    std::string out_buf;
    std::string err_buf;
    ExecutionResult result = runner_.stream_command(command, vars_,
                                                    make_output_sink(out_buf, err_buf, command.sensitive));
    flush_output(out_buf, err_buf, command.sensitive);

    records_.push_back(CommandRecord{step.name, command.description, result});

    if (result.success) {
        if (!command.capture_as.empty()) {
            std::string captured = trim_copy(result.output);
            if (captured.empty() && command.has_default_value) {
                capture(command.capture_as, command.default_value, command.sensitive);
            } else {
                capture(command.capture_as, captured, command.sensitive);
            }
        }
        append_line(LogLineType::Success, "✓ " + command.description + " completed");
        return Outcome::Continue;
    }

    if (!command.capture_as.empty() && command.has_default_value) {
        vars_.set(command.capture_as, command.default_value);
        if (command.sensitive) vars_.mark_sensitive(command.capture_as);
        bool hidden = command.sensitive || vars_.is_sensitive(command.capture_as);
        append_line(LogLineType::Info, "Using default value for " + command.capture_as + ": " +
                                           (hidden ? std::string(kMasked) : command.default_value));
        return Outcome::Continue;
    }

    append_line(LogLineType::Error, "✗ Command failed: " + mask(result.error));
    if (command.safe) return Outcome::Continue;

    fail(step.name, result.error);
    return Outcome::Fail;
}

void Orchestrator::run_post_install() {
    if (config_.post_install.empty()) return;

    append_line(LogLineType::Step, "Post-install");
    for (const auto& post : config_.post_install) {
        if (trim_copy(post.command).empty()) continue;
        std::string resolved = resolve_template(post.command, vars_, TemplateMode::Command);
        append_line(LogLineType::Command, "$ " + post.name);

        std::string out_buf;
        std::string err_buf;
        ExecutionResult result = runner_.run_resolved(resolved, post.name, post.safe, false, 0,
                                                      make_output_sink(out_buf, err_buf, false));
        flush_output(out_buf, err_buf, false);
        records_.push_back(CommandRecord{"post-install", post.name, result});

        if (result.success) {
            append_line(LogLineType::Success, "✓ " + post.name + " completed");
        } else {
            append_line(LogLineType::Error, "Post-install command failed: " + post.name + ": " + mask(result.error));
        }
    }
}

void Orchestrator::complete() {
    phase_ = Phase::Done;
    append_line(LogLineType::Success, "Installation completed successfully");

    bool header = false;
    for (const auto& key : vars_.keys()) {
        if (vars_.is_sensitive(key)) continue;
        if (!header) {
            append_line(LogLineType::Info, "Final configuration:");
            header = true;
        }
        append_line(LogLineType::Variable, "  " + key + ": " + format_value(vars_.get(key), TemplateMode::Display));
    }
    set_state(RunState::Completed);
}

void Orchestrator::fail(const std::string& step, const std::string& error) {
    phase_ = Phase::Done;
    failure_ = step + ": " + mask(error);
    append_line(LogLineType::Error, "Installation failed: " + failure_);
    std::string masked = mask(error);
    notify([&](RunObserver& o) { o.on_step_error(step, masked); });
    set_state(RunState::Failed);
}

// ── Helpers ────────────────────────────────────────────────────

bool Orchestrator::condition_holds(const std::string& expr) {
    if (trim_copy(expr).empty()) return true;
    try {
        return evaluate_condition(expr, vars_);
    } catch (const ConditionEvalError& e) {
        append_line(LogLineType::Error, "Condition error in '" + expr + "': " + e.what());
        return false;
    }
}

void Orchestrator::capture(const std::string& key, nlohmann::json value, bool secret) {
    if (secret) vars_.mark_sensitive(key);
    std::string shown = vars_.is_sensitive(key) ? std::string(kMasked) : format_value(value, TemplateMode::Display);
    vars_.set(key, std::move(value));
    append_line(LogLineType::Variable, "Captured " + key + ": " + shown);
}

void Orchestrator::set_state(RunState state) {
    if (state_.exchange(state) == state) return;
    notify([&](RunObserver& o) { o.on_state_changed(state); });
}

void Orchestrator::append_line(LogLineType type, const std::string& content) {
    LogLine line = log_.append(type, mask(content));
    notify([&](RunObserver& o) { o.on_log_line(line); });
}

std::string Orchestrator::mask(const std::string& text) const {
    std::string out = text;
    for (const auto& secret : vars_.sensitive_values()) {
        if (secret.empty()) continue;
        size_t pos = 0;
        while ((pos = out.find(secret, pos)) != std::string::npos) {
            out.replace(pos, secret.size(), kMasked);
            pos += std::char_traits<char>::length(kMasked);
        }
    }
    return out;
}

CommandOutputSink Orchestrator::make_output_sink(std::string& out_buf, std::string& err_buf, bool sensitive) {
    return [this, &out_buf, &err_buf, sensitive](const CommandOutput& chunk) {
        CommandOutput shown = chunk;
        shown.data = sensitive ? std::string(kMasked) : mask(chunk.data);
        notify([&](RunObserver& o) { o.on_command_output(shown); });

        if (sensitive) return;
        std::string& buf = chunk.stream == OutputStream::Stdout ? out_buf : err_buf;
        LogLineType type = chunk.stream == OutputStream::Stdout ? LogLineType::Output : LogLineType::Error;
        buf += chunk.data;
        size_t nl;
        while ((nl = buf.find('\n')) != std::string::npos) {
            std::string line = buf.substr(0, nl);
            buf.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!trim_copy(line).empty()) append_line(type, line);
        }
    };
}

void Orchestrator::flush_output(std::string& out_buf, std::string& err_buf, bool sensitive) {
    if (sensitive) return;
    if (!trim_copy(out_buf).empty()) append_line(LogLineType::Output, out_buf);
    if (!trim_copy(err_buf).empty()) append_line(LogLineType::Error, err_buf);
    out_buf.clear();
    err_buf.clear();
}
