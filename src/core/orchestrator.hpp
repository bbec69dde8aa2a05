#pragma once

#include "core/command_runner.hpp"
#include "core/installer_config.hpp"
#include "core/precheck.hpp"
#include "core/run_log.hpp"
#include "core/variable_store.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <string>
#include <vector>

// ── Run data ───────────────────────────────────────────────────

enum class RunState { Idle, Running, Suspended, Completed, Failed };

const char* run_state_name(RunState state);

/// A prompt waiting for an answer
struct PromptRequest {
    std::string step;
    InstallCommand command;
    std::string message;   // resolved for display
    std::string error;     // set when the previous answer was rejected
};

/// Informational card shown to the user, already resolved
struct DisplayContent {
    std::string step;
    std::string title;
    std::vector<std::string> lines;
};

/// One executed command and its outcome
struct CommandRecord {
    std::string step;
    std::string description;
    ExecutionResult result;
};

struct ResumeResult {
    bool accepted = false;
    std::string error;
};

struct RunResult {
    bool success = false;
    std::string error;
    std::vector<LogLine> log;
    std::vector<CommandRecord> records;
};

/// Receives run events in the order they happen. All callbacks run on
/// the thread driving the orchestrator.
class RunObserver {
public:
    virtual ~RunObserver() = default;

    virtual void on_step_start(const std::string& /*name*/, const std::string& /*description*/) {}
    virtual void on_step_complete(const std::string& /*name*/) {}
    virtual void on_step_skipped(const std::string& /*name*/) {}
    virtual void on_step_error(const std::string& /*step*/, const std::string& /*error*/) {}
    virtual void on_command_output(const CommandOutput& /*output*/) {}
    virtual void on_prompt(const PromptRequest& /*prompt*/) {}
    virtual void on_display(const DisplayContent& /*display*/) {}
    virtual void on_log_line(const LogLine& /*line*/) {}
    virtual void on_state_changed(RunState /*state*/) {}
};

// ── Orchestrator ───────────────────────────────────────────────

/// Drives one installation run: steps and commands strictly in order,
/// suspending on prompts until resume() supplies an answer.
///
/// The orchestrator owns the run's variables and log; nothing else writes
/// to them. Completed and Failed are final; a retry needs a new instance.
class Orchestrator {
public:
    struct Options {
        int display_delay_ms = 3000;
    };

    Orchestrator(InstallerConfig config, CommandRunner runner);
    Orchestrator(InstallerConfig config, CommandRunner runner, Options options);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void add_observer(RunObserver* observer);
    void remove_observer(RunObserver* observer);

    // ── Before the run ─────────────────────────────────────────

    /// Seed the variables with user configuration. Only allowed while Idle.
    bool save_user_config(const nlohmann::json& values);

    /// Steps whose condition holds against the current variables
    std::vector<InstallStep> install_steps() const;

    /// Run the pre-check battery and store captured values
    std::vector<PreCheckResult> run_prechecks(const PreCheckRunner::UpdateCallback& on_update = nullptr);

    // ── Running ────────────────────────────────────────────────

    /// Leave Idle and run until the first prompt or the end.
    /// Returns false if the run was already started.
    bool start();

    /// Answer the pending prompt. A rejected answer keeps the run suspended
    /// on the same prompt; an accepted one continues to the next prompt or the end.
    ResumeResult resume(const nlohmann::json& value);

    // ── Inspection ─────────────────────────────────────────────

    RunState state() const { return state_.load(); }
    bool finished() const;

    /// The prompt being waited on, or nullptr
    const PromptRequest* pending_prompt() const;

    const InstallerConfig& config() const { return config_; }
    const VariableStore& variables() const { return vars_; }
    const RunLog& log() const { return log_; }
    const std::vector<CommandRecord>& records() const { return records_; }
    const std::string& failure() const { return failure_; }

    RunResult result() const;

private:
    enum class Phase { Steps, PostInstall, Done };
    enum class Outcome { Continue, Suspend, Fail };

    InstallerConfig config_;
    CommandRunner runner_;
    Options options_;
    std::vector<RunObserver*> observers_;

    VariableStore vars_;
    RunLog log_;
    std::vector<CommandRecord> records_;

    std::atomic<RunState> state_{RunState::Idle};
    Phase phase_ = Phase::Steps;
    size_t step_index_ = 0;
    size_t command_index_ = 0;
    bool step_started_ = false;
    bool has_pending_ = false;
    PromptRequest pending_;
    std::string failure_;

    void advance();
    Outcome process_command(const InstallStep& step, const InstallCommand& command);
    Outcome run_shell_command(const InstallStep& step, const InstallCommand& command);
    void run_post_install();
    void complete();
    void fail(const std::string& step, const std::string& error);

    bool condition_holds(const std::string& expr);
    void capture(const std::string& key, nlohmann::json value, bool secret);

    void set_state(RunState state);
    void append_line(LogLineType type, const std::string& content);
    std::string mask(const std::string& text) const;
    CommandOutputSink make_output_sink(std::string& out_buf, std::string& err_buf, bool sensitive);
    void flush_output(std::string& out_buf, std::string& err_buf, bool sensitive);

    template <typename Fn>
    void notify(Fn fn) {
        auto snapshot = observers_;
        for (auto* o : snapshot) fn(*o);
    }
};
