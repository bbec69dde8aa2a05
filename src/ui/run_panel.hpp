#pragma once

#include "core/orchestrator.hpp"

#include <ftxui/component/component.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>

/// Live installation view. Receives run events on the worker thread and
/// renders them on the UI thread.
class RunPanel : public RunObserver {
public:
    struct Callbacks {
        // Hand the answer to the run worker
        std::function<void(const nlohmann::json& answer)> submit_answer;
        // Write the run log; returns the path written, empty on failure
        std::function<std::string()> export_log;
        std::function<void()> on_quit;
        std::function<void()> post_refresh;
        // Run a task on the UI thread; used for state the input widgets own
        std::function<void(std::function<void()>)> post_task;
    };

    explicit RunPanel(std::string title);
    ~RunPanel() override;

    void set_callbacks(Callbacks cb);

    void on_step_start(const std::string& name, const std::string& description) override;
    void on_step_complete(const std::string& name) override;
    void on_step_error(const std::string& step, const std::string& error) override;
    void on_prompt(const PromptRequest& prompt) override;
    void on_display(const DisplayContent& display) override;
    void on_log_line(const LogLine& line) override;
    void on_state_changed(RunState state) override;

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
