#pragma once

#include "core/precheck.hpp"

#include <ftxui/component/component.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class PreCheckPanel {
public:
    struct Callbacks {
        // Start the battery on a worker thread; update is called per check
        std::function<void(PreCheckRunner::UpdateCallback update, std::function<void()> done)> run_checks;
        std::function<void()> on_continue;
        std::function<void()> on_back;
        std::function<void()> post_refresh;
    };

    explicit PreCheckPanel(std::vector<std::string> names);
    ~PreCheckPanel();

    void set_callbacks(Callbacks cb);

    /// Reset all rows to pending and start the checks
    void start();

    bool finished() const;
    bool all_passed() const;

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
