#include "ui/run_panel.hpp"
#include "core/template.hpp"
#include "core/validation.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <deque>
#include <mutex>

using namespace ftxui;
using json = nlohmann::json;

static const int MAX_LOG_LINES = 2000;

struct RunPanel::Impl {
    Callbacks callbacks;
    std::string title;

    // Written by the run worker, read by the renderer
    std::mutex mtx;
    std::deque<LogLine> lines;
    RunState state = RunState::Idle;
    std::string current_step;
    int steps_done = 0;
    std::string failure;
    bool has_display = false;
    DisplayContent display;
    bool has_prompt = false;
    PromptRequest prompt;
    std::string export_msg;

    // Prompt widget state, touched on the UI thread only
    std::string answer_text;
    bool answer_secret = false;
    bool confirm_value = false;
    int cursor = 0;
    std::vector<bool> checked;

    void post_refresh() {
        if (callbacks.post_refresh) callbacks.post_refresh();
    }

    Color line_color(LogLineType type) const {
        switch (type) {
            case LogLineType::Command: return Color::Cyan;
            case LogLineType::Output: return Color::White;
            case LogLineType::Error: return Color::Red;
            case LogLineType::Success: return Color::Green;
            case LogLineType::Info: return Color::GrayLight;
            case LogLineType::Step: return Color::Blue;
            case LogLineType::Variable: return Color::Magenta;
        }
        return Color::White;
    }

    void reset_widget(const PromptRequest& p, bool keep_text) {
        const InstallCommand& cmd = p.command;
        json initial = prompt_initial_value(cmd);

        answer_secret = cmd.prompt_type == "password";
        if (!keep_text) {
            answer_text = (initial.is_string() && !answer_secret) ? initial.get<std::string>() : "";
        }
        confirm_value = initial.is_boolean() ? initial.get<bool>() : parse_yes(format_value(initial, TemplateMode::Command));

        cursor = 0;
        checked.assign(cmd.options.size(), false);
        std::string current = format_value(initial, TemplateMode::Command);
        for (size_t i = 0; i < cmd.options.size(); ++i) {
            const auto& o = cmd.options[i];
            if (cmd.prompt_type == "select" && o.value == current) cursor = static_cast<int>(i);
            if (cmd.prompt_type == "multiselect") {
                bool on = o.selected;
                if (initial.is_array()) {
                    on = false;
                    for (const auto& v : initial) {
                        if (v.is_string() && v.get<std::string>() == o.value) on = true;
                    }
                }
                checked[i] = on;
            }
        }
    }

    json current_answer() const {
        const InstallCommand& cmd = prompt.command;
        if (cmd.prompt_type == "confirm") return confirm_value;
        if (cmd.prompt_type == "select") {
            if (cmd.options.empty()) return answer_text.empty() ? json() : json(answer_text);
            return cmd.options[cursor].value;
        }
        if (cmd.prompt_type == "multiselect") {
            json arr = json::array();
            for (size_t i = 0; i < cmd.options.size(); ++i) {
                if (checked[i]) arr.push_back(cmd.options[i].value);
            }
            return arr;
        }
        return answer_text.empty() ? json() : json(answer_text);
    }

    Element render_prompt(Component input) {
        const InstallCommand& cmd = prompt.command;
        Elements content;
        content.push_back(text(" " + prompt.message) | bold);
        if (!cmd.description.empty() && cmd.description != prompt.message) {
            content.push_back(text(" " + cmd.description) | dim);
        }
        content.push_back(separator());

        if (cmd.prompt_type == "confirm") {
            content.push_back(hbox({
                text(" "),
                text(" Yes ") | (confirm_value ? inverted : dim),
                text("  "),
                text(" No ") | (confirm_value ? dim : inverted),
            }));
        } else if (cmd.prompt_type == "select" && !cmd.options.empty()) {
            for (size_t i = 0; i < cmd.options.size(); ++i) {
                const auto& o = cmd.options[i];
                auto row = text((static_cast<int>(i) == cursor ? " > " : "   ") + (o.label.empty() ? o.value : o.label));
                content.push_back(static_cast<int>(i) == cursor ? row | inverted : row);
            }
        } else if (cmd.prompt_type == "multiselect") {
            for (size_t i = 0; i < cmd.options.size(); ++i) {
                const auto& o = cmd.options[i];
                auto row = text(std::string(static_cast<int>(i) == cursor ? " > " : "   ") +
                                (checked[i] ? "[x] " : "[ ] ") + (o.label.empty() ? o.value : o.label));
                content.push_back(static_cast<int>(i) == cursor ? row | inverted : row);
            }
        } else {
            content.push_back(hbox({text(" > "), input->Render() | flex}));
        }

        if (!prompt.error.empty()) {
            content.push_back(text(" " + prompt.error) | color(Color::Red));
        }
        content.push_back(separator());
        if (cmd.prompt_type == "multiselect") {
            content.push_back(text(" Up/Down = move, Space = toggle, Enter = submit") | dim);
        } else if (cmd.prompt_type == "confirm") {
            content.push_back(text(" Y/N or Left/Right, Enter = submit") | dim);
        } else {
            content.push_back(text(" Enter = submit") | dim);
        }
        return vbox(std::move(content)) | border | color(Color::Yellow);
    }

    Element render_display() {
        Elements content;
        content.push_back(text(" " + (display.title.empty() ? std::string("Information") : display.title)) | bold);
        content.push_back(separator());
        for (const auto& l : display.lines) content.push_back(text(" " + l));
        return vbox(std::move(content)) | border | color(Color::Cyan);
    }
};

RunPanel::RunPanel(std::string title) : impl_(std::make_unique<Impl>()) {
    impl_->title = std::move(title);
}

RunPanel::~RunPanel() = default;

void RunPanel::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

// ── Run events (worker thread) ──────────────────────────────────

void RunPanel::on_step_start(const std::string& name, const std::string& /*description*/) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->current_step = name;
        impl_->has_display = false;
    }
    impl_->post_refresh();
}

void RunPanel::on_step_complete(const std::string& /*name*/) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        ++impl_->steps_done;
    }
    impl_->post_refresh();
}

void RunPanel::on_step_error(const std::string& step, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->failure = step + ": " + error;
    }
    impl_->post_refresh();
}

void RunPanel::on_prompt(const PromptRequest& prompt) {
    auto self = impl_.get();
    auto show = [self, prompt]() {
        std::lock_guard<std::mutex> lock(self->mtx);
        self->prompt = prompt;
        self->has_prompt = true;
        self->has_display = false;
        self->reset_widget(prompt, !prompt.error.empty());
    };

    if (self->callbacks.post_task) {
        self->callbacks.post_task(show);
    } else {
        show();
    }
    self->post_refresh();
}

void RunPanel::on_display(const DisplayContent& display) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->display = display;
        impl_->has_display = true;
    }
    impl_->post_refresh();
}

void RunPanel::on_log_line(const LogLine& line) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->lines.push_back(line);
        while (static_cast<int>(impl_->lines.size()) > MAX_LOG_LINES) {
            impl_->lines.pop_front();
        }
    }
    impl_->post_refresh();
}

void RunPanel::on_state_changed(RunState state) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->state = state;
        if (state != RunState::Suspended) impl_->has_prompt = false;
    }
    impl_->post_refresh();
}

// ── Component ───────────────────────────────────────────────────

Component RunPanel::component() {
    auto self = impl_.get();

    InputOption opt;
    opt.password = &self->answer_secret;
    auto answer_input = Input(&self->answer_text, "", opt);
    auto container = Container::Vertical({answer_input});

    return Renderer(container, [self, answer_input] {
        std::lock_guard<std::mutex> lock(self->mtx);

        // Header: title, step, state
        Color state_color = Color::Yellow;
        if (self->state == RunState::Completed) state_color = Color::Green;
        if (self->state == RunState::Failed) state_color = Color::Red;
        auto header = hbox({
            text(" " + self->title) | bold,
            filler(),
            text(self->current_step.empty() ? "" : self->current_step + "  ") | dim,
            text("[" + std::string(run_state_name(self->state)) + "] ") | color(state_color) | bold,
        });

        Elements log_lines;
        for (const auto& l : self->lines) {
            log_lines.push_back(text(" " + l.content) | color(self->line_color(l.type)));
        }
        if (log_lines.empty()) {
            log_lines.push_back(text("  (waiting)") | dim);
        }
        auto log_view = vbox(std::move(log_lines)) | focusPositionRelative(0, 1);

        Elements body;
        body.push_back(header);
        body.push_back(separator());
        body.push_back(log_view | vscroll_indicator | frame | flex);

        if (self->has_display) body.push_back(self->render_display());
        if (self->has_prompt && self->state == RunState::Suspended) {
            body.push_back(self->render_prompt(answer_input));
        }

        if (self->state == RunState::Completed || self->state == RunState::Failed) {
            body.push_back(separator());
            if (self->state == RunState::Completed) {
                body.push_back(text(" Installation completed successfully") | color(Color::Green) | bold);
            } else {
                body.push_back(text(" Installation failed: " + self->failure) | color(Color::Red) | bold);
            }
            if (!self->export_msg.empty()) body.push_back(text(" " + self->export_msg) | dim);
            body.push_back(text(" E = export log, Q = quit") | dim);
        }

        return vbox(std::move(body)) | border;
    }) | CatchEvent([self](Event event) -> bool {
        std::unique_lock<std::mutex> lock(self->mtx);
        bool finished = self->state == RunState::Completed || self->state == RunState::Failed;

        if (finished) {
            if (event.is_character() && (event.character() == "e" || event.character() == "E")) {
                lock.unlock();
                std::string path = self->callbacks.export_log ? self->callbacks.export_log() : "";
                lock.lock();
                self->export_msg = path.empty() ? "Could not write the log" : "Log written to " + path;
                return true;
            }
            if (event.is_character() && (event.character() == "q" || event.character() == "Q")) {
                lock.unlock();
                if (self->callbacks.on_quit) self->callbacks.on_quit();
                return true;
            }
            return false;
        }

        if (!self->has_prompt || self->state != RunState::Suspended) return false;
        const InstallCommand& cmd = self->prompt.command;
        int n = static_cast<int>(cmd.options.size());

        if (event == Event::Return) {
            json answer = self->current_answer();
            self->has_prompt = false;
            lock.unlock();
            if (self->callbacks.submit_answer) self->callbacks.submit_answer(answer);
            return true;
        }

        if (cmd.prompt_type == "confirm") {
            if (event == Event::ArrowLeft || event == Event::ArrowRight || event == Event::Character(' ')) {
                self->confirm_value = !self->confirm_value;
                return true;
            }
            if (event.is_character() && (event.character() == "y" || event.character() == "Y")) {
                self->confirm_value = true;
                return true;
            }
            if (event.is_character() && (event.character() == "n" || event.character() == "N")) {
                self->confirm_value = false;
                return true;
            }
            return true;
        }

        if ((cmd.prompt_type == "select" || cmd.prompt_type == "multiselect") && n > 0) {
            if (event == Event::ArrowDown) {
                self->cursor = (self->cursor + 1) % n;
                return true;
            }
            if (event == Event::ArrowUp) {
                self->cursor = (self->cursor + n - 1) % n;
                return true;
            }
            if (cmd.prompt_type == "multiselect" && event == Event::Character(' ')) {
                self->checked[self->cursor] = !self->checked[self->cursor];
                return true;
            }
            return true;
        }

        // Text prompts: let the input handle the key
        return false;
    });
}
