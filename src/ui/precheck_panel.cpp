#include "ui/precheck_panel.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <mutex>

using namespace ftxui;

struct PreCheckPanel::Impl {
    Callbacks callbacks;

    // Written by the check worker, read by the renderer
    mutable std::mutex mtx;
    std::vector<PreCheckResult> rows;
    bool running = false;
    bool done = false;

    void post_refresh() {
        if (callbacks.post_refresh) callbacks.post_refresh();
    }

    static const char* glyph(PreCheckStatus s) {
        switch (s) {
            case PreCheckStatus::Pending: return "  ";
            case PreCheckStatus::Running: return "..";
            case PreCheckStatus::Success: return "✓ ";
            case PreCheckStatus::Warning: return "! ";
            case PreCheckStatus::Error: return "✗ ";
        }
        return "  ";
    }

    static Color status_color(PreCheckStatus s) {
        switch (s) {
            case PreCheckStatus::Success: return Color::Green;
            case PreCheckStatus::Warning: return Color::Yellow;
            case PreCheckStatus::Error: return Color::Red;
            case PreCheckStatus::Running: return Color::Cyan;
            default: return Color::GrayDark;
        }
    }
};

PreCheckPanel::PreCheckPanel(std::vector<std::string> names) : impl_(std::make_unique<Impl>()) {
    for (auto& n : names) {
        PreCheckResult r;
        r.name = std::move(n);
        impl_->rows.push_back(std::move(r));
    }
}

PreCheckPanel::~PreCheckPanel() = default;

void PreCheckPanel::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

void PreCheckPanel::start() {
    auto self = impl_.get();
    {
        std::lock_guard<std::mutex> lock(self->mtx);
        if (self->running) return;
        for (auto& r : self->rows) {
            std::string name = r.name;
            r = PreCheckResult{};
            r.name = name;
        }
        self->running = true;
        self->done = false;
    }

    if (!self->callbacks.run_checks || self->rows.empty()) {
        std::lock_guard<std::mutex> lock(self->mtx);
        self->running = false;
        self->done = true;
        return;
    }

    self->callbacks.run_checks(
        [self](size_t index, const PreCheckResult& result) {
            {
                std::lock_guard<std::mutex> lock(self->mtx);
                if (index < self->rows.size()) self->rows[index] = result;
            }
            self->post_refresh();
        },
        [self]() {
            {
                std::lock_guard<std::mutex> lock(self->mtx);
                self->running = false;
                self->done = true;
            }
            self->post_refresh();
        });
}

bool PreCheckPanel::finished() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->done;
}

bool PreCheckPanel::all_passed() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->done && PreCheckRunner::all_passed(impl_->rows);
}

Component PreCheckPanel::component() {
    auto self = impl_.get();

    return Renderer([self](bool /*focused*/) -> Element {
        std::lock_guard<std::mutex> lock(self->mtx);

        Elements lines;
        for (const auto& r : self->rows) {
            Elements row = {
                text(" " + std::string(Impl::glyph(r.status)) + " ") | color(Impl::status_color(r.status)) | bold,
                text(r.name),
            };
            if (!r.message.empty()) {
                row.push_back(text("  " + r.message) | color(Impl::status_color(r.status)) | dim);
            }
            lines.push_back(hbox(std::move(row)));
        }
        if (lines.empty()) {
            lines.push_back(text("  (no checks)") | dim);
        }

        Element footer;
        if (self->running) {
            footer = text(" Running checks...") | color(Color::Yellow);
        } else if (self->done && PreCheckRunner::all_passed(self->rows)) {
            footer = text(" All checks passed. Enter = continue, R = re-run, Esc = back") | dim;
        } else if (self->done) {
            footer = text(" Some checks failed. R = re-run, Esc = back") | color(Color::Red);
        } else {
            footer = text(" R = run checks, Esc = back") | dim;
        }

        return vbox({
            text(" System checks") | bold,
            separator(),
            vbox(std::move(lines)) | frame | flex,
            separator(),
            footer,
        }) | border;
    }) | CatchEvent([this, self](Event event) -> bool {
        bool busy;
        {
            std::lock_guard<std::mutex> lock(self->mtx);
            busy = self->running;
        }
        if (busy) return false;

        if (event == Event::Return) {
            if (all_passed() && self->callbacks.on_continue) self->callbacks.on_continue();
            return true;
        }
        if (event == Event::Escape) {
            if (self->callbacks.on_back) self->callbacks.on_back();
            return true;
        }
        if (event.is_character() && (event.character() == "r" || event.character() == "R")) {
            start();
            return true;
        }
        return false;
    });
}
