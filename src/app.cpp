#include "app.hpp"
#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/installer_config.hpp"
#include "core/orchestrator.hpp"
#include "ui/config_form.hpp"
#include "ui/precheck_panel.hpp"
#include "ui/run_panel.hpp"

#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <thread>

using namespace ftxui;
using json = nlohmann::json;

struct App::Impl {
    Config settings;
    InstallerConfig document;
    std::string load_error;

    std::unique_ptr<ConfigForm> form;
    std::unique_ptr<PreCheckPanel> checks;
    std::unique_ptr<RunPanel> run_panel;
    std::unique_ptr<Orchestrator> orch;

    ScreenInteractive screen = ScreenInteractive::FullscreenAlternateScreen();

    int stage = 0;  // 0=form, 1=checks, 2=run
    Component stage_container;

    // One worker at a time drives the orchestrator
    std::thread worker;

    void join_worker() {
        if (worker.joinable()) worker.join();
    }

    void post_refresh() { screen.Post(Event::Custom); }

    void load_document(const std::string& dir) {
        std::string path = InstallerConfig::locate(Config::expand_home(dir));
        if (path.empty()) {
            load_error = std::string("No ") + InstallerConfig::kAdvancedFileName + " or " +
                         InstallerConfig::kBasicFileName + " in " + dir;
            return;
        }
        try {
            document = InstallerConfig::load_file(path);
        } catch (const ConfigLoadError& e) {
            load_error = e.what();
        }
    }

    void new_orchestrator(const json& values) {
        Orchestrator::Options opts;
        opts.display_delay_ms = settings.data().display_delay_ms;
        orch = std::make_unique<Orchestrator>(document, CommandRunner(CLI::runner_options(settings.data())), opts);
        orch->save_user_config(values);
    }

    std::string export_log() {
        if (!orch) return "";
        AppConfig target = settings.data();
        if (target.log_export_dir.empty()) target.log_export_dir = ".";
        std::string path = CLI::log_export_path(CLI::Options{}, target);
        return orch->log().export_to(path) ? path : "";
    }

    void auto_export() {
        if (orch && orch->finished() && !settings.data().log_export_dir.empty()) {
            export_log();
        }
    }

    // ── Stage transitions ──────────────────────────────────────

    void on_form_submitted(const json& values) {
        join_worker();
        new_orchestrator(values);
        if (document.pre_checks.empty()) {
            start_run();
            return;
        }
        stage = 1;
        checks->start();
    }

    void start_run() {
        join_worker();
        stage = 2;
        orch->add_observer(run_panel.get());
        worker = std::thread([this]() {
            orch->start();
            auto_export();
            post_refresh();
        });
    }

    void submit_answer(const json& answer) {
        join_worker();
        worker = std::thread([this, answer]() {
            orch->resume(answer);
            auto_export();
            post_refresh();
        });
    }

    void setup_panels() {
        form = std::make_unique<ConfigForm>(document.config_fields, json::object());
        {
            ConfigForm::Callbacks fcb;
            fcb.on_submit = [this](const json& values) { on_form_submitted(values); };
            form->set_callbacks(std::move(fcb));
        }

        std::vector<std::string> names;
        for (const auto& c : document.pre_checks) names.push_back(c.name);
        checks = std::make_unique<PreCheckPanel>(std::move(names));
        {
            PreCheckPanel::Callbacks ccb;
            ccb.run_checks = [this](PreCheckRunner::UpdateCallback update, std::function<void()> done) {
                join_worker();
                worker = std::thread([this, update, done]() {
                    orch->run_prechecks(update);
                    done();
                });
            };
            ccb.on_continue = [this]() { start_run(); };
            ccb.on_back = [this]() { stage = 0; };
            ccb.post_refresh = [this]() { post_refresh(); };
            checks->set_callbacks(std::move(ccb));
        }

        std::string title = document.installer.name;
        if (!document.installer.version.empty()) title += " " + document.installer.version;
        run_panel = std::make_unique<RunPanel>(title);
        {
            RunPanel::Callbacks rcb;
            rcb.submit_answer = [this](const json& answer) { submit_answer(answer); };
            rcb.export_log = [this]() { return export_log(); };
            rcb.on_quit = [this]() { screen.Exit(); };
            rcb.post_refresh = [this]() { post_refresh(); };
            rcb.post_task = [this](std::function<void()> task) { screen.Post(std::move(task)); };
            run_panel->set_callbacks(std::move(rcb));
        }

        stage_container = Container::Tab({
            form->component(),
            checks->component(),
            run_panel->component(),
        }, &stage);
    }
};

App::App(const std::string& dir) : impl_(std::make_unique<Impl>()) {
    // Load settings (use defaults if file doesn't exist)
    impl_->settings.load();
    impl_->load_document(dir);
    if (impl_->load_error.empty()) {
        impl_->setup_panels();
    }
}

App::~App() {
    impl_->join_worker();
    if (impl_->orch && impl_->run_panel) impl_->orch->remove_observer(impl_->run_panel.get());
}

void App::run() {
    auto self = impl_.get();

    if (!self->load_error.empty()) {
        auto error_view = Renderer([self] {
            return vbox({
                text(" Cannot load installer") | color(Color::Red) | bold,
                separator(),
                paragraph(" " + self->load_error),
                separator(),
                text(" Q = quit") | dim,
            }) | border;
        }) | CatchEvent([self](Event event) -> bool {
            if (event == Event::Escape ||
                (event.is_character() && (event.character() == "q" || event.character() == "Q"))) {
                self->screen.Exit();
                return true;
            }
            return false;
        });
        self->screen.Loop(error_view);
        return;
    }

    auto root = Renderer(self->stage_container, [self] {
        return vbox({
            hbox({
                text(" setuptui-cpp ") | bold | inverted,
                text(" " + self->document.installer.name) | bold,
                filler(),
                text(self->document.installer.description + " ") | dim,
            }),
            self->stage_container->Render() | flex,
        });
    }) | CatchEvent([self](Event event) -> bool {
        // Esc on the form leaves before anything has run
        if (self->stage == 0 && event == Event::Escape) {
            self->screen.Exit();
            return true;
        }
        return false;
    });

    // Nothing to configure: go straight to the checks
    if (self->document.config_fields.empty()) {
        self->on_form_submitted(json::object());
    }

    self->screen.Loop(root);
    self->join_worker();
}
