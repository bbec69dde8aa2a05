#include "ui/config_form.hpp"
#include "core/template.hpp"
#include "core/validation.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <map>

using namespace ftxui;
using json = nlohmann::json;

struct FieldState {
    std::string text;
    bool checked = false;
    int selected = 0;
    bool secret = false;
};

struct ConfigForm::Impl {
    Callbacks callbacks;
    std::vector<ConfigField> fields;
    std::vector<FieldState> states;   // sized once; inputs hold pointers into it
    std::map<std::string, std::string> errors;

    void load(const json& initial) {
        states.resize(fields.size());
        for (size_t i = 0; i < fields.size(); ++i) {
            const auto& f = fields[i];
            auto& s = states[i];
            json v = initial.is_object() && initial.contains(f.id) ? initial.at(f.id) : f.default_value;

            if (f.type == "boolean") {
                s.checked = VariableStore::is_truthy(v);
            } else if (f.type == "select") {
                std::string current = format_value(v, TemplateMode::Command);
                for (size_t k = 0; k < f.options.size(); ++k) {
                    if (f.options[k].value == current) s.selected = static_cast<int>(k);
                }
            } else {
                s.text = format_value(v, TemplateMode::Command);
            }
            s.secret = f.type == "password";
        }
    }

    json collect() const {
        json values = json::object();
        for (size_t i = 0; i < fields.size(); ++i) {
            const auto& f = fields[i];
            const auto& s = states[i];
            if (f.type == "boolean") {
                values[f.id] = s.checked;
            } else if (f.type == "select") {
                if (!f.options.empty()) values[f.id] = f.options[s.selected].value;
            } else if (!s.text.empty()) {
                values[f.id] = parse_field_input(f, s.text);
            }
        }
        return values;
    }

    Component make_choice(size_t i) {
        return Renderer([this, i](bool focused) -> Element {
            const auto& f = fields[i];
            const auto& s = states[i];
            Element el;
            if (f.type == "boolean") {
                el = text(s.checked ? "[x] Yes" : "[ ] No");
            } else {
                Elements opts;
                for (size_t k = 0; k < f.options.size(); ++k) {
                    const auto& o = f.options[k];
                    auto item = text((static_cast<int>(k) == s.selected ? "(*) " : "( ) ") +
                                     (o.label.empty() ? o.value : o.label) + "  ");
                    if (static_cast<int>(k) == s.selected && focused) item = item | bold;
                    opts.push_back(item);
                }
                el = hbox(std::move(opts));
            }
            return focused ? el | inverted : el;
        }) | CatchEvent([this, i](Event event) -> bool {
            const auto& f = fields[i];
            auto& s = states[i];
            if (f.type == "boolean") {
                if (event == Event::Character(' ') || event == Event::Return) {
                    s.checked = !s.checked;
                    return true;
                }
                return false;
            }
            int n = static_cast<int>(f.options.size());
            if (n == 0) return false;
            if (event == Event::ArrowRight || event == Event::Character(' ')) {
                s.selected = (s.selected + 1) % n;
                return true;
            }
            if (event == Event::ArrowLeft) {
                s.selected = (s.selected + n - 1) % n;
                return true;
            }
            return false;
        });
    }
};

ConfigForm::ConfigForm(std::vector<ConfigField> fields, const json& initial)
    : impl_(std::make_unique<Impl>()) {
    impl_->fields = std::move(fields);
    impl_->load(initial);
}

ConfigForm::~ConfigForm() = default;

void ConfigForm::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

json ConfigForm::values() const { return impl_->collect(); }

bool ConfigForm::submit() {
    json values = impl_->collect();
    impl_->errors = validate_fields(impl_->fields, values);
    if (!impl_->errors.empty()) return false;
    if (impl_->callbacks.on_submit) impl_->callbacks.on_submit(values);
    return true;
}

Component ConfigForm::component() {
    auto self = impl_.get();

    Components inputs;
    for (size_t i = 0; i < self->fields.size(); ++i) {
        const auto& f = self->fields[i];
        if (f.type == "boolean" || f.type == "select") {
            inputs.push_back(self->make_choice(i));
        } else {
            InputOption opt;
            opt.password = self->states[i].secret;
            inputs.push_back(Input(&self->states[i].text, f.placeholder, opt));
        }
    }
    auto container = Container::Vertical(inputs);

    return Renderer(container, [self, container] {
        Elements rows;
        rows.push_back(text(" Configuration") | bold);
        rows.push_back(separator());

        if (self->fields.empty()) {
            rows.push_back(text(" Nothing to configure") | dim);
        }

        for (size_t i = 0; i < self->fields.size(); ++i) {
            const auto& f = self->fields[i];
            std::string label = f.label.empty() ? f.id : f.label;
            if (f.required) label += " *";
            rows.push_back(hbox({
                text(" " + label + ": ") | size(WIDTH, EQUAL, 28),
                container->ChildAt(i)->Render() | flex,
            }));
            if (!f.description.empty()) {
                rows.push_back(text("   " + f.description) | dim);
            }
            auto err = self->errors.find(f.id);
            if (err != self->errors.end()) {
                rows.push_back(text("   " + err->second) | color(Color::Red));
            }
        }

        rows.push_back(separator());
        rows.push_back(text(" Tab/Up/Down = move, Space/Left/Right = change, Ctrl+S = continue") | dim);
        return vbox(std::move(rows)) | border;
    }) | CatchEvent([this](Event event) -> bool {
        // Ctrl+S: submit
        if (event == Event::Special("\x13")) {
            submit();
            return true;
        }
        return false;
    });
}
