#pragma once

#include "core/installer_config.hpp"

#include <ftxui/component/component.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <vector>

/// One input per configuration field. Submits only when every field validates.
class ConfigForm {
public:
    struct Callbacks {
        std::function<void(const nlohmann::json& values)> on_submit;
    };

    ConfigForm(std::vector<ConfigField> fields, const nlohmann::json& initial);
    ~ConfigForm();

    void set_callbacks(Callbacks cb);

    /// Current values, typed per field
    nlohmann::json values() const;

    /// Validate, show errors inline, and submit if clean. Returns true if submitted.
    bool submit();

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
