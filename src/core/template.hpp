#pragma once

#include "core/variable_store.hpp"

#include <nlohmann/json.hpp>
#include <string>

/// Where a resolved string ends up; decides how values are rendered
enum class TemplateMode {
    Command,  // shell command text: literal booleans, empty for missing
    Display   // human-facing text: Yes/No, "<not set>" for missing
};

/// Render one value the way a {{placeholder}} would
std::string format_value(const nlohmann::json& value, TemplateMode mode);

/// Replace every {{key}} in input with the value from vars.
/// Unknown keys render as missing values; an unclosed "{{" is left as-is.
std::string resolve_template(const std::string& input,
                             const VariableStore& vars,
                             TemplateMode mode = TemplateMode::Command);
