#include "core/validation.hpp"
#include "core/template.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>

using json = nlohmann::json;

static std::string lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string number_text(double d) {
    if (d == std::floor(d) && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<int64_t>(d));
    }
    return format_value(json(d), TemplateMode::Command);
}

static bool is_empty_value(const json& value) {
    if (value.is_null()) return true;
    if (value.is_string()) return value.get_ref<const std::string&>().empty();
    if (value.is_array()) return value.empty();
    return false;
}

/// Pattern found anywhere in text; an invalid pattern never matches
static bool matches_pattern(const std::string& pattern, const std::string& text) {
    try {
        return std::regex_search(text, std::regex(pattern, std::regex::ECMAScript));
    } catch (const std::regex_error&) {
        return false;
    }
}

static bool has_option(const std::vector<FieldOption>& options, const std::string& value) {
    return std::any_of(options.begin(), options.end(),
                       [&](const FieldOption& o) { return o.value == value; });
}

bool parse_yes(const std::string& text) {
    std::string t = lower_copy(trim_copy(text));
    return t == "y" || t == "yes" || t == "true" || t == "1";
}

// ── Configuration form fields ──────────────────────────────────

json default_values(const std::vector<ConfigField>& fields) {
    json values = json::object();
    for (const auto& f : fields) {
        if (!f.default_value.is_null()) {
            values[f.id] = f.default_value;
        } else if (f.type == "boolean") {
            values[f.id] = false;
        }
    }
    return values;
}

json parse_field_input(const ConfigField& field, const std::string& text) {
    if (field.type == "boolean") {
        return parse_yes(text);
    }
    if (field.type == "number") {
        std::string t = trim_copy(text);
        if (t.empty()) return json();
        try {
            size_t used = 0;
            double d = std::stod(t, &used);
            if (used == t.size()) {
                if (d == std::floor(d) && std::fabs(d) < 1e15) {
                    return json(static_cast<int64_t>(d));
                }
                return json(d);
            }
        } catch (const std::exception&) {
        }
        return json(t);
    }
    return json(text);
}

std::string validate_field(const ConfigField& field, const json& value) {
    if (field.required && field.type != "boolean" && is_empty_value(value)) {
        return field.label + " is required";
    }
    if (is_empty_value(value)) return "";

    if (field.type == "text" && !field.validation.empty()) {
        std::string text = format_value(value, TemplateMode::Command);
        if (!matches_pattern(field.validation, text)) {
            return "Invalid format for " + field.label;
        }
    }

    if (field.type == "password") {
        std::string text = format_value(value, TemplateMode::Command);
        int len = static_cast<int>(text.size());
        if (field.min_length >= 0 && len < field.min_length) {
            return "Minimum " + std::to_string(field.min_length) + " characters required";
        }
        if (field.max_length >= 0 && len > field.max_length) {
            return "Maximum " + std::to_string(field.max_length) + " characters allowed";
        }
    }

    if (field.type == "number") {
        double num = 0;
        if (value.is_number()) {
            num = value.get<double>();
        } else {
            try {
                size_t used = 0;
                std::string t = trim_copy(format_value(value, TemplateMode::Command));
                num = std::stod(t, &used);
                if (used != t.size()) return field.label + " must be a number";
            } catch (const std::exception&) {
                return field.label + " must be a number";
            }
        }
        if (field.has_min && num < field.min) {
            return "Minimum value is " + number_text(field.min);
        }
        if (field.has_max && num > field.max) {
            return "Maximum value is " + number_text(field.max);
        }
    }

    if (field.type == "select" && !field.options.empty()) {
        if (!has_option(field.options, format_value(value, TemplateMode::Command))) {
            return field.label + " must be one of the listed options";
        }
    }

    return "";
}

std::map<std::string, std::string> validate_fields(const std::vector<ConfigField>& fields,
                                                   const json& values) {
    std::map<std::string, std::string> errors;
    for (const auto& f : fields) {
        json value = values.is_object() && values.contains(f.id) ? values.at(f.id) : json();
        std::string err = validate_field(f, value);
        if (!err.empty()) errors[f.id] = err;
    }
    return errors;
}

// ── Interactive prompts ────────────────────────────────────────

json prompt_initial_value(const InstallCommand& prompt) {
    if (!prompt.prompt_default.is_null()) return prompt.prompt_default;
    if (prompt.prompt_type == "multiselect") {
        json selected = json::array();
        for (const auto& o : prompt.options) {
            if (o.selected) selected.push_back(o.value);
        }
        return selected;
    }
    return json();
}

static json split_list(const std::string& text) {
    json out = json::array();
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string item = trim_copy(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!item.empty()) out.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

json coerce_prompt_answer(const InstallCommand& prompt, const json& answer) {
    json value = answer;
    if (is_empty_value(value)) {
        json initial = prompt_initial_value(prompt);
        if (!is_empty_value(initial)) value = initial;
    }

    if (prompt.required && !prompt.allow_empty && is_empty_value(value)) {
        throw PromptValidationError("This field is required");
    }

    const std::string& type = prompt.prompt_type;

    if (type == "confirm") {
        if (value.is_boolean()) return value;
        if (value.is_number()) return value.get<double>() != 0.0;
        if (value.is_string()) return parse_yes(value.get<std::string>());
        return false;
    }

    if (type == "multiselect") {
        json list = json::array();
        if (value.is_array()) {
            for (const auto& e : value) {
                list.push_back(e.is_string() ? e.get<std::string>() : format_value(e, TemplateMode::Command));
            }
        } else if (value.is_string()) {
            list = split_list(value.get<std::string>());
        } else if (!value.is_null()) {
            list.push_back(format_value(value, TemplateMode::Command));
        }
        if (!prompt.options.empty()) {
            for (const auto& e : list) {
                if (!has_option(prompt.options, e.get<std::string>())) {
                    throw PromptValidationError("Unknown option: " + e.get<std::string>());
                }
            }
        }
        if (prompt.required && !prompt.allow_empty && list.empty()) {
            throw PromptValidationError("This field is required");
        }
        return list;
    }

    if (value.is_array()) {
        throw PromptValidationError("Expected a single value");
    }
    std::string text = value.is_string() ? value.get<std::string>()
                                         : format_value(value, TemplateMode::Command);

    if (!prompt.validation.empty() && !text.empty() && !matches_pattern(prompt.validation, text)) {
        throw PromptValidationError("Invalid format");
    }

    if (type == "select" && !prompt.options.empty() && !text.empty() &&
        !has_option(prompt.options, text)) {
        throw PromptValidationError("Please choose one of the listed options");
    }

    return text;
}
