#pragma once

#include "core/installer_config.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/// Thrown when a prompt answer breaks the prompt's own rules
class PromptValidationError : public std::runtime_error {
public:
    explicit PromptValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// ── Configuration form fields ──────────────────────────────────

/// Initial form values: each field's default, false for booleans
nlohmann::json default_values(const std::vector<ConfigField>& fields);

/// Convert raw text typed for a field into its JSON value
/// (numbers and booleans are coerced; unparseable numbers stay strings)
nlohmann::json parse_field_input(const ConfigField& field, const std::string& text);

/// Returns an error message, or empty if value is acceptable
std::string validate_field(const ConfigField& field, const nlohmann::json& value);

/// Validate every field against values; returns field id -> message
std::map<std::string, std::string> validate_fields(const std::vector<ConfigField>& fields,
                                                   const nlohmann::json& values);

// ── Interactive prompts ────────────────────────────────────────

/// Apply default, required, regex and type rules to an answer.
/// confirm yields a boolean, multiselect a string array, others a string.
/// Throws PromptValidationError.
nlohmann::json coerce_prompt_answer(const InstallCommand& prompt, const nlohmann::json& answer);

/// The value a prompt starts with (explicit default, or selected options)
nlohmann::json prompt_initial_value(const InstallCommand& prompt);

/// Case-insensitive yes/true/y/1
bool parse_yes(const std::string& text);
