#include <gtest/gtest.h>
#include "core/validation.hpp"

using json = nlohmann::json;

static ConfigField make_field(const std::string& id, const std::string& type) {
    ConfigField f;
    f.id = id;
    f.label = id;
    f.type = type;
    return f;
}

static InstallCommand make_prompt(const std::string& type) {
    InstallCommand c;
    c.kind = CommandKind::Prompt;
    c.prompt_type = type;
    c.message = "?";
    return c;
}

// ── Form fields ─────────────────────────────────────────────

TEST(FieldValidationTest, DefaultValues) {
    auto name = make_field("name", "text");
    name.default_value = "demo";
    auto ssl = make_field("ssl", "boolean");
    auto pw = make_field("pw", "password");

    json v = default_values({name, ssl, pw});
    EXPECT_EQ(v["name"], "demo");
    EXPECT_EQ(v["ssl"], false);
    EXPECT_FALSE(v.contains("pw"));
}

TEST(FieldValidationTest, Required) {
    auto f = make_field("App", "text");
    f.required = true;
    EXPECT_EQ(validate_field(f, json()), "App is required");
    EXPECT_EQ(validate_field(f, ""), "App is required");
    EXPECT_EQ(validate_field(f, "x"), "");
}

TEST(FieldValidationTest, TextPattern) {
    auto f = make_field("Name", "text");
    f.validation = "^[a-z]+$";
    EXPECT_EQ(validate_field(f, "demo"), "");
    EXPECT_EQ(validate_field(f, "Demo1"), "Invalid format for Name");
    EXPECT_EQ(validate_field(f, json()), "");  // optional and empty
}

TEST(FieldValidationTest, PasswordLength) {
    auto f = make_field("pw", "password");
    f.min_length = 8;
    f.max_length = 12;
    EXPECT_EQ(validate_field(f, "short"), "Minimum 8 characters required");
    EXPECT_EQ(validate_field(f, "waytoolongpassword"), "Maximum 12 characters allowed");
    EXPECT_EQ(validate_field(f, "justright"), "");
}

TEST(FieldValidationTest, NumberRange) {
    auto f = make_field("Port", "number");
    f.has_min = true;
    f.min = 1;
    f.has_max = true;
    f.max = 65535;
    EXPECT_EQ(validate_field(f, 8080), "");
    EXPECT_EQ(validate_field(f, 0), "Minimum value is 1");
    EXPECT_EQ(validate_field(f, 70000), "Maximum value is 65535");
    EXPECT_EQ(validate_field(f, "abc"), "Port must be a number");
    EXPECT_EQ(validate_field(f, "443"), "");
}

TEST(FieldValidationTest, SelectOptions) {
    auto f = make_field("DB", "select");
    f.options = {{"postgres", "Postgres", false}, {"mysql", "MySQL", false}};
    EXPECT_EQ(validate_field(f, "mysql"), "");
    EXPECT_EQ(validate_field(f, "oracle"), "DB must be one of the listed options");
}

TEST(FieldValidationTest, ValidateFieldsCollectsErrors) {
    auto a = make_field("a", "text");
    a.required = true;
    auto b = make_field("b", "number");
    auto errors = validate_fields({a, b}, json{{"b", "nan?"}});
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors["a"], "a is required");
    EXPECT_EQ(errors["b"], "b must be a number");
}

TEST(FieldValidationTest, ParseFieldInput) {
    EXPECT_EQ(parse_field_input(make_field("n", "number"), "42"), 42);
    EXPECT_EQ(parse_field_input(make_field("n", "number"), "2.5"), 2.5);
    EXPECT_EQ(parse_field_input(make_field("n", "number"), "x1"), "x1");
    EXPECT_TRUE(parse_field_input(make_field("n", "number"), "").is_null());
    EXPECT_EQ(parse_field_input(make_field("b", "boolean"), "Yes"), true);
    EXPECT_EQ(parse_field_input(make_field("b", "boolean"), "off"), false);
    EXPECT_EQ(parse_field_input(make_field("t", "text"), "007"), "007");
}

// ── Prompts ─────────────────────────────────────────────────

TEST(PromptCoercionTest, ConfirmYieldsBoolean) {
    auto p = make_prompt("confirm");
    EXPECT_EQ(coerce_prompt_answer(p, true), json(true));
    EXPECT_EQ(coerce_prompt_answer(p, "yes"), json(true));
    EXPECT_EQ(coerce_prompt_answer(p, "Y"), json(true));
    EXPECT_EQ(coerce_prompt_answer(p, "no"), json(false));
    EXPECT_TRUE(coerce_prompt_answer(p, "true").is_boolean());
}

TEST(PromptCoercionTest, EmptyTakesDefault) {
    auto p = make_prompt("input");
    p.prompt_default = "fallback";
    EXPECT_EQ(coerce_prompt_answer(p, json()), "fallback");
    EXPECT_EQ(coerce_prompt_answer(p, ""), "fallback");
    EXPECT_EQ(coerce_prompt_answer(p, "given"), "given");
}

TEST(PromptCoercionTest, RequiredRejectsEmpty) {
    auto p = make_prompt("input");
    p.required = true;
    EXPECT_THROW(coerce_prompt_answer(p, ""), PromptValidationError);

    p.allow_empty = true;
    EXPECT_EQ(coerce_prompt_answer(p, ""), "");
}

TEST(PromptCoercionTest, RegexValidation) {
    auto p = make_prompt("input");
    p.validation = "^[0-9]+$";
    EXPECT_EQ(coerce_prompt_answer(p, "123"), "123");
    try {
        coerce_prompt_answer(p, "12a");
        FAIL() << "expected PromptValidationError";
    } catch (const PromptValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid format");
    }
}

TEST(PromptCoercionTest, SelectMustBeOption) {
    auto p = make_prompt("select");
    p.options = {{"stable", "Stable", false}, {"beta", "Beta", false}};
    EXPECT_EQ(coerce_prompt_answer(p, "beta"), "beta");
    EXPECT_THROW(coerce_prompt_answer(p, "nightly"), PromptValidationError);
    EXPECT_THROW(coerce_prompt_answer(p, json::array({"beta"})), PromptValidationError);
}

TEST(PromptCoercionTest, MultiselectYieldsArray) {
    auto p = make_prompt("multiselect");
    p.options = {{"api", "API", true}, {"web", "Web", false}, {"cli", "CLI", true}};

    EXPECT_EQ(coerce_prompt_answer(p, json::array({"web"})), json::array({"web"}));
    EXPECT_EQ(coerce_prompt_answer(p, "api, web"), json::array({"api", "web"}));
    EXPECT_EQ(coerce_prompt_answer(p, json()), json::array({"api", "cli"}));
    EXPECT_THROW(coerce_prompt_answer(p, json::array({"gui"})), PromptValidationError);
}

TEST(PromptCoercionTest, InitialValue) {
    auto p = make_prompt("multiselect");
    p.options = {{"a", "A", true}, {"b", "B", false}};
    EXPECT_EQ(prompt_initial_value(p), json::array({"a"}));

    auto q = make_prompt("input");
    EXPECT_TRUE(prompt_initial_value(q).is_null());
}

TEST(PromptCoercionTest, ParseYes) {
    EXPECT_TRUE(parse_yes("y"));
    EXPECT_TRUE(parse_yes(" TRUE "));
    EXPECT_TRUE(parse_yes("1"));
    EXPECT_FALSE(parse_yes("nope"));
    EXPECT_FALSE(parse_yes(""));
}
