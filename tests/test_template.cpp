#include <gtest/gtest.h>
#include "core/template.hpp"

using json = nlohmann::json;

class TemplateTest : public ::testing::Test {
protected:
    VariableStore vars;

    void SetUp() override {
        vars.set("name", "demo");
        vars.set("port", 8080);
        vars.set("ratio", 0.5);
        vars.set("enabled", true);
        vars.set("features", json::array({"api", "web"}));
        vars.set("empty", "");
    }
};

TEST_F(TemplateTest, NoPlaceholdersUnchanged) {
    EXPECT_EQ(resolve_template("apt-get update", vars), "apt-get update");
    EXPECT_EQ(resolve_template("", vars), "");
}

TEST_F(TemplateTest, ReplacesPlaceholders) {
    EXPECT_EQ(resolve_template("mkdir /opt/{{name}} && echo {{port}}", vars), "mkdir /opt/demo && echo 8080");
}

TEST_F(TemplateTest, WhitespaceInsideBraces) {
    EXPECT_EQ(resolve_template("{{ name }}-{{\tport }}", vars), "demo-8080");
}

TEST_F(TemplateTest, Deterministic) {
    std::string t = "{{name}}:{{port}}:{{features}}:{{missing}}";
    EXPECT_EQ(resolve_template(t, vars), resolve_template(t, vars));
}

TEST_F(TemplateTest, CommandModeRendering) {
    EXPECT_EQ(resolve_template("{{enabled}}", vars, TemplateMode::Command), "true");
    EXPECT_EQ(resolve_template("{{features}}", vars, TemplateMode::Command), "api,web");
    EXPECT_EQ(resolve_template("[{{missing}}]", vars, TemplateMode::Command), "[]");
    EXPECT_EQ(resolve_template("{{ratio}}", vars, TemplateMode::Command), "0.5");
}

TEST_F(TemplateTest, DisplayModeRendering) {
    EXPECT_EQ(resolve_template("{{enabled}}", vars, TemplateMode::Display), "Yes");
    EXPECT_EQ(resolve_template("{{features}}", vars, TemplateMode::Display), "api, web");
    EXPECT_EQ(resolve_template("{{missing}}", vars, TemplateMode::Display), "<not set>");
    EXPECT_EQ(resolve_template("{{empty}}", vars, TemplateMode::Display), "<not set>");
}

TEST_F(TemplateTest, UnclosedPlaceholderLeftAsIs) {
    EXPECT_EQ(resolve_template("echo {{name}} {{port", vars), "echo demo {{port");
}

TEST(FormatValueTest, WholeDoublesHaveNoDecimals) {
    EXPECT_EQ(format_value(json(3.0), TemplateMode::Command), "3");
    EXPECT_EQ(format_value(json(-42), TemplateMode::Display), "-42");
}

TEST(FormatValueTest, FalseRendering) {
    EXPECT_EQ(format_value(json(false), TemplateMode::Command), "false");
    EXPECT_EQ(format_value(json(false), TemplateMode::Display), "No");
}
