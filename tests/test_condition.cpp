#include <gtest/gtest.h>
#include "core/condition.hpp"

using json = nlohmann::json;

class ConditionTest : public ::testing::Test {
protected:
    VariableStore vars;

    void SetUp() override {
        vars.set("enableSsl", true);
        vars.set("useDocker", false);
        vars.set("dbType", "postgres");
        vars.set("replicas", 3);
        vars.set("features", json::array({"metrics", "backup"}));
        vars.set("osName", "Ubuntu 22.04");
    }

    bool eval(const std::string& expr) { return evaluate_condition(expr, vars); }
};

TEST_F(ConditionTest, BareVariableTruthiness) {
    EXPECT_TRUE(eval("enableSsl"));
    EXPECT_FALSE(eval("useDocker"));
    EXPECT_FALSE(eval("hasFeatureX"));  // absent -> null -> false
}

TEST_F(ConditionTest, Negation) {
    EXPECT_TRUE(eval("!useDocker"));
    EXPECT_TRUE(eval("not useDocker"));
    EXPECT_FALSE(eval("!!useDocker"));
}

TEST_F(ConditionTest, Equality) {
    EXPECT_TRUE(eval("dbType == 'postgres'"));
    EXPECT_TRUE(eval("dbType === \"postgres\""));
    EXPECT_TRUE(eval("dbType != 'mysql'"));
    EXPECT_FALSE(eval("dbType !== 'postgres'"));
    EXPECT_TRUE(eval("replicas == 3"));
    EXPECT_TRUE(eval("replicas == '3'"));
    EXPECT_TRUE(eval("enableSsl == true"));
    EXPECT_TRUE(eval("missing == null"));
}

TEST_F(ConditionTest, LogicalOperators) {
    EXPECT_TRUE(eval("enableSsl && dbType == 'postgres'"));
    EXPECT_FALSE(eval("enableSsl && useDocker"));
    EXPECT_TRUE(eval("useDocker || enableSsl"));
    EXPECT_TRUE(eval("useDocker or (enableSsl and replicas == 3)"));
}

TEST_F(ConditionTest, Precedence) {
    // && binds tighter than ||
    EXPECT_TRUE(eval("enableSsl || useDocker && missing"));
    EXPECT_FALSE(eval("(enableSsl || useDocker) && missing"));
}

TEST_F(ConditionTest, Membership) {
    EXPECT_TRUE(eval("'backup' in features"));
    EXPECT_FALSE(eval("'logs' in features"));
    EXPECT_TRUE(eval("features.includes('metrics')"));
    EXPECT_TRUE(eval("osName.includes('Ubuntu')"));
    EXPECT_FALSE(eval("missing.includes('x')"));
}

TEST_F(ConditionTest, ParsedConditionReusable) {
    Condition c = Condition::parse("replicas == 3");
    EXPECT_EQ(c.source(), "replicas == 3");
    EXPECT_TRUE(c.evaluate(vars));
    vars.set("replicas", 1);
    EXPECT_FALSE(c.evaluate(vars));
}

TEST_F(ConditionTest, MalformedThrows) {
    EXPECT_THROW(eval(""), ConditionEvalError);
    EXPECT_THROW(eval("enableSsl &&"), ConditionEvalError);
    EXPECT_THROW(eval("(enableSsl"), ConditionEvalError);
    EXPECT_THROW(eval("dbType == 'postgres"), ConditionEvalError);
    EXPECT_THROW(eval("a b"), ConditionEvalError);
    EXPECT_THROW(eval("process.exit(1)"), ConditionEvalError);
}

TEST_F(ConditionTest, NumbersMustParseCompletely) {
    EXPECT_THROW(eval("replicas == 1.2.3"), ConditionEvalError);
    EXPECT_THROW(eval("replicas == 99999999999999999999999"), ConditionEvalError);
    EXPECT_TRUE(eval("replicas == 3.0"));
    EXPECT_FALSE(eval("replicas == -3"));
}
