#include <gtest/gtest.h>
#include "core/orchestrator.hpp"

using json = nlohmann::json;

/// Collects every event so tests can assert on order and content
class RecordingObserver : public RunObserver {
public:
    std::vector<std::string> started;
    std::vector<std::string> completed;
    std::vector<std::string> skipped;
    std::vector<std::pair<std::string, std::string>> errors;
    std::vector<CommandOutput> outputs;
    std::vector<PromptRequest> prompts;
    std::vector<DisplayContent> displays;
    std::vector<RunState> states;

    void on_step_start(const std::string& name, const std::string&) override { started.push_back(name); }
    void on_step_complete(const std::string& name) override { completed.push_back(name); }
    void on_step_skipped(const std::string& name) override { skipped.push_back(name); }
    void on_step_error(const std::string& step, const std::string& error) override {
        errors.emplace_back(step, error);
    }
    void on_command_output(const CommandOutput& output) override { outputs.push_back(output); }
    void on_prompt(const PromptRequest& prompt) override { prompts.push_back(prompt); }
    void on_display(const DisplayContent& display) override { displays.push_back(display); }
    void on_state_changed(RunState state) override { states.push_back(state); }
};

class OrchestratorTest : public ::testing::Test {
protected:
    RecordingObserver observer;

    std::unique_ptr<Orchestrator> make(const std::string& doc) {
        Orchestrator::Options opts;
        opts.display_delay_ms = 0;
        auto orch = std::make_unique<Orchestrator>(InstallerConfig::parse(doc), CommandRunner(), opts);
        orch->add_observer(&observer);
        return orch;
    }

    static bool log_has(const Orchestrator& orch, const std::string& needle) {
        for (const auto& line : orch.log().lines()) {
            if (line.content.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

// ── Command execution ───────────────────────────────────────

TEST_F(OrchestratorTest, SafeFailureFallsBackToDefault) {
    auto orch = make(R"({"installSteps": [{"name": "Detect", "commands": [
        {"description": "Read version", "cmd": "exit 3", "safe": true,
         "captureAs": "ver", "defaultValue": "1.0"}]}]})");

    ASSERT_TRUE(orch->start());
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_EQ(orch->variables().get("ver"), "1.0");
    EXPECT_TRUE(log_has(*orch, "Using default value for ver: 1.0"));
    EXPECT_TRUE(log_has(*orch, "Installation completed successfully"));
}

TEST_F(OrchestratorTest, CapturesTrimmedOutput) {
    auto orch = make(R"({"installSteps": [{"name": "Detect", "commands": [
        {"description": "Greet", "cmd": "echo '  hello  '", "captureAs": "greeting"}]}]})");

    orch->start();
    EXPECT_EQ(orch->variables().get("greeting"), "hello");
    EXPECT_TRUE(log_has(*orch, "Captured greeting: hello"));
    EXPECT_TRUE(log_has(*orch, "✓ Greet completed"));
    ASSERT_EQ(orch->records().size(), 1u);
    EXPECT_EQ(orch->records()[0].step, "Detect");
}

TEST_F(OrchestratorTest, SafeFailureWithoutDefaultContinues) {
    auto orch = make(R"({"installSteps": [{"name": "S", "commands": [
        {"description": "Optional", "cmd": "exit 5", "safe": true},
        {"description": "Next", "cmd": "echo next"}]}]})");

    orch->start();
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_TRUE(log_has(*orch, "✗ Command failed: Command exited with code 5"));
    EXPECT_TRUE(log_has(*orch, "✓ Next completed"));
}

TEST_F(OrchestratorTest, UnsafeFailureStopsRun) {
    auto orch = make(R"({"installSteps": [
        {"name": "Verify", "commands": [{"description": "Look for marker", "cmd": "test -e /nonexistent-setuptui-marker"}]},
        {"name": "Later", "commands": [{"description": "Never", "cmd": "echo never"}]}]})");

    orch->start();
    EXPECT_EQ(orch->state(), RunState::Failed);
    EXPECT_EQ(orch->failure(), "Verify: Command exited with code 1");
    EXPECT_TRUE(log_has(*orch, "Installation failed: Verify: Command exited with code 1"));
    ASSERT_EQ(observer.errors.size(), 1u);
    EXPECT_EQ(observer.errors[0].first, "Verify");
    EXPECT_EQ(observer.started, std::vector<std::string>{"Verify"});
    EXPECT_FALSE(orch->result().success);
}

TEST_F(OrchestratorTest, UnsafeCommandIsSimulated) {
    auto orch = make(R"({"installSteps": [{"name": "Install", "commands": [
        {"description": "Install packages", "cmd": "apt-get install -y nginx"}]}]})");

    orch->start();
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_TRUE(log_has(*orch, "Would run: apt-get install -y nginx"));
}

TEST_F(OrchestratorTest, EmptyCommandIsLoggedAndSkipped) {
    auto orch = make(R"({"installSteps": [{"name": "S", "commands": [{"description": "Blank", "cmd": "  "}]}]})");
    orch->start();
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_TRUE(log_has(*orch, "No command specified for: Blank"));
    EXPECT_TRUE(orch->records().empty());
}

TEST_F(OrchestratorTest, FailedCaptureWithDefaultKeepsStepGoing) {
    auto orch = make(R"({"installSteps": [{"name": "Inspect host", "commands": [
        {"description": "Look for marker", "cmd": "test -e /nonexistent-setuptui-marker",
         "captureAs": "x", "defaultValue": "d"},
        {"description": "Use value", "cmd": "echo v={{x}}"}]}]})");

    ASSERT_TRUE(orch->start());
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_EQ(orch->variables().get("x"), "d");
    EXPECT_TRUE(log_has(*orch, "Using default value for x: d"));
    EXPECT_TRUE(log_has(*orch, "v=d"));
    EXPECT_TRUE(observer.errors.empty());
    EXPECT_EQ(observer.completed, std::vector<std::string>{"Inspect host"});
}

// ── Conditions ──────────────────────────────────────────────

TEST_F(OrchestratorTest, AbsentConditionSkipsStep) {
    auto orch = make(R"({"installSteps": [
        {"name": "Feature X", "condition": "hasFeatureX", "commands": [{"description": "x", "cmd": "echo x"}]}]})");

    orch->start();
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_EQ(observer.skipped, std::vector<std::string>{"Feature X"});
    EXPECT_TRUE(observer.started.empty());
    EXPECT_TRUE(observer.outputs.empty());
    EXPECT_TRUE(log_has(*orch, "Skipping step: Feature X (condition not met)"));
}

TEST_F(OrchestratorTest, CommandConditionUsesSavedConfig) {
    auto orch = make(R"json({"installSteps": [{"name": "S", "commands": [
        {"description": "Web", "cmd": "echo web", "condition": "components.includes('web')"},
        {"description": "Cli", "cmd": "echo cli", "condition": "components.includes('cli')"}]}]})json");

    ASSERT_TRUE(orch->save_user_config(json{{"components", json::array({"web"})}}));
    orch->start();
    EXPECT_TRUE(log_has(*orch, "✓ Web completed"));
    EXPECT_TRUE(log_has(*orch, "Skipping: Cli (condition not met)"));
}

TEST_F(OrchestratorTest, MalformedConditionIsLoggedAndFalse) {
    auto orch = make(R"({"installSteps": [{"name": "S", "commands": [
        {"description": "Guarded", "cmd": "echo guarded", "condition": "enableSsl =="}]}]})");

    orch->start();
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_TRUE(log_has(*orch, "Condition error in 'enableSsl =='"));
    EXPECT_FALSE(log_has(*orch, "✓ Guarded completed"));
}

TEST_F(OrchestratorTest, InstallStepsFiltersByCondition) {
    auto orch = make(R"({"installSteps": [
        {"name": "Base", "commands": []},
        {"name": "SSL", "condition": "enableSsl", "commands": []},
        {"name": "Broken", "condition": "((", "commands": []}]})");

    auto steps = orch->install_steps();
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].name, "Base");

    orch->save_user_config(json{{"enableSsl", true}});
    EXPECT_EQ(orch->install_steps().size(), 2u);
}

// ── Prompts ─────────────────────────────────────────────────

TEST_F(OrchestratorTest, PromptSuspendsUntilResumed) {
    auto orch = make(R"({"installSteps": [{"name": "Ask", "commands": [
        {"type": "prompt", "promptType": "confirm", "message": "Proceed?", "captureAs": "go"},
        {"description": "After", "cmd": "echo after"}]}]})");

    orch->start();
    EXPECT_EQ(orch->state(), RunState::Suspended);
    ASSERT_NE(orch->pending_prompt(), nullptr);
    EXPECT_EQ(orch->pending_prompt()->message, "Proceed?");
    EXPECT_TRUE(orch->records().empty());
    ASSERT_EQ(observer.prompts.size(), 1u);
    EXPECT_TRUE(log_has(*orch, "User input required: Proceed?"));

    auto r = orch->resume(true);
    EXPECT_TRUE(r.accepted);
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_TRUE(orch->variables().get("go").is_boolean());
    EXPECT_EQ(orch->variables().get("go"), true);
    EXPECT_EQ(orch->pending_prompt(), nullptr);
    EXPECT_EQ(orch->records().size(), 1u);

    std::vector<RunState> expected = {RunState::Running, RunState::Suspended, RunState::Running,
                                      RunState::Completed};
    EXPECT_EQ(observer.states, expected);
}

TEST_F(OrchestratorTest, RejectedAnswerKeepsPrompt) {
    auto orch = make(R"({"installSteps": [{"name": "Ask", "commands": [
        {"type": "prompt", "promptType": "input", "message": "Port?", "captureAs": "port",
         "validation": "^[0-9]+$"}]}]})");

    orch->start();
    auto r = orch->resume("abc");
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error, "Invalid format");
    EXPECT_EQ(orch->state(), RunState::Suspended);
    ASSERT_EQ(observer.prompts.size(), 2u);
    EXPECT_EQ(observer.prompts[1].error, "Invalid format");
    EXPECT_FALSE(orch->variables().contains("port"));

    EXPECT_TRUE(orch->resume("8080").accepted);
    EXPECT_EQ(orch->variables().get("port"), "8080");
    EXPECT_EQ(orch->state(), RunState::Completed);
}

TEST_F(OrchestratorTest, ResumeWithoutPromptIsRejected) {
    auto orch = make(R"({"installSteps": []})");
    auto r = orch->resume("x");
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error, "No prompt is waiting for input");
    EXPECT_EQ(orch->state(), RunState::Idle);
}

TEST_F(OrchestratorTest, PasswordPromptIsMasked) {
    auto orch = make(R"({"installSteps": [{"name": "Auth", "commands": [
        {"type": "prompt", "promptType": "password", "message": "Token?", "captureAs": "apiKey"},
        {"description": "Use token", "cmd": "echo token={{apiKey}}", "safe": true}]}]})");

    orch->start();
    ASSERT_TRUE(orch->resume("tok-abc-123").accepted);
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_EQ(orch->variables().get("apiKey"), "tok-abc-123");
    EXPECT_TRUE(log_has(*orch, "Captured apiKey: ********"));
    EXPECT_TRUE(log_has(*orch, "token=********"));
    EXPECT_FALSE(log_has(*orch, "tok-abc-123"));
}

// ── Display ─────────────────────────────────────────────────

TEST_F(OrchestratorTest, DisplayResolvesContent) {
    auto orch = make(R"({"installSteps": [{"name": "Show", "commands": [
        {"type": "display", "title": "Summary", "content": ["App: {{appName}}", "Db: {{db}}"]}]}]})");

    orch->save_user_config(json{{"appName", "demo"}});
    orch->start();
    ASSERT_EQ(observer.displays.size(), 1u);
    EXPECT_EQ(observer.displays[0].title, "Summary");
    ASSERT_EQ(observer.displays[0].lines.size(), 2u);
    EXPECT_EQ(observer.displays[0].lines[0], "App: demo");
    EXPECT_EQ(observer.displays[0].lines[1], "Db: <not set>");
    EXPECT_TRUE(log_has(*orch, "Displaying: Summary"));
}

// ── Secrets ─────────────────────────────────────────────────

TEST_F(OrchestratorTest, PasswordFieldNeverReachesLog) {
    auto orch = make(R"({
        "configFields": [{"id": "adminPass", "label": "Admin", "type": "password"},
                         {"id": "appName", "label": "App", "type": "text"}],
        "installSteps": [{"name": "S", "commands": [
            {"description": "Echo secret", "cmd": "echo pw={{adminPass}}", "safe": true}]}]})");

    orch->save_user_config(json{{"adminPass", "s3cretpw"}, {"appName", "demo"}});
    orch->start();

    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_FALSE(log_has(*orch, "s3cretpw"));
    EXPECT_TRUE(log_has(*orch, "pw=********"));
    for (const auto& out : observer.outputs) {
        EXPECT_EQ(out.data.find("s3cretpw"), std::string::npos);
    }
    // Final configuration lists non-sensitive keys only
    EXPECT_TRUE(log_has(*orch, "  appName: demo"));
    EXPECT_FALSE(log_has(*orch, "adminPass:"));
}

TEST_F(OrchestratorTest, SecretsMaskedInTitlesAndPromptMessages) {
    auto orch = make(R"({
        "configFields": [{"id": "adminPass", "label": "Admin", "type": "password"}],
        "installSteps": [{"name": "S", "commands": [
            {"type": "display", "title": "Login {{adminPass}}", "content": ["pw {{adminPass}}"]},
            {"type": "prompt", "promptType": "input", "message": "Keep {{adminPass}}?", "captureAs": "keep"}]}]})");

    orch->save_user_config(json{{"adminPass", "s3cretpw"}});
    orch->start();

    ASSERT_EQ(observer.displays.size(), 1u);
    EXPECT_EQ(observer.displays[0].title, "Login ********");
    EXPECT_EQ(observer.displays[0].lines[0], "pw ********");
    ASSERT_EQ(observer.prompts.size(), 1u);
    EXPECT_EQ(observer.prompts[0].message, "Keep ********?");
    ASSERT_NE(orch->pending_prompt(), nullptr);
    EXPECT_EQ(orch->pending_prompt()->message, "Keep ********?");
    EXPECT_FALSE(log_has(*orch, "s3cretpw"));
}

TEST_F(OrchestratorTest, SensitiveCommandOutputIsHidden) {
    auto orch = make(R"({"installSteps": [{"name": "S", "commands": [
        {"description": "Print key", "cmd": "echo plain-output", "safe": true, "sensitive": true}]}]})");

    orch->start();
    EXPECT_FALSE(log_has(*orch, "plain-output"));
    ASSERT_FALSE(observer.outputs.empty());
    EXPECT_EQ(observer.outputs[0].data, "********");
    ASSERT_EQ(orch->records().size(), 1u);
    EXPECT_EQ(orch->records()[0].result.command, CommandRunner::kRedacted);
}

// ── Post-install ────────────────────────────────────────────

TEST_F(OrchestratorTest, PostInstallIsBestEffort) {
    auto orch = make(R"({
        "installSteps": [{"name": "S", "commands": []}],
        "postInstall": [{"name": "Broken hook", "command": "exit 1", "safe": true},
                        {"name": "Good hook", "command": "echo ok", "safe": true}]})");

    orch->start();
    EXPECT_EQ(orch->state(), RunState::Completed);
    EXPECT_TRUE(log_has(*orch, "Post-install command failed: Broken hook: Command exited with code 1"));
    EXPECT_TRUE(log_has(*orch, "✓ Good hook completed"));
    ASSERT_EQ(orch->records().size(), 2u);
    EXPECT_EQ(orch->records()[1].step, "post-install");
}

// ── Lifecycle ───────────────────────────────────────────────

TEST_F(OrchestratorTest, StartOnlyOnce) {
    auto orch = make(R"({"installer": {"name": "Demo"}, "installSteps": []})");
    EXPECT_TRUE(orch->start());
    EXPECT_FALSE(orch->start());
    EXPECT_TRUE(orch->finished());
    EXPECT_TRUE(log_has(*orch, "Starting Demo"));
    EXPECT_FALSE(orch->save_user_config(json{{"late", 1}}));
    EXPECT_STREQ(run_state_name(orch->state()), "completed");
}

TEST_F(OrchestratorTest, SaveUserConfigRequiresObject) {
    auto orch = make(R"({"installSteps": []})");
    EXPECT_FALSE(orch->save_user_config(json::array({1, 2})));
    EXPECT_TRUE(orch->save_user_config(json::object()));
}

TEST_F(OrchestratorTest, PreChecksSeedVariables) {
    auto orch = make(R"({
        "preChecks": [{"name": "Arch", "command": "echo x86_64", "captureAs": "arch", "safe": true}],
        "installSteps": [{"name": "S", "commands": [{"description": "Arch", "cmd": "echo arch={{arch}}"}]}]})");

    auto results = orch->run_prechecks();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, PreCheckStatus::Success);
    EXPECT_EQ(orch->variables().get("arch"), "x86_64");

    orch->start();
    EXPECT_TRUE(log_has(*orch, "arch=x86_64"));
}

TEST_F(OrchestratorTest, RemovedObserverGetsNothing) {
    auto orch = make(R"({"installSteps": [{"name": "S", "commands": []}]})");
    orch->remove_observer(&observer);
    orch->start();
    EXPECT_TRUE(observer.started.empty());
    EXPECT_TRUE(observer.states.empty());
}
