#include <gtest/gtest.h>
#include "ui/run_panel.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

using namespace ftxui;

static std::string render(Component component) {
    auto screen = Screen::Create(Dimension::Fixed(100), Dimension::Fixed(40));
    Render(screen, component->Render());
    return screen.ToString();
}

static PromptRequest make_prompt(const std::string& message) {
    PromptRequest p;
    p.step = "Ask";
    p.message = message;
    p.command.kind = CommandKind::Prompt;
    p.command.prompt_type = "input";
    p.command.message = message;
    return p;
}

TEST(RunPanelTest, PromptAppliedOnUiTask) {
    RunPanel panel("Demo");
    std::vector<std::function<void()>> ui_tasks;
    RunPanel::Callbacks cb;
    cb.post_task = [&ui_tasks](std::function<void()> task) { ui_tasks.push_back(std::move(task)); };
    panel.set_callbacks(std::move(cb));
    auto component = panel.component();

    panel.on_state_changed(RunState::Suspended);
    panel.on_prompt(make_prompt("Portnumber?"));

    // Nothing the input widget owns changes until the UI thread runs the task
    ASSERT_EQ(ui_tasks.size(), 1u);
    EXPECT_EQ(render(component).find("Portnumber?"), std::string::npos);

    ui_tasks[0]();
    EXPECT_NE(render(component).find("Portnumber?"), std::string::npos);
}

TEST(RunPanelTest, PromptWithoutUiTaskAppliesDirectly) {
    RunPanel panel("Demo");
    auto component = panel.component();

    panel.on_state_changed(RunState::Suspended);
    panel.on_prompt(make_prompt("Hostname?"));
    EXPECT_NE(render(component).find("Hostname?"), std::string::npos);
}

TEST(RunPanelTest, PromptHiddenOnceRunResumes) {
    RunPanel panel("Demo");
    auto component = panel.component();

    panel.on_state_changed(RunState::Suspended);
    panel.on_prompt(make_prompt("Region?"));
    panel.on_state_changed(RunState::Running);
    EXPECT_EQ(render(component).find("Region?"), std::string::npos);
}
