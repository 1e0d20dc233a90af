#include <gtest/gtest.h>

#include "services/layout/layout_command.hpp"

using namespace viewport_coordinator::services;

namespace {

struct LayoutRecorder {
    std::string current = "1x1";
    std::vector<std::string> applied;

    LayoutSwitchCommand::ApplyFunction apply() {
        return [this](const std::string& name) {
            current = name;
            applied.push_back(name);
        };
    }
};

std::unique_ptr<LayoutSwitchCommand> makeSwitch(LayoutRecorder& recorder, std::string to) {
    auto from = recorder.current;
    return std::make_unique<LayoutSwitchCommand>(from, std::move(to), recorder.apply());
}

}  // anonymous namespace

// =============================================================================
// LayoutSwitchCommand
// =============================================================================

TEST(LayoutSwitchCommandTest, ExecuteAppliesTarget) {
    LayoutRecorder recorder;
    LayoutSwitchCommand command("1x1", "2x2", recorder.apply());

    command.execute();
    EXPECT_EQ(recorder.current, "2x2");

    command.undo();
    EXPECT_EQ(recorder.current, "1x1");
    EXPECT_EQ(command.description(), "1x1 -> 2x2");
}

TEST(LayoutSwitchCommandTest, NullApplyIsNoOp) {
    LayoutSwitchCommand command("1x1", "2x2", nullptr);
    command.execute();
    command.undo();
    EXPECT_EQ(command.fromLayout(), "1x1");
    EXPECT_EQ(command.toLayout(), "2x2");
}

// =============================================================================
// LayoutCommandStack
// =============================================================================

TEST(LayoutCommandStackTest, DefaultConstruction) {
    LayoutCommandStack stack;
    EXPECT_FALSE(stack.canUndo());
    EXPECT_FALSE(stack.canRedo());
    EXPECT_EQ(stack.undoCount(), 0u);
    EXPECT_EQ(stack.maxHistorySize(), 10u);
}

TEST(LayoutCommandStackTest, MinimumHistorySize) {
    LayoutCommandStack stack(0);
    EXPECT_EQ(stack.maxHistorySize(), 1u);
}

TEST(LayoutCommandStackTest, UndoAndRedo) {
    LayoutRecorder recorder;
    LayoutCommandStack stack;

    stack.execute(makeSwitch(recorder, "2x2"));
    stack.execute(makeSwitch(recorder, "1x3"));
    EXPECT_EQ(recorder.current, "1x3");

    EXPECT_TRUE(stack.undo());
    EXPECT_EQ(recorder.current, "2x2");
    EXPECT_TRUE(stack.undo());
    EXPECT_EQ(recorder.current, "1x1");
    EXPECT_FALSE(stack.undo());

    EXPECT_TRUE(stack.redo());
    EXPECT_EQ(recorder.current, "2x2");
    EXPECT_EQ(stack.redoCount(), 1u);
}

TEST(LayoutCommandStackTest, RedoClearedOnNewCommand) {
    LayoutRecorder recorder;
    LayoutCommandStack stack;

    stack.execute(makeSwitch(recorder, "2x2"));
    stack.undo();
    EXPECT_TRUE(stack.canRedo());

    stack.execute(makeSwitch(recorder, "3x1"));
    EXPECT_FALSE(stack.canRedo());
    EXPECT_EQ(recorder.current, "3x1");
}

TEST(LayoutCommandStackTest, HistoryIsCapped) {
    LayoutRecorder recorder;
    LayoutCommandStack stack(10);

    const std::vector<std::string> cycle = {"2x2", "1x3", "3x1", "2x3", "3x2", "1x1"};
    for (int i = 0; i < 15; ++i) {
        stack.execute(makeSwitch(recorder, cycle[i % cycle.size()]));
    }

    EXPECT_EQ(stack.undoCount(), 10u);
    int undone = 0;
    while (stack.undo()) ++undone;
    EXPECT_EQ(undone, 10);
}

TEST(LayoutCommandStackTest, ShrinkingHistoryDropsOldest) {
    LayoutRecorder recorder;
    LayoutCommandStack stack;

    stack.execute(makeSwitch(recorder, "2x2"));
    stack.execute(makeSwitch(recorder, "1x3"));
    stack.execute(makeSwitch(recorder, "3x1"));

    stack.setMaxHistorySize(2);
    auto descriptions = stack.undoDescriptions();
    ASSERT_EQ(descriptions.size(), 2u);
    EXPECT_EQ(descriptions[0], "2x2 -> 1x3");
    EXPECT_EQ(descriptions[1], "1x3 -> 3x1");
}

TEST(LayoutCommandStackTest, AvailabilityCallback) {
    LayoutRecorder recorder;
    LayoutCommandStack stack;

    bool lastUndo = false;
    bool lastRedo = false;
    int calls = 0;
    stack.setAvailabilityCallback([&](bool canUndo, bool canRedo) {
        lastUndo = canUndo;
        lastRedo = canRedo;
        ++calls;
    });

    stack.execute(makeSwitch(recorder, "2x2"));
    EXPECT_TRUE(lastUndo);
    EXPECT_FALSE(lastRedo);

    stack.undo();
    EXPECT_FALSE(lastUndo);
    EXPECT_TRUE(lastRedo);

    stack.clear();
    EXPECT_FALSE(lastRedo);
    EXPECT_GE(calls, 3);
}
