#include <gtest/gtest.h>

#include <cstring>

#include "input/key_bindings.h"

namespace pomo {
namespace {

TEST(KeyBindingsTest, MapsKeyboardLayout) {
    EXPECT_EQ(command_for_key('f'), ControlCommand::Flip);
    EXPECT_EQ(command_for_key('i'), ControlCommand::IncreaseDuration);
    EXPECT_EQ(command_for_key('d'), ControlCommand::DecreaseDuration);
    EXPECT_EQ(command_for_key('n'), ControlCommand::Reset);
    EXPECT_EQ(command_for_key('p'), ControlCommand::TogglePause);
    EXPECT_EQ(command_for_key(' '), ControlCommand::TogglePause);
}

TEST(KeyBindingsTest, UnknownKeysMapToNone) {
    EXPECT_EQ(command_for_key('x'), ControlCommand::None);
    EXPECT_EQ(command_for_key('\0'), ControlCommand::None);
    EXPECT_EQ(command_for_key('5'), ControlCommand::None);
}

TEST(KeyBindingsTest, UpperCaseFollowsConfig) {
    EXPECT_EQ(command_for_key('F'), ControlCommand::Flip);

    KeyBindingConfig strict{};
    strict.case_insensitive = false;
    EXPECT_EQ(command_for_key('F', strict), ControlCommand::None);
}

TEST(KeyBindingsTest, SpaceCanBeDisabled) {
    KeyBindingConfig config{};
    config.space_toggles_pause = false;
    EXPECT_EQ(command_for_key(' ', config), ControlCommand::None);
    EXPECT_EQ(command_for_key('p', config), ControlCommand::TogglePause);
}

TEST(KeyBindingsTest, LegendNamesTheKey) {
    EXPECT_EQ(std::strncmp(key_legend(ControlCommand::Flip), "f:", 2), 0);
    EXPECT_EQ(std::strncmp(key_legend(ControlCommand::Reset), "n:", 2), 0);
    EXPECT_STREQ(key_legend(ControlCommand::Start), "");
}

}  // namespace
}  // namespace pomo
