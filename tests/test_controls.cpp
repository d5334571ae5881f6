#include <gtest/gtest.h>
#include "controls.hpp"

using namespace swisp;

TEST(Controls, KeyBindings)
{
    EXPECT_EQ(command_from_key('+'), Command::INCREMENT);
    EXPECT_EQ(command_from_key('='), Command::INCREMENT);
    EXPECT_EQ(command_from_key('-'), Command::DECREMENT);
    EXPECT_EQ(command_from_key('_'), Command::DECREMENT);
    EXPECT_EQ(command_from_key('s'), Command::CYCLE_ACTIVE);
    EXPECT_EQ(command_from_key('r'), Command::RESET);
    EXPECT_EQ(command_from_key('q'), Command::QUIT);
    EXPECT_EQ(command_from_key(27), Command::QUIT);

    EXPECT_EQ(command_from_key('x'), Command::NONE);
    EXPECT_EQ(command_from_key('S'), Command::NONE);
    EXPECT_EQ(command_from_key(-1), Command::NONE);
}

TEST(Controls, OnlyLowByteIsSignificant)
{
    // Window toolkits report modifier state in the upper bits
    EXPECT_EQ(command_from_key(0x100000 | '+'), Command::INCREMENT);
    EXPECT_EQ(command_from_key(0x20000 | 's'), Command::CYCLE_ACTIVE);
    EXPECT_EQ(command_from_key(0xFF00 | 27), Command::QUIT);
}

TEST(Controls, IncrementAdjustsActiveSetting)
{
    ParameterStore store;
    EXPECT_EQ(apply_key_script(store, "+++"), 3u);
    EXPECT_EQ(store.get(Setting::BRIGHTNESS), 3);

    EXPECT_EQ(apply_key_script(store, "-"), 1u);
    EXPECT_EQ(store.get(Setting::BRIGHTNESS), 2);
}

TEST(Controls, CycleThenAdjust)
{
    ParameterStore store;
    apply_key_script(store, "s++");
    EXPECT_EQ(store.active(), Setting::CONTRAST);
    EXPECT_EQ(store.get(Setting::CONTRAST), 2);
    EXPECT_EQ(store.get(Setting::BRIGHTNESS), 0);
}

TEST(Controls, ResetKeepsActiveSetting)
{
    ParameterStore store;
    apply_key_script(store, "ss+++++r");
    EXPECT_EQ(store.active(), Setting::HUE);
    EXPECT_EQ(store.parameters(), ParameterSet());
}

TEST(Controls, QuitStopsScript)
{
    ParameterStore store;
    EXPECT_EQ(apply_key_script(store, "+q+"), 1u);
    EXPECT_EQ(store.get(Setting::BRIGHTNESS), 1);

    EXPECT_FALSE(apply_command(store, Command::QUIT));
    EXPECT_TRUE(apply_command(store, Command::NONE));
}

TEST(Controls, UnknownKeysAreIgnored)
{
    ParameterStore store;
    EXPECT_EQ(apply_key_script(store, "a+ b+\n"), 2u);
    EXPECT_EQ(store.get(Setting::BRIGHTNESS), 2);
}

TEST(Controls, FullCycleReturnsToStart)
{
    ParameterStore store;
    apply_key_script(store, "ssssssss");
    EXPECT_EQ(store.active(), Setting::BRIGHTNESS);

    apply_key_script(store, "sssssss");
    EXPECT_EQ(store.active(), Setting::WHITEBALANCE_TEMPERATURE);
    apply_key_script(store, "---");
    EXPECT_EQ(store.get(Setting::WHITEBALANCE_TEMPERATURE), 5497);
}
