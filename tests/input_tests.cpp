#include <gtest/gtest.h>

#include "Utils/Input.hpp"

TEST(InputTest, TapLastsOneTick) {
    Input input;
    input.SetKey(3, true);
    EXPECT_TRUE(input.KeyTapped(3));
    EXPECT_TRUE(input.KeyPressed(3));

    input.Update();
    EXPECT_FALSE(input.KeyTapped(3));
    EXPECT_TRUE(input.KeyPressed(3));
    EXPECT_EQ(input.GetState(3), Input::KeyState::Held);

    // Holding the key down does not re-tap it
    input.SetKey(3, true);
    EXPECT_FALSE(input.KeyTapped(3));
}

TEST(InputTest, ReleaseGoesBackToUpAfterOneTick) {
    Input input;
    input.SetKey(1, true);
    input.Update();
    input.SetKey(1, false);
    EXPECT_EQ(input.GetState(1), Input::KeyState::Released);
    EXPECT_FALSE(input.KeyPressed(1));

    input.Update();
    EXPECT_EQ(input.GetState(1), Input::KeyState::Up);
}

TEST(InputTest, UnknownKeysAreUp) {
    Input input;
    EXPECT_EQ(input.GetState(42), Input::KeyState::Up);
    input.SetKey(42, false);
    EXPECT_EQ(input.GetState(42), Input::KeyState::Up);
}
