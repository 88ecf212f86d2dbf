#include <gtest/gtest.h>

#include "game/TimeScale.hpp"

// ===== Freeze =====

TEST(TimeScaleTest, StartsAtNormalSpeed) {
    TimeScale timeScale;
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 1.0f);
    EXPECT_FLOAT_EQ(timeScale.Apply(16.0f), 16.0f);
    EXPECT_FALSE(timeScale.IsActive());
}

TEST(TimeScaleTest, FreezeAppliesImmediatelyAndEasesBack) {
    TimeScale timeScale;
    timeScale.Freeze(200.0f, 0.05f);
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 0.05f);
    EXPECT_FLOAT_EQ(timeScale.Apply(100.0f), 5.0f);
    EXPECT_TRUE(timeScale.IsActive());

    timeScale.Update(100.0f);
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 0.05f);

    // Timer runs out, then a 100 ms step covers the whole way back
    timeScale.Update(100.0f);
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 1.0f);
    EXPECT_FALSE(timeScale.IsActive());
}

TEST(TimeScaleTest, FreezeDefaultsToOneTenth) {
    TimeScale timeScale;
    timeScale.Freeze(50.0f);
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 0.1f);
}

// ===== Slow motion =====

TEST(TimeScaleTest, SetScaleEasesAtTheTransitionSpeed) {
    TimeScale timeScale;
    timeScale.SetScale(0.5f, 8000.0f);
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 1.0f);

    timeScale.Update(16.0f);
    EXPECT_NEAR(timeScale.GetScale(), 0.84f, 1e-5f);

    for (int i = 0; i < 10; ++i) {
        timeScale.Update(16.0f);
    }
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 0.5f);

    for (int i = 0; i < 80; ++i) {
        timeScale.Update(100.0f);
    }
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 1.0f);
}

TEST(TimeScaleTest, SetScaleIsClamped) {
    TimeScale timeScale;
    timeScale.SetScale(5.0f);
    for (int i = 0; i < 10; ++i) {
        timeScale.Update(100.0f);
    }
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 2.0f);

    timeScale.SetScale(-1.0f);
    for (int i = 0; i < 10; ++i) {
        timeScale.Update(100.0f);
    }
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 0.0f);
}

TEST(TimeScaleTest, ResetRestoresNormalSpeed) {
    TimeScale timeScale;
    timeScale.Freeze(1000.0f, 0.1f);
    timeScale.Reset();
    EXPECT_FLOAT_EQ(timeScale.GetScale(), 1.0f);
    EXPECT_FALSE(timeScale.IsActive());
}
