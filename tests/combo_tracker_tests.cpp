#include <gtest/gtest.h>

#include "game/ComboTracker.hpp"

namespace {

std::optional<Achievement> KillTimes(ComboTracker& combo, int count, float nowMs) {
    std::optional<Achievement> last;
    for (int i = 0; i < count; ++i) {
        last = combo.OnKill(nowMs);
    }
    return last;
}

}

// ===== Milestones =====

TEST(ComboTrackerTest, FifthKillUnlocksTheFirstCombo) {
    ComboTracker combo;
    EXPECT_FALSE(KillTimes(combo, 4, 0.0f).has_value());

    std::optional<Achievement> achievement = combo.OnKill(0.0f);
    ASSERT_TRUE(achievement.has_value());
    EXPECT_EQ(achievement->kind, AchievementKind::Combo);
    EXPECT_EQ(achievement->points, 50);
    EXPECT_EQ(achievement->text, "COMBO x5!");
}

TEST(ComboTrackerTest, ThresholdsFireOnlyOnExactMatch) {
    ComboTracker combo;
    std::optional<Achievement> mega = KillTimes(combo, 25, 0.0f);
    ASSERT_TRUE(mega.has_value());
    EXPECT_EQ(mega->text, "MEGA COMBO x25!");
    EXPECT_EQ(mega->points, 250);

    for (int kill = 26; kill <= 29; ++kill) {
        EXPECT_FALSE(combo.OnKill(0.0f).has_value()) << "kill " << kill;
    }
}

TEST(ComboTrackerTest, ComboMilestoneWinsOverKillStreak) {
    ComboTracker combo;
    std::optional<Achievement> tenth = KillTimes(combo, 10, 0.0f);
    ASSERT_TRUE(tenth.has_value());
    EXPECT_EQ(tenth->kind, AchievementKind::Combo);

    // At 20 the combo has no milestone, so the streak is reported
    std::optional<Achievement> twentieth = KillTimes(combo, 10, 0.0f);
    ASSERT_TRUE(twentieth.has_value());
    EXPECT_EQ(twentieth->kind, AchievementKind::KillStreak);
    EXPECT_EQ(twentieth->text, "RAMPAGE!");
    EXPECT_EQ(twentieth->points, 1000);
}

TEST(ComboTrackerTest, KillStreakRestartsAfterTheTimeout) {
    ComboTracker combo;
    KillTimes(combo, 4, 0.0f);
    combo.OnKill(5001.0f);
    EXPECT_EQ(combo.GetKillStreak(), 1);
    EXPECT_EQ(combo.GetComboCount(), 5);
}

// ===== Decay =====

TEST(ComboTrackerTest, DecaysOnePerIntervalAfterTheGraceWindow) {
    ComboTracker combo;
    KillTimes(combo, 3, 1000.0f);

    combo.Tick(100.0f, 4000.0f);
    EXPECT_EQ(combo.GetComboCount(), 3);

    combo.Tick(100.0f, 4100.0f);
    EXPECT_EQ(combo.GetComboCount(), 2);

    combo.Tick(50.0f, 4150.0f);
    EXPECT_EQ(combo.GetComboCount(), 2);
    combo.Tick(50.0f, 4200.0f);
    EXPECT_EQ(combo.GetComboCount(), 1);
}

TEST(ComboTrackerTest, NeverDecaysBelowZero) {
    ComboTracker combo;
    for (int i = 0; i < 10; ++i) {
        combo.Tick(100.0f, 5000.0f + i * 100.0f);
    }
    EXPECT_EQ(combo.GetComboCount(), 0);
}

// ===== Misses and resets =====

TEST(ComboTrackerTest, MissOnlyBreaksASignificantCombo) {
    ComboTracker combo;
    KillTimes(combo, 4, 0.0f);
    combo.OnMiss();
    EXPECT_EQ(combo.GetComboCount(), 4);

    combo.OnKill(0.0f);
    combo.OnMiss();
    EXPECT_EQ(combo.GetComboCount(), 0);
}

TEST(ComboTrackerTest, ResetStreaksClearsEveryCounter) {
    ComboTracker combo;
    KillTimes(combo, 7, 0.0f);
    combo.OnPowerUpCollected();
    combo.ResetStreaks();
    EXPECT_EQ(combo.GetComboCount(), 0);
    EXPECT_EQ(combo.GetKillStreak(), 0);
    EXPECT_EQ(combo.GetPowerUpStreak(), 0);
}

// ===== Multiplier =====

TEST(ComboTrackerTest, MultiplierStepsEveryFiveAndCaps) {
    EXPECT_FLOAT_EQ(ComboTracker::MultiplierFor(0), 1.0f);
    EXPECT_FLOAT_EQ(ComboTracker::MultiplierFor(4), 1.0f);
    EXPECT_FLOAT_EQ(ComboTracker::MultiplierFor(5), 1.5f);
    EXPECT_FLOAT_EQ(ComboTracker::MultiplierFor(12), 2.0f);
    EXPECT_FLOAT_EQ(ComboTracker::MultiplierFor(90), 10.0f);
    EXPECT_FLOAT_EQ(ComboTracker::MultiplierFor(500), 10.0f);
}

// ===== Other achievements =====

TEST(ComboTrackerTest, PowerUpStreakMilestones) {
    ComboTracker combo;
    EXPECT_FALSE(combo.OnPowerUpCollected().has_value());
    EXPECT_FALSE(combo.OnPowerUpCollected().has_value());

    std::optional<Achievement> third = combo.OnPowerUpCollected();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->text, "POWER-UP MANIAC!");
    EXPECT_EQ(third->points, 75);
}

TEST(ComboTrackerTest, WaveAndBossRewards) {
    ComboTracker combo;
    Achievement wave = combo.OnWaveCleared(4);
    EXPECT_EQ(wave.points, 400);
    EXPECT_EQ(wave.text, "WAVE 4 CLEARED!");
    EXPECT_EQ(combo.OnBossKilled().points, 1000);
}
