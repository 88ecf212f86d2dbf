#include <gtest/gtest.h>

#include "TestWorld.hpp"
#include "game/CollisionPipeline.hpp"
#include "game/LogicSystems.hpp"
#include "Math/Vector2.hpp"

// ===== Power-up table =====

TEST(PowerUpConfigTest, RoutesAndDurations) {
    const PowerUpConfig* rapid = FindPowerUpConfig(PowerUpType::RapidFire);
    ASSERT_NE(rapid, nullptr);
    EXPECT_EQ(rapid->route, PowerUpRoute::Ledger);
    EXPECT_FLOAT_EQ(rapid->durationMs, 10000.0f);

    EXPECT_EQ(FindPowerUpConfig(PowerUpType::Magnet)->route, PowerUpRoute::Ledger);
    EXPECT_EQ(FindPowerUpConfig(PowerUpType::Shield)->route, PowerUpRoute::Special);
    EXPECT_EQ(FindPowerUpConfig(PowerUpType::Nuke)->route, PowerUpRoute::Special);
    EXPECT_FLOAT_EQ(FindPowerUpConfig(PowerUpType::Invincibility)->durationMs, 8000.0f);
}

TEST(PowerUpConfigTest, UnknownKindsAreRejected) {
    EXPECT_FALSE(IsValidPowerUpType(PowerUpType::Count));
    EXPECT_STREQ(PowerUpName(PowerUpType::Count), "Unknown");
    EXPECT_STREQ(PowerUpName(PowerUpType::HomingMissile), "Homing Missile");
#ifndef NDEBUG
    EXPECT_THROW(FindPowerUpConfig(PowerUpType::Count), ConfigurationError);
#else
    EXPECT_EQ(FindPowerUpConfig(PowerUpType::Count), nullptr);
#endif
}

TEST(PowerUpConfigTest, ClassicKindsNeverIncludeTheNewerOnes) {
    Random random(11);
    for (int i = 0; i < 200; ++i) {
        PowerUpType type = RandomClassicPowerUp(random);
        EXPECT_NE(type, PowerUpType::Nuke);
        EXPECT_NE(type, PowerUpType::Magnet);
        EXPECT_NE(type, PowerUpType::Invincibility);
    }
}

// ===== Applying effects =====

TEST(ApplyPowerUpTest, TimedKindsGoToTheWeaponLedger) {
    TestWorld world;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::SpreadShot, glm::vec2(1.0f, 2.0f));

    EXPECT_TRUE(world.weapons.HasPowerUp(PowerUpType::SpreadShot));
    EXPECT_FLOAT_EQ(world.weapons.GetRemainingTime(PowerUpType::SpreadShot), 12000.0f);
    ASSERT_EQ(world.CountEvents(POWERUP_COLLECTED), 1u);

    PowerUpCollectedEventData data = ReadEventPayload<PowerUpCollectedEventData>(world.events.back().event);
    EXPECT_EQ(data.type, static_cast<int>(PowerUpType::SpreadShot));
    EXPECT_FLOAT_EQ(data.y, 2.0f);
}

TEST(ApplyPowerUpTest, ShieldPickupDoesNotStack) {
    TestWorld world;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::Shield, glm::vec2(0.0f));
    ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::Shield, glm::vec2(0.0f));

    EXPECT_EQ(world.Count<ShieldComponent>(), 1u);
    Entity shield = world.ctx.GetShield(world.em);
    ASSERT_NE(shield, NULL_ENTITY);
    EXPECT_FLOAT_EQ(world.em.GetComponent<ShieldComponent>(shield)->remainingMs, 15000.0f);
}

TEST(ApplyPowerUpTest, ShieldDurationFollowsDifficulty) {
    TestWorld world;
    world.difficulty.SetLevel(DifficultyLevel::Hard);
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::Shield, glm::vec2(0.0f));

    Entity shield = world.ctx.GetShield(world.em);
    ASSERT_NE(shield, NULL_ENTITY);
    EXPECT_FLOAT_EQ(world.em.GetComponent<ShieldComponent>(shield)->remainingMs, 12000.0f);
}

TEST(ApplyPowerUpTest, NukeClearsTheFieldWithoutFragments) {
    TestWorld world;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    world.AddStillAsteroid(AsteroidSize::Large, glm::vec2(100.0f, 100.0f));
    world.AddStillAsteroid(AsteroidSize::Medium, glm::vec2(700.0f, 100.0f));
    world.AddStillAsteroid(AsteroidSize::Small, glm::vec2(100.0f, 500.0f));

    ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::Nuke, glm::vec2(0.0f));

    EXPECT_EQ(world.Count<AsteroidComponent>(), 0u);
    EXPECT_EQ(world.ctx.score, 170);
    EXPECT_EQ(world.combo.GetComboCount(), 0);
}

TEST(ApplyPowerUpTest, SlowMotionHalvesTime) {
    TestWorld world;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::SlowMotion, glm::vec2(0.0f));

    world.timeScale.Update(100.0f);
    EXPECT_FLOAT_EQ(world.timeScale.GetScale(), 0.5f);
    EXPECT_FALSE(world.weapons.HasPowerUp(PowerUpType::SlowMotion));
}

TEST(ApplyPowerUpTest, InvincibilityProtectsTheShip) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::Invincibility, glm::vec2(0.0f));

    EXPECT_FALSE(world.em.GetComponent<ShipComponent>(ship)->CanTakeDamage());
    EXPECT_FALSE(HitShip(world.em, world.ctx, world.events));
    EXPECT_TRUE(world.em.IsActive(ship));
}

TEST(ApplyPowerUpTest, HyperspaceLandsClearOfHazards) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    world.AddStillAsteroid(AsteroidSize::Large, glm::vec2(400.0f, 300.0f));

    ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::Hyperspace, glm::vec2(0.0f));

    glm::vec2 position = world.em.GetComponent<Transform>(ship)->getPosition();
    EXPECT_GE(Vec2::Distance(position, glm::vec2(400.0f, 300.0f)), 140.0f);
    EXPECT_GE(position.x, 0.0f);
    EXPECT_LE(position.x, 800.0f);
}

TEST(ApplyPowerUpTest, ThirdPickupInARowIsAnAchievement) {
    TestWorld world;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    for (int i = 0; i < 3; ++i) {
        ApplyPowerUp(world.em, world.ctx, world.events, PowerUpType::RapidFire, glm::vec2(0.0f));
    }

    EXPECT_EQ(world.CountEvents(ACHIEVEMENT_UNLOCKED), 1u);
    EXPECT_EQ(world.ctx.score, 75);
}

TEST(ApplyPowerUpTest, ShipCollectsOverlappingPickups) {
    TestWorld world;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity pickup = CreatePowerUp(world.em, world.random, PowerUpType::TripleShot, glm::vec2(410.0f, 300.0f));

    CollisionResolutionSystem system(world.ctx);
    system.Update(world.em, world.events, 0.016f);

    EXPECT_FALSE(world.em.IsActive(pickup));
    EXPECT_TRUE(world.weapons.HasPowerUp(PowerUpType::TripleShot));
}

// ===== Pickup movement =====

TEST(PowerUpSystemTest, MagnetPullsPickupsTowardTheShip) {
    TestWorld world;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity pickup = CreatePowerUp(world.em, world.random, PowerUpType::RapidFire, glm::vec2(500.0f, 300.0f));
    glm::vec2 drift = world.em.GetComponent<Kinematics>(pickup)->velocity;

    world.weapons.AddPowerUp(PowerUpType::Magnet, 12000.0f);
    PowerUpSystem system(world.ctx);
    system.Update(world.em, world.events, 0.1f);

    glm::vec2 velocity = world.em.GetComponent<Kinematics>(pickup)->velocity;
    EXPECT_NEAR(velocity.x, drift.x * 0.99f - 20.0f, 1e-3f);
    EXPECT_NEAR(velocity.y, drift.y * 0.99f, 1e-3f);
}

TEST(PowerUpSystemTest, WithoutMagnetPickupsOnlySlowDown) {
    TestWorld world;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity pickup = CreatePowerUp(world.em, world.random, PowerUpType::RapidFire, glm::vec2(500.0f, 300.0f));
    glm::vec2 drift = world.em.GetComponent<Kinematics>(pickup)->velocity;

    PowerUpSystem system(world.ctx);
    system.Update(world.em, world.events, 0.1f);

    EXPECT_NEAR(world.em.GetComponent<Kinematics>(pickup)->velocity.x, drift.x * 0.99f, 1e-4f);
}

TEST(PowerUpSpawnSystemTest, SpawnsAwayFromTheShipOnTheInterval) {
    TestWorld world;
    world.config.timedPowerUpChance = 1.0f;
    world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));

    PowerUpSpawnSystem system(world.ctx);
    system.Update(world.em, world.events, 6.9f);
    EXPECT_EQ(world.Count<PowerUpComponent>(), 0u);

    system.Update(world.em, world.events, 0.1f);
    ASSERT_EQ(world.Count<PowerUpComponent>(), 1u);

    Entity pickup = world.em.CreateQuery<PowerUpComponent>().Entities().front();
    glm::vec2 position = world.em.GetComponent<Transform>(pickup)->getPosition();
    EXPECT_GE(Vec2::Distance(position, glm::vec2(400.0f, 300.0f)), 200.0f);
}
