#include <gtest/gtest.h>

#include "TestWorld.hpp"
#include "game/CollisionPipeline.hpp"
#include "game/LogicSystems.hpp"

namespace {

Entity GiveShield(TestWorld& world, Entity ship, float durationMs) {
    Entity shield = CreateShield(world.em, ship, durationMs);
    world.ctx.shieldHandle = world.em.GetHandle(shield);
    return shield;
}

}

// ===== Creation =====

TEST(ShieldTest, WrapsTheShipWithPadding) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(100.0f, 100.0f));
    Entity shield = GiveShield(world, ship, ShieldComponent::PICKUP_DURATION_MS);

    ASSERT_NE(shield, NULL_ENTITY);
    EXPECT_FLOAT_EQ(world.em.GetComponent<CircleCollider2D>(shield)->radius, 23.0f);
    const ShieldComponent* state = world.em.GetComponent<ShieldComponent>(shield);
    EXPECT_EQ(state->hitPoints, 3);
    EXPECT_EQ(state->owner, world.em.GetHandle(ship));
}

TEST(ShieldTest, NoShieldWithoutAShip) {
    TestWorld world;
    EXPECT_EQ(CreateShield(world.em, NULL_ENTITY, 1000.0f), NULL_ENTITY);

    Entity ship = world.AddVulnerableShip(glm::vec2(100.0f, 100.0f));
    world.em.DestroyEntity(ship);
    EXPECT_EQ(CreateShield(world.em, ship, 1000.0f), NULL_ENTITY);
}

// ===== Absorbing hits =====

TEST(ShieldTest, AbsorbsThreeHitsThenBreaks) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity shield = GiveShield(world, ship, ShieldComponent::PICKUP_DURATION_MS);

    EXPECT_TRUE(HitShip(world.em, world.ctx, world.events));
    EXPECT_TRUE(HitShip(world.em, world.ctx, world.events));
    EXPECT_EQ(world.em.GetComponent<ShieldComponent>(shield)->hitPoints, 1);
    EXPECT_TRUE(world.em.IsActive(ship));

    EXPECT_TRUE(HitShip(world.em, world.ctx, world.events));
    EXPECT_FALSE(world.em.IsActive(shield));
    EXPECT_EQ(world.ctx.GetShield(world.em), NULL_ENTITY);
    EXPECT_TRUE(world.em.IsActive(ship));
    EXPECT_EQ(world.ctx.lives, 3);

    EXPECT_TRUE(HitShip(world.em, world.ctx, world.events));
    EXPECT_FALSE(world.em.IsActive(ship));
    EXPECT_EQ(world.ctx.lives, 2);
}

TEST(ShieldTest, TakesOneHitPerHazardInAPass) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity shield = GiveShield(world, ship, ShieldComponent::PICKUP_DURATION_MS);
    world.AddStillAsteroid(AsteroidSize::Small, glm::vec2(405.0f, 300.0f));
    world.AddStillAsteroid(AsteroidSize::Small, glm::vec2(395.0f, 300.0f));

    CollisionResolutionSystem system(world.ctx);
    system.Update(world.em, world.events, 0.016f);

    EXPECT_EQ(world.em.GetComponent<ShieldComponent>(shield)->hitPoints, 1);
    EXPECT_TRUE(world.em.IsActive(ship));
}

TEST(ShieldTest, DestroyedWithTheShip) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity shield = GiveShield(world, ship, ShieldComponent::PICKUP_DURATION_MS);

    DestroyShip(world.em, world.ctx, world.events);

    EXPECT_FALSE(world.em.IsActive(shield));
    EXPECT_EQ(world.ctx.GetShield(world.em), NULL_ENTITY);
}

// ===== Systems =====

TEST(ShieldSystemTest, FollowsItsOwnerAndCountsDown) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity shield = GiveShield(world, ship, 1000.0f);

    world.em.GetComponent<Transform>(ship)->setPosition(glm::vec2(50.0f, 60.0f));
    ShieldSystem system(world.ctx);
    system.Update(world.em, world.events, 0.25f);

    glm::vec2 position = world.em.GetComponent<Transform>(shield)->getPosition();
    EXPECT_FLOAT_EQ(position.x, 50.0f);
    EXPECT_FLOAT_EQ(position.y, 60.0f);
    EXPECT_FLOAT_EQ(world.em.GetComponent<ShieldComponent>(shield)->remainingMs, 750.0f);
}

TEST(ShieldSystemTest, VanishesWhenTheOwnerIsGone) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity shield = GiveShield(world, ship, 1000.0f);
    world.em.DestroyEntity(ship);

    ShieldSystem system(world.ctx);
    system.Update(world.em, world.events, 0.016f);

    EXPECT_FALSE(world.em.IsActive(shield));
}

TEST(ShieldExpirySystemTest, RemovesExpiredShields) {
    TestWorld world;
    Entity ship = world.AddVulnerableShip(glm::vec2(400.0f, 300.0f));
    Entity shield = GiveShield(world, ship, 500.0f);

    ShieldSystem shieldSystem(world.ctx);
    ShieldExpirySystem expirySystem(world.ctx);

    shieldSystem.Update(world.em, world.events, 0.25f);
    expirySystem.Update(world.em, world.events, 0.25f);
    EXPECT_TRUE(world.em.IsActive(shield));

    shieldSystem.Update(world.em, world.events, 0.25f);
    expirySystem.Update(world.em, world.events, 0.25f);
    EXPECT_FALSE(world.em.IsActive(shield));
    EXPECT_EQ(world.ctx.GetShield(world.em), NULL_ENTITY);
}
