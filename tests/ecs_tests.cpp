#include <gtest/gtest.h>

#include "ecs/ecs.hpp"
#include "ecs/ecs_common.hpp"
#include "ecs/Collisions/CircleCollider2D.hpp"

#include <memory>
#include <stdexcept>

namespace {

struct Health : public IComponent {
    int value;
    explicit Health(int v = 10) : value(v) {}
};

struct Tag : public IComponent {};

class CountingSystem : public ISystem {
public:
    int calls = 0;
    float lastDelta = 0.0f;
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override {
        calls++;
        lastDelta = deltaTime;
    }
};

}

// ===== Entity lifecycle =====

TEST(EntityManagerTest, EntityIdsStartAtOne) {
    EntityManager em;
    Entity first = em.CreateEntity();
    EXPECT_NE(first, NULL_ENTITY);
    EXPECT_TRUE(em.IsActive(first));
    EXPECT_EQ(em.GetEntityCount(), 1u);
}

TEST(EntityManagerTest, DestroyDeactivatesImmediatelyAndFlushReclaims) {
    EntityManager em;
    em.RegisterComponentType<Health>();
    Entity e = em.CreateEntity();
    em.AddComponent<Health>(e, 5);

    em.DestroyEntity(e);
    EXPECT_FALSE(em.IsActive(e));
    EXPECT_TRUE(em.IsEntityValid(e));
    EXPECT_NE(em.GetComponent<Health>(e), nullptr);

    em.FlushDestroyedEntities();
    EXPECT_FALSE(em.IsEntityValid(e));
    EXPECT_EQ(em.GetComponent<Health>(e), nullptr);
    EXPECT_EQ(em.GetEntityCount(), 0u);
}

TEST(EntityManagerTest, DestroyTwiceIsHarmless) {
    EntityManager em;
    Entity e = em.CreateEntity();
    em.DestroyEntity(e);
    em.DestroyEntity(e);
    EXPECT_EQ(em.GetPendingDestroyCount(), 1u);
    em.FlushDestroyedEntities();
    EXPECT_EQ(em.GetEntityCount(), 0u);
}

// ===== Handles =====

TEST(EntityHandleTest, StaleHandleDoesNotResolveToRecycledId) {
    EntityManager em;
    Entity e = em.CreateEntity();
    EntityHandle handle = em.GetHandle(e);
    EXPECT_TRUE(em.IsHandleValid(handle));

    em.DestroyEntity(e);
    EXPECT_FALSE(em.IsHandleValid(handle));
    em.FlushDestroyedEntities();

    Entity recycled = em.CreateEntity();
    EXPECT_EQ(recycled, e);
    EXPECT_FALSE(em.IsHandleValid(handle));
    EXPECT_TRUE(em.IsHandleValid(em.GetHandle(recycled)));
}

TEST(EntityHandleTest, NullHandleIsNeverValid) {
    EntityManager em;
    EXPECT_TRUE(EntityHandle{}.IsNull());
    EXPECT_FALSE(em.IsHandleValid(EntityHandle{}));
    EXPECT_TRUE(em.GetHandle(NULL_ENTITY).IsNull());
}

// ===== Components =====

TEST(ComponentTest, DoubleRegistrationThrows) {
    EntityManager em;
    em.RegisterComponentType<Health>();
    EXPECT_THROW(em.RegisterComponentType<Health>(), std::invalid_argument);
}

TEST(ComponentTest, AddingUnregisteredTypeThrows) {
    EntityManager em;
    Entity e = em.CreateEntity();
    EXPECT_THROW(em.AddComponent<Health>(e), std::invalid_argument);
}

TEST(ComponentTest, AddGetRemove) {
    EntityManager em;
    em.RegisterComponentType<Health>();
    Entity e = em.CreateEntity();

    Health* health = em.AddComponent<Health>(e, 42);
    ASSERT_NE(health, nullptr);
    EXPECT_EQ(em.GetComponent<Health>(e)->value, 42);
    EXPECT_TRUE(em.HasComponent<Health>(e));

    EXPECT_TRUE(em.RemoveComponent<Health>(e));
    EXPECT_FALSE(em.HasComponent<Health>(e));
    EXPECT_FALSE(em.RemoveComponent<Health>(e));
}

// ===== Queries =====

TEST(QueryTest, MatchesOnlyEntitiesWithAllComponents) {
    EntityManager em;
    em.RegisterComponentType<Health>();
    em.RegisterComponentType<Tag>();

    Entity both = em.CreateEntity();
    em.AddComponent<Health>(both);
    em.AddComponent<Tag>(both);
    Entity healthOnly = em.CreateEntity();
    em.AddComponent<Health>(healthOnly);

    auto query = em.CreateQuery<Health, Tag>();
    ASSERT_EQ(query.Count(), 1u);
    EXPECT_EQ(query.Entities()[0], both);
    EXPECT_EQ(em.CreateQuery<Health>().Count(), 2u);
}

TEST(QueryTest, SkipsEntitiesPendingDestruction) {
    EntityManager em;
    em.RegisterComponentType<Health>();
    Entity a = em.CreateEntity();
    em.AddComponent<Health>(a);
    Entity b = em.CreateEntity();
    em.AddComponent<Health>(b);

    em.DestroyEntity(a);
    auto query = em.CreateQuery<Health>();
    ASSERT_EQ(query.Count(), 1u);
    EXPECT_EQ(query.Entities()[0], b);
}

TEST(QueryTest, EntitiesCreatedDuringIterationAreNotVisited) {
    EntityManager em;
    em.RegisterComponentType<Health>();
    Entity original = em.CreateEntity();
    em.AddComponent<Health>(original, 1);

    int visited = 0;
    auto query = em.CreateQuery<Health>();
    query.ForEach([&](Entity entity, Health* health) {
        visited++;
        Entity spawned = em.CreateEntity();
        em.AddComponent<Health>(spawned, health->value + 1);
    });

    EXPECT_EQ(visited, 1);
    EXPECT_EQ(em.CreateQuery<Health>().Count(), 2u);
}

TEST(QueryTest, TupleIterationYieldsComponents) {
    EntityManager em;
    em.RegisterComponentType<Health>();
    for (int i = 1; i <= 3; ++i) {
        Entity e = em.CreateEntity();
        em.AddComponent<Health>(e, i);
    }

    int sum = 0;
    auto query = em.CreateQuery<Health>();
    for (auto [entity, health] : query) {
        sum += health->value;
    }
    EXPECT_EQ(sum, 6);
}

// ===== World =====

TEST(ECSWorldTest, RunsSystemsInOrderAndFindsThem) {
    ECSWorld world;
    world.AddSystem(std::make_unique<CountingSystem>());
    world.AddSystem(std::make_unique<DestroyingSystem>());

    world.Update(0.5f);
    CountingSystem* counter = world.GetSystem<CountingSystem>();
    ASSERT_NE(counter, nullptr);
    EXPECT_EQ(counter->calls, 1);
    EXPECT_FLOAT_EQ(counter->lastDelta, 0.5f);
}

TEST(ECSWorldTest, DestroyingSystemFlushes) {
    ECSWorld world;
    world.AddSystem(std::make_unique<DestroyingSystem>());
    EntityManager& em = world.GetEntityManager();
    Entity e = em.CreateEntity();
    em.DestroyEntity(e);

    world.Update(0.016f);
    EXPECT_FALSE(em.IsEntityValid(e));
}

// ===== Overlap =====

TEST(CheckOverlapTest, TouchingCirclesDoNotOverlap) {
    EntityManager em;
    em.RegisterComponentType<Transform>();
    em.RegisterComponentType<CircleCollider2D>();

    Entity a = em.CreateEntity();
    em.AddComponent<Transform>(a, glm::vec2(0.0f, 0.0f));
    em.AddComponent<CircleCollider2D>(a, 10.0f);
    Entity b = em.CreateEntity();
    em.AddComponent<Transform>(b, glm::vec2(20.0f, 0.0f));
    em.AddComponent<CircleCollider2D>(b, 10.0f);

    EXPECT_FALSE(CheckOverlap(em, a, b));
    em.GetComponent<Transform>(b)->setPosition(glm::vec2(19.0f, 0.0f));
    EXPECT_TRUE(CheckOverlap(em, a, b));
}

TEST(CheckOverlapTest, InactiveEntitiesNeverOverlap) {
    EntityManager em;
    em.RegisterComponentType<Transform>();
    em.RegisterComponentType<CircleCollider2D>();

    Entity a = em.CreateEntity();
    em.AddComponent<Transform>(a, glm::vec2(0.0f));
    em.AddComponent<CircleCollider2D>(a, 5.0f);
    Entity b = em.CreateEntity();
    em.AddComponent<Transform>(b, glm::vec2(1.0f, 0.0f));
    em.AddComponent<CircleCollider2D>(b, 5.0f);

    CollisionInfo info;
    ASSERT_TRUE(CheckOverlap(em, a, b, info));
    EXPECT_EQ(info.otherEntity, b);
    EXPECT_NEAR(info.penetration, 9.0f, 1e-4f);

    em.DestroyEntity(b);
    EXPECT_FALSE(CheckOverlap(em, a, b));
}
