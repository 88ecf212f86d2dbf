#include <gtest/gtest.h>

#include "ecs/Events/ecs_event_processor.hpp"
#include "game/EventHandlers.hpp"
#include "game/Isolation.hpp"

#include <memory>
#include <stdexcept>

namespace {

class CountingHandler : public IEventHandler {
public:
    explicit CountingHandler(int& counter) : counter(counter) {}
    void Handle(const GameEventBlob& event) override {
        ReadEventPayload<WaveEventData>(event);
        counter++;
    }
private:
    int& counter;
};

}

// ===== Event blobs =====

TEST(EventBlobTest, PayloadSurvivesPacking) {
    EventEntry entry = MakeEventEntry(42, WAVE_CLEARED, WaveEventData{ 3, 1500, 0 });
    EXPECT_EQ(entry.tick, 42);
    EXPECT_EQ(entry.event.type, WAVE_CLEARED);
    EXPECT_EQ(entry.event.len, static_cast<int>(sizeof(WaveEventData)));

    WaveEventData data = ReadEventPayload<WaveEventData>(entry.event);
    EXPECT_EQ(data.wave, 3);
    EXPECT_EQ(data.bonus, 1500);
}

TEST(EventBlobTest, ReadingTheWrongPayloadThrows) {
    EventEntry entry = MakeEventEntry(0, LEVEL_CLEARED, LevelClearedEventData{ 2, 2000 });
    EXPECT_THROW(ReadEventPayload<BossEventData>(entry.event), std::invalid_argument);
}

// ===== Processor =====

TEST(EventProcessorTest, DispatchesByTypeAndIgnoresTheRest) {
    int waves = 0;
    EventProcessor processor;
    processor.RegisterHandler(WAVE_STARTED, std::make_unique<CountingHandler>(waves));

    std::vector<EventEntry> events = {
        MakeEventEntry(1, WAVE_STARTED, WaveEventData{ 1, 0, 4 }),
        MakeEventEntry(1, SCORE_CHANGED, ScoreChangedEventData{ 20, 20 }),
        MakeEventEntry(2, WAVE_STARTED, WaveEventData{ 2, 0, 5 })
    };
    processor.ProcessEvents(events);

    EXPECT_EQ(waves, 2);
    EXPECT_TRUE(processor.HasHandler(WAVE_STARTED));
    EXPECT_FALSE(processor.HasHandler(SCORE_CHANGED));
}

TEST(EventProcessorTest, LoggingHandlersCoverEveryGameplayEvent) {
    EventProcessor processor;
    RegisterLoggingHandlers(processor);
    for (int type = SCORE_CHANGED; type <= GAME_OVER; ++type) {
        EXPECT_TRUE(processor.HasHandler(type)) << "event type " << type;
    }

    std::vector<EventEntry> events = {
        MakeEventEntry(1, GAME_OVER, GameOverEventData{ 1200, 4, 2 }),
        MakeEventEntry(1, BOSS_DEFEATED, BossEventData{ 5, 0, 5000, 400.0f, 150.0f })
    };
    EXPECT_NO_THROW(processor.ProcessEvents(events));
}

// ===== Per-entity isolation =====

TEST(IsolationTest, FailingEntityIsDestroyed) {
    EntityManager em;
    Entity entity = em.CreateEntity();

    RunIsolated(em, entity, "Test", []() { throw std::runtime_error("broken entity"); });

    EXPECT_FALSE(em.IsActive(entity));
}

TEST(IsolationTest, SuccessfulWorkLeavesTheEntityAlone) {
    EntityManager em;
    Entity entity = em.CreateEntity();
    bool ran = false;

    RunIsolated(em, entity, "Test", [&]() { ran = true; });

    EXPECT_TRUE(ran);
    EXPECT_TRUE(em.IsActive(entity));
}

TEST(IsolationTest, ConfigurationErrorsPropagate) {
    EntityManager em;
    Entity entity = em.CreateEntity();

    EXPECT_THROW(RunIsolated(em, entity, "Test", []() { throw ConfigurationError("bad kind"); }),
                 ConfigurationError);
    EXPECT_TRUE(em.IsActive(entity));
}
