#ifndef GAME_EVENT_BLOB_H
#define GAME_EVENT_BLOB_H

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <type_traits>

constexpr size_t GAME_EVENT_BLOB_SIZE = 128;

// Fixed-size event record: a type id plus a trivially copyable payload
struct GameEventBlob {
    int type = 0;
    uint8_t data[GAME_EVENT_BLOB_SIZE];
    int len = 0; // length of the valid payload
};

struct EventEntry {
    int tick;
    GameEventBlob event;
};

// Packs a trivially copyable payload into an event entry
template<typename T>
inline EventEntry MakeEventEntry(int tick, int type, const T& payload) {
    static_assert(std::is_trivially_copyable<T>::value, "Event payload must be trivially copyable");
    static_assert(sizeof(T) <= GAME_EVENT_BLOB_SIZE, "Event payload does not fit in a GameEventBlob");

    EventEntry entry;
    entry.tick = tick;
    std::memset(entry.event.data, 0, sizeof(entry.event.data));
    entry.event.type = type;
    std::memcpy(entry.event.data, &payload, sizeof(T));
    entry.event.len = sizeof(T);
    return entry;
}

template<typename T>
inline T ReadEventPayload(const GameEventBlob& blob) {
    static_assert(std::is_trivially_copyable<T>::value, "Event payload must be trivially copyable");
    if (blob.len != static_cast<int>(sizeof(T))) {
        throw std::invalid_argument("ReadEventPayload: payload size mismatch");
    }
    T payload;
    std::memcpy(&payload, blob.data, sizeof(T));
    return payload;
}

static_assert(std::is_trivially_copyable<GameEventBlob>::value,
    "GameEventBlob must be trivially copyable");

#endif // GAME_EVENT_BLOB_H
