#pragma once
#include <unordered_map>
#include <memory>
#include <vector>
#include "ecs_iecs_event_handler.hpp"

// Routes drained events to the handler registered for their type.
// Events without a handler are ignored.
class EventProcessor {
private:
    std::unordered_map<int, std::unique_ptr<IEventHandler>> handlers;

public:
    void RegisterHandler(int eventType, std::unique_ptr<IEventHandler> handler) {
        handlers[eventType] = std::move(handler);
    }

    bool HasHandler(int eventType) const {
        return handlers.find(eventType) != handlers.end();
    }

    void ProcessEvents(const std::vector<EventEntry>& events) {
        for (const auto& eventEntry : events) {
            auto it = handlers.find(eventEntry.event.type);
            if (it != handlers.end()) {
                it->second->Handle(eventEntry.event);
            }
        }
    }
};
