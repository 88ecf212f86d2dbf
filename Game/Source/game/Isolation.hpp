#pragma once

#include "ecs/ecs.hpp"
#include "PowerUps.hpp"
#include "Utils/Debug/Debug.hpp"
#include <exception>

// Runs one entity's work so that a failure only takes that entity down.
// Configuration errors are programming errors and keep propagating.
template<typename Func>
void RunIsolated(EntityManager& entityManager, Entity entity, const char* channel, Func&& func) {
    try {
        func();
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        Debug::Error(channel) << "Entity " << entity << " failed: " << e.what() << ", destroying it\n";
        entityManager.DestroyEntity(entity);
    }
}
