#ifndef ECS_HPP
#define ECS_HPP

#include "Events/GameEventBlob.hpp"
#include <unordered_map>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <queue>
#include <stdexcept>
#include <string>
#include <vector>
#include <tuple>
#include <cstdint>

using Entity = uint32_t;
constexpr Entity NULL_ENTITY = 0;

// Weak reference into the entity arena. A recycled id carries a new generation,
// so a handle taken before destruction never resolves to the new occupant.
struct EntityHandle {
    Entity id = NULL_ENTITY;
    uint32_t generation = 0;

    bool IsNull() const { return id == NULL_ENTITY; }
};

inline bool operator==(const EntityHandle& a, const EntityHandle& b) {
    return a.id == b.id && a.generation == b.generation;
}

inline bool operator!=(const EntityHandle& a, const EntityHandle& b) {
    return !(a == b);
}

inline bool operator<(const EntityHandle& a, const EntityHandle& b) {
    return a.id != b.id ? a.id < b.id : a.generation < b.generation;
}

class IComponent {
public:
    virtual ~IComponent() = default;
};

class IComponentArray {
public:
    virtual ~IComponentArray() = default;
    virtual void Erase(Entity entity) = 0;
    virtual bool Contains(Entity entity) const = 0;
};

template<typename T>
class ComponentArray : public IComponentArray {
    static_assert(std::is_base_of<IComponent, T>::value, "ComponentArray<T>: T must derive from IComponent");
    std::unordered_map<Entity, std::unique_ptr<T>> components;

public:
    // Replaces any component of the same type the entity already had
    T* Insert(Entity entity, std::unique_ptr<T> component) {
        if (!component) throw std::invalid_argument("AddComponent: null component");
        T* raw = component.get();
        components[entity] = std::move(component);
        return raw;
    }

    T* Find(Entity entity) const {
        auto it = components.find(entity);
        return it == components.end() ? nullptr : it->second.get();
    }

    void Erase(Entity entity) override {
        components.erase(entity);
    }

    bool Contains(Entity entity) const override {
        return components.count(entity) != 0;
    }
};


class EntityManager {
    // Bookkeeping for one entity id. A slot is live from CreateEntity until the
    // flush after DestroyEntity; pending marks the time in between.
    struct Slot {
        bool live = false;
        bool pending = false;
        uint32_t generation = 0;
    };

    std::unordered_map<std::type_index, std::unique_ptr<IComponentArray>> componentArrays;
    std::vector<Slot> slots{ Slot{} }; // slot 0 is NULL_ENTITY and never live
    std::queue<Entity> freeIds;
    std::vector<Entity> destroyQueue;
    size_t liveCount = 0;

    template<typename T>
    ComponentArray<T>* FindArray() const {
        auto it = componentArrays.find(std::type_index(typeid(T)));
        return it == componentArrays.end() ? nullptr : static_cast<ComponentArray<T>*>(it->second.get());
    }

public:
    Entity CreateEntity() {
        Entity entity;
        if (freeIds.empty()) {
            entity = static_cast<Entity>(slots.size());
            slots.emplace_back();
        } else {
            entity = freeIds.front();
            freeIds.pop();
        }

        slots[entity].live = true;
        slots[entity].pending = false;
        ++liveCount;
        return entity;
    }

    // Marks the entity inactive right away; storage is reclaimed by FlushDestroyedEntities.
    // Calling it twice for the same entity is harmless.
    void DestroyEntity(Entity entity) {
        if (!IsActive(entity)) {
            return;
        }
        slots[entity].pending = true;
        destroyQueue.push_back(entity);
    }

    void FlushDestroyedEntities() {
        for (Entity entity : destroyQueue) {
            Slot& slot = slots[entity];
            if (!slot.live) {
                continue;
            }
            for (auto& entry : componentArrays) {
                entry.second->Erase(entity);
            }
            slot = Slot{ false, false, slot.generation + 1 };
            freeIds.push(entity);
            --liveCount;
        }
        destroyQueue.clear();
    }

    // True while the entity still owns storage, even if it is pending destruction
    bool IsEntityValid(Entity entity) const {
        return entity != NULL_ENTITY && entity < slots.size() && slots[entity].live;
    }

    // True for entities that take part in the simulation (valid and not pending destruction)
    bool IsActive(Entity entity) const {
        return IsEntityValid(entity) && !slots[entity].pending;
    }

    EntityHandle GetHandle(Entity entity) const {
        return IsEntityValid(entity) ? EntityHandle{ entity, slots[entity].generation } : EntityHandle{};
    }

    bool IsHandleValid(const EntityHandle& handle) const {
        return IsActive(handle.id) && slots[handle.id].generation == handle.generation;
    }

    size_t GetEntityCount() const { return liveCount; }
    size_t GetPendingDestroyCount() const { return destroyQueue.size(); }

    template<typename T>
    void RegisterComponentType() {
        auto inserted = componentArrays.emplace(std::type_index(typeid(T)), std::make_unique<ComponentArray<T>>());
        if (!inserted.second) {
            throw std::invalid_argument(std::string("Component type already registered: ") + typeid(T).name());
        }
    }

    template<typename T, typename... Args>
    T* AddComponent(Entity entity, Args&&... args) {
        ComponentArray<T>* array = FindArray<T>();
        if (!array) {
            throw std::invalid_argument(std::string("Component type not registered: ") + typeid(T).name());
        }
        if (!IsEntityValid(entity)) {
            return nullptr;
        }
        return array->Insert(entity, std::make_unique<T>(std::forward<Args>(args)...));
    }

    template<typename T>
    bool RemoveComponent(Entity entity) {
        ComponentArray<T>* array = FindArray<T>();
        if (!array || !IsEntityValid(entity) || !array->Contains(entity)) {
            return false;
        }
        array->Erase(entity);
        return true;
    }

    template<typename T>
    T* GetComponent(Entity entity) {
        ComponentArray<T>* array = FindArray<T>();
        return (array && IsEntityValid(entity)) ? array->Find(entity) : nullptr;
    }

    template<typename T>
    const T* GetComponent(Entity entity) const {
        ComponentArray<T>* array = FindArray<T>();
        return (array && IsEntityValid(entity)) ? array->Find(entity) : nullptr;
    }

    template<typename T>
    bool HasComponent(Entity entity) const {
        return GetComponent<T>(entity) != nullptr;
    }

    // Entities that are active and carry every listed component. The matching
    // set is captured on first use, so entities created while iterating are
    // not visited and entities destroyed while iterating still are (check
    // IsActive before acting on them).
    template<typename... Components>
    class Query {
        EntityManager* manager;
        std::vector<Entity> matches;
        bool collected = false;

        const std::vector<Entity>& Collect() {
            if (!collected) {
                for (Entity entity = 1; entity < manager->slots.size(); ++entity) {
                    if (manager->IsActive(entity) && (manager->HasComponent<Components>(entity) && ...)) {
                        matches.push_back(entity);
                    }
                }
                collected = true;
            }
            return matches;
        }

    public:
        explicit Query(EntityManager* mgr) : manager(mgr) {}

        // Dereferences to (entity, Components*...)
        class Iterator {
            EntityManager* manager;
            std::vector<Entity>::const_iterator position;

        public:
            Iterator(EntityManager* mgr, std::vector<Entity>::const_iterator it)
                : manager(mgr), position(it) {}

            std::tuple<Entity, Components*...> operator*() const {
                return std::tuple<Entity, Components*...>(*position, manager->GetComponent<Components>(*position)...);
            }

            Iterator& operator++() {
                ++position;
                return *this;
            }

            bool operator!=(const Iterator& other) const {
                return position != other.position;
            }
        };

        Iterator begin() { return Iterator(manager, Collect().begin()); }
        Iterator end() { return Iterator(manager, Collect().end()); }

        size_t Count() { return Collect().size(); }

        // Matching entity ids in ascending order
        const std::vector<Entity>& Entities() { return Collect(); }

        template<typename Func>
        void ForEach(Func&& func) {
            for (Entity entity : Collect()) {
                func(entity, manager->GetComponent<Components>(entity)...);
            }
        }
    };

    template<typename... Components>
    Query<Components...> CreateQuery() {
        return Query<Components...>(this);
    }
};

class ISystem {
public:
    virtual ~ISystem() = default;
    virtual void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) = 0;
};

// One simulation session: the entity arena, the ordered system list and the
// events the systems raised since the last ClearEvents
class ECSWorld {
    EntityManager entityManager;
    std::vector<std::unique_ptr<ISystem>> systems;
    std::vector<EventEntry> events;

public:
    EntityManager& GetEntityManager() { return entityManager; }
    const EntityManager& GetEntityManager() const { return entityManager; }

    void AddSystem(std::unique_ptr<ISystem> system) {
        systems.push_back(std::move(system));
    }

    // Runs every system in registration order
    void Update(float deltaTime) {
        for (auto& system : systems) {
            system->Update(entityManager, events, deltaTime);
        }
    }

    std::vector<EventEntry>& GetEvents() { return events; }
    void ClearEvents() { events.clear(); }

    // Drops every entity, component registration and system
    void Clear() {
        entityManager = EntityManager();
        systems.clear();
        events.clear();
    }

    template<typename T>
    T* GetSystem() {
        static_assert(std::is_base_of<ISystem, T>::value, "T must inherit from ISystem");
        for (auto& system : systems) {
            if (T* found = dynamic_cast<T*>(system.get())) {
                return found;
            }
        }
        return nullptr;
    }
};

// Prune point: reclaims every entity destroyed during the tick
class DestroyingSystem : public ISystem {
public:
    void Update(EntityManager& entityManager, std::vector<EventEntry>&, float) override {
        entityManager.FlushDestroyedEntities();
    }
};

#endif // ECS_HPP
