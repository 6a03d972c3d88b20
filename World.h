#pragma once

#include "ComponentFactory.h"
#include "Components.h"
#include "Diagnostics.h"
#include "EcsConfig.h"
#include "Entity.h"
#include "EventBus.h"
#include "GameConstants.h"
#include "ISystem.h"

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// Every listed predicate must hold. An empty list means "not specified".
struct EntityQuery {
    std::vector<ComponentKind> all;   // holds every kind
    std::vector<ComponentKind> any;   // holds at least one kind
    std::vector<ComponentKind> none;  // holds none of the kinds
    std::vector<std::string>   tags;  // carries every tag
};

struct GameTime {
    float         deltaTime = 0.0f;
    double        elapsedTime = 0.0;
    std::uint64_t frameCount = 0;
};

// Owns the entities, the priority-ordered system list and the event bus.
//
// QueryEntities and the per-system batches hand out live Entity pointers.
// They stay valid until that entity is removed; removing entities while
// walking a batch leaves the rest of the batch dangling.
class World {
public:
    explicit World(const EcsConfig& config = {});
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // --- Entities ---
    Entity& CreateEntity();
    // Emits component:removed once per kind still attached, in kind order,
    // then entity:removed. Returns false for unknown ids and for an entity
    // whose removal is already under way further up the stack.
    bool    RemoveEntity(const EntityId& id);
    Entity* GetEntity(const EntityId& id) const;
    std::vector<Entity*> GetEntities() const;
    std::size_t GetEntityCount() const { return mEntities.size(); }

    // --- Components ---
    bool AddComponent(const EntityId& id, std::shared_ptr<Component> component);
    bool RemoveComponent(const EntityId& id, ComponentKind kind);
    std::shared_ptr<Component> GetComponent(const EntityId& id, ComponentKind kind) const;

    template<typename T>
    std::shared_ptr<T> GetComponent(const EntityId& id) const {
        // AddComponent accepts any struct carrying the kind, so check the type.
        return std::dynamic_pointer_cast<T>(GetComponent(id, T::Kind));
    }

    // Creates T through the World's factory and attaches it. Returns null
    // (creating nothing) when the entity is unknown.
    template<typename T, typename... Args>
    std::shared_ptr<T> EmplaceComponent(const EntityId& id, Args&&... args) {
        if (!GetEntity(id)) {
            return nullptr;
        }
        auto component = mFactory.Create<T>(std::forward<Args>(args)...);
        AddComponent(id, component);
        return component;
    }

    // --- Systems ---
    void AddSystem(std::shared_ptr<ISystem> system);
    bool RemoveSystem(const std::shared_ptr<ISystem>& system);
    const std::vector<std::shared_ptr<ISystem>>& GetSystems() const { return mSystems; }
    // Stable re-sort after priorities were changed in place.
    void SortSystems();

    void Update(float dt);
    std::vector<Entity*> QueryEntities(const EntityQuery& query) const;

    // --- Events ---
    void On(const std::string& type, const ListenerHandle& listener) { mEvents.On(type, listener); }
    ListenerHandle On(const std::string& type, EventListener fn) { return mEvents.On(type, std::move(fn)); }
    ListenerHandle Once(const std::string& type, EventListener fn) { return mEvents.Once(type, std::move(fn)); }
    void Off(const std::string& type, const ListenerHandle& listener) { mEvents.Off(type, listener); }
    void Emit(GameEvent event) { mEvents.Emit(std::move(event)); }
    EventBus& GetEventBus() { return mEvents; }

    // --- Scene helpers ---
    void    InitializeWorld();
    Entity& CreatePlayerEntity(const glm::vec3& position = stroll::positions::Player);
    Entity& CreateNPCEntity(const glm::vec3& position, const std::string& dialogueKey);
    Entity& CreateBillboardEntity(const glm::vec3& position = stroll::positions::Billboard);

    void Destroy();

    const GameTime& GetTime() const { return mTime; }
    const EcsConfig& GetConfig() const { return mConfig; }
    ComponentFactory& GetComponentFactory() { return mFactory; }
    diag::Diagnostics& GetDiagnostics() { return mDiagnostics; }
    const diag::Diagnostics& GetDiagnostics() const { return mDiagnostics; }

private:
    static bool matches(const Entity& entity, const EntityQuery& query);
    void emitComponentEvent(const char* type, const EntityId& id, ComponentKind kind);
    void releaseComponent(const std::shared_ptr<Component>& component);
    Entity& createTaggedEntity(const char* tag);

    EcsConfig mConfig;
    ComponentFactory mFactory;
    diag::Diagnostics mDiagnostics;
    EventBus mEvents;

    std::vector<std::unique_ptr<Entity>> mEntities;   // creation order
    std::unordered_map<EntityId, Entity*> mIndex;
    std::unordered_set<EntityId> mRemoving;           // component:removed in flight
    std::vector<std::shared_ptr<ISystem>> mSystems;   // ascending priority

    GameTime mTime{};
};
