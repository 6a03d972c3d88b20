#include "World.h"
#include "Chrono.h"
#include "Instrument.h"
#include "Uuid.h"

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>

namespace {
    std::string toString(const glm::vec3& v) {
        std::ostringstream out;
        out << "(" << v.x << ", " << v.y << ", " << v.z << ")";
        return out.str();
    }
}

World::World(const EcsConfig& config)
    : mConfig(config)
    , mFactory(config.maxPoolSize)
    , mDiagnostics(config.diagnostics)
{
    mEvents.SetFaultHandler([this](const std::string& type, const std::string& message) {
        mDiagnostics.reportListenerFault(type, message);
    });
}

World::~World() {
    if (!mSystems.empty() || !mEntities.empty()) {
        Destroy();
    }
}

Entity& World::CreateEntity() {
    auto entity = std::make_unique<Entity>();
    entity->id = stroll::GenerateUuid();
    entity->active = true;

    Entity& ref = *entity;
    mIndex.emplace(ref.id, &ref);
    mEntities.push_back(std::move(entity));

    GameEvent ev;
    ev.type = stroll::events::EntityCreated;
    ev.entityId = ref.id;
    mEvents.Emit(std::move(ev));

    return ref;
}

bool World::RemoveEntity(const EntityId& id) {
    auto it = mIndex.find(id);
    if (it == mIndex.end() || mRemoving.count(id) > 0) {
        return false;
    }

    // Listeners still see the entity while its components are announced.
    // Each kind is announced once, including kinds a listener attaches.
    std::set<ComponentKind> announced;
    mRemoving.insert(id);
    for (;;) {
        // Destroy() from a listener may have cleared the world.
        it = mIndex.find(id);
        if (it == mIndex.end()) {
            break;
        }
        const auto& current = it->second->components;
        auto next = std::find_if(current.begin(), current.end(),
            [&announced](const auto& pair) { return announced.count(pair.first) == 0; });
        if (next == current.end()) {
            break;
        }
        const ComponentKind kind = next->first;
        announced.insert(kind);
        emitComponentEvent(stroll::events::ComponentRemoved, id, kind);
    }
    mRemoving.erase(id);

    if (it == mIndex.end()) {
        return true;
    }

    Entity* entity = it->second;
    const auto components = std::move(entity->components);
    mIndex.erase(it);
    mEntities.erase(std::find_if(mEntities.begin(), mEntities.end(),
        [entity](const std::unique_ptr<Entity>& e) { return e.get() == entity; }));

    for (const auto& pair : components) {
        releaseComponent(pair.second);
    }

    GameEvent ev;
    ev.type = stroll::events::EntityRemoved;
    ev.entityId = id;
    mEvents.Emit(std::move(ev));

    return true;
}

Entity* World::GetEntity(const EntityId& id) const {
    auto it = mIndex.find(id);
    return it == mIndex.end() ? nullptr : it->second;
}

std::vector<Entity*> World::GetEntities() const {
    std::vector<Entity*> out;
    out.reserve(mEntities.size());
    for (const auto& e : mEntities) {
        out.push_back(e.get());
    }
    return out;
}

bool World::AddComponent(const EntityId& id, std::shared_ptr<Component> component) {
    Entity* entity = GetEntity(id);
    if (!entity || !component) {
        return false;
    }

    component->entityId = id;
    const ComponentKind kind = component->kind;

    // One component per kind: a second add replaces the first.
    auto existing = entity->components.find(kind);
    if (existing != entity->components.end()) {
        if (existing->second != component) {
            releaseComponent(existing->second);
        }
        existing->second = std::move(component);
    }
    else {
        entity->components.emplace(kind, std::move(component));
    }

    emitComponentEvent(stroll::events::ComponentAdded, id, kind);
    return true;
}

bool World::RemoveComponent(const EntityId& id, ComponentKind kind) {
    Entity* entity = GetEntity(id);
    if (!entity) {
        return false;
    }

    auto it = entity->components.find(kind);
    if (it == entity->components.end()) {
        return false;
    }

    std::shared_ptr<Component> component = std::move(it->second);
    entity->components.erase(it);

    emitComponentEvent(stroll::events::ComponentRemoved, id, kind);
    releaseComponent(component);
    return true;
}

std::shared_ptr<Component> World::GetComponent(const EntityId& id, ComponentKind kind) const {
    Entity* entity = GetEntity(id);
    if (!entity) {
        return nullptr;
    }

    auto it = entity->components.find(kind);
    return it == entity->components.end() ? nullptr : it->second;
}

void World::AddSystem(std::shared_ptr<ISystem> system) {
    if (!system) return;

    ISystem* raw = system.get();
    mSystems.push_back(std::move(system));
    SortSystems();

    raw->Initialize(*this);

    GameEvent ev;
    ev.type = stroll::events::SystemAdded;
    ev.system = raw;
    mEvents.Emit(std::move(ev));
}

bool World::RemoveSystem(const std::shared_ptr<ISystem>& system) {
    auto it = std::find(mSystems.begin(), mSystems.end(), system);
    if (it == mSystems.end()) {
        return false;
    }

    // Hold a reference so the system outlives its own system:removed event.
    std::shared_ptr<ISystem> keep = *it;
    keep->Cleanup();

    // Cleanup may have touched the list; look the system up again.
    it = std::find(mSystems.begin(), mSystems.end(), keep);
    if (it != mSystems.end()) {
        mSystems.erase(it);
    }

    GameEvent ev;
    ev.type = stroll::events::SystemRemoved;
    ev.system = keep.get();
    mEvents.Emit(std::move(ev));

    return true;
}

void World::SortSystems() {
    std::stable_sort(mSystems.begin(), mSystems.end(),
        [](const std::shared_ptr<ISystem>& a, const std::shared_ptr<ISystem>& b) {
            return a->GetPriority() < b->GetPriority();
        });
}

void World::Update(float dt)
{
    mTime.deltaTime = dt;
    mTime.elapsedTime += dt;
    mTime.frameCount++;

    const diag::Stopwatch frameTimer;
    mDiagnostics.beginFrame(mTime.frameCount);

    // Systems added by another system start next frame. Removed ones stop at once.
    const std::vector<std::shared_ptr<ISystem>> systems = mSystems;
    for (const auto& system : systems) {
        if (!system->IsActive()) {
            continue;
        }
        if (std::find(mSystems.begin(), mSystems.end(), system) == mSystems.end()) {
            continue;
        }

        EntityQuery query;
        query.all = system->GetRequiredComponents();
        const std::vector<Entity*> entities = QueryEntities(query);

        STROLL_ZONE_CPU(mDiagnostics, system->GetName());
        system->Update(dt, entities);
    }

    diag::WorldGauges gauges{};
    gauges.entities = mEntities.size();
    gauges.systems = mSystems.size();
    for (std::size_t i = 0; i < MAX_COMPONENTS; ++i) {
        gauges.pooledComponents += mFactory.GetPoolSize(static_cast<ComponentKind>(i));
    }
    mDiagnostics.publishGauges(gauges);
    mDiagnostics.endFrame(mTime.frameCount, frameTimer.elapsedMs());
}

std::vector<Entity*> World::QueryEntities(const EntityQuery& query) const {
    std::vector<Entity*> result;

    for (const auto& entity : mEntities) {
        if (!entity->active) {
            continue;
        }
        if (matches(*entity, query)) {
            result.push_back(entity.get());
        }
    }

    return result;
}

bool World::matches(const Entity& entity, const EntityQuery& query) {
    for (ComponentKind kind : query.all) {
        if (!entity.HasComponent(kind)) return false;
    }

    if (!query.any.empty()) {
        const bool hasAny = std::any_of(query.any.begin(), query.any.end(),
            [&entity](ComponentKind kind) { return entity.HasComponent(kind); });
        if (!hasAny) return false;
    }

    for (ComponentKind kind : query.none) {
        if (entity.HasComponent(kind)) return false;
    }

    for (const auto& tag : query.tags) {
        if (!entity.HasTag(tag)) return false;
    }

    return true;
}

void World::InitializeWorld() {
    Entity& skybox = createTaggedEntity(stroll::tags::Skybox);
    Entity& planet = createTaggedEntity(stroll::tags::Planet);

    if (mConfig.verbose) {
        std::cout << "[World] Skybox entity " << skybox.id << "\n";
        std::cout << "[World] Planet entity " << planet.id << "\n";
    }

    GameEvent ev;
    ev.type = stroll::events::WorldInitialized;
    mEvents.Emit(std::move(ev));
}

Entity& World::CreatePlayerEntity(const glm::vec3& position) {
    Entity& entity = createTaggedEntity(stroll::tags::Player);
    if (mConfig.verbose) {
        std::cout << "[World] Player entity " << entity.id << " at " << toString(position) << "\n";
    }
    return entity;
}

Entity& World::CreateNPCEntity(const glm::vec3& position, const std::string& dialogueKey) {
    Entity& entity = createTaggedEntity(stroll::tags::Npc);
    if (mConfig.verbose) {
        std::cout << "[World] NPC entity " << entity.id << " at " << toString(position)
            << " dialogue=" << dialogueKey << "\n";
    }
    return entity;
}

Entity& World::CreateBillboardEntity(const glm::vec3& position) {
    Entity& entity = createTaggedEntity(stroll::tags::Billboard);
    if (mConfig.verbose) {
        std::cout << "[World] Billboard entity " << entity.id << " at " << toString(position) << "\n";
    }
    return entity;
}

void World::Destroy() {
    // Direct teardown: no per-system removal events.
    const std::vector<std::shared_ptr<ISystem>> systems = mSystems;
    for (const auto& system : systems) {
        system->Cleanup();
    }

    mIndex.clear();
    mEntities.clear();
    mRemoving.clear();
    mSystems.clear();
    mEvents.RemoveAllListeners();
    mFactory.ClearPools();

    if (mConfig.verbose) {
        std::cout << "[World] Destroyed\n";
    }
}

void World::emitComponentEvent(const char* type, const EntityId& id, ComponentKind kind) {
    GameEvent ev;
    ev.type = type;
    ev.entityId = id;
    ev.componentType = kind;
    mEvents.Emit(std::move(ev));
}

void World::releaseComponent(const std::shared_ptr<Component>& component) {
    if (mConfig.recycleOnRemove && component) {
        mFactory.Recycle(component);
    }
}

Entity& World::createTaggedEntity(const char* tag) {
    Entity& entity = CreateEntity();
    entity.AddTag(tag);
    return entity;
}
