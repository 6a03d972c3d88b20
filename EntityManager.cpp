#include "EntityManager.h"
#include "World.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <utility>

namespace {
    constexpr float TWO_PI = 6.28318530717958647692f;
}

const char* ToString(PortfolioContent content) {
    switch (content) {
    case PortfolioContent::Resume:   return "resume";
    case PortfolioContent::Projects: return "projects";
    case PortfolioContent::Skills:   return "skills";
    }
    return "unknown";
}

EntityManager::EntityManager(World& world)
    : mWorld(world)
{
}

template<typename T, typename... Args>
void EntityManager::attachIfRegistered(const EntityId& id, Args&&... args) {
    if (mWorld.GetComponentFactory().IsRegistered(T::Kind)) {
        mWorld.EmplaceComponent<T>(id, std::forward<Args>(args)...);
    }
}

std::vector<Entity*> EntityManager::GetEntitiesByTag(const std::string& tag) const {
    EntityQuery query;
    query.tags = { tag };
    return mWorld.QueryEntities(query);
}

std::vector<Entity*> EntityManager::GetEntitiesByComponents(const std::vector<ComponentKind>& kinds) const {
    EntityQuery query;
    query.all = kinds;
    return mWorld.QueryEntities(query);
}

Entity& EntityManager::CreateCharacterEntity(const glm::vec3& position, bool isPlayer,
    const std::string& characterName)
{
    Entity& entity = mWorld.CreateEntity();
    entity.AddTag(isPlayer ? stroll::tags::Player : stroll::tags::Npc);

    attachIfRegistered<TransformComponent>(entity.id, position);
    if (isPlayer) {
        attachIfRegistered<PlayerComponent>(entity.id);
    }
    else {
        attachIfRegistered<NpcComponent>(entity.id, characterName, std::string{});
    }

    if (mWorld.GetConfig().verbose) {
        std::cout << "[EntityManager] Character " << entity.id
            << (isPlayer ? " (player)" : " (npc)");
        if (!characterName.empty()) {
            std::cout << " name=" << characterName;
        }
        std::cout << "\n";
    }

    return entity;
}

Entity& EntityManager::CreateInteractiveObject(const glm::vec3& position, const std::string& interactionType) {
    Entity& entity = mWorld.CreateEntity();
    entity.AddTag(stroll::tags::Interactive);

    attachIfRegistered<TransformComponent>(entity.id, position);
    attachIfRegistered<InteractableComponent>(entity.id, interactionType);

    return entity;
}

std::vector<Entity*> EntityManager::CreateEntityFormation(const glm::vec3& center, std::size_t count,
    float radius, const SpawnFn& spawn)
{
    std::vector<Entity*> entities;
    if (!spawn) {
        return entities;
    }
    entities.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const float angle = (static_cast<float>(i) / static_cast<float>(count)) * TWO_PI;
        const glm::vec3 position{
            center.x + std::cos(angle) * radius,
            center.y,
            center.z + std::sin(angle) * radius
        };
        entities.push_back(&spawn(position));
    }

    return entities;
}

Entity& EntityManager::CreateNPCWithDialogue(const glm::vec3& position, const std::string& dialogueKey,
    const std::string& name)
{
    Entity& entity = mWorld.CreateNPCEntity(position, dialogueKey);

    attachIfRegistered<TransformComponent>(entity.id, position);
    attachIfRegistered<NpcComponent>(entity.id, name, dialogueKey);
    attachIfRegistered<DialogueComponent>(entity.id, dialogueKey, std::vector<std::string>{});

    if (mWorld.GetConfig().verbose) {
        std::cout << "[EntityManager] NPC \"" << name << "\" dialogue=" << dialogueKey << "\n";
    }

    return entity;
}

Entity& EntityManager::CreatePortfolioBillboard(const glm::vec3& position, PortfolioContent content) {
    Entity& entity = mWorld.CreateBillboardEntity(position);

    attachIfRegistered<TransformComponent>(entity.id, position);
    attachIfRegistered<BillboardComponent>(entity.id, std::string(ToString(content)));

    return entity;
}

std::size_t EntityManager::DeactivateAllExcept(const std::vector<std::string>& exceptTags) {
    std::size_t deactivated = 0;

    for (Entity* entity : mWorld.GetEntities()) {
        bool keep = false;
        for (const auto& tag : exceptTags) {
            if (entity->HasTag(tag)) {
                keep = true;
                break;
            }
        }

        if (!keep && entity->active) {
            entity->active = false;
            ++deactivated;
        }
    }

    return deactivated;
}

std::size_t EntityManager::RemoveEntitiesMatching(const EntityQuery& query) {
    // Copy ids first: removal invalidates the Entity pointers.
    std::vector<EntityId> ids;
    for (const Entity* entity : mWorld.QueryEntities(query)) {
        ids.push_back(entity->id);
    }

    std::size_t removed = 0;
    for (const auto& id : ids) {
        if (mWorld.RemoveEntity(id)) {
            ++removed;
        }
    }
    return removed;
}

Entity* EntityManager::CloneEntity(const EntityId& id) {
    Entity* source = mWorld.GetEntity(id);
    if (!source) {
        return nullptr;
    }

    // CreateEntity runs listeners, which could remove the source; copy first.
    const bool active = source->active;
    const auto tags = source->tags;

    // Only components the factory can copy are carried over.
    ComponentFactory& factory = mWorld.GetComponentFactory();
    std::vector<std::shared_ptr<Component>> components;
    for (const auto& [kind, component] : source->components) {
        if (factory.CanClone(*component)) {
            components.push_back(component);
        }
    }

    Entity& clone = mWorld.CreateEntity();
    clone.active = active;
    clone.tags = tags;

    for (const auto& component : components) {
        auto copy = factory.Clone(*component);
        copy->active = component->active;
        mWorld.AddComponent(clone.id, std::move(copy));
    }

    if (mWorld.GetConfig().verbose) {
        std::cout << "[EntityManager] Cloned " << id << " -> " << clone.id << "\n";
    }

    return &clone;
}

Entity* EntityManager::FindClosestEntity(const glm::vec3& position, const EntityQuery& query) const {
    Entity* closest = nullptr;
    float closestDist2 = std::numeric_limits<float>::max();

    for (Entity* entity : mWorld.QueryEntities(query)) {
        auto it = entity->components.find(ComponentKind::Transform);
        if (it == entity->components.end()) {
            continue;
        }

        const auto* transform = dynamic_cast<const TransformComponent*>(it->second.get());
        if (!transform) {
            continue;
        }
        const glm::vec3 d = transform->position - position;
        const float dist2 = glm::dot(d, d);
        if (!closest || dist2 < closestDist2) {
            closest = entity;
            closestDist2 = dist2;
        }
    }

    return closest;
}
