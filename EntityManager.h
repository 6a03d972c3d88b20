#pragma once

#include "Entity.h"
#include "GameConstants.h"

#include <glm/glm.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

class World;
struct EntityQuery;

enum class PortfolioContent { Resume, Projects, Skills };

const char* ToString(PortfolioContent content);

// Higher-level construction and bulk operations, built only on World's
// public primitives. Builders attach a component only when its kind is
// registered with the World's ComponentFactory; the tag is always set.
class EntityManager {
public:
    using SpawnFn = std::function<Entity&(const glm::vec3& position)>;

    explicit EntityManager(World& world);

    std::vector<Entity*> GetEntitiesByTag(const std::string& tag) const;
    std::vector<Entity*> GetEntitiesByComponents(const std::vector<ComponentKind>& kinds) const;

    Entity& CreateCharacterEntity(const glm::vec3& position = stroll::positions::Player,
        bool isPlayer = true, const std::string& characterName = {});
    Entity& CreateInteractiveObject(const glm::vec3& position, const std::string& interactionType);

    // count entities evenly spaced on a circle in the XZ plane around center.
    std::vector<Entity*> CreateEntityFormation(const glm::vec3& center, std::size_t count,
        float radius, const SpawnFn& spawn);

    Entity& CreateNPCWithDialogue(const glm::vec3& position, const std::string& dialogueKey,
        const std::string& name);
    Entity& CreatePortfolioBillboard(const glm::vec3& position, PortfolioContent content);

    // Returns the number of entities switched from active to inactive.
    std::size_t DeactivateAllExcept(const std::vector<std::string>& exceptTags);
    std::size_t RemoveEntitiesMatching(const EntityQuery& query);

    // Copies the active flag, tags and every component whose kind is
    // registered. Null when the source does not exist.
    Entity* CloneEntity(const EntityId& id);

    // Nearest match by TransformComponent position; entities without a
    // transform are ignored. Null when nothing qualifies.
    Entity* FindClosestEntity(const glm::vec3& position, const EntityQuery& query) const;

private:
    template<typename T, typename... Args>
    void attachIfRegistered(const EntityId& id, Args&&... args);

    World& mWorld;
};
