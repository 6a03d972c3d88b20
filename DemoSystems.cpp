#include "DemoSystems.h"
#include "Components.h"
#include "World.h"

#include <glm/gtc/constants.hpp>

#include <algorithm>
#include <cmath>
#include <memory>

namespace {

    template<typename T>
    T* componentOf(Entity* entity) {
        auto it = entity->components.find(T::Kind);
        if (it == entity->components.end()) return nullptr;
        return dynamic_cast<T*>(it->second.get());
    }

}

ScriptedInputSystem::ScriptedInputSystem()
    : ISystem(SystemPriority::Highest, { ComponentKind::Player, ComponentKind::Velocity })
{
}

void ScriptedInputSystem::Update(float dt, const std::vector<Entity*>& entities)
{
    mHeading += dt * 0.5f;
    if (mHeading > glm::two_pi<float>()) mHeading -= glm::two_pi<float>();

    const glm::vec3 dir(std::cos(mHeading), 0.0f, std::sin(mHeading));
    for (Entity* e : entities) {
        auto* player = componentOf<PlayerComponent>(e);
        auto* vel = componentOf<VelocityComponent>(e);
        if (!player || !vel) continue;
        vel->linear = dir * player->moveSpeed;
    }
}

MovementSystem::MovementSystem()
    : ISystem(SystemPriority::High, { ComponentKind::Transform, ComponentKind::Velocity })
{
}

void MovementSystem::Update(float dt, const std::vector<Entity*>& entities)
{
    for (Entity* e : entities) {
        auto* tr = componentOf<TransformComponent>(e);
        auto* vel = componentOf<VelocityComponent>(e);
        if (!tr || !vel || !tr->active || !vel->active) continue;

        tr->position += vel->linear * dt;
        tr->rotation += vel->angular * dt;
    }
}

ProximitySystem::ProximitySystem()
    : ISystem(SystemPriority::Normal, { ComponentKind::Transform, ComponentKind::Interactable })
{
}

void ProximitySystem::Initialize(World& world)
{
    mWorld = &world;
}

void ProximitySystem::Cleanup()
{
    mInside.clear();
    mWorld = nullptr;
}

void ProximitySystem::Update(float, const std::vector<Entity*>& entities)
{
    if (!mWorld) return;

    EntityQuery playerQuery;
    playerQuery.all = { ComponentKind::Transform, ComponentKind::Player };
    const std::vector<Entity*> players = mWorld->QueryEntities(playerQuery);
    if (players.empty()) return;

    const auto* playerTr = componentOf<TransformComponent>(players.front());
    if (!playerTr) return;
    const glm::vec3 playerPos = playerTr->position;

    for (Entity* e : entities) {
        const auto* tr = componentOf<TransformComponent>(e);
        const auto* inter = componentOf<InteractableComponent>(e);
        if (!tr || !inter) continue;

        const glm::vec3 d = tr->position - playerPos;
        const bool inside = glm::dot(d, d) <= inter->radius * inter->radius;
        auto it = std::find(mInside.begin(), mInside.end(), e->id);
        const bool wasInside = it != mInside.end();

        if (inside == wasInside) continue;

        GameEvent ev;
        ev.entityId = e->id;
        ev.data["interactionType"] = inter->interactionType;
        if (inside) {
            mInside.push_back(e->id);
            ++mEnterCount;
            ev.type = "interaction:enter";
        }
        else {
            mInside.erase(it);
            ev.type = "interaction:exit";
        }
        mWorld->Emit(std::move(ev));
    }
}

AnimationSystem::AnimationSystem()
    : ISystem(SystemPriority::Low, { ComponentKind::Animation })
{
}

void AnimationSystem::Update(float dt, const std::vector<Entity*>& entities)
{
    for (Entity* e : entities) {
        auto* anim = componentOf<AnimationComponent>(e);
        if (anim && anim->playing) {
            anim->time += dt;
        }
    }
}
