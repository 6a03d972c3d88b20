#pragma once

#include "ISystem.h"

#include <glm/glm.hpp>

#include <cstddef>
#include <string>
#include <vector>

class World;

// Scripted stand-in for device input: steers the player around a circle.
class ScriptedInputSystem : public ISystem {
public:
    ScriptedInputSystem();
    void Update(float dt, const std::vector<Entity*>& entities) override;
    std::string GetName() const override { return "ScriptedInput"; }

private:
    float mHeading = 0.0f;
};

// Integrates VelocityComponent into TransformComponent.
class MovementSystem : public ISystem {
public:
    MovementSystem();
    void Update(float dt, const std::vector<Entity*>& entities) override;
    std::string GetName() const override { return "Movement"; }
};

// Raises "interaction:enter" / "interaction:exit" when the player crosses
// an interactable's radius.
class ProximitySystem : public ISystem {
public:
    ProximitySystem();
    void Initialize(World& world) override;
    void Cleanup() override;
    void Update(float dt, const std::vector<Entity*>& entities) override;
    std::string GetName() const override { return "Proximity"; }

    std::size_t GetEnterCount() const { return mEnterCount; }

private:
    World* mWorld = nullptr;
    std::vector<EntityId> mInside;
    std::size_t mEnterCount = 0;
};

// Steps AnimationComponent clocks.
class AnimationSystem : public ISystem {
public:
    AnimationSystem();
    void Update(float dt, const std::vector<Entity*>& entities) override;
    std::string GetName() const override { return "Animation"; }
};
