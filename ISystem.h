#pragma once

#include "ComponentTypes.h"
#include "Entity.h"

#include <string>
#include <utility>
#include <vector>

class World;

// Lower value runs earlier.
enum class SystemPriority : int {
    Highest = 0,
    High = 1,
    Normal = 2,
    Low = 3,
    Lowest = 4,
};

class ISystem {
public:
    explicit ISystem(SystemPriority priority = SystemPriority::Normal,
        std::vector<ComponentKind> requiredComponents = {},
        bool active = true)
        : mPriority(static_cast<int>(priority))
        , mActive(active)
        , mRequiredComponents(std::move(requiredComponents))
    {
    }
    virtual ~ISystem() = default;

    // entities holds every active entity that carries all required kinds.
    virtual void Update(float dt, const std::vector<Entity*>& entities) = 0;

    // Called once by World::AddSystem / World::RemoveSystem.
    virtual void Initialize(World& /*world*/) {}
    virtual void Cleanup() {}

    // Used as the diagnostics scope label.
    virtual std::string GetName() const { return mId.empty() ? "system" : mId; }

    int  GetPriority() const { return mPriority; }
    void SetPriority(int priority) { mPriority = priority; }
    void SetPriority(SystemPriority priority) { mPriority = static_cast<int>(priority); }

    bool IsActive() const { return mActive; }
    // Once registered with a SystemManager, toggle through EnableSystem /
    // DisableSystem instead; its active and inactive lists are not resynced.
    void SetActive(bool active) { mActive = active; }

    const std::vector<ComponentKind>& GetRequiredComponents() const { return mRequiredComponents; }

    // Assigned by SystemManager; empty until registered there.
    const std::string& GetId() const { return mId; }
    void SetId(std::string id) { mId = std::move(id); }

protected:
    int mPriority;
    bool mActive;
    std::vector<ComponentKind> mRequiredComponents;
    std::string mId;
};
