#pragma once

#include "ISystem.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

class World;

// Registry layered over World: stable ids, enable/disable bookkeeping and
// named groups that can be toggled and updated on their own. World keeps
// its own system list; this class mirrors membership and delegates to it.
class SystemManager {
public:
    explicit SystemManager(World& world);

    // Assigns an id ("system_<n>") when the system has none or its id is
    // already taken by a tracked system. Registering a system this manager
    // already tracks only adds it to groupName.
    std::shared_ptr<ISystem> RegisterSystem(std::shared_ptr<ISystem> system,
        const std::string& groupName = {});

    template<typename T, typename... Args>
    std::shared_ptr<T> CreateSystem(const std::string& groupName, Args&&... args) {
        auto system = std::make_shared<T>(std::forward<Args>(args)...);
        RegisterSystem(system, groupName);
        return system;
    }

    bool UnregisterSystem(const std::shared_ptr<ISystem>& system);

    std::shared_ptr<ISystem> GetSystem(const std::string& systemId) const;
    std::vector<std::shared_ptr<ISystem>> GetSystemsInGroup(const std::string& groupName) const;

    bool EnableSystem(const std::string& systemId);
    bool DisableSystem(const std::string& systemId);

    // Both return how many systems actually changed state.
    std::size_t EnableSystemGroup(const std::string& groupName);
    std::size_t DisableSystemGroup(const std::string& groupName);

    bool SetSystemPriority(const std::string& systemId, int priority);
    bool SetSystemPriority(const std::string& systemId, SystemPriority priority) {
        return SetSystemPriority(systemId, static_cast<int>(priority));
    }

    // Updates the group's active members in ascending priority order and
    // returns how many ran.
    std::size_t UpdateSystemGroup(const std::string& groupName, float dt);

    std::vector<std::shared_ptr<ISystem>> GetAllSystems() const;
    const std::vector<std::shared_ptr<ISystem>>& GetActiveSystems() const { return mActiveSystems; }
    const std::vector<std::shared_ptr<ISystem>>& GetInactiveSystems() const { return mInactiveSystems; }
    std::vector<std::string> GetSystemGroups() const;

    void Destroy();

private:
    struct Group {
        std::string name;
        std::vector<std::shared_ptr<ISystem>> members;
    };

    using SystemList = std::vector<std::shared_ptr<ISystem>>;

    static SystemList::iterator findById(SystemList& list, const std::string& systemId);
    bool isTracked(const std::shared_ptr<ISystem>& system) const;
    Group* findGroup(const std::string& groupName);
    const Group* findGroup(const std::string& groupName) const;

    World& mWorld;
    SystemList mActiveSystems;
    SystemList mInactiveSystems;
    std::vector<Group> mGroups;
    std::uint64_t mNextId = 0;
};
