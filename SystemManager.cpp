#include "SystemManager.h"
#include "Instrument.h"
#include "World.h"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <string>

SystemManager::SystemManager(World& world)
    : mWorld(world)
{
}

std::shared_ptr<ISystem> SystemManager::RegisterSystem(std::shared_ptr<ISystem> system,
    const std::string& groupName)
{
    if (!system) {
        return nullptr;
    }

    const bool alreadyTracked = isTracked(system);

    if (!alreadyTracked) {
        const std::string& requested = system->GetId();
        if (!requested.empty() && GetSystem(requested)) {
            std::cerr << "[SystemManager] Id " << requested
                << " is already taken; assigning a new one\n";
        }
        if (requested.empty() || GetSystem(requested)) {
            std::string id;
            do {
                id = "system_" + std::to_string(mNextId++);
            } while (GetSystem(id));
            system->SetId(id);
        }

        if (system->IsActive()) {
            mActiveSystems.push_back(system);
        }
        else {
            mInactiveSystems.push_back(system);
        }
    }

    if (!groupName.empty()) {
        Group* group = findGroup(groupName);
        if (!group) {
            mGroups.push_back(Group{ groupName, {} });
            group = &mGroups.back();
        }
        if (std::find(group->members.begin(), group->members.end(), system) == group->members.end()) {
            group->members.push_back(system);
        }
    }

    if (!alreadyTracked) {
        mWorld.AddSystem(system);
    }

    return system;
}

bool SystemManager::UnregisterSystem(const std::shared_ptr<ISystem>& system) {
    if (!system || !isTracked(system)) {
        return false;
    }

    mActiveSystems.erase(std::remove(mActiveSystems.begin(), mActiveSystems.end(), system),
        mActiveSystems.end());
    mInactiveSystems.erase(std::remove(mInactiveSystems.begin(), mInactiveSystems.end(), system),
        mInactiveSystems.end());

    for (auto& group : mGroups) {
        group.members.erase(std::remove(group.members.begin(), group.members.end(), system),
            group.members.end());
    }
    mGroups.erase(std::remove_if(mGroups.begin(), mGroups.end(),
        [](const Group& g) { return g.members.empty(); }), mGroups.end());

    return mWorld.RemoveSystem(system);
}

std::shared_ptr<ISystem> SystemManager::GetSystem(const std::string& systemId) const {
    for (const SystemList* list : { &mActiveSystems, &mInactiveSystems }) {
        for (const auto& system : *list) {
            if (system->GetId() == systemId) {
                return system;
            }
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<ISystem>> SystemManager::GetSystemsInGroup(const std::string& groupName) const {
    const Group* group = findGroup(groupName);
    return group ? group->members : std::vector<std::shared_ptr<ISystem>>{};
}

bool SystemManager::EnableSystem(const std::string& systemId) {
    auto it = findById(mInactiveSystems, systemId);
    if (it == mInactiveSystems.end()) {
        return false;
    }

    std::shared_ptr<ISystem> system = *it;
    mInactiveSystems.erase(it);
    system->SetActive(true);
    mActiveSystems.push_back(std::move(system));
    return true;
}

bool SystemManager::DisableSystem(const std::string& systemId) {
    auto it = findById(mActiveSystems, systemId);
    if (it == mActiveSystems.end()) {
        return false;
    }

    std::shared_ptr<ISystem> system = *it;
    mActiveSystems.erase(it);
    system->SetActive(false);
    mInactiveSystems.push_back(std::move(system));
    return true;
}

std::size_t SystemManager::EnableSystemGroup(const std::string& groupName) {
    const Group* group = findGroup(groupName);
    if (!group) {
        return 0;
    }

    std::size_t enabled = 0;
    for (const auto& system : group->members) {
        if (EnableSystem(system->GetId())) {
            ++enabled;
        }
    }
    return enabled;
}

std::size_t SystemManager::DisableSystemGroup(const std::string& groupName) {
    const Group* group = findGroup(groupName);
    if (!group) {
        return 0;
    }

    std::size_t disabled = 0;
    for (const auto& system : group->members) {
        if (DisableSystem(system->GetId())) {
            ++disabled;
        }
    }
    return disabled;
}

bool SystemManager::SetSystemPriority(const std::string& systemId, int priority) {
    std::shared_ptr<ISystem> system = GetSystem(systemId);
    if (!system) {
        return false;
    }

    system->SetPriority(priority);
    mWorld.SortSystems();
    return true;
}

std::size_t SystemManager::UpdateSystemGroup(const std::string& groupName, float dt) {
    const Group* group = findGroup(groupName);
    if (!group) {
        return 0;
    }

    // Priorities may have changed since registration; order per call.
    SystemList ordered;
    std::copy_if(group->members.begin(), group->members.end(), std::back_inserter(ordered),
        [](const std::shared_ptr<ISystem>& s) { return s->IsActive(); });
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const std::shared_ptr<ISystem>& a, const std::shared_ptr<ISystem>& b) {
            return a->GetPriority() < b->GetPriority();
        });

    for (const auto& system : ordered) {
        EntityQuery query;
        query.all = system->GetRequiredComponents();
        const std::vector<Entity*> entities = mWorld.QueryEntities(query);

        STROLL_ZONE_CPU(mWorld.GetDiagnostics(), system->GetName());
        system->Update(dt, entities);
    }

    return ordered.size();
}

std::vector<std::shared_ptr<ISystem>> SystemManager::GetAllSystems() const {
    SystemList all = mActiveSystems;
    all.insert(all.end(), mInactiveSystems.begin(), mInactiveSystems.end());
    return all;
}

std::vector<std::string> SystemManager::GetSystemGroups() const {
    std::vector<std::string> names;
    names.reserve(mGroups.size());
    for (const auto& group : mGroups) {
        names.push_back(group.name);
    }
    return names;
}

void SystemManager::Destroy() {
    for (const auto& system : GetAllSystems()) {
        mWorld.RemoveSystem(system);
    }

    mActiveSystems.clear();
    mInactiveSystems.clear();
    mGroups.clear();
}

SystemManager::SystemList::iterator SystemManager::findById(SystemList& list, const std::string& systemId) {
    return std::find_if(list.begin(), list.end(),
        [&systemId](const std::shared_ptr<ISystem>& s) { return s->GetId() == systemId; });
}

bool SystemManager::isTracked(const std::shared_ptr<ISystem>& system) const {
    return std::find(mActiveSystems.begin(), mActiveSystems.end(), system) != mActiveSystems.end()
        || std::find(mInactiveSystems.begin(), mInactiveSystems.end(), system) != mInactiveSystems.end();
}

SystemManager::Group* SystemManager::findGroup(const std::string& groupName) {
    auto it = std::find_if(mGroups.begin(), mGroups.end(),
        [&groupName](const Group& g) { return g.name == groupName; });
    return it == mGroups.end() ? nullptr : &*it;
}

const SystemManager::Group* SystemManager::findGroup(const std::string& groupName) const {
    auto it = std::find_if(mGroups.begin(), mGroups.end(),
        [&groupName](const Group& g) { return g.name == groupName; });
    return it == mGroups.end() ? nullptr : &*it;
}
