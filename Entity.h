#pragma once

#include "ComponentTypes.h"

#include <map>
#include <memory>
#include <string>
#include <unordered_set>

struct Component;

using EntityId = std::string;

inline const EntityId INVALID_ENTITY{};

struct Entity {
    EntityId id;
    std::map<ComponentKind, std::shared_ptr<Component>> components;
    std::unordered_set<std::string> tags;
    bool active = true;

    bool HasComponent(ComponentKind kind) const {
        return components.find(kind) != components.end();
    }
    bool HasTag(const std::string& tag) const {
        return tags.find(tag) != tags.end();
    }
    void AddTag(const std::string& tag) { tags.insert(tag); }
    bool RemoveTag(const std::string& tag) { return tags.erase(tag) > 0; }
};
