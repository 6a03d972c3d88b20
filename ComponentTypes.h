#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

enum class ComponentKind : std::uint8_t {
    // Physics
    Transform = 0,
    Velocity,
    Collider,

    // Character
    Player,
    Npc,
    Animation,

    // Interaction
    Interactable,
    Dialogue,
    Trigger,

    // UI
    Billboard,
    Hud,
    VirtualKeyboard,

    COUNT
};

constexpr std::size_t MAX_COMPONENTS = static_cast<std::size_t>(ComponentKind::COUNT);

inline const char* ToString(ComponentKind kind) {
    switch (kind) {
    case ComponentKind::Transform:       return "transform";
    case ComponentKind::Velocity:        return "velocity";
    case ComponentKind::Collider:        return "collider";
    case ComponentKind::Player:          return "player";
    case ComponentKind::Npc:             return "npc";
    case ComponentKind::Animation:       return "animation";
    case ComponentKind::Interactable:    return "interactable";
    case ComponentKind::Dialogue:        return "dialogue";
    case ComponentKind::Trigger:         return "trigger";
    case ComponentKind::Billboard:       return "billboard";
    case ComponentKind::Hud:             return "hud";
    case ComponentKind::VirtualKeyboard: return "virtualKeyboard";
    case ComponentKind::COUNT:           break;
    }
    return "unknown";
}

inline std::optional<ComponentKind> ComponentKindFromString(std::string_view name) {
    for (std::size_t i = 0; i < MAX_COMPONENTS; ++i) {
        const auto kind = static_cast<ComponentKind>(i);
        if (name == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}
