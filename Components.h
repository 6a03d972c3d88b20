#pragma once

#include "ComponentTypes.h"
#include "Entity.h"

#include <glm/glm.hpp>
#include <string>
#include <utility>
#include <vector>

// Envelope shared by every component. The data fields live in the derived
// structs; World and the systems only read kind/entityId/active.
struct Component {
    explicit Component(ComponentKind k) : kind(k) {}
    virtual ~Component() = default;

    ComponentKind kind;
    EntityId      entityId;
    bool          active = true;
};

struct TransformComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Transform;

    TransformComponent() : Component(Kind) {}
    explicit TransformComponent(const glm::vec3& pos,
        const glm::vec3& rot = glm::vec3(0.0f),
        const glm::vec3& scl = glm::vec3(1.0f))
        : Component(Kind), position(pos), rotation(rot), scale(scl) {}

    void Reset(const glm::vec3& pos = glm::vec3(0.0f),
        const glm::vec3& rot = glm::vec3(0.0f),
        const glm::vec3& scl = glm::vec3(1.0f)) {
        position = pos;
        rotation = rot;
        scale = scl;
    }

    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);
    glm::vec3 scale = glm::vec3(1.0f);
};

struct VelocityComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Velocity;

    VelocityComponent() : Component(Kind) {}
    explicit VelocityComponent(const glm::vec3& lin, const glm::vec3& ang = glm::vec3(0.0f))
        : Component(Kind), linear(lin), angular(ang) {}

    glm::vec3 linear = glm::vec3(0.0f);
    glm::vec3 angular = glm::vec3(0.0f);
};

struct ColliderComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Collider;

    ColliderComponent() : Component(Kind) {}
    explicit ColliderComponent(const glm::vec3& extents, bool trigger = false)
        : Component(Kind), halfExtents(extents), isTrigger(trigger) {}

    glm::vec3 halfExtents = glm::vec3(0.5f);
    bool isTrigger = false;
};

struct PlayerComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Player;

    PlayerComponent() : Component(Kind) {}
    explicit PlayerComponent(float speed) : Component(Kind), moveSpeed(speed) {}

    float moveSpeed = 4.0f;
};

struct NpcComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Npc;

    NpcComponent() : Component(Kind) {}
    NpcComponent(std::string n, std::string key)
        : Component(Kind), name(std::move(n)), dialogueKey(std::move(key)) {}

    void Reset(std::string n = {}, std::string key = {}) {
        name = std::move(n);
        dialogueKey = std::move(key);
    }

    std::string name;
    std::string dialogueKey;
};

struct AnimationComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Animation;

    AnimationComponent() : Component(Kind) {}
    explicit AnimationComponent(std::string clipName, bool play = true)
        : Component(Kind), clip(std::move(clipName)), playing(play) {}

    std::string clip;
    float time = 0.0f;
    bool playing = false;
};

struct InteractableComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Interactable;

    InteractableComponent() : Component(Kind) {}
    explicit InteractableComponent(std::string type, float r = 2.0f)
        : Component(Kind), interactionType(std::move(type)), radius(r) {}

    std::string interactionType;
    float radius = 2.0f;
};

struct DialogueComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Dialogue;

    DialogueComponent() : Component(Kind) {}
    DialogueComponent(std::string key, std::vector<std::string> text)
        : Component(Kind), dialogueKey(std::move(key)), lines(std::move(text)) {}

    void Reset(std::string key = {}, std::vector<std::string> text = {}) {
        dialogueKey = std::move(key);
        lines = std::move(text);
        index = 0;
    }

    std::string dialogueKey;
    std::vector<std::string> lines;
    std::size_t index = 0;
};

struct TriggerComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Trigger;

    TriggerComponent() : Component(Kind) {}
    explicit TriggerComponent(float r) : Component(Kind), radius(r) {}

    float radius = 1.0f;
    bool triggered = false;
};

struct BillboardComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Billboard;

    BillboardComponent() : Component(Kind) {}
    explicit BillboardComponent(std::string content)
        : Component(Kind), contentType(std::move(content)) {}

    std::string contentType;
};

struct HudComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::Hud;

    HudComponent() : Component(Kind) {}
    explicit HudComponent(bool show) : Component(Kind), visible(show) {}

    bool visible = true;
};

struct VirtualKeyboardComponent : Component {
    static constexpr ComponentKind Kind = ComponentKind::VirtualKeyboard;

    VirtualKeyboardComponent() : Component(Kind) {}
    explicit VirtualKeyboardComponent(bool show) : Component(Kind), visible(show) {}

    bool visible = false;
};
