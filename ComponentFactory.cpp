#include "ComponentFactory.h"

#include <algorithm>

ComponentFactory::ComponentFactory(std::size_t maxPoolSize)
    : mMaxPoolSize(maxPoolSize)
{
}

void ComponentFactory::Unregister(ComponentKind kind) {
    mRegistry.erase(kind);
}

bool ComponentFactory::IsRegistered(ComponentKind kind) const {
    return mRegistry.find(kind) != mRegistry.end();
}

bool ComponentFactory::CanClone(const Component& source) const {
    auto it = mRegistry.find(source.kind);
    return it != mRegistry.end() && it->second.type == std::type_index(typeid(source));
}

std::shared_ptr<Component> ComponentFactory::Create(ComponentKind kind) {
    Registration& reg = requireRegistration(kind);

    std::shared_ptr<Component> component = popPooled(reg);
    if (component) {
        component->active = true;
        reg.reset(*component);
    }
    else {
        component = reg.construct();
    }

    finalize(*component, kind);
    return component;
}

std::shared_ptr<Component> ComponentFactory::Clone(const Component& source) {
    Registration& reg = requireRegistration(source.kind);
    if (reg.type != std::type_index(typeid(source))) {
        throw std::logic_error(std::string("Component type ") + ToString(source.kind)
            + " is registered to a different component struct.");
    }

    std::shared_ptr<Component> copy = reg.copy(source);
    copy->entityId.clear();
    finalize(*copy, source.kind);
    return copy;
}

void ComponentFactory::Recycle(const std::shared_ptr<Component>& component) {
    if (!component) return;

    auto it = mRegistry.find(component->kind);
    if (it == mRegistry.end()) {
        return;
    }

    component->active = false;
    component->entityId.clear();

    // A pool only ever holds instances of the currently registered struct.
    if (it->second.type != std::type_index(typeid(*component))) {
        return;
    }

    auto& pool = it->second.pool;
    if (pool.size() >= mMaxPoolSize) {
        return;
    }
    if (std::find(pool.begin(), pool.end(), component) != pool.end()) {
        return;
    }
    pool.push_back(component);
}

std::size_t ComponentFactory::GetPoolSize(ComponentKind kind) const {
    auto it = mRegistry.find(kind);
    if (it == mRegistry.end()) {
        return 0;
    }
    return it->second.pool.size();
}

void ComponentFactory::ClearPools() {
    for (auto& pair : mRegistry) {
        pair.second.pool.clear();
    }
}

ComponentFactory::Registration& ComponentFactory::requireRegistration(ComponentKind kind) {
    auto it = mRegistry.find(kind);
    if (it == mRegistry.end()) {
        throw std::runtime_error(std::string("Component type ") + ToString(kind)
            + " is not registered.");
    }
    return it->second;
}

std::shared_ptr<Component> ComponentFactory::popPooled(Registration& reg) {
    if (reg.pool.empty()) {
        return nullptr;
    }
    std::shared_ptr<Component> component = std::move(reg.pool.back());
    reg.pool.pop_back();
    return component;
}

void ComponentFactory::finalize(Component& component, ComponentKind kind) {
    component.kind = kind;
    component.active = true;
}

void RegisterBuiltinComponents(ComponentFactory& factory) {
    factory.Register<TransformComponent>();
    factory.Register<VelocityComponent>();
    factory.Register<ColliderComponent>();
    factory.Register<PlayerComponent>();
    factory.Register<NpcComponent>();
    factory.Register<AnimationComponent>();
    factory.Register<InteractableComponent>();
    factory.Register<DialogueComponent>();
    factory.Register<TriggerComponent>();
    factory.Register<BillboardComponent>();
    factory.Register<HudComponent>();
    factory.Register<VirtualKeyboardComponent>();
}
