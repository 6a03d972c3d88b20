#pragma once

#include "ComponentTypes.h"
#include "Components.h"

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace detail {

    template<typename, typename T, typename... Args>
    struct HasResetImpl : std::false_type {};

    template<typename T, typename... Args>
    struct HasResetImpl<
        std::void_t<decltype(std::declval<T&>().Reset(std::declval<Args>()...))>,
        T, Args...> : std::true_type {};

    // True when T exposes Reset(Args...).
    template<typename T, typename... Args>
    using HasReset = HasResetImpl<void, T, Args...>;

}

// Creates components by kind and keeps a bounded free-list per kind so
// removed components can be handed out again instead of reallocated.
class ComponentFactory {
public:
    static constexpr std::size_t MAX_POOL_SIZE = 1000;

    explicit ComponentFactory(std::size_t maxPoolSize = MAX_POOL_SIZE);

    template<typename T>
    void Register();

    void Unregister(ComponentKind kind);
    bool IsRegistered(ComponentKind kind) const;
    // True when source's kind is registered to source's dynamic type.
    bool CanClone(const Component& source) const;

    // Throws std::runtime_error when T::Kind was never registered and
    // std::logic_error when the kind is registered to a different type.
    template<typename T, typename... Args>
    std::shared_ptr<T> Create(Args&&... args);

    // Untyped creation with default-constructed state.
    std::shared_ptr<Component> Create(ComponentKind kind);

    // Fresh instance carrying a copy of source's data, with no owning entity.
    // Throws like Create when source's kind is not registered.
    std::shared_ptr<Component> Clone(const Component& source);

    void Recycle(const std::shared_ptr<Component>& component);

    std::size_t GetPoolSize(ComponentKind kind) const;
    std::size_t GetMaxPoolSize() const { return mMaxPoolSize; }
    void ClearPools();

private:
    struct Registration {
        std::type_index type{ typeid(void) };
        std::function<std::shared_ptr<Component>()> construct;
        std::function<void(Component&)> reset;
        std::function<std::shared_ptr<Component>(const Component&)> copy;
        std::vector<std::shared_ptr<Component>> pool;
    };

    Registration& requireRegistration(ComponentKind kind);
    std::shared_ptr<Component> popPooled(Registration& reg);
    static void finalize(Component& component, ComponentKind kind);

    std::size_t mMaxPoolSize;
    std::unordered_map<ComponentKind, Registration> mRegistry;
};

// Registers every component struct declared in Components.h.
void RegisterBuiltinComponents(ComponentFactory& factory);

template<typename T>
void ComponentFactory::Register() {
    static_assert(std::is_base_of<Component, T>::value, "T must derive from Component");
    static_assert(std::is_default_constructible<T>::value, "T must be default constructible");

    const ComponentKind kind = T::Kind;
    const std::type_index ti{ typeid(T) };

    auto it = mRegistry.find(kind);
    if (it != mRegistry.end()) {
        std::cerr << "[ComponentFactory] Component type " << ToString(kind)
            << " is already registered. Overwriting.\n";
        if (it->second.type != ti) {
            it->second.pool.clear();
        }
    }

    Registration& reg = mRegistry[kind];
    reg.type = ti;
    reg.construct = [] { return std::static_pointer_cast<Component>(std::make_shared<T>()); };
    reg.reset = [](Component& c) {
        T& typed = static_cast<T&>(c);
        if constexpr (detail::HasReset<T>::value) {
            typed.Reset();
        }
        else {
            typed = T();
        }
    };
    reg.copy = [](const Component& c) {
        return std::static_pointer_cast<Component>(std::make_shared<T>(static_cast<const T&>(c)));
    };
}

template<typename T, typename... Args>
std::shared_ptr<T> ComponentFactory::Create(Args&&... args) {
    const ComponentKind kind = T::Kind;
    Registration& reg = requireRegistration(kind);
    if (reg.type != std::type_index(typeid(T))) {
        throw std::logic_error(std::string("Component type ") + ToString(kind)
            + " is registered to a different component struct.");
    }

    std::shared_ptr<T> component;
    if (auto pooled = popPooled(reg)) {
        component = std::static_pointer_cast<T>(pooled);
        component->active = true;
        if constexpr (detail::HasReset<T, Args...>::value) {
            component->Reset(std::forward<Args>(args)...);
        }
        else {
            *component = T(std::forward<Args>(args)...);
        }
    }
    else {
        component = std::make_shared<T>(std::forward<Args>(args)...);
    }

    finalize(*component, kind);
    return component;
}
