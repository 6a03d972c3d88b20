#pragma once

#include "ComponentTypes.h"
#include "Entity.h"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class ISystem;

struct GameEvent {
    std::string type;
    EntityId entityId;
    std::optional<ComponentKind> componentType;
    ISystem* system = nullptr;
    std::map<std::string, std::string> data;
    std::int64_t timestampNs = 0;
};

using EventListener = std::function<void(const GameEvent&)>;

// Listeners are compared by handle identity, so keep the handle to remove one.
using ListenerHandle = std::shared_ptr<EventListener>;

ListenerHandle MakeListener(EventListener fn);

GameEvent MakeEvent(std::string type, std::map<std::string, std::string> data = {});

// Runs before dispatch. Returning an empty optional cancels the event.
class EventMiddleware {
public:
    virtual ~EventMiddleware() = default;
    virtual std::optional<GameEvent> Process(GameEvent event) = 0;
};

class LoggingMiddleware : public EventMiddleware {
public:
    enum class Level { Debug, Info, Warn, Error };

    explicit LoggingMiddleware(Level level = Level::Debug, std::ostream* out = nullptr);
    std::optional<GameEvent> Process(GameEvent event) override;

private:
    Level mLevel;
    std::ostream* mOut;
};

class FilterMiddleware : public EventMiddleware {
public:
    void BlockEventType(const std::string& type) { mBlocked.insert(type); }
    void UnblockEventType(const std::string& type) { mBlocked.erase(type); }
    bool IsBlocked(const std::string& type) const { return mBlocked.count(type) > 0; }

    std::optional<GameEvent> Process(GameEvent event) override;

private:
    std::unordered_set<std::string> mBlocked;
};

// Synchronous publish/subscribe keyed by event type string.
//
// Delivery happens on the caller's stack in registration order. A listener
// may emit again (including the same type); nothing bounds that recursion.
class EventBus {
public:
    using FaultHandler = std::function<void(const std::string& eventType, const std::string& message)>;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void On(const std::string& type, const ListenerHandle& listener);
    ListenerHandle On(const std::string& type, EventListener fn);

    // The returned handle is the registered wrapper; pass it to Off to cancel.
    ListenerHandle Once(const std::string& type, EventListener fn);

    void Off(const std::string& type, const ListenerHandle& listener);
    void RemoveAllListeners(const std::string& type);
    void RemoveAllListeners();

    // A throwing listener is reported to the fault handler and the
    // remaining listeners still run.
    void Emit(GameEvent event);

    std::size_t ListenerCount(const std::string& type) const;
    std::vector<std::string> EventNames() const;

    void AddMiddleware(std::shared_ptr<EventMiddleware> middleware);
    bool RemoveMiddleware(const std::shared_ptr<EventMiddleware>& middleware);

    void SetFaultHandler(FaultHandler handler) { mFaultHandler = std::move(handler); }

private:
    bool isRegistered(const std::string& type, const ListenerHandle& listener) const;
    void reportFault(const std::string& type, const std::string& message);

    std::unordered_map<std::string, std::vector<ListenerHandle>> mListeners;
    std::vector<std::shared_ptr<EventMiddleware>> mMiddleware;
    FaultHandler mFaultHandler;
};
