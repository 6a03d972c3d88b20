#include "EventBus.h"
#include "Chrono.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

ListenerHandle MakeListener(EventListener fn) {
    return std::make_shared<EventListener>(std::move(fn));
}

GameEvent MakeEvent(std::string type, std::map<std::string, std::string> data) {
    GameEvent event;
    event.type = std::move(type);
    event.data = std::move(data);
    event.timestampNs = diag::now_ns();
    return event;
}

LoggingMiddleware::LoggingMiddleware(Level level, std::ostream* out)
    : mLevel(level)
    , mOut(out)
{
}

std::optional<GameEvent> LoggingMiddleware::Process(GameEvent event) {
    static const char* names[] = { "debug", "info", "warn", "error" };

    std::ostream& out = mOut ? *mOut
        : (mLevel == Level::Warn || mLevel == Level::Error) ? std::cerr : std::cout;

    out << "[Event:" << names[static_cast<int>(mLevel)] << "] " << event.type;
    if (!event.entityId.empty()) {
        out << " entity=" << event.entityId;
    }
    if (event.componentType) {
        out << " component=" << ToString(*event.componentType);
    }
    for (const auto& [key, value] : event.data) {
        out << " " << key << "=" << value;
    }
    out << " t=" << event.timestampNs << "\n";

    return event;
}

std::optional<GameEvent> FilterMiddleware::Process(GameEvent event) {
    if (IsBlocked(event.type)) {
        return std::nullopt;
    }
    return event;
}

void EventBus::On(const std::string& type, const ListenerHandle& listener) {
    if (!listener) return;
    auto& listeners = mListeners[type];
    if (std::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
        listeners.push_back(listener);
    }
}

ListenerHandle EventBus::On(const std::string& type, EventListener fn) {
    ListenerHandle handle = MakeListener(std::move(fn));
    On(type, handle);
    return handle;
}

ListenerHandle EventBus::Once(const std::string& type, EventListener fn) {
    auto wrapper = std::make_shared<EventListener>();
    std::weak_ptr<EventListener> weak = wrapper;

    *wrapper = [this, type, fn = std::move(fn), weak](const GameEvent& event) {
        // Unregister before the call so a throwing listener still fires only once.
        if (auto self = weak.lock()) {
            Off(type, self);
        }
        fn(event);
    };

    On(type, wrapper);
    return wrapper;
}

void EventBus::Off(const std::string& type, const ListenerHandle& listener) {
    auto it = mListeners.find(type);
    if (it == mListeners.end()) {
        return;
    }

    auto& listeners = it->second;
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());

    if (listeners.empty()) {
        mListeners.erase(it);
    }
}

void EventBus::RemoveAllListeners(const std::string& type) {
    mListeners.erase(type);
}

void EventBus::RemoveAllListeners() {
    mListeners.clear();
}

void EventBus::Emit(GameEvent event) {
    if (event.timestampNs == 0) {
        event.timestampNs = diag::now_ns();
    }

    for (const auto& mw : mMiddleware) {
        std::optional<GameEvent> processed = mw->Process(std::move(event));
        if (!processed) {
            return;
        }
        event = std::move(*processed);
    }

    auto it = mListeners.find(event.type);
    if (it == mListeners.end()) {
        return;
    }

    // Iterate a copy: listeners may call On/Off while we dispatch.
    const std::vector<ListenerHandle> snapshot = it->second;
    for (const auto& listener : snapshot) {
        if (!isRegistered(event.type, listener)) {
            continue;
        }

        try {
            (*listener)(event);
        }
        catch (const std::exception& e) {
            reportFault(event.type, e.what());
        }
        catch (...) {
            reportFault(event.type, "non-standard exception");
        }
    }
}

std::size_t EventBus::ListenerCount(const std::string& type) const {
    auto it = mListeners.find(type);
    return it == mListeners.end() ? 0 : it->second.size();
}

std::vector<std::string> EventBus::EventNames() const {
    std::vector<std::string> names;
    names.reserve(mListeners.size());
    for (const auto& pair : mListeners) {
        names.push_back(pair.first);
    }
    return names;
}

void EventBus::AddMiddleware(std::shared_ptr<EventMiddleware> middleware) {
    if (middleware) {
        mMiddleware.push_back(std::move(middleware));
    }
}

bool EventBus::RemoveMiddleware(const std::shared_ptr<EventMiddleware>& middleware) {
    auto it = std::find(mMiddleware.begin(), mMiddleware.end(), middleware);
    if (it == mMiddleware.end()) {
        return false;
    }
    mMiddleware.erase(it);
    return true;
}

bool EventBus::isRegistered(const std::string& type, const ListenerHandle& listener) const {
    auto it = mListeners.find(type);
    if (it == mListeners.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), listener) != it->second.end();
}

void EventBus::reportFault(const std::string& type, const std::string& message) {
    if (mFaultHandler) {
        mFaultHandler(type, message);
        return;
    }
    std::cerr << "[EventBus] Error in event listener for " << type << ": " << message << "\n";
}
