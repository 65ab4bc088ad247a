// AEGIS - Controller Event Bus Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/controller/events.h"
#include "aegis/util/logging.h"

#include <algorithm>
#include <exception>
#include <sstream>

namespace aegis {
namespace controller {

namespace {

struct EventName {
    EventType type;
    const char* name;
};

const EventName EVENT_NAMES[] = {
    {EventType::StateChange, "state-change"},
    {EventType::Rejected, "rejected"},
    {EventType::Registered, "registered"},
    {EventType::KeyRegistered, "key-registered"},
    {EventType::UpdateStaged, "update-staged"},
    {EventType::UpdateApplied, "update-applied"},
    {EventType::UpdateFailed, "update-failed"},
    {EventType::Reset, "reset"},
};

} // namespace

const char* EventTypeToString(EventType type) {
    for (const auto& entry : EVENT_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

std::optional<EventType> ParseEventType(const std::string& name) {
    for (const auto& entry : EVENT_NAMES) {
        if (name == entry.name) return entry.type;
    }
    return std::nullopt;
}

std::string ControllerEvent::ToString() const {
    std::ostringstream ss;
    ss << EventTypeToString(type) << "{";
    switch (type) {
        case EventType::StateChange:
            ss << "from=" << fromState << ", to=" << toState;
            break;
        case EventType::Rejected:
            ss << "contract=" << (contract ? contract->id : "") << ", error=" << error;
            break;
        case EventType::Registered:
            ss << "contract=" << (contract ? contract->id : "");
            break;
        case EventType::KeyRegistered:
            ss << "keyId=" << keyId;
            break;
        case EventType::UpdateStaged:
            ss << "version=" << version << ", target=" << target;
            break;
        case EventType::UpdateApplied:
            ss << "version=" << version << ", target=" << target << ", status=" << status;
            break;
        case EventType::UpdateFailed:
            ss << "version=" << version << ", target=" << target << ", error=" << error;
            break;
        case EventType::Reset:
            break;
    }
    ss << "}";
    return ss.str();
}

// ============================================================================
// EventBus
// ============================================================================

SubscriptionId EventBus::Subscribe(EventType type, EventHandler handler) {
    SubscriptionId id = nextId_++;
    subscriptions_.push_back({id, type, std::move(handler)});
    return id;
}

SubscriptionId EventBus::SubscribeAll(EventHandler handler) {
    SubscriptionId id = nextId_++;
    subscriptions_.push_back({id, std::nullopt, std::move(handler)});
    return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

void EventBus::Publish(const ControllerEvent& event) {
    if (depth_ >= MAX_DISPATCH_DEPTH) {
        ++dropped_;
        LOG_ERROR(util::LogCategory::EVENTS)
            << "Refusing nested dispatch of " << EventTypeToString(event.type)
            << " at depth " << depth_;
        return;
    }

    LOG_TRACE(util::LogCategory::EVENTS) << "Publish " << event.ToString();

    // Handlers may subscribe or unsubscribe while we dispatch
    std::vector<EventHandler> handlers;
    for (const auto& sub : subscriptions_) {
        if (!sub.type || *sub.type == event.type) {
            handlers.push_back(sub.handler);
        }
    }

    struct DepthGuard {
        int& depth;
        explicit DepthGuard(int& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
    } guard(depth_);

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            ++handlerErrors_;
            LOG_ERROR(util::LogCategory::EVENTS)
                << "Handler for " << EventTypeToString(event.type) << " threw: " << e.what();
        } catch (...) {
            ++handlerErrors_;
            LOG_ERROR(util::LogCategory::EVENTS)
                << "Handler for " << EventTypeToString(event.type)
                << " threw a non-standard exception";
        }
    }
}

size_t EventBus::SubscriberCount(EventType type) const {
    return static_cast<size_t>(std::count_if(
        subscriptions_.begin(), subscriptions_.end(),
        [type](const Subscription& s) { return !s.type || *s.type == type; }));
}

} // namespace controller
} // namespace aegis
