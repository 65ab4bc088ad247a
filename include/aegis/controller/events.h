// AEGIS - Controller Event Bus
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Synchronous publish/subscribe notification of controller state changes
// and update outcomes. Handlers run on the publishing call's stack, in
// subscription order. A handler may call back into the controller; nested
// dispatch is bounded by MAX_DISPATCH_DEPTH and refused beyond it.

#ifndef AEGIS_CONTROLLER_EVENTS_H
#define AEGIS_CONTROLLER_EVENTS_H

#include "aegis/registry/contract.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace aegis {
namespace controller {

// ============================================================================
// Events
// ============================================================================

enum class EventType {
    StateChange,
    Rejected,
    Registered,
    KeyRegistered,
    UpdateStaged,
    UpdateApplied,
    UpdateFailed,
    Reset
};

/// Wire name of an event ("state-change", "update-applied", ...)
const char* EventTypeToString(EventType type);

/// Parse a wire name
std::optional<EventType> ParseEventType(const std::string& name);

/// Event payload. Only the fields named for the event type are set.
struct ControllerEvent {
    EventType type{EventType::StateChange};

    /// state-change
    std::string fromState;
    std::string toState;

    /// rejected, registered
    std::optional<registry::Contract> contract;

    /// rejected, update-failed
    std::string error;

    /// key-registered
    std::string keyId;

    /// update-staged, update-applied, update-failed
    std::string version;
    std::string target;

    /// update-applied
    std::string status;

    std::string ToString() const;
};

// ============================================================================
// Event Bus
// ============================================================================

using EventHandler = std::function<void(const ControllerEvent&)>;
using SubscriptionId = uint64_t;

class EventBus {
public:
    /// Nested dispatch deeper than this is refused
    static constexpr int MAX_DISPATCH_DEPTH = 8;

    /// Subscribe to one event type. Returns a token for Unsubscribe().
    SubscriptionId Subscribe(EventType type, EventHandler handler);

    /// Subscribe to every event type
    SubscriptionId SubscribeAll(EventHandler handler);

    /// Remove a subscription. Returns false if the token is unknown.
    bool Unsubscribe(SubscriptionId id);

    /// Deliver an event to its subscribers
    void Publish(const ControllerEvent& event);

    /// Number of handlers that would receive an event of this type
    size_t SubscriberCount(EventType type) const;

    /// Events refused because of the depth bound
    uint64_t DroppedCount() const { return dropped_; }

    /// Handler invocations that ended in an exception
    uint64_t HandlerErrorCount() const { return handlerErrors_; }

private:
    struct Subscription {
        SubscriptionId id;
        std::optional<EventType> type;
        EventHandler handler;
    };

    std::vector<Subscription> subscriptions_;
    SubscriptionId nextId_{1};
    int depth_{0};
    uint64_t dropped_{0};
    uint64_t handlerErrors_{0};
};

} // namespace controller
} // namespace aegis

#endif // AEGIS_CONTROLLER_EVENTS_H
