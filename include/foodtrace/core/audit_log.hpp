#pragma once

/**
 * @file audit_log.hpp
 * @brief Append-only, queryable trail of registration events
 *
 * The audit log is owned by ProductRegistry, which appends to it in the same
 * critical section that inserts the record. External collaborators read it
 * or subscribe to be told about new events.
 *
 * - Sequence numbers start at 0 and are dense (event i has sequence i)
 * - Events are never modified or removed
 * - Thread-safe (shared_mutex for events, separate mutex for listeners)
 *
 * Listeners run on the registering thread after the registry has released its
 * lock, so they may call back into the registry. With concurrent registrations
 * notifications can arrive out of sequence order; use the event's sequence
 * when order matters.
 */

#include "foodtrace/core/product_record.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace foodtrace {

class AuditLog {
public:
    using Listener = std::function<void(const RegistrationEvent&)>;
    using SubscriptionId = uint64_t;
    static constexpr SubscriptionId INVALID_SUBSCRIPTION = 0;

    AuditLog() = default;

    // Non-copyable (contains mutexes)
    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    /// Number of events recorded
    [[nodiscard]] size_t size() const;

    /// Snapshot of all events in sequence order
    [[nodiscard]] std::vector<RegistrationEvent> events() const;

    /// Events for one product id (at most one for a well-formed registry)
    [[nodiscard]] std::vector<RegistrationEvent> eventsFor(std::string_view productId) const;

    /// Events with sequence >= `sequence`
    [[nodiscard]] std::vector<RegistrationEvent> eventsSince(uint64_t sequence) const;

    /// Most recent event, or nullopt if empty
    [[nodiscard]] std::optional<RegistrationEvent> latest() const;

    /// Register a listener for future events. Returns a non-zero id.
    SubscriptionId subscribe(Listener listener);

    /// Remove a listener. Returns false if the id is unknown.
    bool unsubscribe(SubscriptionId id);

    [[nodiscard]] size_t listenerCount() const;

private:
    friend class ProductRegistry;

    // Assigns the next sequence number, stores the event and returns the stored copy.
    // Caller holds the registry's write lock.
    RegistrationEvent append(RegistrationEvent event);

    // Invoke every listener; exceptions from a listener are logged and dropped
    void notify(const RegistrationEvent& event) const;

    mutable std::shared_mutex mutex_;
    std::vector<RegistrationEvent> events_;

    mutable std::mutex listenerMutex_;
    std::vector<std::pair<SubscriptionId, Listener>> listeners_;
    SubscriptionId nextSubscription_ = 1;
};

}  // namespace foodtrace
