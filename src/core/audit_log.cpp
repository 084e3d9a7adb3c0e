#include "foodtrace/core/audit_log.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace foodtrace {

size_t AuditLog::size() const {
    std::shared_lock lock(mutex_);
    return events_.size();
}

std::vector<RegistrationEvent> AuditLog::events() const {
    std::shared_lock lock(mutex_);
    return events_;
}

std::vector<RegistrationEvent> AuditLog::eventsFor(std::string_view productId) const {
    std::shared_lock lock(mutex_);
    std::vector<RegistrationEvent> result;
    for (const auto& event : events_) {
        if (event.productId == productId) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<RegistrationEvent> AuditLog::eventsSince(uint64_t sequence) const {
    std::shared_lock lock(mutex_);
    if (sequence >= events_.size()) {
        return {};
    }
    return std::vector<RegistrationEvent>(
        events_.begin() + static_cast<std::ptrdiff_t>(sequence), events_.end());
}

std::optional<RegistrationEvent> AuditLog::latest() const {
    std::shared_lock lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    return events_.back();
}

AuditLog::SubscriptionId AuditLog::subscribe(Listener listener) {
    std::lock_guard lock(listenerMutex_);
    SubscriptionId id = nextSubscription_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool AuditLog::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(listenerMutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

size_t AuditLog::listenerCount() const {
    std::lock_guard lock(listenerMutex_);
    return listeners_.size();
}

RegistrationEvent AuditLog::append(RegistrationEvent event) {
    std::unique_lock lock(mutex_);
    event.sequence = events_.size();
    events_.push_back(event);
    return event;
}

void AuditLog::notify(const RegistrationEvent& event) const {
    // Copy so listeners may subscribe/unsubscribe from inside a callback
    std::vector<std::pair<SubscriptionId, Listener>> listeners;
    {
        std::lock_guard lock(listenerMutex_);
        listeners = listeners_;
    }

    for (const auto& [id, listener] : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            std::cerr << "[AuditLog] Listener " << id << " failed on event "
                      << event.sequence << ": " << e.what() << '\n';
        }
    }
}

}  // namespace foodtrace
