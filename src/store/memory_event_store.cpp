#include "store/memory_event_store.hpp"

#include <algorithm>
#include <set>
#include "common/errors.hpp"
#include "common/event_type.hpp"
#include "common/logger.hpp"

namespace event_hub {
namespace store {

namespace {

bool matchesEventTypes(const Event& event, const std::set<std::string>& canonicalTypes) {
    return canonicalTypes.empty() || canonicalTypes.count(canonicalEventType(event.type)) > 0;
}

} // namespace

MemoryEventStore::MemoryEventStore(const std::vector<Event>& events) {
    std::vector<Event> numbered;
    std::vector<Event> unnumbered;
    for (const auto& event : events) {
        if (event.isStored()) {
            numbered.push_back(event);
        } else {
            unnumbered.push_back(event);
        }
    }

    std::sort(numbered.begin(), numbered.end(),
              [](const Event& a, const Event& b) { return a.id < b.id; });
    for (size_t i = 1; i < numbered.size(); ++i) {
        if (numbered[i].id == numbered[i - 1].id) {
            throw StoreError("Duplicate event id in seed: " + std::to_string(numbered[i].id));
        }
    }

    events_ = std::move(numbered);
    lastId_ = events_.empty() ? 0 : events_.back().id;

    for (auto& event : unnumbered) {
        appendLocked(std::move(event));
    }
}

Event MemoryEventStore::append(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendLocked(event);
}

Event MemoryEventStore::appendLocked(Event event) {
    if (event.type.empty()) {
        throw StoreError("Cannot append an event without a type");
    }

    event.id = ++lastId_;
    if (!event.createdAt) {
        event.createdAt = std::chrono::system_clock::now();
    }
    events_.push_back(event);

    LOG_TRACE("Appended event ", event.id, " (", event.type, ")");
    return event;
}

std::vector<Event> MemoryEventStore::getNextFrom(EventId position,
                                                 size_t limit,
                                                 const std::vector<std::string>& eventTypes) const {
    const auto types = canonicalEventTypes(eventTypes);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::upper_bound(events_.begin(), events_.end(), position,
                               [](EventId id, const Event& e) { return id < e.id; });

    std::vector<Event> result;
    for (; it != events_.end() && result.size() < limit; ++it) {
        if (matchesEventTypes(*it, types)) {
            result.push_back(*it);
        }
    }
    return result;
}

EventId MemoryEventStore::latestEventId(const std::vector<std::string>& eventTypes) const {
    const auto types = canonicalEventTypes(eventTypes);

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (matchesEventTypes(*it, types)) {
            return it->id;
        }
    }
    return 0;
}

std::vector<Event> MemoryEventStore::getEventsForAggregateId(const std::string& aggregateId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> result;
    for (const auto& event : events_) {
        if (event.aggregateId && *event.aggregateId == aggregateId) {
            result.push_back(event);
        }
    }
    return result;
}

EventId MemoryEventStore::nextEventId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastId_ + 1;
}

size_t MemoryEventStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace store
} // namespace event_hub
