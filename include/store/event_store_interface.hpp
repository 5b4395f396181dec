#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include "common/types.hpp"

namespace event_hub {
namespace store {

class EventStoreInterface {
public:
    virtual ~EventStoreInterface() = default;

    // Durably appends the event and returns the stored copy with its id
    // (and createdAt, when unset) assigned. Throws StoreError on failure.
    virtual Event append(const Event& event) = 0;

    // Events with id > position, ascending by id, at most `limit`.
    // A non-empty `eventTypes` restricts the result to those types.
    virtual std::vector<Event> getNextFrom(EventId position,
                                           size_t limit,
                                           const std::vector<std::string>& eventTypes = {}) const = 0;

    virtual EventId latestEventId(const std::vector<std::string>& eventTypes = {}) const = 0;

    virtual std::vector<Event> getEventsForAggregateId(const std::string& aggregateId) const = 0;

    virtual size_t size() const = 0;

protected:
    EventStoreInterface() = default;
};

} // namespace store
} // namespace event_hub
