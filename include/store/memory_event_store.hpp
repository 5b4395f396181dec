#pragma once

#include <mutex>
#include <vector>
#include "store/event_store_interface.hpp"

namespace event_hub {
namespace store {

class MemoryEventStore : public EventStoreInterface {
public:
    MemoryEventStore() = default;

    // Seeds the store with pre-existing events. Their ids are kept; events
    // without an id are numbered after the highest seeded id.
    explicit MemoryEventStore(const std::vector<Event>& events);

    Event append(const Event& event) override;

    std::vector<Event> getNextFrom(EventId position,
                                   size_t limit,
                                   const std::vector<std::string>& eventTypes = {}) const override;

    EventId latestEventId(const std::vector<std::string>& eventTypes = {}) const override;

    std::vector<Event> getEventsForAggregateId(const std::string& aggregateId) const override;

    size_t size() const override;

    // Id the next append will receive
    EventId nextEventId() const;

private:
    Event appendLocked(Event event);

    mutable std::mutex mutex_;
    std::vector<Event> events_;
    EventId lastId_ = 0;
};

} // namespace store
} // namespace event_hub
