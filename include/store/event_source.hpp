#pragma once

#include <memory>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "store/event_store_interface.hpp"

namespace event_hub {
namespace store {

class EventSource {
public:
    virtual ~EventSource() = default;

    // Ascending by id, strictly after `position`; restartable from any position
    virtual std::vector<Event> getNextFrom(EventId position,
                                           size_t limit,
                                           const std::vector<std::string>& eventTypes = {}) = 0;

    virtual EventId latestEventId(const std::vector<std::string>& eventTypes = {}) = 0;

protected:
    EventSource() = default;
};

class StoreEventSource : public EventSource {
public:
    explicit StoreEventSource(std::shared_ptr<EventStoreInterface> eventStore);

    std::vector<Event> getNextFrom(EventId position,
                                   size_t limit,
                                   const std::vector<std::string>& eventTypes = {}) override;

    EventId latestEventId(const std::vector<std::string>& eventTypes = {}) override;

    std::vector<Event> getEventsForAggregateId(const std::string& aggregateId);

    const std::shared_ptr<EventStoreInterface>& eventStore() const { return eventStore_; }

private:
    std::shared_ptr<EventStoreInterface> eventStore_;
};

} // namespace store
} // namespace event_hub
