#include "store/event_source.hpp"
#include "common/errors.hpp"

namespace event_hub {
namespace store {

StoreEventSource::StoreEventSource(std::shared_ptr<EventStoreInterface> eventStore)
    : eventStore_(std::move(eventStore))
{
    if (!eventStore_) {
        throw ConfigurationError("StoreEventSource requires an event store");
    }
}

std::vector<Event> StoreEventSource::getNextFrom(EventId position,
                                                 size_t limit,
                                                 const std::vector<std::string>& eventTypes) {
    return eventStore_->getNextFrom(position, limit, eventTypes);
}

EventId StoreEventSource::latestEventId(const std::vector<std::string>& eventTypes) {
    return eventStore_->latestEventId(eventTypes);
}

std::vector<Event> StoreEventSource::getEventsForAggregateId(const std::string& aggregateId) {
    return eventStore_->getEventsForAggregateId(aggregateId);
}

} // namespace store
} // namespace event_hub
