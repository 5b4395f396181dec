#include "store/event_sink.hpp"
#include "common/errors.hpp"

namespace event_hub {
namespace store {

StoreEventSink::StoreEventSink(std::shared_ptr<EventStoreInterface> eventStore)
    : eventStore_(std::move(eventStore))
{
    if (!eventStore_) {
        throw ConfigurationError("StoreEventSink requires an event store");
    }
}

Event StoreEventSink::append(const Event& event) {
    return eventStore_->append(event);
}

} // namespace store
} // namespace event_hub
