#pragma once

#include <memory>
#include "common/types.hpp"
#include "store/event_store_interface.hpp"

namespace event_hub {
namespace store {

class EventSink {
public:
    virtual ~EventSink() = default;

    // Blocks until the event is durably recorded; returns the stored event.
    // Throws StoreError if the append cannot be committed.
    virtual Event append(const Event& event) = 0;

protected:
    EventSink() = default;
};

class StoreEventSink : public EventSink {
public:
    explicit StoreEventSink(std::shared_ptr<EventStoreInterface> eventStore);

    Event append(const Event& event) override;

    const std::shared_ptr<EventStoreInterface>& eventStore() const { return eventStore_; }

private:
    std::shared_ptr<EventStoreInterface> eventStore_;
};

} // namespace store
} // namespace event_hub
