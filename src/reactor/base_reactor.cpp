#include "reactor/base_reactor.hpp"

#include <stdexcept>
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace event_hub {
namespace reactor {

BaseReactor::BaseReactor(std::shared_ptr<const ReactorDescriptor> descriptor,
                         std::shared_ptr<tracker::TrackerInterface> tracker,
                         std::shared_ptr<store::EventSource> eventSource,
                         std::shared_ptr<store::EventSink> eventSink)
    : descriptor_(std::move(descriptor))
    , tracker_(std::move(tracker))
    , eventSource_(std::move(eventSource))
    , eventSink_(std::move(eventSink))
    , processing_(false)
{
    if (!descriptor_) {
        throw ConfigurationError("Reactor requires a definition");
    }
    if (!tracker_) {
        throw ConfigurationError(descriptor_->processorName() + " requires a tracker");
    }
    if (descriptor_->emitsEvents()) {
        if (!eventSink_) {
            throw ConfigurationError(descriptor_->processorName() +
                                     " emits events and requires an event sink");
        }
        if (!eventSource_) {
            throw ConfigurationError(descriptor_->processorName() +
                                     " emits events and requires an event source");
        }
    }
    LOG_DEBUG("Initialized reactor ", descriptor_->processorName());
}

void BaseReactor::setup() {
    tracker_->setup(processorName());
    LOG_INFO("Reactor ", processorName(), " set up at position ", lastProcessedEventId());
}

void BaseReactor::reset() {
    tracker_->reset(processorName());
    LOG_INFO("Reactor ", processorName(), " reset");
}

const std::string& BaseReactor::processorName() const {
    return descriptor_->processorName();
}

EventId BaseReactor::lastProcessedEventId() const {
    return tracker_->lastProcessedEventId(processorName());
}

size_t BaseReactor::processEvents(const std::vector<Event>& events) {
    size_t count = 0;
    for (const auto& event : events) {
        process(event);
        // Redelivered events are processed again but never move the position back
        if (event.id > lastProcessedEventId()) {
            tracker_->processed(processorName(), event.id);
        }
        ++count;
    }
    return count;
}

size_t BaseReactor::catchUp(size_t batchSize) {
    if (!eventSource_) {
        throw ConfigurationError(processorName() + " requires an event source to catch up");
    }
    if (batchSize == 0) {
        throw ConfigurationError("Batch size must be positive");
    }

    const auto eventTypes = descriptor_->processesEventTypes();
    if (eventTypes.empty()) {
        return 0;
    }

    size_t total = 0;
    while (true) {
        auto events = eventSource_->getNextFrom(lastProcessedEventId(), batchSize, eventTypes);
        if (events.empty()) {
            break;
        }
        total += processEvents(events);
        LOG_DEBUG("Reactor ", processorName(), " processed up to event ", events.back().id);
    }
    return total;
}

BaseReactor::ProcessingGuard::ProcessingGuard(BaseReactor& reactor)
    : reactor_(reactor)
{
    if (reactor_.processing_.exchange(true)) {
        throw std::logic_error("Reactor " + reactor_.processorName() +
                               " is already processing an event");
    }
}

BaseReactor::ProcessingGuard::~ProcessingGuard() {
    reactor_.processing_.store(false);
}

} // namespace reactor
} // namespace event_hub
