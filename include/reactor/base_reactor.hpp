#pragma once

#include <atomic>
#include <memory>
#include <vector>
#include "reactor/reactor_interface.hpp"
#include "reactor/reactor_descriptor.hpp"
#include "store/event_sink.hpp"
#include "store/event_source.hpp"
#include "tracker/tracker_interface.hpp"

namespace event_hub {
namespace reactor {

// Wiring, tracking and batch processing shared by every Reactor<State>.
//
// A tracker is always required. Event source and sink are optional unless
// the reactor declares emissions, in which case both must be present.
class BaseReactor : public ReactorInterface {
public:
    static constexpr size_t kDefaultBatchSize = 1000;

    BaseReactor(std::shared_ptr<const ReactorDescriptor> descriptor,
                std::shared_ptr<tracker::TrackerInterface> tracker,
                std::shared_ptr<store::EventSource> eventSource,
                std::shared_ptr<store::EventSink> eventSink);

    // Lifecycle
    void setup() override;
    void reset() override;

    // Reactor info
    const std::string& processorName() const override;
    const ReactorDescriptor& descriptor() const { return *descriptor_; }
    EventId lastProcessedEventId() const;

    // Processes each event in order and advances the tracker after each one.
    // An exception stops the batch; the position stays at the last event
    // that completed.
    size_t processEvents(const std::vector<Event>& events);

    // Single pass over the event source from the tracked position until it
    // has nothing more for this reactor. Returns the number of events processed.
    size_t catchUp(size_t batchSize = kDefaultBatchSize);

    const std::shared_ptr<tracker::TrackerInterface>& tracker() const { return tracker_; }
    const std::shared_ptr<store::EventSource>& eventSource() const { return eventSource_; }
    const std::shared_ptr<store::EventSink>& eventSink() const { return eventSink_; }

protected:
    // Held for the duration of one process() call; throws std::logic_error
    // if another call is already running on this instance
    class ProcessingGuard {
    public:
        explicit ProcessingGuard(BaseReactor& reactor);
        ~ProcessingGuard();

        ProcessingGuard(const ProcessingGuard&) = delete;
        ProcessingGuard& operator=(const ProcessingGuard&) = delete;

    private:
        BaseReactor& reactor_;
    };

private:
    std::shared_ptr<const ReactorDescriptor> descriptor_;
    std::shared_ptr<tracker::TrackerInterface> tracker_;
    std::shared_ptr<store::EventSource> eventSource_;
    std::shared_ptr<store::EventSink> eventSink_;
    std::atomic<bool> processing_;
};

} // namespace reactor
} // namespace event_hub
