#pragma once

#include <vector>
#include "common/types.hpp"
#include "reactor/reactor_descriptor.hpp"
#include "store/event_sink.hpp"

namespace event_hub {
namespace reactor {

// Emission capability handed to a handler for the duration of one
// process() call. Each emit:
//   1. rejects types the reactor did not declare (EventProcessingError),
//   2. stamps causation and correlation ids from the source event,
//   3. runs the body mutator, if any,
//   4. appends through the event sink,
//   5. runs the post-append action, if any, only once the append succeeded;
//      a SourceEventAction receives the event being processed.
// Store errors and exceptions thrown by callbacks propagate to the handler.
class EmitContext {
public:
    EmitContext(const Event& sourceEvent,
                const ReactorDescriptor& descriptor,
                store::EventSink* eventSink);

    Event emit(Event event);
    Event emit(Event event, PostAppendAction action);
    Event emit(Event event, SourceEventAction action);
    Event emit(Event event, BodyMutator mutateBody, PostAppendAction action = {});
    Event emit(Event event, BodyMutator mutateBody, SourceEventAction action);

    const Event& sourceEvent() const { return sourceEvent_; }

    // Stored copies of everything emitted through this context, in order
    const std::vector<Event>& emittedEvents() const { return emitted_; }

private:
    void stampCausation(Event& event) const;

    const Event& sourceEvent_;
    const ReactorDescriptor& descriptor_;
    store::EventSink* eventSink_;
    std::vector<Event> emitted_;
};

} // namespace reactor
} // namespace event_hub
