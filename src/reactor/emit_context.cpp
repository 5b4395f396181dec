#include "reactor/emit_context.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace event_hub {
namespace reactor {

EmitContext::EmitContext(const Event& sourceEvent,
                         const ReactorDescriptor& descriptor,
                         store::EventSink* eventSink)
    : sourceEvent_(sourceEvent)
    , descriptor_(descriptor)
    , eventSink_(eventSink)
{}

Event EmitContext::emit(Event event) {
    return emit(std::move(event), BodyMutator{}, PostAppendAction{});
}

Event EmitContext::emit(Event event, PostAppendAction action) {
    return emit(std::move(event), BodyMutator{}, std::move(action));
}

Event EmitContext::emit(Event event, SourceEventAction action) {
    return emit(std::move(event), BodyMutator{}, std::move(action));
}

Event EmitContext::emit(Event event, BodyMutator mutateBody, SourceEventAction action) {
    PostAppendAction bound;
    if (action) {
        bound = [this, action = std::move(action)]() { action(sourceEvent_); };
    }
    return emit(std::move(event), std::move(mutateBody), std::move(bound));
}

Event EmitContext::emit(Event event, BodyMutator mutateBody, PostAppendAction action) {
    if (!descriptor_.emitsEvent(event.type)) {
        throw EventProcessingError(
            descriptor_.processorName() + " emitted undeclared event type '" + event.type +
            "' while processing event " + std::to_string(sourceEvent_.id),
            sourceEvent_, event.type);
    }
    if (!eventSink_) {
        throw EventProcessingError(
            descriptor_.processorName() + " has no event sink to emit '" + event.type + "'",
            sourceEvent_, event.type);
    }

    stampCausation(event);

    if (mutateBody) {
        mutateBody(event.body);
    }

    Event stored = eventSink_->append(event);
    LOG_DEBUG(descriptor_.processorName(), " emitted ", stored.type, " #", stored.id,
              " caused by #", sourceEvent_.id);
    emitted_.push_back(stored);

    if (action) {
        action();
    }
    return stored;
}

void EmitContext::stampCausation(Event& event) const {
    event.causationId = sourceEvent_.uuid;
    event.correlationId = sourceEvent_.correlationId
        ? *sourceEvent_.correlationId
        : sourceEvent_.uuid;
}

} // namespace reactor
} // namespace event_hub
