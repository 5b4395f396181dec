#pragma once

#include <memory>
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "reactor/base_reactor.hpp"
#include "reactor/emit_context.hpp"
#include "reactor/reactor_definition.hpp"

namespace event_hub {
namespace reactor {

// A reactor instance: one definition bound to a tracker, an event source and
// an event sink, plus the handler-owned State that process() calls mutate.
template<typename State>
class Reactor : public BaseReactor {
public:
    using Definition = ReactorDefinition<State>;

    Reactor(std::shared_ptr<const Definition> definition,
            std::shared_ptr<tracker::TrackerInterface> tracker,
            std::shared_ptr<store::EventSource> eventSource = nullptr,
            std::shared_ptr<store::EventSink> eventSink = nullptr,
            State initialState = State{})
        : BaseReactor(descriptorOf(definition),
                      std::move(tracker),
                      std::move(eventSource),
                      std::move(eventSink))
        , definition_(std::move(definition))
        , state_(std::move(initialState))
    {}

    // Events without a registered handler are ignored. Handler exceptions
    // propagate unchanged.
    void process(const Event& event) override {
        ProcessingGuard guard(*this);

        const auto* handler = definition_->handlerFor(event.type);
        if (!handler) {
            LOG_TRACE("Reactor ", processorName(), " ignores ", event.type, " #", event.id);
            return;
        }

        LOG_DEBUG("Reactor ", processorName(), " processing ", event.type, " #", event.id);
        EmitContext context(event, descriptor(), eventSink().get());
        (*handler)(event, context, state_);
    }

    const Definition& definition() const { return *definition_; }

    State& state() { return state_; }
    const State& state() const { return state_; }

private:
    static std::shared_ptr<const ReactorDescriptor> descriptorOf(
            const std::shared_ptr<const Definition>& definition) {
        if (!definition) {
            throw ConfigurationError("Reactor requires a definition");
        }
        return definition->descriptor();
    }

    std::shared_ptr<const Definition> definition_;
    State state_;
};

} // namespace reactor
} // namespace event_hub
