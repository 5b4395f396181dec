#pragma once

#include <memory>
#include <optional>
#include "reactor/reactor.hpp"
#include "reactor/reactor_config.hpp"

namespace event_hub {
namespace reactor {

// Per-instance overrides. An unset entry falls back to ReactorDefaults;
// an entry set to nullptr means "no such dependency" and is not defaulted.
struct ReactorDependencies {
    std::optional<std::shared_ptr<tracker::TrackerInterface>> tracker;
    std::optional<std::shared_ptr<store::EventSource>> eventSource;
    std::optional<std::shared_ptr<store::EventSink>> eventSink;
};

template<typename State>
std::unique_ptr<Reactor<State>> makeReactor(
        std::shared_ptr<const ReactorDefinition<State>> definition,
        const ReactorDependencies& dependencies = {},
        State initialState = State{}) {
    auto& defaults = ReactorDefaults::getInstance();
    const ReactorConfig config = defaults.config();

    auto tracker = dependencies.tracker ? *dependencies.tracker : defaults.defaultTracker();
    auto eventSource = dependencies.eventSource ? *dependencies.eventSource : config.eventSource;
    auto eventSink = dependencies.eventSink ? *dependencies.eventSink : config.eventSink;

    return std::make_unique<Reactor<State>>(std::move(definition),
                                            std::move(tracker),
                                            std::move(eventSource),
                                            std::move(eventSink),
                                            std::move(initialState));
}

} // namespace reactor
} // namespace event_hub
