#pragma once

#include <stdexcept>
#include <string>
#include "common/types.hpp"

namespace event_hub {

// Invalid wiring or declaration: missing dependencies, bad definitions, bad settings
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Raised from inside a handler while a source event is being processed
class EventProcessingError : public std::runtime_error {
public:
    EventProcessingError(const std::string& message,
                         const Event& sourceEvent,
                         const std::string& eventType)
        : std::runtime_error(message)
        , sourceEvent_(sourceEvent)
        , eventType_(eventType)
    {}

    const Event& sourceEvent() const { return sourceEvent_; }
    const std::string& eventType() const { return eventType_; }

private:
    Event sourceEvent_;
    std::string eventType_;
};

// Event store or tracker could not read or durably write
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace event_hub
