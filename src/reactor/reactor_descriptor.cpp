#include "reactor/reactor_descriptor.hpp"
#include "common/errors.hpp"
#include "common/event_type.hpp"

namespace event_hub {
namespace reactor {

ReactorDescriptor::ReactorDescriptor(const std::string& processorName,
                                     std::set<std::string> handledTypes,
                                     std::set<std::string> emittableTypes)
    : processorName_(canonicalEventType(processorName))
    , handledTypes_(std::move(handledTypes))
    , emittableTypes_(std::move(emittableTypes))
{
    requireValidEventName(processorName, "Reactor processor name");
    if (processorName_.empty()) {
        throw ConfigurationError("Reactor processor name must not be empty");
    }
    for (const auto& type : handledTypes_) {
        requireValidEventName(type, processorName_ + ": handled event type");
    }
    for (const auto& type : emittableTypes_) {
        requireValidEventName(type, processorName_ + ": emitted event type");
    }
}

bool ReactorDescriptor::processes(const std::string& eventType) const {
    return handledTypes_.count(canonicalEventType(eventType)) > 0;
}

bool ReactorDescriptor::emitsEvent(const std::string& eventType) const {
    if (emittableTypes_.empty()) {
        return false;
    }
    return emittableTypes_.count(canonicalEventType(eventType)) > 0;
}

std::vector<std::string> ReactorDescriptor::processesEventTypes() const {
    return std::vector<std::string>(handledTypes_.begin(), handledTypes_.end());
}

} // namespace reactor
} // namespace event_hub
