#pragma once

#include <string>
#include "common/types.hpp"

namespace event_hub {
namespace reactor {

class ReactorInterface {
public:
    virtual ~ReactorInterface() = default;

    // Lifecycle
    virtual void setup() = 0;
    virtual void reset() = 0;

    // Event handling; not safe to call concurrently on one instance
    virtual void process(const Event& event) = 0;

    // Reactor info
    virtual const std::string& processorName() const = 0;

protected:
    ReactorInterface() = default;
};

} // namespace reactor
} // namespace event_hub
