#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"

namespace event_hub {
namespace tracker {

// Durable mapping from processor name to the id of the last event it processed
class TrackerInterface {
public:
    virtual ~TrackerInterface() = default;

    // Creates the record at 0 when absent; no-op otherwise
    virtual void setup(const std::string& processorName) = 0;

    // Advances the position. Moving backwards throws StoreError.
    virtual void processed(const std::string& processorName, EventId eventId) = 0;

    // Sets the position to `desired` only if it currently equals `expected`
    virtual bool compareAndSet(const std::string& processorName,
                               EventId expected,
                               EventId desired) = 0;

    virtual void reset(const std::string& processorName) = 0;

    // 0 for processors that were never set up or advanced
    virtual EventId lastProcessedEventId(const std::string& processorName) const = 0;

    virtual std::vector<std::string> trackedProcessors() const = 0;

protected:
    TrackerInterface() = default;
};

} // namespace tracker
} // namespace event_hub
