#pragma once

#include <set>
#include <string>
#include <vector>

namespace event_hub {
namespace reactor {

// Type-independent half of a reactor definition: its tracking key and the
// event types it handles and may emit, all in canonical form.
class ReactorDescriptor {
public:
    ReactorDescriptor(const std::string& processorName,
                      std::set<std::string> handledTypes,
                      std::set<std::string> emittableTypes);

    const std::string& processorName() const { return processorName_; }

    // Accepts any spelling that canonicalizes to a registered type
    bool processes(const std::string& eventType) const;

    // False for reactors that declare no emissions at all
    bool emitsEvent(const std::string& eventType) const;

    bool emitsEvents() const { return !emittableTypes_.empty(); }

    std::vector<std::string> processesEventTypes() const;

    const std::set<std::string>& emittableEventTypes() const { return emittableTypes_; }

private:
    std::string processorName_;
    std::set<std::string> handledTypes_;
    std::set<std::string> emittableTypes_;
};

} // namespace reactor
} // namespace event_hub
