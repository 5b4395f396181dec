#pragma once

#include <string>
#include <chrono>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <cstdint>
#include "common/uuid.hpp"

namespace event_hub {

using EventId = int64_t;
using Timestamp = std::chrono::system_clock::time_point;
using EventBody = std::map<std::string, std::string>;

struct Event {
    // Sequence number assigned by the store on append; 0 until then
    EventId id = 0;
    std::string type;
    std::optional<std::string> aggregateId;
    EventBody body;

    std::string uuid = generateUuid();
    std::optional<std::string> causationId;
    std::optional<std::string> correlationId;

    std::optional<Timestamp> createdAt;
    int version = 1;

    bool isStored() const { return id > 0; }
};

inline bool operator==(const Event& lhs, const Event& rhs) {
    return lhs.id == rhs.id
        && lhs.type == rhs.type
        && lhs.aggregateId == rhs.aggregateId
        && lhs.body == rhs.body
        && lhs.uuid == rhs.uuid
        && lhs.causationId == rhs.causationId
        && lhs.correlationId == rhs.correlationId
        && lhs.version == rhs.version;
}

inline bool operator!=(const Event& lhs, const Event& rhs) {
    return !(lhs == rhs);
}

using BodyMutator = std::function<void(EventBody&)>;
using PostAppendAction = std::function<void()>;
// Post-append action that receives the event being processed
using SourceEventAction = std::function<void(const Event&)>;

} // namespace event_hub
