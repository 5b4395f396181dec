#pragma once

#include <map>
#include <mutex>
#include "tracker/tracker_interface.hpp"
#include "common/errors.hpp"

namespace event_hub {
namespace tracker {

class MemoryTracker : public TrackerInterface {
public:
    MemoryTracker() = default;

    void setup(const std::string& processorName) override {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_.emplace(processorName, 0);
    }

    void processed(const std::string& processorName, EventId eventId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        EventId& position = positions_[processorName];
        if (eventId < position) {
            throw StoreError("Cannot move " + processorName + " back from " +
                             std::to_string(position) + " to " + std::to_string(eventId));
        }
        position = eventId;
    }

    bool compareAndSet(const std::string& processorName,
                       EventId expected,
                       EventId desired) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(processorName);
        EventId current = it == positions_.end() ? 0 : it->second;
        if (current != expected) {
            return false;
        }
        positions_[processorName] = desired;
        return true;
    }

    void reset(const std::string& processorName) override {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_[processorName] = 0;
    }

    EventId lastProcessedEventId(const std::string& processorName) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(processorName);
        return it == positions_.end() ? 0 : it->second;
    }

    std::vector<std::string> trackedProcessors() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, position] : positions_) {
            names.push_back(name);
        }
        return names;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, EventId> positions_;
};

} // namespace tracker
} // namespace event_hub
