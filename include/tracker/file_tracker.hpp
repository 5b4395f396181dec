#pragma once

#include <map>
#include <mutex>
#include <string>
#include "tracker/tracker_interface.hpp"

namespace event_hub {
namespace tracker {

// Positions persisted as "name=id" lines. Every mutation rewrites the file
// through a temporary file and a rename, so a crash leaves either the old or
// the new contents.
class FileTracker : public TrackerInterface {
public:
    explicit FileTracker(const std::string& path);

    void setup(const std::string& processorName) override;
    void processed(const std::string& processorName, EventId eventId) override;
    bool compareAndSet(const std::string& processorName,
                       EventId expected,
                       EventId desired) override;
    void reset(const std::string& processorName) override;
    EventId lastProcessedEventId(const std::string& processorName) const override;
    std::vector<std::string> trackedProcessors() const override;

    const std::string& path() const { return path_; }

private:
    // Names are file keys: empty names, control characters and '=' are rejected
    static void requireProcessorName(const std::string& processorName);

    std::map<std::string, EventId> readLocked() const;
    void writeLocked(const std::map<std::string, EventId>& positions) const;

    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace tracker
} // namespace event_hub
