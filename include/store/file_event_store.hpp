#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "store/event_store_interface.hpp"
#include "store/memory_event_store.hpp"

namespace event_hub {
namespace store {

// Append-only JSON-lines event log. The whole file is replayed into memory
// on open; each append writes and flushes one line before returning.
class FileEventStore : public EventStoreInterface {
public:
    explicit FileEventStore(const std::string& path);
    ~FileEventStore() override;

    FileEventStore(const FileEventStore&) = delete;
    FileEventStore& operator=(const FileEventStore&) = delete;

    Event append(const Event& event) override;

    std::vector<Event> getNextFrom(EventId position,
                                   size_t limit,
                                   const std::vector<std::string>& eventTypes = {}) const override;

    EventId latestEventId(const std::vector<std::string>& eventTypes = {}) const override;

    std::vector<Event> getEventsForAggregateId(const std::string& aggregateId) const override;

    size_t size() const override;

    const std::string& path() const { return path_; }

private:
    void load();

    // Truncates the log back to `size` after a failed append and reopens it
    void discardPartialWrite(std::uintmax_t size);

    std::string path_;
    std::ofstream out_;

    // Serializes appends so the file order matches id order
    std::mutex writeMutex_;
    std::unique_ptr<MemoryEventStore> index_;
};

} // namespace store
} // namespace event_hub
