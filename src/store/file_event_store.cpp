#include "store/file_event_store.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <simdjson.h>
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logger.hpp"

namespace event_hub {
namespace store {

FileEventStore::FileEventStore(const std::string& path)
    : path_(path)
{
    if (path_.empty()) {
        throw ConfigurationError("FileEventStore requires a path");
    }

    const std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    load();

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw StoreError("Cannot open event log for writing: " + path_);
    }
    LOG_INFO("Opened event log ", path_, " with ", index_->size(), " events");
}

FileEventStore::~FileEventStore() {
    if (out_.is_open()) {
        out_.close();
    }
}

void FileEventStore::load() {
    std::vector<Event> events;

    std::ifstream in(path_);
    if (in.is_open()) {
        simdjson::ondemand::parser parser;
        std::string line;
        int lineNumber = 0;
        EventId previousId = 0;
        while (std::getline(in, line)) {
            ++lineNumber;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }

            Event event;
            try {
                event = json::JsonUtils::parseEvent(parser, line);
            } catch (const simdjson::simdjson_error& e) {
                throw StoreError(path_ + ":" + std::to_string(lineNumber) +
                                 ": malformed event record: " + e.what());
            } catch (const std::invalid_argument& e) {
                throw StoreError(path_ + ":" + std::to_string(lineNumber) +
                                 ": invalid event record: " + e.what());
            }

            if (event.id <= previousId) {
                throw StoreError(path_ + ":" + std::to_string(lineNumber) +
                                 ": event id " + std::to_string(event.id) + " is out of order");
            }
            previousId = event.id;
            events.push_back(std::move(event));
        }
        if (in.bad()) {
            throw StoreError("Failed reading event log: " + path_);
        }
    }

    index_ = std::make_unique<MemoryEventStore>(events);
}

Event FileEventStore::append(const Event& event) {
    if (event.type.empty()) {
        throw StoreError("Cannot append an event without a type");
    }

    std::lock_guard<std::mutex> lock(writeMutex_);

    Event stored = event;
    stored.id = index_->nextEventId();
    if (!stored.createdAt) {
        stored.createdAt = std::chrono::system_clock::now();
    }

    std::string record;
    try {
        record = json::JsonUtils::serializeEvent(stored);
    } catch (const std::invalid_argument& e) {
        throw StoreError("Cannot store event " + std::to_string(stored.id) + ": " + e.what());
    }

    std::error_code ec;
    const auto sizeBefore = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw StoreError("Cannot stat event log " + path_ + ": " + ec.message());
    }

    out_ << record << "\n";
    out_.flush();
    if (!out_.good()) {
        discardPartialWrite(sizeBefore);
        throw StoreError("Failed writing event " + std::to_string(stored.id) + " to " + path_);
    }

    return index_->append(stored);
}

void FileEventStore::discardPartialWrite(std::uintmax_t size) {
    // Closing first so buffered bytes cannot land after the truncation
    out_.close();
    out_.clear();

    std::error_code ec;
    std::filesystem::resize_file(path_, size, ec);
    if (ec) {
        LOG_ERROR("Cannot truncate event log ", path_, " to ", size, " bytes: ", ec.message());
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        LOG_ERROR("Cannot reopen event log ", path_, " after a failed write");
    }
}

std::vector<Event> FileEventStore::getNextFrom(EventId position,
                                               size_t limit,
                                               const std::vector<std::string>& eventTypes) const {
    return index_->getNextFrom(position, limit, eventTypes);
}

EventId FileEventStore::latestEventId(const std::vector<std::string>& eventTypes) const {
    return index_->latestEventId(eventTypes);
}

std::vector<Event> FileEventStore::getEventsForAggregateId(const std::string& aggregateId) const {
    return index_->getEventsForAggregateId(aggregateId);
}

size_t FileEventStore::size() const {
    return index_->size();
}

} // namespace store
} // namespace event_hub
