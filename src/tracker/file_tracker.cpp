#include "tracker/file_tracker.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include "common/errors.hpp"
#include "common/event_type.hpp"
#include "common/logger.hpp"

namespace event_hub {
namespace tracker {

FileTracker::FileTracker(const std::string& path)
    : path_(path)
{
    if (path_.empty()) {
        throw ConfigurationError("FileTracker requires a path");
    }

    const std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }
    LOG_INFO("Tracking processor positions in ", path_);
}

std::map<std::string, EventId> FileTracker::readLocked() const {
    std::map<std::string, EventId> positions;

    std::ifstream in(path_);
    if (!in.is_open()) {
        return positions;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (line.empty()) {
            continue;
        }

        auto pos = line.rfind('=');
        if (pos == std::string::npos || pos == 0) {
            throw StoreError(path_ + ":" + std::to_string(lineNumber) + ": malformed entry");
        }
        try {
            size_t consumed = 0;
            const std::string value = line.substr(pos + 1);
            EventId id = std::stoll(value, &consumed);
            if (consumed != value.size() || id < 0) {
                throw std::invalid_argument(value);
            }
            positions[line.substr(0, pos)] = id;
        } catch (const std::logic_error&) {
            throw StoreError(path_ + ":" + std::to_string(lineNumber) + ": invalid position");
        }
    }
    if (in.bad()) {
        throw StoreError("Failed reading tracker file: " + path_);
    }
    return positions;
}

void FileTracker::writeLocked(const std::map<std::string, EventId>& positions) const {
    const std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("Cannot open tracker file for writing: " + tmpPath);
        }
        for (const auto& [name, id] : positions) {
            out << name << "=" << id << "\n";
        }
        out.flush();
        if (!out.good()) {
            throw StoreError("Failed writing tracker file: " + tmpPath);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path_, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        throw StoreError("Cannot replace tracker file " + path_);
    }
}

void FileTracker::requireProcessorName(const std::string& processorName) {
    if (processorName.empty()) {
        throw ConfigurationError("Tracker processor name must not be empty");
    }
    requireValidEventName(processorName, "Tracker processor name");
}

void FileTracker::setup(const std::string& processorName) {
    requireProcessorName(processorName);
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = readLocked();
    if (positions.emplace(processorName, 0).second) {
        writeLocked(positions);
    }
}

void FileTracker::processed(const std::string& processorName, EventId eventId) {
    requireProcessorName(processorName);
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = readLocked();
    EventId& position = positions[processorName];
    if (eventId < position) {
        throw StoreError("Cannot move " + processorName + " back from " +
                         std::to_string(position) + " to " + std::to_string(eventId));
    }
    position = eventId;
    writeLocked(positions);
}

bool FileTracker::compareAndSet(const std::string& processorName,
                                EventId expected,
                                EventId desired) {
    requireProcessorName(processorName);
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = readLocked();
    auto it = positions.find(processorName);
    EventId current = it == positions.end() ? 0 : it->second;
    if (current != expected) {
        return false;
    }
    positions[processorName] = desired;
    writeLocked(positions);
    return true;
}

void FileTracker::reset(const std::string& processorName) {
    requireProcessorName(processorName);
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = readLocked();
    positions[processorName] = 0;
    writeLocked(positions);
}

EventId FileTracker::lastProcessedEventId(const std::string& processorName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = readLocked();
    auto it = positions.find(processorName);
    return it == positions.end() ? 0 : it->second;
}

std::vector<std::string> FileTracker::trackedProcessors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, id] : readLocked()) {
        names.push_back(name);
    }
    return names;
}

} // namespace tracker
} // namespace event_hub
