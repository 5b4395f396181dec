#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "common/config.hpp"
#include "store/event_sink.hpp"
#include "store/event_source.hpp"
#include "store/event_store_interface.hpp"
#include "tracker/tracker_interface.hpp"

namespace event_hub {
namespace reactor {

// Default dependencies for reactors built at the composition root
struct ReactorConfig {
    std::shared_ptr<store::EventStoreInterface> eventStore;
    std::shared_ptr<store::EventSource> eventSource;
    std::shared_ptr<store::EventSink> eventSink;

    // Where the default tracker keeps positions; empty means in memory
    std::string trackerStoragePath;
};

// Builds a ReactorConfig from settings:
//   event_store.path  JSON-lines event log (in-memory store when absent or empty)
//   tracker.path      tracker file (in-memory tracker when absent or empty)
ReactorConfig loadReactorConfig(const Config& settings);

// Applies log.level, log.console and log.file when present
void applyLogSettings(const Config& settings);

// Process-wide defaults, configured once at startup:
//
//   ReactorDefaults::getInstance().configure([&](ReactorConfig& config) {
//       config = loadReactorConfig(settings);
//   });
class ReactorDefaults {
public:
    static ReactorDefaults& getInstance() {
        static ReactorDefaults instance;
        return instance;
    }

    void configure(const std::function<void(ReactorConfig&)>& configurer);

    ReactorConfig config() const;

    // Built from trackerStoragePath on first use and shared afterwards
    std::shared_ptr<tracker::TrackerInterface> defaultTracker();

    void reset();

private:
    ReactorDefaults() = default;

    mutable std::mutex mutex_;
    ReactorConfig config_;
    std::shared_ptr<tracker::TrackerInterface> defaultTracker_;
};

} // namespace reactor
} // namespace event_hub
