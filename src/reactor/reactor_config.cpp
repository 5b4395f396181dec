#include "reactor/reactor_config.hpp"

#include "common/logger.hpp"
#include "store/file_event_store.hpp"
#include "store/memory_event_store.hpp"
#include "tracker/file_tracker.hpp"
#include "tracker/memory_tracker.hpp"

namespace event_hub {
namespace reactor {

ReactorConfig loadReactorConfig(const Config& settings) {
    ReactorConfig config;

    const auto eventStorePath = settings.get<std::string>("event_store.path", "");
    if (eventStorePath.empty()) {
        config.eventStore = std::make_shared<store::MemoryEventStore>();
        LOG_INFO("Using in-memory event store");
    } else {
        config.eventStore = std::make_shared<store::FileEventStore>(eventStorePath);
    }

    config.eventSource = std::make_shared<store::StoreEventSource>(config.eventStore);
    config.eventSink = std::make_shared<store::StoreEventSink>(config.eventStore);
    config.trackerStoragePath = settings.get<std::string>("tracker.path", "");
    return config;
}

void applyLogSettings(const Config& settings) {
    auto& logger = Logger::getInstance();
    if (settings.has("log.level")) {
        logger.setLogLevel(parseLogLevel(settings.get<std::string>("log.level")));
    }
    if (settings.has("log.console")) {
        logger.setConsoleOutput(settings.get<bool>("log.console"));
    }
    const auto logFile = settings.get<std::string>("log.file", "");
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
    }
}

void ReactorDefaults::configure(const std::function<void(ReactorConfig&)>& configurer) {
    // The configurer runs unlocked so it may read the current defaults
    ReactorConfig updated = config();
    configurer(updated);

    std::lock_guard<std::mutex> lock(mutex_);
    if (updated.trackerStoragePath != config_.trackerStoragePath) {
        defaultTracker_.reset();
    }
    config_ = std::move(updated);
}

ReactorConfig ReactorDefaults::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::shared_ptr<tracker::TrackerInterface> ReactorDefaults::defaultTracker() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!defaultTracker_) {
        if (config_.trackerStoragePath.empty()) {
            defaultTracker_ = std::make_shared<tracker::MemoryTracker>();
        } else {
            defaultTracker_ = std::make_shared<tracker::FileTracker>(config_.trackerStoragePath);
        }
    }
    return defaultTracker_;
}

void ReactorDefaults::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = ReactorConfig{};
    defaultTracker_.reset();
}

} // namespace reactor
} // namespace event_hub
