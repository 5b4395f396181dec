#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <fstream>
#include <sstream>
#include <cstdint>
#include "common/errors.hpp"

namespace event_hub {

// Flat key=value settings. Blank lines and lines starting with '#' are skipped.
//
//   event_store.path=/var/lib/event_hub/events.jsonl
//   tracker.path=/var/lib/event_hub/tracker.db
//   log.level=info
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    Config() = default;

    Config(const Config& other) {
        std::lock_guard<std::mutex> lock(other.mutex_);
        config_ = other.config_;
    }

    void loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw ConfigurationError("Cannot open config file: " + filename);
        }

        std::stringstream content;
        content << file.rdbuf();
        loadFromString(content.str(), filename);
    }

    void loadFromString(const std::string& text, const std::string& origin = "<string>") {
        std::lock_guard<std::mutex> lock(mutex_);

        std::istringstream input(text);
        std::string line;
        int lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                throw ConfigurationError("Malformed setting at " + origin + ":" +
                                         std::to_string(lineNumber) + ": " + line);
            }

            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (key.empty()) {
                throw ConfigurationError("Empty key at " + origin + ":" +
                                         std::to_string(lineNumber));
            }
            config_[key] = value;
        }
    }

    void saveToFile(const std::string& filename) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ofstream file(filename);
        if (!file.is_open()) {
            throw ConfigurationError("Cannot open file for writing: " + filename);
        }

        for (const auto& [key, value] : config_) {
            file << key << "=" << value << "\n";
        }
    }

    template<typename T>
    T get(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = config_.find(path);
        if (it == config_.end()) {
            throw ConfigurationError("Config path not found: " + path);
        }
        try {
            return convertValue<T>(it->second);
        } catch (const std::logic_error&) {
            throw ConfigurationError("Invalid value for " + path + ": " + it->second);
        }
    }

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const {
        if (!has(path)) {
            return defaultValue;
        }
        return get<T>(path);
    }

    template<typename T>
    void set(const std::string& path, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;
        ss << value;
        config_[path] = ss.str();
    }

    bool has(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.find(path) != config_.end();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.clear();
    }

private:
    static std::string trim(const std::string& s) {
        const char* whitespace = " \t\r\n";
        auto begin = s.find_first_not_of(whitespace);
        if (begin == std::string::npos) {
            return "";
        }
        auto end = s.find_last_not_of(whitespace);
        return s.substr(begin, end - begin + 1);
    }

    template<typename T>
    T convertValue(const std::string& str) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> config_;
};

template<>
inline std::string Config::convertValue<std::string>(const std::string& str) const {
    return str;
}

template<>
inline int Config::convertValue<int>(const std::string& str) const {
    return std::stoi(str);
}

template<>
inline int64_t Config::convertValue<int64_t>(const std::string& str) const {
    return std::stoll(str);
}

template<>
inline size_t Config::convertValue<size_t>(const std::string& str) const {
    return static_cast<size_t>(std::stoull(str));
}

template<>
inline double Config::convertValue<double>(const std::string& str) const {
    return std::stod(str);
}

template<>
inline bool Config::convertValue<bool>(const std::string& str) const {
    return str == "true" || str == "1";
}

} // namespace event_hub
