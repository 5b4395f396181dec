#pragma once

#include <string>
#include <string_view>
#include <simdjson.h>
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "common/types.hpp"

namespace event_hub {
namespace json {

class JsonUtils {
public:
    // One event as a single-line JSON object:
    // {"id":1,"uuid":"...","type":"terms_accepted","aggregate_id":"...",
    //  "causation_id":"...","correlation_id":"...","created_at":1700000000000,
    //  "version":1,"body":{"key":"value"}}
    // Absent optional fields are omitted. Throws std::invalid_argument when a
    // string is not valid UTF-8, so nothing unreadable reaches a log.
    static std::string serializeEvent(const Event& event);

    // Throws simdjson::simdjson_error on malformed input and
    // std::invalid_argument when required fields are missing.
    static Event parseEvent(simdjson::ondemand::parser& parser, std::string_view line);

    static int64_t toEpochMillis(const Timestamp& timestamp);
    static Timestamp fromEpochMillis(int64_t millis);

private:
    using EventWriter = rapidjson::Writer<rapidjson::StringBuffer,
                                          rapidjson::UTF8<>,
                                          rapidjson::UTF8<>,
                                          rapidjson::CrtAllocator,
                                          rapidjson::kWriteValidateEncodingFlag>;

    static void writeString(EventWriter& writer, const std::string& key, const std::string& value);

    static std::string getString(simdjson::ondemand::object& obj, const char* key);
    static std::optional<std::string> getOptionalString(simdjson::ondemand::object& obj,
                                                        const char* key);
};

} // namespace json
} // namespace event_hub
