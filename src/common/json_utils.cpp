#include "common/json_utils.hpp"

#include <stdexcept>

namespace event_hub {
namespace json {

int64_t JsonUtils::toEpochMillis(const Timestamp& timestamp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count();
}

Timestamp JsonUtils::fromEpochMillis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

std::string JsonUtils::serializeEvent(const Event& event) {
    rapidjson::StringBuffer buffer;
    EventWriter writer(buffer);

    writer.StartObject();
    writer.Key("id");
    writer.Int64(event.id);
    writeString(writer, "uuid", event.uuid);
    writeString(writer, "type", event.type);
    if (event.aggregateId) {
        writeString(writer, "aggregate_id", *event.aggregateId);
    }
    if (event.causationId) {
        writeString(writer, "causation_id", *event.causationId);
    }
    if (event.correlationId) {
        writeString(writer, "correlation_id", *event.correlationId);
    }
    if (event.createdAt) {
        writer.Key("created_at");
        writer.Int64(toEpochMillis(*event.createdAt));
    }
    writer.Key("version");
    writer.Int(event.version);

    writer.Key("body");
    writer.StartObject();
    for (const auto& [key, value] : event.body) {
        writeString(writer, key, value);
    }
    writer.EndObject();
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

void JsonUtils::writeString(EventWriter& writer, const std::string& key, const std::string& value) {
    if (!writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()))) {
        throw std::invalid_argument("field name '" + key + "' is not valid UTF-8");
    }
    if (!writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()))) {
        throw std::invalid_argument("value of '" + key + "' is not valid UTF-8");
    }
}

std::string JsonUtils::getString(simdjson::ondemand::object& obj, const char* key) {
    auto value = getOptionalString(obj, key);
    if (!value) {
        throw std::invalid_argument(std::string("missing field '") + key + "'");
    }
    return *value;
}

std::optional<std::string> JsonUtils::getOptionalString(simdjson::ondemand::object& obj,
                                                        const char* key) {
    std::string_view value;
    auto error = obj[key].get_string().get(value);
    if (error == simdjson::NO_SUCH_FIELD) {
        return std::nullopt;
    }
    if (error) {
        throw simdjson::simdjson_error(error);
    }
    return std::string(value);
}

Event JsonUtils::parseEvent(simdjson::ondemand::parser& parser, std::string_view line) {
    simdjson::padded_string json(line);
    auto doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object().value();

    Event event;
    event.id = obj["id"].get_int64().value();
    event.uuid = getString(obj, "uuid");
    event.type = getString(obj, "type");
    event.aggregateId = getOptionalString(obj, "aggregate_id");
    event.causationId = getOptionalString(obj, "causation_id");
    event.correlationId = getOptionalString(obj, "correlation_id");

    int64_t createdAt = 0;
    auto createdError = obj["created_at"].get_int64().get(createdAt);
    if (createdError == simdjson::SUCCESS) {
        event.createdAt = fromEpochMillis(createdAt);
    } else if (createdError != simdjson::NO_SUCH_FIELD) {
        throw simdjson::simdjson_error(createdError);
    }

    int64_t version = 1;
    auto versionError = obj["version"].get_int64().get(version);
    if (versionError && versionError != simdjson::NO_SUCH_FIELD) {
        throw simdjson::simdjson_error(versionError);
    }
    event.version = static_cast<int>(version);

    simdjson::ondemand::object body;
    auto bodyError = obj["body"].get_object().get(body);
    if (bodyError == simdjson::SUCCESS) {
        for (auto field : body) {
            std::string key(field.unescaped_key().value());
            simdjson::ondemand::value value = field.value();
            auto type = value.type().value();
            if (type == simdjson::ondemand::json_type::string) {
                event.body[key] = std::string(value.get_string().value());
            } else if (type == simdjson::ondemand::json_type::object
                       || type == simdjson::ondemand::json_type::array) {
                throw std::invalid_argument("nested body value for key '" + key + "'");
            } else {
                // Numbers, booleans and null are kept as their JSON text
                std::string_view raw = value.raw_json_token();
                while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\n')) {
                    raw.remove_suffix(1);
                }
                event.body[key] = std::string(raw);
            }
        }
    } else if (bodyError != simdjson::NO_SUCH_FIELD) {
        throw simdjson::simdjson_error(bodyError);
    }

    return event;
}

} // namespace json
} // namespace event_hub
