#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "common/json_utils.hpp"

using namespace event_hub;
using namespace testing;

TEST(JsonUtilsTest, EscapesQuotesAndControlCharacters) {
    Event event;
    event.id = 1;
    event.type = "terms_accepted";
    event.body["note"] = "say \"hi\"\nthen\tleave \\ \x01";
    event.body["name"] = "caf\xc3\xa9";

    std::string line = json::JsonUtils::serializeEvent(event);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    simdjson::ondemand::parser parser;
    Event parsed = json::JsonUtils::parseEvent(parser, line);
    EXPECT_EQ(parsed.body, event.body);
}

TEST(JsonUtilsTest, RejectsInvalidUtf8) {
    Event event;
    event.type = "terms_accepted";
    event.body["name"] = "caf\xe9";
    EXPECT_THROW(json::JsonUtils::serializeEvent(event), std::invalid_argument);

    Event badKey;
    badKey.type = "terms_accepted";
    badKey.body["caf\xe9"] = "ok";
    EXPECT_THROW(json::JsonUtils::serializeEvent(badKey), std::invalid_argument);

    Event badType;
    badType.type = "terms\xff";
    EXPECT_THROW(json::JsonUtils::serializeEvent(badType), std::invalid_argument);
}

TEST(JsonUtilsTest, OmitsAbsentOptionalFields) {
    Event event;
    event.id = 3;
    event.type = "item_viewed";

    std::string line = json::JsonUtils::serializeEvent(event);
    EXPECT_THAT(line, HasSubstr("\"id\":3"));
    EXPECT_THAT(line, HasSubstr("\"type\":\"item_viewed\""));
    EXPECT_THAT(line, Not(HasSubstr("aggregate_id")));
    EXPECT_THAT(line, Not(HasSubstr("causation_id")));
    EXPECT_THAT(line, HasSubstr("\"body\":{}"));
}

TEST(JsonUtilsTest, ParsesStoredRecord) {
    simdjson::ondemand::parser parser;
    const std::string line =
        R"({"id":7,"uuid":"1b4e28ba-2fa1-11d2-883f-0016d3cca427","type":"echo_event",)"
        R"("aggregate_id":"agg-1","causation_id":"c-1","correlation_id":"r-1",)"
        R"("created_at":1700000000123,"version":2,"body":{"token":"secret","count":3}})";

    Event event = json::JsonUtils::parseEvent(parser, line);
    EXPECT_EQ(event.id, 7);
    EXPECT_EQ(event.uuid, "1b4e28ba-2fa1-11d2-883f-0016d3cca427");
    EXPECT_EQ(event.type, "echo_event");
    EXPECT_EQ(event.aggregateId, "agg-1");
    EXPECT_EQ(event.causationId, "c-1");
    EXPECT_EQ(event.correlationId, "r-1");
    ASSERT_TRUE(event.createdAt.has_value());
    EXPECT_EQ(json::JsonUtils::toEpochMillis(*event.createdAt), 1700000000123);
    EXPECT_EQ(event.version, 2);
    EXPECT_EQ(event.body.at("token"), "secret");
    EXPECT_EQ(event.body.at("count"), "3");
}

TEST(JsonUtilsTest, PreservesEscapedBodyText) {
    simdjson::ondemand::parser parser;

    Event event;
    event.id = 1;
    event.type = "note_added";
    event.body["text"] = "line one\nline \"two\"";

    Event parsed = json::JsonUtils::parseEvent(parser, json::JsonUtils::serializeEvent(event));
    EXPECT_EQ(parsed.body.at("text"), "line one\nline \"two\"");
    EXPECT_EQ(parsed.uuid, event.uuid);
    EXPECT_FALSE(parsed.aggregateId.has_value());
}

TEST(JsonUtilsTest, RejectsRecordWithoutType) {
    simdjson::ondemand::parser parser;
    EXPECT_THROW(json::JsonUtils::parseEvent(parser, R"({"id":1,"uuid":"u"})"),
                 std::invalid_argument);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
