#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "reactor/emit_context.hpp"
#include "store/memory_event_store.hpp"
#include "common/errors.hpp"
#include "support/mocks.hpp"

using namespace event_hub;
using namespace event_hub::reactor;
using namespace event_hub::testing_support;
using namespace testing;

class EmitContextTest : public Test {
protected:
    EmitContextTest()
        : descriptor("terms_confirmation", {"terms_accepted"}, {"terms_confirmation_email_sent"})
    {}

    void SetUp() override {
        eventStore = std::make_shared<store::MemoryEventStore>();
        sink.delegateTo(eventStore);
        source = makeEvent("terms_accepted", 7, std::string("customer-1"));
    }

    ReactorDescriptor descriptor;
    std::shared_ptr<store::MemoryEventStore> eventStore;
    NiceMock<MockEventSink> sink;
    Event source;
};

TEST_F(EmitContextTest, ReturnsStoredEvent) {
    EmitContext context(source, descriptor, &sink);

    Event stored = context.emit(makeEvent("terms_confirmation_email_sent", 0, source.aggregateId));
    EXPECT_EQ(stored.id, 1);
    EXPECT_EQ(stored.causationId, source.uuid);
    EXPECT_EQ(stored.correlationId, source.uuid);
    EXPECT_TRUE(stored.createdAt.has_value());
    EXPECT_THAT(context.emittedEvents(), ElementsAre(stored));
}

TEST_F(EmitContextTest, KeepsSourceCorrelation) {
    source.correlationId = "conversation-1";
    EmitContext context(source, descriptor, &sink);

    Event stored = context.emit(makeEvent("terms_confirmation_email_sent"));
    EXPECT_EQ(stored.causationId, source.uuid);
    EXPECT_EQ(stored.correlationId, "conversation-1");
}

TEST_F(EmitContextTest, MutatesBodyBeforeAppend) {
    EmitContext context(source, descriptor, &sink);

    EXPECT_CALL(sink, append(_)).WillOnce([this](const Event& event) {
        EXPECT_EQ(event.body.at("token"), "secret-identifier");
        return eventStore->append(event);
    });
    context.emit(makeEvent("terms_confirmation_email_sent"),
                 [](EventBody& body) { body["token"] = "secret-identifier"; });
}

TEST_F(EmitContextTest, RunsMutatorThenAppendThenAction) {
    EmitContext context(source, descriptor, &sink);
    std::vector<std::string> steps;

    EXPECT_CALL(sink, append(_)).WillOnce([this, &steps](const Event& event) {
        steps.push_back("append");
        return eventStore->append(event);
    });
    context.emit(makeEvent("terms_confirmation_email_sent"),
                 [&steps](EventBody&) { steps.push_back("mutate"); },
                 [&steps]() { steps.push_back("action"); });

    EXPECT_THAT(steps, ElementsAre("mutate", "append", "action"));
}

TEST_F(EmitContextTest, ActionCanReceiveSourceEvent) {
    EmitContext context(source, descriptor, &sink);
    std::vector<std::string> actionedFor;

    context.emit(makeEvent("terms_confirmation_email_sent"),
                 [&actionedFor](const Event& processed) { actionedFor.push_back(processed.uuid); });
    context.emit(makeEvent("terms_confirmation_email_sent"),
                 [](EventBody& body) { body["token"] = "secret-identifier"; },
                 [&actionedFor, this](const Event& processed) {
                     EXPECT_EQ(eventStore->size(), 2u);
                     actionedFor.push_back(processed.uuid);
                 });

    EXPECT_THAT(actionedFor, ElementsAre(source.uuid, source.uuid));
}

TEST_F(EmitContextTest, RejectsUndeclaredTypeBeforeAnySideEffect) {
    EmitContext context(source, descriptor, &sink);
    bool mutated = false;
    bool actioned = false;

    EXPECT_CALL(sink, append(_)).Times(0);
    EXPECT_THROW(context.emit(makeEvent("item_viewed"),
                              [&mutated](EventBody&) { mutated = true; },
                              [&actioned]() { actioned = true; }),
                 EventProcessingError);
    EXPECT_FALSE(mutated);
    EXPECT_FALSE(actioned);
    EXPECT_TRUE(context.emittedEvents().empty());
}

TEST_F(EmitContextTest, RequiresSink) {
    EmitContext context(source, descriptor, nullptr);
    EXPECT_THROW(context.emit(makeEvent("terms_confirmation_email_sent")), EventProcessingError);
}

TEST_F(EmitContextTest, ActionFailurePropagatesAfterStorage) {
    EmitContext context(source, descriptor, &sink);

    EXPECT_THROW(context.emit(makeEvent("terms_confirmation_email_sent"),
                              []() { throw std::runtime_error("mailer unavailable"); }),
                 std::runtime_error);
    EXPECT_EQ(eventStore->size(), 1u);
    EXPECT_EQ(context.emittedEvents().size(), 1u);
}

TEST_F(EmitContextTest, SkipsActionWhenAppendFails) {
    EmitContext context(source, descriptor, &sink);
    int actions = 0;

    EXPECT_CALL(sink, append(_)).WillOnce(Throw(StoreError("disk full")));
    EXPECT_THROW(context.emit(makeEvent("terms_confirmation_email_sent"), [&actions]() { ++actions; }),
                 StoreError);
    EXPECT_EQ(actions, 0);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
