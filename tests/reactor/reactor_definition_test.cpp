#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "reactor/reactor_definition.hpp"
#include "common/errors.hpp"

using namespace event_hub;
using namespace event_hub::reactor;
using namespace testing;

namespace {

struct NoState {};

void ignore(const Event&, EmitContext&, NoState&) {}

} // namespace

TEST(ReactorDefinitionTest, ProcessorNameIsCanonical) {
    auto definition = ReactorDefinition<NoState>::Builder("TermsConfirmationReactor").build();
    EXPECT_EQ(definition->processorName(), "terms_confirmation_reactor");
}

TEST(ReactorDefinitionTest, RejectsEmptyProcessorName) {
    EXPECT_THROW(ReactorDefinition<NoState>::Builder(""), ConfigurationError);
    EXPECT_THROW(ReactorDefinition<NoState>::Builder("__"), ConfigurationError);
}

TEST(ReactorDefinitionTest, RejectsNamesThatCannotBeStored) {
    EXPECT_THROW(ReactorDefinition<NoState>::Builder("bad\nname"), ConfigurationError);
    EXPECT_THROW(ReactorDefinition<NoState>::Builder("my=reactor"), ConfigurationError);

    ReactorDefinition<NoState>::Builder builder("my_reactor");
    EXPECT_THROW(builder.process("terms\taccepted", ignore), ConfigurationError);
    EXPECT_THROW(builder.emitsEvents({"echo\x7f"}), ConfigurationError);
}

TEST(ReactorDescriptorTest, RejectsNamesThatCannotBeStored) {
    EXPECT_THROW(ReactorDescriptor("bad\rname", {}, {}), ConfigurationError);
    EXPECT_THROW(ReactorDescriptor("my_reactor", {"a=b"}, {}), ConfigurationError);
    EXPECT_THROW(ReactorDescriptor("my_reactor", {}, {"echo\n"}), ConfigurationError);
    EXPECT_NO_THROW(ReactorDescriptor("my_reactor", {"terms_accepted"}, {"echo_event"}));
}

TEST(ReactorDefinitionTest, ProcessesAnySpellingOfRegisteredType) {
    auto definition = ReactorDefinition<NoState>::Builder("my_reactor")
        .process("terms_accepted", ignore)
        .build();

    EXPECT_TRUE(definition->processes("terms_accepted"));
    EXPECT_TRUE(definition->processes(":terms_accepted"));
    EXPECT_TRUE(definition->processes("TermsAccepted"));
    EXPECT_FALSE(definition->processes("item_viewed"));
    EXPECT_THAT(definition->descriptor()->processesEventTypes(), ElementsAre("terms_accepted"));
}

TEST(ReactorDefinitionTest, RegistersOneHandlerForSeveralTypes) {
    auto definition = ReactorDefinition<NoState>::Builder("my_reactor")
        .process({"terms_accepted", "TermsRevoked"}, ignore)
        .build();

    EXPECT_NE(definition->handlerFor("terms_accepted"), nullptr);
    EXPECT_NE(definition->handlerFor("terms_revoked"), nullptr);
    EXPECT_EQ(definition->handlerFor("item_viewed"), nullptr);
    EXPECT_THAT(definition->descriptor()->processesEventTypes(),
                ElementsAre("terms_accepted", "terms_revoked"));
}

TEST(ReactorDefinitionTest, RejectsSecondHandlerForSameType) {
    ReactorDefinition<NoState>::Builder builder("my_reactor");
    builder.process("terms_accepted", ignore);

    EXPECT_THROW(builder.process("TermsAccepted", ignore), ConfigurationError);
}

TEST(ReactorDefinitionTest, RejectsEmptyTypeAndEmptyHandler) {
    ReactorDefinition<NoState>::Builder builder("my_reactor");
    EXPECT_THROW(builder.process("", ignore), ConfigurationError);
    EXPECT_THROW(builder.process("terms_accepted", ReactorDefinition<NoState>::Handler{}),
                 ConfigurationError);
    EXPECT_THROW(builder.emitsEvents({""}), ConfigurationError);
}

TEST(ReactorDefinitionTest, EmitsEventsIsAdditive) {
    auto definition = ReactorDefinition<NoState>::Builder("reactor_with_emit")
        .emitsEvents({"terms_confirmation_email_sent"})
        .emitsEvents({"AuditRecorded", "terms_confirmation_email_sent"})
        .build();

    EXPECT_TRUE(definition->emitsEvent("terms_confirmation_email_sent"));
    EXPECT_TRUE(definition->emitsEvent(":terms_confirmation_email_sent"));
    EXPECT_TRUE(definition->emitsEvent("audit_recorded"));
    EXPECT_FALSE(definition->emitsEvent("item_viewed"));
    EXPECT_EQ(definition->descriptor()->emittableEventTypes().size(), 2u);
}

TEST(ReactorDefinitionTest, NonEmittingReactorEmitsNothing) {
    auto definition = ReactorDefinition<NoState>::Builder("my_reactor")
        .process("terms_accepted", ignore)
        .build();

    EXPECT_FALSE(definition->descriptor()->emitsEvents());
    EXPECT_FALSE(definition->emitsEvent("terms_accepted"));
    EXPECT_FALSE(definition->emitsEvent("terms_confirmation_email_sent"));
}

TEST(ReactorDefinitionTest, BuiltDefinitionIsUnaffectedByLaterRegistrations) {
    ReactorDefinition<NoState>::Builder builder("my_reactor");
    builder.process("terms_accepted", ignore);
    auto first = builder.build();

    builder.process("item_viewed", ignore).emitsEvents({"echo_event"});
    auto second = builder.build();

    EXPECT_FALSE(first->processes("item_viewed"));
    EXPECT_FALSE(first->emitsEvent("echo_event"));
    EXPECT_TRUE(second->processes("item_viewed"));
    EXPECT_TRUE(second->emitsEvent("echo_event"));
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
