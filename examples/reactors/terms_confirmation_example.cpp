#include <iostream>
#include <string>
#include <vector>
#include "common/config.hpp"
#include "common/logger.hpp"
#include "reactor/reactor_factory.hpp"

using namespace event_hub;
using namespace reactor;

namespace {

struct ConfirmationState {
    std::vector<std::string> emailsSent;
};

void sendConfirmationEmail(ConfirmationState& state, const std::string& aggregateId) {
    // Stand-in for a real mail gateway
    state.emailsSent.push_back(aggregateId);
    std::cout << "  -> confirmation email sent for " << aggregateId << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Optional settings file: event_store.path, tracker.path, log.level, log.file
        Config settings;
        if (argc > 1) {
            settings.loadFromFile(argv[1]);
        }
        if (!settings.has("log.level")) {
            settings.set("log.level", "info");
        }
        applyLogSettings(settings);

        ReactorDefaults::getInstance().configure([&](ReactorConfig& config) {
            config = loadReactorConfig(settings);
        });
        auto eventStore = ReactorDefaults::getInstance().config().eventStore;

        // Seed a few events for a fresh store
        if (eventStore->size() == 0) {
            for (const char* customer : {"customer-1", "customer-2", "customer-3"}) {
                Event accepted;
                accepted.type = "terms_accepted";
                accepted.aggregateId = std::string(customer);
                accepted.body["terms_version"] = "2024-01";
                eventStore->append(accepted);
            }
            Event viewed;
            viewed.type = "item_viewed";
            viewed.aggregateId = std::string("customer-1");
            eventStore->append(viewed);
        }

        auto definition = ReactorDefinition<ConfirmationState>::Builder("TermsConfirmationReactor")
            .emitsEvents({"terms_confirmation_email_sent"})
            .process("terms_accepted",
                     [](const Event& event, EmitContext& context, ConfirmationState& state) {
                         Event sent;
                         sent.type = "terms_confirmation_email_sent";
                         sent.aggregateId = event.aggregateId;
                         const std::string recipient = event.aggregateId.value_or("unknown");
                         context.emit(
                             sent,
                             [&](EventBody& body) {
                                 body["recipient"] = recipient;
                                 body["confirmation_token"] = generateUuid();
                             },
                             [&]() { sendConfirmationEmail(state, recipient); });
                     })
            .build();

        auto confirmations = makeReactor(definition);
        confirmations->setup();

        std::cout << "Catching up " << confirmations->processorName()
                  << " from position " << confirmations->lastProcessedEventId() << std::endl;
        size_t processed = confirmations->catchUp();
        std::cout << "Processed " << processed << " events, "
                  << confirmations->state().emailsSent.size() << " emails sent" << std::endl;

        std::cout << "\nEvent stream:" << std::endl;
        for (const auto& event : eventStore->getNextFrom(0, 100)) {
            std::cout << "  #" << event.id << " " << event.type
                      << " aggregate=" << event.aggregateId.value_or("-")
                      << " causation=" << event.causationId.value_or("-") << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Reactor example failed: ", e.what());
        return 1;
    }
}
