#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "common/errors.hpp"
#include "common/event_type.hpp"
#include "common/types.hpp"
#include "reactor/emit_context.hpp"
#include "reactor/reactor_descriptor.hpp"

namespace event_hub {
namespace reactor {

// Immutable registry of handlers and emittable types for one kind of reactor.
// Built once through Builder and shared by every instance:
//
//   auto definition = ReactorDefinition<TermsState>::Builder("terms_confirmation")
//       .emitsEvents({"terms_confirmation_email_sent"})
//       .process("terms_accepted", [](const Event& event, EmitContext& ctx, TermsState& state) {
//           ...
//       })
//       .build();
template<typename State>
class ReactorDefinition {
public:
    using Handler = std::function<void(const Event&, EmitContext&, State&)>;

    class Builder {
    public:
        explicit Builder(const std::string& processorName)
            : processorName_(processorName)
        {
            requireValidEventName(processorName_, "Reactor processor name");
            if (canonicalEventType(processorName_).empty()) {
                throw ConfigurationError("Reactor processor name must not be empty");
            }
        }

        // One handler per event type; registering a type twice is an error
        Builder& process(const std::string& eventType, Handler handler) {
            requireValidEventName(eventType, processorName_ + ": event type");
            const std::string type = canonicalEventType(eventType);
            if (type.empty()) {
                throw ConfigurationError(processorName_ + ": event type must not be empty");
            }
            if (!handler) {
                throw ConfigurationError(processorName_ + ": empty handler for " + type);
            }
            if (handlers_.count(type) > 0) {
                throw ConfigurationError(processorName_ + " already processes " + type);
            }
            handlers_.emplace(type, std::move(handler));
            return *this;
        }

        Builder& process(std::initializer_list<std::string> eventTypes, const Handler& handler) {
            for (const auto& eventType : eventTypes) {
                process(eventType, handler);
            }
            return *this;
        }

        // Additive across calls
        Builder& emitsEvents(std::initializer_list<std::string> eventTypes) {
            return emitsEvents(std::vector<std::string>(eventTypes));
        }

        Builder& emitsEvents(const std::vector<std::string>& eventTypes) {
            for (const auto& eventType : eventTypes) {
                requireValidEventName(eventType, processorName_ + ": emitted event type");
                const std::string type = canonicalEventType(eventType);
                if (type.empty()) {
                    throw ConfigurationError(processorName_ + ": emitted event type must not be empty");
                }
                emittableTypes_.insert(type);
            }
            return *this;
        }

        std::shared_ptr<const ReactorDefinition> build() const {
            std::set<std::string> handledTypes;
            for (const auto& [type, handler] : handlers_) {
                handledTypes.insert(type);
            }
            auto descriptor = std::make_shared<const ReactorDescriptor>(
                processorName_, std::move(handledTypes), emittableTypes_);
            return std::shared_ptr<const ReactorDefinition>(
                new ReactorDefinition(std::move(descriptor), handlers_));
        }

    private:
        std::string processorName_;
        std::map<std::string, Handler> handlers_;
        std::set<std::string> emittableTypes_;
    };

    const std::shared_ptr<const ReactorDescriptor>& descriptor() const { return descriptor_; }

    const std::string& processorName() const { return descriptor_->processorName(); }

    bool processes(const std::string& eventType) const {
        return descriptor_->processes(eventType);
    }

    bool emitsEvent(const std::string& eventType) const {
        return descriptor_->emitsEvent(eventType);
    }

    // nullptr when no handler is registered for the type
    const Handler* handlerFor(const std::string& eventType) const {
        auto it = handlers_.find(canonicalEventType(eventType));
        return it == handlers_.end() ? nullptr : &it->second;
    }

private:
    ReactorDefinition(std::shared_ptr<const ReactorDescriptor> descriptor,
                      std::map<std::string, Handler> handlers)
        : descriptor_(std::move(descriptor))
        , handlers_(std::move(handlers))
    {}

    std::shared_ptr<const ReactorDescriptor> descriptor_;
    std::map<std::string, Handler> handlers_;
};

} // namespace reactor
} // namespace event_hub
