#include "common/event_type.hpp"

#include <cctype>
#include "common/errors.hpp"

namespace event_hub {

namespace {

bool isSeparator(char c) {
    return c == '_' || c == '-' || c == '.' || c == ' ';
}

} // namespace

std::string canonicalEventType(const std::string& name) {
    std::string::size_type begin = 0;
    while (begin < name.size() && name[begin] == ':') {
        ++begin;
    }

    std::string result;
    result.reserve(name.size() + 4);

    for (std::string::size_type i = begin; i < name.size(); ++i) {
        const auto c = static_cast<unsigned char>(name[i]);

        if (isSeparator(name[i])) {
            if (!result.empty() && result.back() != '_') {
                result.push_back('_');
            }
            continue;
        }

        if (std::isupper(c)) {
            // Word boundary: "termsAccepted", "HTTPRequest" -> "http_request"
            const bool afterLowerOrDigit = i > begin
                && (std::islower(static_cast<unsigned char>(name[i - 1]))
                    || std::isdigit(static_cast<unsigned char>(name[i - 1])));
            const bool endsAcronym = i > begin && i + 1 < name.size()
                && std::isupper(static_cast<unsigned char>(name[i - 1]))
                && std::islower(static_cast<unsigned char>(name[i + 1]));

            if ((afterLowerOrDigit || endsAcronym) && !result.empty() && result.back() != '_') {
                result.push_back('_');
            }
            result.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }

        result.push_back(static_cast<char>(c));
    }

    while (!result.empty() && result.back() == '_') {
        result.pop_back();
    }
    return result;
}

std::set<std::string> canonicalEventTypes(const std::vector<std::string>& names) {
    std::set<std::string> result;
    for (const auto& name : names) {
        result.insert(canonicalEventType(name));
    }
    return result;
}

void requireValidEventName(const std::string& name, const std::string& what) {
    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f || c == '=') {
            throw ConfigurationError(what + " contains a control character or '='");
        }
    }
}

} // namespace event_hub
