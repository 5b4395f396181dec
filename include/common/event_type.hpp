#pragma once

#include <string>
#include <vector>
#include <set>

namespace event_hub {

// Canonical lower_snake_case name used for dispatch and whitelist checks.
// "TermsAccepted", "terms_accepted", ":terms_accepted" and "terms-accepted"
// all map to "terms_accepted".
std::string canonicalEventType(const std::string& name);

std::set<std::string> canonicalEventTypes(const std::vector<std::string>& names);

// Names end up as keys in tracker files and event logs, so control
// characters and '=' are rejected. Throws ConfigurationError naming `what`.
void requireValidEventName(const std::string& name, const std::string& what);

} // namespace event_hub
