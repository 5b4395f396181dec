#pragma once

#include <string>

namespace event_hub {

// Random (version 4) UUID in canonical 8-4-4-4-12 form
std::string generateUuid();

bool isValidUuid(const std::string& value);

} // namespace event_hub
