#include "common/uuid.hpp"

#include <stdexcept>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/string_generator.hpp>

namespace event_hub {

std::string generateUuid() {
    // random_generator is not thread-safe; one per thread
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

bool isValidUuid(const std::string& value) {
    if (value.size() != 36) {
        return false;
    }
    try {
        boost::uuids::string_generator parse;
        parse(value);
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

} // namespace event_hub
