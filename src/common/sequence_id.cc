#include "sequence_id.h"

#include <stdexcept>

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace Chronicle {

std::string SequenceIdToString(const SequenceId& id) {
    return boost::uuids::to_string(id);
}

SequenceId ParseSequenceId(const std::string& text) {
    // string_generator accepts braces and missing dashes; only the canonical
    // form round-trips, so insist on it.
    if (text.size() != 36) {
        throw std::invalid_argument("Malformed sequence id: '" + text + "'");
    }
    try {
        return boost::uuids::string_generator()(text);
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument("Malformed sequence id: '" + text + "': " + e.what());
    }
}

SequenceId DeriveSequenceId(const SequenceId& ns, const std::string& name) {
    boost::uuids::name_generator_sha1 gen(ns);
    return gen(name);
}

SequenceId RandomSequenceId() {
    thread_local boost::uuids::random_generator gen;
    return gen();
}

} // namespace Chronicle
