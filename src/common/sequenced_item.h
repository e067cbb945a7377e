#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/uuid/uuid.hpp>

namespace Chronicle {

using SequenceId = boost::uuids::uuid;

struct SequenceIdHash {
    size_t operator()(const SequenceId& id) const {
        return boost::uuids::hash_value(id);
    }
};

// Reference to a notification in another log that must be processed before
// this item. The only ordering carried across sequences.
struct CausalDependency {
    std::string log_id;
    int64_t notification_id = 0;

    bool operator==(const CausalDependency& other) const {
        return log_id == other.log_id && notification_id == other.notification_id;
    }
    bool operator!=(const CausalDependency& other) const { return !(*this == other); }
};

using CausalDependencies = std::vector<CausalDependency>;

/**
 * One immutable record in a sequence. (sequence_id, position) is unique in
 * every record store; data is opaque to this library.
 */
struct SequencedItem {
    SequenceId sequence_id;
    int64_t position = 0;
    std::string topic;
    std::string data;
    CausalDependencies causal_dependencies;

    bool operator==(const SequencedItem& other) const {
        return sequence_id == other.sequence_id && position == other.position &&
               topic == other.topic && data == other.data &&
               causal_dependencies == other.causal_dependencies;
    }
    bool operator!=(const SequencedItem& other) const { return !(*this == other); }
};

} // namespace Chronicle
