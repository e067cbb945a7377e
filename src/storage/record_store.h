#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/sequenced_item.h"

namespace Chronicle {

/**
 * Range selection for IRecordStore::ReadRange. Bounds are positions in the
 * sequence; gte is inclusive and lt exclusive.
 */
struct RangeQuery {
    std::optional<int64_t> gte;
    std::optional<int64_t> lt;
    std::optional<size_t> limit;
    bool ascending = true;
};

/**
 * Interface for storage backends.
 *
 * Every write is conditional on (sequence_id, position) being free and
 * raises ConcurrencyError otherwise. Transient failures raise StorageError.
 * Implementations must be safe to call from many threads at once.
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    virtual void ConditionalInsert(const SequencedItem& item) = 0;

    virtual std::optional<SequencedItem> Get(const SequenceId& sequence_id, int64_t position) = 0;

    // Items in position order (reversed when !query.ascending), gaps omitted.
    virtual std::vector<SequencedItem> ReadRange(const SequenceId& sequence_id, const RangeQuery& query) = 0;

    virtual std::optional<int64_t> GetMaxPosition(const SequenceId& sequence_id) = 0;

    // Strict contiguity: the position is max + 1 (0 for an empty sequence),
    // computed in the same atomic step as the insert.
    virtual bool SupportsServerComputedPosition() const = 0;
    virtual int64_t InsertWithServerComputedPosition(const SequenceId& sequence_id,
                                                     const std::string& topic,
                                                     const std::string& data,
                                                     const CausalDependencies& causal_dependencies) = 0;
};

} // namespace Chronicle
