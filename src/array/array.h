#ifndef CHRONICLE_SRC_ARRAY_ARRAY_H_
#define CHRONICLE_SRC_ARRAY_ARRAY_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/sequenced_item.h"
#include "storage/record_store.h"

namespace Chronicle {

/**
 * One fixed-size partition: a sequence in the record store whose positions
 * are slot indexes in [0, size). Cheap to construct; holds no state besides
 * its id.
 */
class Array {
public:
    Array(SequenceId id, IRecordStore* store, int64_t size);

    const SequenceId& id() const { return id_; }
    int64_t size() const { return size_; }

    // Throws ConcurrencyError if the slot is filled.
    void Set(int64_t index, const std::string& topic, const std::string& data,
             const CausalDependencies& causal_dependencies = {});

    std::optional<SequencedItem> Get(int64_t index) const;

    // One entry per slot in [start, min(stop, size)); unfilled slots are empty.
    std::vector<std::optional<SequencedItem>> GetSlice(int64_t start, int64_t stop) const;

    // Highest filled slot (if any) and the slot after it.
    std::pair<std::optional<SequencedItem>, int64_t> GetLastItemAndNextPosition() const;

    int64_t GetNextPosition() const { return GetLastItemAndNextPosition().second; }

private:
    void CheckIndex(int64_t index) const;

    SequenceId id_;
    IRecordStore* store_;
    int64_t size_;
};

} // namespace Chronicle

#endif // CHRONICLE_SRC_ARRAY_ARRAY_H_
