#include "array.h"

#include <algorithm>
#include <stdexcept>

#include "common/errors.h"
#include "common/sequence_id.h"

namespace Chronicle {

Array::Array(SequenceId id, IRecordStore* store, int64_t size)
    : id_(id), store_(store), size_(size) {
    if (store_ == nullptr) {
        throw std::invalid_argument("Array needs a record store");
    }
    if (size_ < 1) {
        throw std::invalid_argument("Array size must be positive");
    }
}

void Array::CheckIndex(int64_t index) const {
    if (index < 0 || index >= size_) {
        throw InvalidPosition("Index " + std::to_string(index) + " outside array " +
                              SequenceIdToString(id_) + " of size " + std::to_string(size_));
    }
}

void Array::Set(int64_t index, const std::string& topic, const std::string& data,
                const CausalDependencies& causal_dependencies) {
    CheckIndex(index);
    SequencedItem item;
    item.sequence_id = id_;
    item.position = index;
    item.topic = topic;
    item.data = data;
    item.causal_dependencies = causal_dependencies;
    store_->ConditionalInsert(item);
}

std::optional<SequencedItem> Array::Get(int64_t index) const {
    CheckIndex(index);
    return store_->Get(id_, index);
}

std::vector<std::optional<SequencedItem>> Array::GetSlice(int64_t start, int64_t stop) const {
    if (start < 0) {
        throw InvalidPosition("Slice start must not be negative: " + std::to_string(start));
    }
    stop = std::min(stop, size_);
    if (start >= stop) {
        return {};
    }

    RangeQuery query;
    query.gte = start;
    query.lt = stop;
    std::vector<SequencedItem> found = store_->ReadRange(id_, query);

    std::vector<std::optional<SequencedItem>> slots(static_cast<size_t>(stop - start));
    for (auto& item : found) {
        slots[static_cast<size_t>(item.position - start)] = std::move(item);
    }
    return slots;
}

std::pair<std::optional<SequencedItem>, int64_t> Array::GetLastItemAndNextPosition() const {
    RangeQuery query;
    query.limit = 1;
    query.ascending = false;
    std::vector<SequencedItem> last = store_->ReadRange(id_, query);
    if (last.empty()) {
        return {std::nullopt, 0};
    }
    const int64_t next = last.front().position + 1;
    return {std::move(last.front()), next};
}

} // namespace Chronicle
