#include "big_array.h"

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>

#include "array/partition.h"
#include "common/errors.h"
#include "common/sequence_id.h"

namespace Chronicle {

// BigArraySlice::Iterator

BigArraySlice::Iterator::Iterator(const BigArray* array, int64_t start, int64_t stop)
    : array_(array), position_(start), fetch_from_(start), stop_(stop), at_end_(start >= stop) {
    if (!at_end_) {
        LoadChunk();
    }
}

void BigArraySlice::Iterator::LoadChunk() {
    const PartitionSpan span = PartitionOf(fetch_from_, array_->array_size());
    const int64_t chunk_stop = std::min(stop_, span.stop);
    Array partition = array_->Node(array_->ArrayId(span.start, span.stop));

    std::vector<std::optional<SequencedItem>> slots =
        partition.GetSlice(span.offset, chunk_stop - span.start);
    chunk_.clear();
    chunk_.reserve(slots.size());
    for (auto& slot : slots) {
        chunk_.push_back(array_->Globalize(std::move(slot), span.start));
    }

    position_ = fetch_from_;
    fetch_from_ = chunk_stop;
    index_ = 0;
    at_end_ = chunk_.empty();
}

BigArraySlice::Iterator& BigArraySlice::Iterator::operator++() {
    ++index_;
    ++position_;
    if (index_ >= chunk_.size()) {
        if (fetch_from_ < stop_) {
            LoadChunk();
        } else {
            chunk_.clear();
            at_end_ = true;
        }
    }
    return *this;
}

bool BigArraySlice::Iterator::operator==(const Iterator& other) const {
    if (at_end_ || other.at_end_) {
        return at_end_ == other.at_end_;
    }
    return array_ == other.array_ && position_ == other.position_;
}

// BigArray

BigArray::BigArray(SequenceId id, std::shared_ptr<IRecordStore> store, int64_t array_size)
    : id_(id),
      store_(std::move(store)),
      array_size_(array_size),
      capacity_(Capacity(array_size)) {
    if (!store_) {
        throw std::invalid_argument("BigArray needs a record store");
    }
}

Array BigArray::Node(const SequenceId& node_id) const {
    return Array(node_id, store_.get(), array_size_);
}

SequenceId BigArray::ArrayId(int64_t start, int64_t stop) const {
    return DeriveSequenceId(id_, SpanName(start, stop));
}

std::optional<SequencedItem> BigArray::Globalize(std::optional<SequencedItem> item,
                                                 int64_t partition_start) const {
    if (item) {
        item->sequence_id = id_;
        item->position += partition_start;
    }
    return item;
}

std::optional<SequencedItem> BigArray::Get(int64_t position) const {
    if (position >= capacity_) {
        throw InvalidPosition("Position " + std::to_string(position) + " beyond capacity " +
                              std::to_string(capacity_));
    }
    const PartitionSpan span = PartitionOf(position, array_size_);
    return Globalize(Node(ArrayId(span.start, span.stop)).Get(span.offset), span.start);
}

BigArraySlice BigArray::GetSlice(int64_t start, int64_t stop) const {
    if (start < 0) {
        throw InvalidPosition("Slice start must not be negative: " + std::to_string(start));
    }
    return BigArraySlice(this, start, std::min(stop, capacity_));
}

std::vector<std::optional<SequencedItem>> BigArray::ReadSlice(int64_t start, int64_t stop) const {
    BigArraySlice slice = GetSlice(start, stop);
    return std::vector<std::optional<SequencedItem>>(slice.begin(), slice.end());
}

bool BigArray::EnsureLink(Array node, int64_t index, const char* topic,
                          const SequenceId& target) const {
    if (node.Get(index)) {
        return false;
    }
    try {
        node.Set(index, topic, SequenceIdToString(target));
    } catch (const ConcurrencyError&) {
        // Links are deterministic; a concurrent writer stored the same one.
        VLOG(3) << "Link to " << SequenceIdToString(target) << " written concurrently";
        return false;
    }
    return true;
}

void BigArray::Set(int64_t position, const std::string& topic, const std::string& data,
                   const CausalDependencies& causal_dependencies) {
    const int required_height = CalcRequiredHeight(position, array_size_);
    const PartitionSpan span = PartitionOf(position, array_size_);
    const SequenceId partition_id = ArrayId(span.start, span.stop);

    // Register the partition bottom-up, every level, so that links a failed
    // writer left half done are completed by the next one.
    SequenceId array_id = partition_id;
    int64_t start = span.start;
    int64_t stop = span.stop;
    int height = 1;
    while (height < required_height) {
        const ParentLink parent = CalcParent(start, stop, height, array_size_);
        const SequenceId child_id = array_id;
        array_id = ArrayId(parent.start, parent.stop);
        EnsureLink(Node(array_id), parent.index_of_child, kArrayNodeTopic, child_id);
        start = parent.start;
        stop = parent.stop;
        height = parent.height;
    }

    if (EnsureLink(Root(), required_height - 1, kArrayApexTopic, array_id)) {
        VLOG(1) << "BigArray " << SequenceIdToString(id_) << " apex now at height " << required_height;
    }

    Node(partition_id).Set(span.offset, topic, data, causal_dependencies);
}

int64_t BigArray::Append(const std::string& topic, const std::string& data,
                         const CausalDependencies& causal_dependencies) {
    const int64_t position = GetNextPosition();
    Set(position, topic, data, causal_dependencies);
    return position;
}

int64_t BigArray::GetNextPosition() const {
    return GetLastItemAndNextPosition().second;
}

std::pair<std::optional<SequencedItem>, int64_t> BigArray::GetLastItemAndNextPosition() const {
    auto [apex, apex_height] = Root().GetLastItemAndNextPosition();
    if (!apex) {
        return {std::nullopt, 0};
    }

    // Descend through the last child of each node down to a partition.
    Array node = Node(ParseSequenceId(apex->data));
    int64_t partition_start = 0;
    int64_t height = apex_height;
    while (height > 1) {
        --height;
        auto [child, width] = node.GetLastItemAndNextPosition();
        if (!child) {
            throw StorageError("Index node " + SequenceIdToString(node.id()) + " at height " +
                               std::to_string(height + 1) + " has no children");
        }
        partition_start += (width - 1) * SaturatingPow(array_size_, height);
        node = Node(ParseSequenceId(child->data));
    }

    auto [last, next_offset] = node.GetLastItemAndNextPosition();
    return {Globalize(std::move(last), partition_start), partition_start + next_offset};
}

} // namespace Chronicle
