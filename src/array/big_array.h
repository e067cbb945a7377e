#ifndef CHRONICLE_SRC_ARRAY_BIG_ARRAY_H_
#define CHRONICLE_SRC_ARRAY_BIG_ARRAY_H_

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "array/array.h"
#include "common/config.h"
#include "common/sequenced_item.h"
#include "storage/record_store.h"

namespace Chronicle {

class BigArray;

/**
 * Lazy view of [start, stop) in a BigArray. Each partition is fetched with
 * one range read when iteration reaches it; begin() starts a fresh pass.
 */
class BigArraySlice {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::optional<SequencedItem>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        Iterator() = default;

        reference operator*() const { return chunk_[index_]; }
        pointer operator->() const { return &chunk_[index_]; }
        Iterator& operator++();

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class BigArraySlice;
        Iterator(const BigArray* array, int64_t start, int64_t stop);

        // Loads the partition containing fetch_from_, up to stop_.
        void LoadChunk();

        const BigArray* array_ = nullptr;
        int64_t position_ = 0;
        int64_t fetch_from_ = 0;
        int64_t stop_ = 0;
        std::vector<std::optional<SequencedItem>> chunk_;
        size_t index_ = 0;
        bool at_end_ = true;
    };

    Iterator begin() const { return Iterator(array_, start_, stop_); }
    Iterator end() const { return Iterator(); }

    int64_t start() const { return start_; }
    int64_t stop() const { return stop_; }
    bool empty() const { return start_ >= stop_; }

private:
    friend class BigArray;
    BigArraySlice(const BigArray* array, int64_t start, int64_t stop)
        : array_(array), start_(start), stop_(stop) {}

    const BigArray* array_;
    int64_t start_;
    int64_t stop_;
};

/**
 * Append log sharded into fixed-size partitions. Partitions are linked into
 * an index tree of branching factor array_size; the root array (whose id is
 * the BigArray id) holds the apex node of each height, so the next free
 * position is found in O(log_array_size(N)) reads.
 *
 * Items come back with sequence_id = BigArray id and position = the global
 * position, whatever partition holds them.
 */
class BigArray {
public:
    BigArray(SequenceId id, std::shared_ptr<IRecordStore> store,
             int64_t array_size = kDefaultArraySize);

    const SequenceId& id() const { return id_; }
    int64_t array_size() const { return array_size_; }
    int64_t capacity() const { return capacity_; }
    IRecordStore& store() const { return *store_; }

    std::optional<SequencedItem> Get(int64_t position) const;

    // stop is clamped to capacity.
    BigArraySlice GetSlice(int64_t start, int64_t stop) const;
    std::vector<std::optional<SequencedItem>> ReadSlice(int64_t start, int64_t stop) const;

    // Conditional. Throws ConcurrencyError if the slot is filled, even with
    // identical content. The partition is linked into the index tree before
    // the slot is written, so a failed Set leaves at most links to a
    // partition that discovery already treats as empty.
    void Set(int64_t position, const std::string& topic, const std::string& data,
             const CausalDependencies& causal_dependencies = {});

    // Discovers the next position and sets it. One attempt.
    int64_t Append(const std::string& topic, const std::string& data,
                   const CausalDependencies& causal_dependencies = {});

    int64_t GetNextPosition() const;
    // The item is empty while the last linked partition is still empty.
    std::pair<std::optional<SequencedItem>, int64_t> GetLastItemAndNextPosition() const;

    // Id of the index node (or partition) spanning [start, stop).
    SequenceId ArrayId(int64_t start, int64_t stop) const;

private:
    friend class BigArraySlice::Iterator;

    Array Node(const SequenceId& node_id) const;

    // Writes a link unless it is already there. True if this call wrote it.
    bool EnsureLink(Array node, int64_t index, const char* topic,
                    const SequenceId& target) const;
    Array Root() const { return Node(id_); }

    // Partition slots -> big-array items.
    std::optional<SequencedItem> Globalize(std::optional<SequencedItem> item,
                                           int64_t partition_start) const;

    const SequenceId id_;
    std::shared_ptr<IRecordStore> store_;
    const int64_t array_size_;
    const int64_t capacity_;
};

} // namespace Chronicle

#endif // CHRONICLE_SRC_ARRAY_BIG_ARRAY_H_
