#pragma once

#include <cstddef>
#include <list>
#include <utility>

#include "absl/container/flat_hash_map.h"

namespace Chronicle {

/**
 * Fixed-capacity map that drops the least recently used entry when full.
 * Not synchronized; callers hold their own lock.
 */
template <typename Key, typename Value>
class LruCache {
public:
    explicit LruCache(size_t capacity) : capacity_(capacity) {}

    // Returns nullptr on a miss. A hit becomes the most recently used entry.
    Value* Find(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        return &it->second->second;
    }

    void Put(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        if (capacity_ == 0) {
            return;
        }
        if (entries_.size() >= capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();
    }

    void Erase(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return;
        }
        entries_.erase(it->second);
        index_.erase(it);
    }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

private:
    using Entries = std::list<std::pair<Key, Value>>;

    const size_t capacity_;
    Entries entries_;
    absl::flat_hash_map<Key, typename Entries::iterator> index_;
};

} // namespace Chronicle
