#include "in_memory_record_store.h"

#include <limits>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/sequence_id.h"

namespace Chronicle {

namespace {

void RaiseConflict(const SequencedItem& item) {
    throw ConcurrencyError("Position " + std::to_string(item.position) +
                           " already taken in sequence " + SequenceIdToString(item.sequence_id));
}

void CheckPosition(const SequencedItem& item) {
    if (item.position < 0) {
        throw InvalidPosition("Negative position " + std::to_string(item.position) +
                              " for sequence " + SequenceIdToString(item.sequence_id));
    }
}

} // namespace

InMemoryRecordStore::Sequence* InMemoryRecordStore::GetOrCreateSequence(const SequenceId& sequence_id) {
    absl::MutexLock lock(&sequences_mu_);
    auto it = sequences_.find(sequence_id);
    if (it != sequences_.end()) return it->second.get();
    auto seq = std::make_unique<Sequence>();
    Sequence* ptr = seq.get();
    sequences_.emplace(sequence_id, std::move(seq));
    return ptr;
}

InMemoryRecordStore::Sequence* InMemoryRecordStore::FindSequence(const SequenceId& sequence_id) const {
    absl::MutexLock lock(&sequences_mu_);
    auto it = sequences_.find(sequence_id);
    return it == sequences_.end() ? nullptr : it->second.get();
}

void InMemoryRecordStore::ConditionalInsert(const SequencedItem& item) {
    CheckPosition(item);
    Sequence* seq = GetOrCreateSequence(item.sequence_id);
    absl::MutexLock lock(&seq->mu);
    if (!seq->items.emplace(item.position, item).second) {
        RaiseConflict(item);
    }
}

std::optional<SequencedItem> InMemoryRecordStore::Get(const SequenceId& sequence_id, int64_t position) {
    Sequence* seq = FindSequence(sequence_id);
    if (!seq) return std::nullopt;
    absl::MutexLock lock(&seq->mu);
    auto it = seq->items.find(position);
    if (it == seq->items.end()) return std::nullopt;
    return it->second;
}

std::vector<SequencedItem> InMemoryRecordStore::ReadRange(const SequenceId& sequence_id, const RangeQuery& query) {
    std::vector<SequencedItem> result;
    Sequence* seq = FindSequence(sequence_id);
    if (!seq) return result;
    if (query.limit.has_value() && *query.limit == 0) return result;
    if (query.gte.has_value() && query.lt.has_value() && *query.gte >= *query.lt) return result;

    absl::MutexLock lock(&seq->mu);
    auto first = query.gte.has_value() ? seq->items.lower_bound(*query.gte) : seq->items.begin();
    auto last = query.lt.has_value() ? seq->items.lower_bound(*query.lt) : seq->items.end();

    auto full = [&]() { return query.limit.has_value() && result.size() >= *query.limit; };
    if (query.ascending) {
        for (auto it = first; it != last && !full(); ++it) {
            result.push_back(it->second);
        }
    } else {
        for (auto it = last; it != first && !full();) {
            --it;
            result.push_back(it->second);
        }
    }
    return result;
}

std::optional<int64_t> InMemoryRecordStore::GetMaxPosition(const SequenceId& sequence_id) {
    Sequence* seq = FindSequence(sequence_id);
    if (!seq) return std::nullopt;
    absl::MutexLock lock(&seq->mu);
    if (seq->items.empty()) return std::nullopt;
    return seq->items.rbegin()->first;
}

int64_t InMemoryRecordStore::InsertWithServerComputedPosition(const SequenceId& sequence_id,
                                                              const std::string& topic,
                                                              const std::string& data,
                                                              const CausalDependencies& causal_dependencies) {
    Sequence* seq = GetOrCreateSequence(sequence_id);
    absl::MutexLock lock(&seq->mu);
    int64_t position = 0;
    if (!seq->items.empty()) {
        const int64_t max_position = seq->items.rbegin()->first;
        if (max_position == std::numeric_limits<int64_t>::max()) {
            throw SequenceExhausted("Sequence " + SequenceIdToString(sequence_id) + " is full");
        }
        position = max_position + 1;
    }
    seq->items.emplace(position,
                       SequencedItem{sequence_id, position, topic, data, causal_dependencies});
    VLOG(3) << "Inserted position " << position << " in " << SequenceIdToString(sequence_id);
    return position;
}

size_t InMemoryRecordStore::NumSequences() const {
    absl::MutexLock lock(&sequences_mu_);
    return sequences_.size();
}

} // namespace Chronicle
