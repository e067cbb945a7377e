#pragma once

#include <memory>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "storage/record_store.h"

namespace Chronicle {

/**
 * InMemoryRecordStore keeps every sequence in process memory.
 * Each sequence has its own lock, so writers to different sequences never
 * contend; a registry lock is held only to find or create a sequence.
 */
class InMemoryRecordStore : public IRecordStore {
public:
    InMemoryRecordStore() = default;
    ~InMemoryRecordStore() override = default;

    InMemoryRecordStore(const InMemoryRecordStore&) = delete;
    InMemoryRecordStore& operator=(const InMemoryRecordStore&) = delete;

    // IRecordStore interface
    void ConditionalInsert(const SequencedItem& item) override;
    std::optional<SequencedItem> Get(const SequenceId& sequence_id, int64_t position) override;
    std::vector<SequencedItem> ReadRange(const SequenceId& sequence_id, const RangeQuery& query) override;
    std::optional<int64_t> GetMaxPosition(const SequenceId& sequence_id) override;
    bool SupportsServerComputedPosition() const override { return true; }
    int64_t InsertWithServerComputedPosition(const SequenceId& sequence_id,
                                             const std::string& topic,
                                             const std::string& data,
                                             const CausalDependencies& causal_dependencies) override;

    size_t NumSequences() const;

private:
    struct Sequence {
        absl::Mutex mu;
        absl::btree_map<int64_t, SequencedItem> items ABSL_GUARDED_BY(mu);
    };

    Sequence* GetOrCreateSequence(const SequenceId& sequence_id);
    Sequence* FindSequence(const SequenceId& sequence_id) const;

    mutable absl::Mutex sequences_mu_;
    absl::flat_hash_map<SequenceId, std::unique_ptr<Sequence>, SequenceIdHash> sequences_
        ABSL_GUARDED_BY(sequences_mu_);
};

} // namespace Chronicle
