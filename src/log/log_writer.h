#ifndef CHRONICLE_SRC_LOG_LOG_WRITER_H_
#define CHRONICLE_SRC_LOG_LOG_WRITER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "array/big_array.h"
#include "common/retry.h"
#include "common/sequenced_item.h"
#include "sequencer/integer_sequencer.h"
#include "storage/record_store.h"

namespace Chronicle {

/**
 * Appends to the application log and returns the assigned position.
 * Conflicts are retried internally; ConcurrencyError escapes only when the
 * retry policy is exhausted.
 */
class ILogWriter {
public:
    virtual ~ILogWriter() = default;
    virtual int64_t Append(const std::string& topic, const std::string& data,
                           const CausalDependencies& causal_dependencies) = 0;

    int64_t Append(const std::string& topic, const std::string& data) {
        return Append(topic, data, CausalDependencies());
    }
};

// Sequencer-driven BigArray writer. Each attempt takes a fresh number, so a
// conflict leaves the losing number as a gap. Conflicts are reported to the
// sequencer.
class SequencedAppender : public ILogWriter {
public:
    SequencedAppender(std::shared_ptr<BigArray> array, std::shared_ptr<IIntegerSequencer> sequencer,
                      RetryPolicy policy = RetryPolicy());

    using ILogWriter::Append;
    int64_t Append(const std::string& topic, const std::string& data,
                   const CausalDependencies& causal_dependencies) override;

private:
    std::shared_ptr<BigArray> array_;
    std::shared_ptr<IIntegerSequencer> sequencer_;
    const RetryPolicy policy_;
};

// BigArray writer that finds the next position through the index tree.
// Gapless, but writers contend on the same slot.
class DiscoveringAppender : public ILogWriter {
public:
    DiscoveringAppender(std::shared_ptr<BigArray> array, RetryPolicy policy = RetryPolicy());

    using ILogWriter::Append;
    int64_t Append(const std::string& topic, const std::string& data,
                   const CausalDependencies& causal_dependencies) override;

private:
    std::shared_ptr<BigArray> array_;
    const RetryPolicy policy_;
};

/**
 * Writes the application sequence directly in a record store. With a
 * sequencer, positions come from it. Without one, the store computes
 * max + 1 atomically when it can, and otherwise the writer reads max + 1
 * and inserts conditionally.
 */
class RecordStoreAppender : public ILogWriter {
public:
    RecordStoreAppender(std::shared_ptr<IRecordStore> store, SequenceId sequence_id,
                        std::shared_ptr<IIntegerSequencer> sequencer = nullptr,
                        RetryPolicy policy = RetryPolicy());

    using ILogWriter::Append;
    int64_t Append(const std::string& topic, const std::string& data,
                   const CausalDependencies& causal_dependencies) override;

private:
    int64_t InsertAt(int64_t position, const std::string& topic, const std::string& data,
                     const CausalDependencies& causal_dependencies);

    std::shared_ptr<IRecordStore> store_;
    const SequenceId sequence_id_;
    std::shared_ptr<IIntegerSequencer> sequencer_;
    const RetryPolicy policy_;
};

// Next unassigned position of a record-store sequence (max + 1, 0 if empty).
// Suitable as the distributed sequencer's high-water mark.
int64_t NextUnassignedPosition(IRecordStore& store, const SequenceId& sequence_id);

} // namespace Chronicle

#endif // CHRONICLE_SRC_LOG_LOG_WRITER_H_
