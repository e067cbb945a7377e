#include "log_writer.h"

#include <stdexcept>

#include <glog/logging.h>

#include "common/errors.h"

namespace Chronicle {

SequencedAppender::SequencedAppender(std::shared_ptr<BigArray> array,
                                     std::shared_ptr<IIntegerSequencer> sequencer,
                                     RetryPolicy policy)
    : array_(std::move(array)), sequencer_(std::move(sequencer)), policy_(policy) {
    if (!array_ || !sequencer_) {
        throw std::invalid_argument("SequencedAppender needs a BigArray and a sequencer");
    }
}

int64_t SequencedAppender::Append(const std::string& topic, const std::string& data,
                                  const CausalDependencies& causal_dependencies) {
    return RetryOnConcurrencyError(policy_, [&]() {
        const int64_t position = sequencer_->Next();
        try {
            array_->Set(position, topic, data, causal_dependencies);
        } catch (const ConcurrencyError&) {
            sequencer_->ReportConflict(position);
            throw;
        }
        VLOG(3) << "Appended '" << topic << "' at " << position;
        return position;
    });
}

DiscoveringAppender::DiscoveringAppender(std::shared_ptr<BigArray> array, RetryPolicy policy)
    : array_(std::move(array)), policy_(policy) {
    if (!array_) {
        throw std::invalid_argument("DiscoveringAppender needs a BigArray");
    }
}

int64_t DiscoveringAppender::Append(const std::string& topic, const std::string& data,
                                    const CausalDependencies& causal_dependencies) {
    return RetryOnConcurrencyError(policy_,
                                   [&]() { return array_->Append(topic, data, causal_dependencies); });
}

RecordStoreAppender::RecordStoreAppender(std::shared_ptr<IRecordStore> store,
                                         SequenceId sequence_id,
                                         std::shared_ptr<IIntegerSequencer> sequencer,
                                         RetryPolicy policy)
    : store_(std::move(store)),
      sequence_id_(sequence_id),
      sequencer_(std::move(sequencer)),
      policy_(policy) {
    if (!store_) {
        throw std::invalid_argument("RecordStoreAppender needs a record store");
    }
}

int64_t RecordStoreAppender::InsertAt(int64_t position, const std::string& topic,
                                      const std::string& data,
                                      const CausalDependencies& causal_dependencies) {
    SequencedItem item;
    item.sequence_id = sequence_id_;
    item.position = position;
    item.topic = topic;
    item.data = data;
    item.causal_dependencies = causal_dependencies;
    store_->ConditionalInsert(item);
    return position;
}

int64_t RecordStoreAppender::Append(const std::string& topic, const std::string& data,
                                    const CausalDependencies& causal_dependencies) {
    if (sequencer_) {
        return RetryOnConcurrencyError(policy_, [&]() {
            const int64_t position = sequencer_->Next();
            try {
                return InsertAt(position, topic, data, causal_dependencies);
            } catch (const ConcurrencyError&) {
                sequencer_->ReportConflict(position);
                throw;
            }
        });
    }
    if (store_->SupportsServerComputedPosition()) {
        return store_->InsertWithServerComputedPosition(sequence_id_, topic, data,
                                                        causal_dependencies);
    }
    return RetryOnConcurrencyError(policy_, [&]() {
        return InsertAt(NextUnassignedPosition(*store_, sequence_id_), topic, data,
                        causal_dependencies);
    });
}

int64_t NextUnassignedPosition(IRecordStore& store, const SequenceId& sequence_id) {
    std::optional<int64_t> max = store.GetMaxPosition(sequence_id);
    return max ? *max + 1 : 0;
}

} // namespace Chronicle
