#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "absl/synchronization/mutex.h"

#include "sequencer/integer_sequencer.h"

namespace Chronicle {

enum class FailoverPolicy {
    // Check the counter against storage on first use, whenever it goes
    // backwards, and after an issued position turned out to be taken. Raise
    // it past the storage high-water mark.
    kResyncOnDetection,
    // Trust the counter; a reissued number fails at the storage layer with
    // ConcurrencyError and the writer draws again.
    kRelyOnStorageUniqueness,
};

/**
 * DistributedIntegerSequencer issues positions from a shared counter so that
 * writers on many machines never race for the same slot.
 * Position = counter value - 1, so a fresh counter issues position 0 first.
 */
class DistributedIntegerSequencer : public IIntegerSequencer {
public:
    // Returns the next unassigned position in storage (max assigned + 1).
    using HighWaterMarkFunc = std::function<int64_t()>;

    DistributedIntegerSequencer(std::shared_ptr<ICounterClient> counter,
                                HighWaterMarkFunc high_water_mark,
                                FailoverPolicy policy = FailoverPolicy::kResyncOnDetection);

    int64_t Next() override;

    // Under kResyncOnDetection the next Next() checks storage again. A counter
    // that failed over to a lagging replica can hand out values above anything
    // this process saw and still below the high-water mark; a collision is the
    // only sign of it.
    void ReportConflict(int64_t position) override;

    FailoverPolicy policy() const { return policy_; }
    int64_t ResyncCount() const { return resyncs_.load(); }

private:
    static constexpr int kMaxResyncRounds = 8;

    bool Suspicious(int64_t value);

    std::shared_ptr<ICounterClient> counter_;
    HighWaterMarkFunc high_water_mark_;
    const FailoverPolicy policy_;

    absl::Mutex mu_;
    bool synced_ ABSL_GUARDED_BY(mu_) = false;
    int64_t last_observed_ ABSL_GUARDED_BY(mu_) = 0;
    std::atomic<int64_t> resyncs_{0};
};

} // namespace Chronicle
