#include "distributed_integer_sequencer.h"

#include <algorithm>
#include <string>

#include <glog/logging.h>

#include "common/errors.h"

namespace Chronicle {

DistributedIntegerSequencer::DistributedIntegerSequencer(std::shared_ptr<ICounterClient> counter,
                                                         HighWaterMarkFunc high_water_mark,
                                                         FailoverPolicy policy)
    : counter_(std::move(counter)),
      high_water_mark_(std::move(high_water_mark)),
      policy_(policy) {
    if (!counter_) {
        throw std::invalid_argument("DistributedIntegerSequencer needs a counter client");
    }
    if (policy_ == FailoverPolicy::kResyncOnDetection && !high_water_mark_) {
        throw std::invalid_argument("Resync on detection needs a high-water mark source");
    }
}

bool DistributedIntegerSequencer::Suspicious(int64_t value) {
    absl::MutexLock lock(&mu_);
    // Values from concurrent callers in this process may arrive out of order,
    // so a regression is only a suspicion until storage confirms it.
    bool suspicious = !synced_ || value <= last_observed_;
    last_observed_ = std::max(last_observed_, value);
    return suspicious;
}

void DistributedIntegerSequencer::ReportConflict(int64_t position) {
    if (policy_ != FailoverPolicy::kResyncOnDetection) {
        return;
    }
    VLOG(1) << "Position " << position << " was taken; checking the counter against storage";
    absl::MutexLock lock(&mu_);
    synced_ = false;
}

int64_t DistributedIntegerSequencer::Next() {
    for (int round = 0; round <= kMaxResyncRounds; ++round) {
        const int64_t value = counter_->Increment();
        if (value <= 0) {
            throw StorageError("Counter returned non-positive value " + std::to_string(value));
        }
        const int64_t position = value - 1;

        if (policy_ == FailoverPolicy::kRelyOnStorageUniqueness || !Suspicious(value)) {
            return position;
        }

        const int64_t high_water = high_water_mark_();
        if (position >= high_water) {
            absl::MutexLock lock(&mu_);
            synced_ = true;
            return position;
        }

        // The counter is behind what storage already holds: it lost state or
        // failed over. Raise it past the high-water mark, and past anything
        // this sequencer has already handed out, then draw again.
        LOG(WARNING) << "Counter issued position " << position << " below storage high-water mark "
                     << high_water << "; resynchronizing";
        int64_t floor = high_water;
        {
            absl::MutexLock lock(&mu_);
            floor = std::max(floor, last_observed_);
        }
        const int64_t advanced = counter_->AdvanceTo(floor);
        resyncs_.fetch_add(1);
        {
            absl::MutexLock lock(&mu_);
            last_observed_ = std::max(last_observed_, advanced);
        }
        VLOG(1) << "Counter advanced to " << advanced;
    }
    throw StorageError("Counter did not catch up with storage after " +
                       std::to_string(kMaxResyncRounds) + " resync rounds");
}

} // namespace Chronicle
