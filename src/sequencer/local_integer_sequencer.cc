#include "local_integer_sequencer.h"

#include <limits>
#include <string>

#include "common/errors.h"

namespace Chronicle {

LocalIntegerSequencer::LocalIntegerSequencer(int64_t start) : next_(start) {
    if (start < 0) {
        throw InvalidPosition("Sequencer start must not be negative: " + std::to_string(start));
    }
}

int64_t LocalIntegerSequencer::Next() {
    int64_t current = next_.load(std::memory_order_relaxed);
    // Exhaustion leaves the counter pinned at the maximum.
    while (true) {
        if (current == std::numeric_limits<int64_t>::max()) {
            throw SequenceExhausted("Local integer sequence exhausted");
        }
        if (next_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                        std::memory_order_relaxed)) {
            return current;
        }
    }
}

} // namespace Chronicle
