#pragma once

#include <atomic>
#include <cstdint>

#include "sequencer/integer_sequencer.h"

namespace Chronicle {

/**
 * In-process counter. Restarting the process restarts the sequence, so this
 * is only sound when a single process writes the log.
 */
class LocalIntegerSequencer : public IIntegerSequencer {
public:
    explicit LocalIntegerSequencer(int64_t start = 0);

    int64_t Next() override;

    // Next value that would be issued
    int64_t Peek() const { return next_.load(std::memory_order_acquire); }

private:
    std::atomic<int64_t> next_;
};

} // namespace Chronicle
