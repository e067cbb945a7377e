#pragma once

#include <cstdint>

namespace Chronicle {

/**
 * Interface for integer sequence generators.
 * Next() hands out each number at most once per generator; a number that is
 * issued but never written becomes a permanent gap.
 */
class IIntegerSequencer {
public:
    virtual ~IIntegerSequencer() = default;

    // Throws SequenceExhausted on int64 overflow.
    virtual int64_t Next() = 0;

    // A number issued by Next() turned out to be taken in storage.
    virtual void ReportConflict(int64_t position) {}
};

/**
 * Interface for a shared atomic counter (the distributed sequencer's backend).
 * Values may repeat after the counter service fails over; they never go down
 * in steady state.
 */
class ICounterClient {
public:
    virtual ~ICounterClient() = default;

    // Returns the value after incrementing; a fresh counter yields 1.
    virtual int64_t Increment() = 0;

    // Raises the counter to at least floor and returns the resulting value.
    virtual int64_t AdvanceTo(int64_t floor) = 0;
};

} // namespace Chronicle
