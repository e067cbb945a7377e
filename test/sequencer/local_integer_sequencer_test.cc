#include <gtest/gtest.h>
#include "sequencer/local_integer_sequencer.h"

#include <algorithm>
#include <limits>
#include <mutex>
#include <thread>
#include <vector>

#include "common/errors.h"

using namespace Chronicle;

TEST(LocalIntegerSequencerTest, IssuesFromStart) {
    LocalIntegerSequencer sequencer;
    EXPECT_EQ(sequencer.Next(), 0);
    EXPECT_EQ(sequencer.Next(), 1);
    EXPECT_EQ(sequencer.Peek(), 2);

    LocalIntegerSequencer resumed(41);
    EXPECT_EQ(resumed.Next(), 41);
}

TEST(LocalIntegerSequencerTest, NegativeStartRejected) {
    EXPECT_THROW(LocalIntegerSequencer(-1), InvalidPosition);
}

TEST(LocalIntegerSequencerTest, ExhaustionThrowsAndStaysExhausted) {
    LocalIntegerSequencer sequencer(std::numeric_limits<int64_t>::max() - 1);
    EXPECT_EQ(sequencer.Next(), std::numeric_limits<int64_t>::max() - 1);
    EXPECT_THROW(sequencer.Next(), SequenceExhausted);
    EXPECT_THROW(sequencer.Next(), SequenceExhausted);
}

TEST(LocalIntegerSequencerTest, ConcurrentCallersGetDistinctContiguousNumbers) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;
    LocalIntegerSequencer sequencer;
    std::mutex mu;
    std::vector<int64_t> issued;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            std::vector<int64_t> mine;
            for (int i = 0; i < kPerThread; ++i) {
                mine.push_back(sequencer.Next());
            }
            std::lock_guard<std::mutex> lock(mu);
            issued.insert(issued.end(), mine.begin(), mine.end());
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    std::sort(issued.begin(), issued.end());
    ASSERT_EQ(issued.size(), static_cast<size_t>(kThreads * kPerThread));
    for (size_t i = 0; i < issued.size(); ++i) {
        EXPECT_EQ(issued[i], static_cast<int64_t>(i));
    }
}
