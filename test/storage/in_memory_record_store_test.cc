#include <gtest/gtest.h>
#include "storage/in_memory_record_store.h"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "common/errors.h"
#include "common/sequence_id.h"

using namespace Chronicle;

class InMemoryRecordStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        sequence_ = RandomSequenceId();
    }

    SequencedItem Item(int64_t position, const std::string& topic = "t", const std::string& data = "d") {
        return SequencedItem{sequence_, position, topic, data};
    }

    InMemoryRecordStore store_;
    SequenceId sequence_;
};

TEST_F(InMemoryRecordStoreTest, InsertAndGet) {
    store_.ConditionalInsert(Item(0, "created", "a"));
    auto item = store_.Get(sequence_, 0);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->topic, "created");
    EXPECT_EQ(item->data, "a");
    EXPECT_FALSE(store_.Get(sequence_, 1).has_value());
    EXPECT_FALSE(store_.Get(RandomSequenceId(), 0).has_value());
}

TEST_F(InMemoryRecordStoreTest, SecondWriteToSlotConflictsEvenWithSameContent) {
    store_.ConditionalInsert(Item(3));
    EXPECT_THROW(store_.ConditionalInsert(Item(3)), ConcurrencyError);
    EXPECT_EQ(store_.GetMaxPosition(sequence_), 3);
}

TEST_F(InMemoryRecordStoreTest, NegativePositionRejected) {
    EXPECT_THROW(store_.ConditionalInsert(Item(-1)), InvalidPosition);
}

TEST_F(InMemoryRecordStoreTest, ReadRangeBoundsLimitAndOrder) {
    for (int64_t p : {0, 1, 2, 4, 5, 7}) {
        store_.ConditionalInsert(Item(p));
    }
    RangeQuery query;
    query.gte = 1;
    query.lt = 6;
    auto items = store_.ReadRange(sequence_, query);
    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items.front().position, 1);
    EXPECT_EQ(items.back().position, 5);

    query.ascending = false;
    query.limit = 2;
    items = store_.ReadRange(sequence_, query);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].position, 5);
    EXPECT_EQ(items[1].position, 4);

    RangeQuery last;
    last.ascending = false;
    last.limit = 1;
    items = store_.ReadRange(sequence_, last);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].position, 7);
}

TEST_F(InMemoryRecordStoreTest, CausalDependenciesAreKept) {
    SequencedItem item = Item(0);
    item.causal_dependencies = {{"orders", 12}, {"payments", 3}};
    store_.ConditionalInsert(item);
    EXPECT_EQ(store_.Get(sequence_, 0)->causal_dependencies, item.causal_dependencies);

    const int64_t position =
        store_.InsertWithServerComputedPosition(sequence_, "t", "b", {{"orders", 13}});
    ASSERT_EQ(store_.Get(sequence_, position)->causal_dependencies.size(), 1u);
    EXPECT_EQ(store_.Get(sequence_, position)->causal_dependencies[0].notification_id, 13);
}

TEST_F(InMemoryRecordStoreTest, ServerComputedPositionIsMaxPlusOne) {
    EXPECT_TRUE(store_.SupportsServerComputedPosition());
    EXPECT_EQ(store_.InsertWithServerComputedPosition(sequence_, "t", "a", {}), 0);
    EXPECT_EQ(store_.InsertWithServerComputedPosition(sequence_, "t", "b", {}), 1);
    store_.ConditionalInsert(Item(9));
    EXPECT_EQ(store_.InsertWithServerComputedPosition(sequence_, "t", "c", {}), 10);
}

// At most one of many concurrent writers to the same slot succeeds.
TEST_F(InMemoryRecordStoreTest, AtMostOneWinnerPerSlot) {
    constexpr int kWriters = 16;
    std::atomic<int> winners{0};
    std::atomic<int> losers{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([&, i]() {
            try {
                store_.ConditionalInsert(Item(0, "t", std::to_string(i)));
                winners++;
            } catch (const ConcurrencyError&) {
                losers++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(losers.load(), kWriters - 1);
}

// N writers each appending M items through the contiguous path leave
// positions 0..N*M-1 with no gap and no duplicate.
TEST_F(InMemoryRecordStoreTest, ServerComputedAppendsAreGapless) {
    constexpr int kWriters = 8;
    constexpr int kPerWriter = 250;
    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&, w]() {
            for (int i = 0; i < kPerWriter; ++i) {
                store_.InsertWithServerComputedPosition(sequence_, "t", std::to_string(w), {});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto items = store_.ReadRange(sequence_, RangeQuery());
    ASSERT_EQ(items.size(), static_cast<size_t>(kWriters * kPerWriter));
    for (size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(items[i].position, static_cast<int64_t>(i));
    }
    EXPECT_EQ(store_.NumSequences(), 1u);
}
