#include <gtest/gtest.h>
#include "array/partition.h"

#include <limits>
#include <stdexcept>

#include "common/errors.h"

using namespace Chronicle;

TEST(PartitionTest, PartitionOfIsPure) {
    PartitionSpan span = PartitionOf(25, 10);
    EXPECT_EQ(span.index, 2);
    EXPECT_EQ(span.start, 20);
    EXPECT_EQ(span.stop, 30);
    EXPECT_EQ(span.offset, 5);

    span = PartitionOf(0, 10);
    EXPECT_EQ(span.index, 0);
    EXPECT_EQ(span.offset, 0);

    EXPECT_THROW(PartitionOf(-1, 10), InvalidPosition);
    EXPECT_THROW(PartitionOf(0, 1), std::invalid_argument);
}

TEST(PartitionTest, CapacityIsSizeToTheSize) {
    EXPECT_EQ(Capacity(2), 4);
    EXPECT_EQ(Capacity(3), 27);
    EXPECT_EQ(Capacity(10), 10000000000LL);
    EXPECT_EQ(Capacity(10000), std::numeric_limits<int64_t>::max());
}

TEST(PartitionTest, RequiredHeight) {
    EXPECT_EQ(CalcRequiredHeight(0, 10), 1);
    EXPECT_EQ(CalcRequiredHeight(1, 10), 1);
    EXPECT_EQ(CalcRequiredHeight(9, 10), 1);
    EXPECT_EQ(CalcRequiredHeight(10, 10), 2);
    EXPECT_EQ(CalcRequiredHeight(99, 10), 2);
    EXPECT_EQ(CalcRequiredHeight(100, 10), 3);
    // Exact powers stay exact where floating-point logs drift.
    EXPECT_EQ(CalcRequiredHeight(999999999, 1000), 3);
    EXPECT_EQ(CalcRequiredHeight(1000000000, 1000), 4);

    EXPECT_EQ(CalcRequiredHeight(3, 2), 2);
    EXPECT_THROW(CalcRequiredHeight(4, 2), InvalidPosition);
    EXPECT_THROW(CalcRequiredHeight(-1, 2), InvalidPosition);
}

TEST(PartitionTest, RequiredHeightNearInt64Limit) {
    const int64_t last = std::numeric_limits<int64_t>::max() - 1;
    // 10000^4 < last < 10000^5
    EXPECT_EQ(CalcRequiredHeight(last, 10000), 5);
}

TEST(PartitionTest, ParentSpans) {
    ParentLink parent = CalcParent(20, 30, 1, 10);
    EXPECT_EQ(parent.start, 0);
    EXPECT_EQ(parent.stop, 100);
    EXPECT_EQ(parent.height, 2);
    EXPECT_EQ(parent.index_of_child, 2);

    parent = CalcParent(100, 200, 2, 10);
    EXPECT_EQ(parent.start, 0);
    EXPECT_EQ(parent.stop, 1000);
    EXPECT_EQ(parent.height, 3);
    EXPECT_EQ(parent.index_of_child, 1);

    parent = CalcParent(1230, 1240, 1, 10);
    EXPECT_EQ(parent.start, 1200);
    EXPECT_EQ(parent.stop, 1300);
    EXPECT_EQ(parent.index_of_child, 3);
}

TEST(PartitionTest, SpanName) {
    EXPECT_EQ(SpanName(0, 10000), "(0, 10000)");
}
