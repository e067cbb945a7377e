#ifndef CHRONICLE_SRC_ARRAY_PARTITION_H_
#define CHRONICLE_SRC_ARRAY_PARTITION_H_

#include <cstdint>
#include <string>

namespace Chronicle {

// Leaf partition holding a position. [start, stop) is the partition's span
// in the big array, offset the slot within the partition.
struct PartitionSpan {
    int64_t index;
    int64_t start;
    int64_t stop;
    int64_t offset;
};

// Parent of an index-tree node: its span, height, and the slot of the child.
struct ParentLink {
    int64_t start;
    int64_t stop;
    int height;
    int64_t index_of_child;
};

// All arithmetic saturates at INT64_MAX.
int64_t SaturatingPow(int64_t base, int64_t exponent);

// array_size ^ array_size, saturated.
int64_t Capacity(int64_t array_size);

// Pure function of (position, array_size). Throws InvalidPosition for a
// negative position.
PartitionSpan PartitionOf(int64_t position, int64_t array_size);

// Height of the smallest tree whose apex spans position; 1 means the leaf
// partition is the apex. Throws InvalidPosition outside [0, capacity).
int CalcRequiredHeight(int64_t position, int64_t array_size);

// Node of the given height spanning [start, stop) -> its parent.
ParentLink CalcParent(int64_t start, int64_t stop, int height, int64_t array_size);

// "(start, stop)", the name from which a node's id is derived.
std::string SpanName(int64_t start, int64_t stop);

} // namespace Chronicle

#endif // CHRONICLE_SRC_ARRAY_PARTITION_H_
