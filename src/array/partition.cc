#include "partition.h"

#include <limits>
#include <stdexcept>

#include "common/errors.h"

namespace Chronicle {

namespace {

constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

int64_t SaturatingMul(int64_t a, int64_t b) {
    if (a != 0 && b > kMax / a) {
        return kMax;
    }
    return a * b;
}

int64_t SaturatingAdd(int64_t a, int64_t b) {
    return a > kMax - b ? kMax : a + b;
}

void CheckArraySize(int64_t array_size) {
    if (array_size < 2) {
        throw std::invalid_argument("Array size must be at least 2, got " +
                                    std::to_string(array_size));
    }
}

} // namespace

int64_t SaturatingPow(int64_t base, int64_t exponent) {
    int64_t result = 1;
    for (int64_t i = 0; i < exponent && result != kMax; ++i) {
        result = SaturatingMul(result, base);
    }
    return result;
}

int64_t Capacity(int64_t array_size) {
    CheckArraySize(array_size);
    return SaturatingPow(array_size, array_size);
}

PartitionSpan PartitionOf(int64_t position, int64_t array_size) {
    CheckArraySize(array_size);
    if (position < 0) {
        throw InvalidPosition("Position must not be negative: " + std::to_string(position));
    }
    PartitionSpan span;
    span.index = position / array_size;
    span.start = span.index * array_size;
    span.stop = SaturatingAdd(span.start, array_size);
    span.offset = position - span.start;
    return span;
}

int CalcRequiredHeight(int64_t position, int64_t array_size) {
    const int64_t capacity = Capacity(array_size);
    if (position < 0 || position >= capacity) {
        throw InvalidPosition("Position " + std::to_string(position) +
                              " outside capacity " + std::to_string(capacity));
    }
    int height = 1;
    int64_t span = array_size;
    while (span < position + 1) {
        span = SaturatingMul(span, array_size);
        ++height;
    }
    return height;
}

ParentLink CalcParent(int64_t start, int64_t stop, int height, int64_t array_size) {
    CheckArraySize(array_size);
    const int64_t child_span = SaturatingPow(array_size, height);
    const int64_t parent_span = SaturatingPow(array_size, height + 1);

    ParentLink parent;
    parent.height = height + 1;
    parent.start = start - start % parent_span;
    parent.stop = SaturatingAdd(parent.start, parent_span);
    parent.index_of_child = (start - parent.start) / child_span;
    if (parent.start > start || parent.stop < stop) {
        throw std::logic_error("Parent span [" + std::to_string(parent.start) + ", " +
                               std::to_string(parent.stop) + ") does not contain child [" +
                               std::to_string(start) + ", " + std::to_string(stop) + ")");
    }
    return parent;
}

std::string SpanName(int64_t start, int64_t stop) {
    return "(" + std::to_string(start) + ", " + std::to_string(stop) + ")";
}

} // namespace Chronicle
