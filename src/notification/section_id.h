#pragma once

#include <cstdint>
#include <string>

namespace Chronicle {

/**
 * Parsed notification log section id. Numbers are 1-based notification ids.
 *   "current"     -> kCurrent
 *   "first,last"  -> kRange
 *   "first,"      -> kFrom (the section containing notification `first`)
 */
struct SectionId {
    enum class Kind { kCurrent, kRange, kFrom };

    Kind kind = Kind::kCurrent;
    int64_t first = 0;
    int64_t last = 0;
};

// Throws InvalidSectionId.
SectionId ParseSectionId(const std::string& text);

std::string FormatSectionId(int64_t first, int64_t last);

// "first,"
std::string FormatPositionSectionId(int64_t first);

// First notification number of a formatted "first,last" or "first," id.
int64_t SectionFirst(const std::string& section_id);

} // namespace Chronicle
