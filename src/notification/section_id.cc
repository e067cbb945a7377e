#include "section_id.h"

#include <cctype>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

#include "common/config.h"
#include "common/errors.h"

namespace Chronicle {

namespace {

int64_t ParseNumber(absl::string_view part, const std::string& text) {
    int64_t value = 0;
    // SimpleAtoi tolerates surrounding whitespace and a sign; ids carry neither.
    for (char c : part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidSectionId("Malformed section id '" + text + "'");
        }
    }
    if (part.empty() || !absl::SimpleAtoi(part, &value)) {
        throw InvalidSectionId("Malformed section id '" + text + "'");
    }
    return value;
}

} // namespace

SectionId ParseSectionId(const std::string& text) {
    SectionId id;
    if (text == kCurrentSectionId) {
        id.kind = SectionId::Kind::kCurrent;
        return id;
    }

    std::vector<absl::string_view> parts = absl::StrSplit(text, ',');
    if (parts.size() != 2) {
        throw InvalidSectionId("Malformed section id '" + text + "'");
    }
    id.first = ParseNumber(parts[0], text);
    if (id.first < 1) {
        throw InvalidSectionId("Section id '" + text + "' must start at 1 or above");
    }
    if (parts[1].empty()) {
        id.kind = SectionId::Kind::kFrom;
        id.last = id.first;
        return id;
    }
    id.kind = SectionId::Kind::kRange;
    id.last = ParseNumber(parts[1], text);
    if (id.last < id.first) {
        throw InvalidSectionId("Section id '" + text + "' ends before it starts");
    }
    return id;
}

std::string FormatSectionId(int64_t first, int64_t last) {
    return absl::StrCat(first, ",", last);
}

std::string FormatPositionSectionId(int64_t first) {
    return absl::StrCat(first, ",");
}

int64_t SectionFirst(const std::string& section_id) {
    return ParseSectionId(section_id).first;
}

} // namespace Chronicle
