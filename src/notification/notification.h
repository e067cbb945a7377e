#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/sequenced_item.h"

namespace Chronicle {

// One entry of the application log as seen by readers. id is 1-based:
// id = position + 1.
struct Notification {
    int64_t id = 0;
    std::string topic;
    std::string data;
    CausalDependencies causal_dependencies;

    bool operator==(const Notification& other) const {
        return id == other.id && topic == other.topic && data == other.data &&
               causal_dependencies == other.causal_dependencies;
    }
    bool operator!=(const Notification& other) const { return !(*this == other); }
};

// An empty optional is a gap: an unassigned position below the high-water mark.
using NotificationSlot = std::optional<Notification>;

/**
 * Fixed window of the log, derived on every read. next_id is set once the
 * window is full so readers can move on. The section is archived, and never
 * changes again, only when every slot is filled: a gap may still be filled
 * by a late writer.
 */
struct NotificationSection {
    std::string section_id;
    std::optional<std::string> previous_id;
    std::optional<std::string> next_id;
    std::vector<NotificationSlot> items;

    bool IsArchived() const {
        return next_id.has_value() &&
               std::all_of(items.begin(), items.end(),
                           [](const NotificationSlot& slot) { return slot.has_value(); });
    }
};

} // namespace Chronicle
