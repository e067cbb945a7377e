#include "notification_log.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <glog/logging.h>

#include "common/errors.h"
#include "notification/section_id.h"

namespace Chronicle {

std::vector<NotificationSlot> INotificationLog::ReadDirect(int64_t start,
                                                           std::optional<int64_t> stop) {
    throw std::logic_error("Notification log does not support direct queries");
}

LocalNotificationLog::LocalNotificationLog(int64_t section_size) : section_size_(section_size) {
    if (section_size_ < 1) {
        throw std::invalid_argument("Section size must be positive, got " +
                                    std::to_string(section_size_));
    }
}

NotificationSlot LocalNotificationLog::ToNotification(std::optional<SequencedItem> item) {
    if (!item) {
        return std::nullopt;
    }
    Notification notification;
    notification.id = item->position + 1;
    notification.topic = std::move(item->topic);
    notification.data = std::move(item->data);
    notification.causal_dependencies = std::move(item->causal_dependencies);
    return notification;
}

NotificationSection LocalNotificationLog::GetSection(const std::string& section_id) {
    const SectionId parsed = ParseSectionId(section_id);
    const int64_t next_position = GetNextPosition();

    int64_t start;
    if (parsed.kind == SectionId::Kind::kCurrent) {
        start = next_position / section_size_ * section_size_;
    } else {
        // 1-based id -> 0-based position, snapped back to the section start.
        start = (parsed.first - 1) / section_size_ * section_size_;
    }
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t stop = start > max - section_size_ ? max : start + section_size_;

    NotificationSection section;
    section.section_id = FormatSectionId(start + 1, stop);
    if (start < next_position) {
        section.items = GetItems(start, std::min(stop, next_position));
    }
    if (start > 0) {
        section.previous_id = FormatSectionId(start + 1 - section_size_, start);
    }
    if (static_cast<int64_t>(section.items.size()) == section_size_ && stop < max) {
        section.next_id = FormatSectionId(stop + 1, stop > max - section_size_ ? max : stop + section_size_);
    }
    VLOG(2) << "Section " << section_id << " -> " << section.section_id << " with "
            << section.items.size() << " items";
    return section;
}

std::vector<NotificationSlot> LocalNotificationLog::ReadDirect(int64_t start,
                                                               std::optional<int64_t> stop) {
    if (start < 0) {
        throw InvalidPosition("Read start must not be negative: " + std::to_string(start));
    }
    const int64_t next_position = GetNextPosition();
    const int64_t bounded_stop = stop ? std::min(*stop, next_position) : next_position;
    if (start >= bounded_stop) {
        return {};
    }
    return GetItems(start, bounded_stop);
}

// RecordStoreNotificationLog

RecordStoreNotificationLog::RecordStoreNotificationLog(std::shared_ptr<IRecordStore> store,
                                                       SequenceId sequence_id,
                                                       int64_t section_size)
    : LocalNotificationLog(section_size), store_(std::move(store)), sequence_id_(sequence_id) {
    if (!store_) {
        throw std::invalid_argument("RecordStoreNotificationLog needs a record store");
    }
}

int64_t RecordStoreNotificationLog::GetNextPosition() {
    std::optional<int64_t> max = store_->GetMaxPosition(sequence_id_);
    return max ? *max + 1 : 0;
}

std::vector<NotificationSlot> RecordStoreNotificationLog::GetItems(int64_t start, int64_t stop) {
    RangeQuery query;
    query.gte = start;
    query.lt = stop;
    std::vector<SequencedItem> found = store_->ReadRange(sequence_id_, query);

    std::vector<NotificationSlot> slots(static_cast<size_t>(stop - start));
    for (auto& item : found) {
        const int64_t index = item.position - start;
        slots[static_cast<size_t>(index)] = ToNotification(std::move(item));
    }
    return slots;
}

// BigArrayNotificationLog

BigArrayNotificationLog::BigArrayNotificationLog(std::shared_ptr<BigArray> array,
                                                 int64_t section_size)
    : LocalNotificationLog(section_size), array_(std::move(array)) {
    if (!array_) {
        throw std::invalid_argument("BigArrayNotificationLog needs a BigArray");
    }
    if (array_->array_size() % section_size != 0) {
        throw std::invalid_argument("Section size " + std::to_string(section_size) +
                                    " doesn't divide array size " +
                                    std::to_string(array_->array_size()));
    }
}

int64_t BigArrayNotificationLog::GetNextPosition() {
    return array_->GetNextPosition();
}

std::vector<NotificationSlot> BigArrayNotificationLog::GetItems(int64_t start, int64_t stop) {
    std::vector<NotificationSlot> slots;
    slots.reserve(static_cast<size_t>(stop - start));
    for (const auto& item : array_->GetSlice(start, stop)) {
        slots.push_back(ToNotification(item));
    }
    return slots;
}

} // namespace Chronicle
