#include "notification_reader.h"

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>

#include "common/errors.h"
#include "notification/section_id.h"

namespace Chronicle {

NotificationReader::NotificationReader(std::shared_ptr<INotificationLog> log,
                                       ReaderOptions options)
    : log_(std::move(log)), options_(options) {
    if (!log_) {
        throw std::invalid_argument("NotificationReader needs a notification log");
    }
}

void NotificationReader::Seek(int64_t position) {
    if (position < 0) {
        throw InvalidPosition("Position less than zero: " + std::to_string(position));
    }
    position_ = position;
}

std::vector<NotificationSlot> NotificationReader::Read(std::optional<int64_t> advance_by) {
    return ReadItems(std::nullopt, advance_by);
}

std::vector<NotificationSlot> NotificationReader::ReadSlice(int64_t start,
                                                            std::optional<int64_t> stop) {
    Seek(start);
    return ReadItems(stop, std::nullopt);
}

NotificationSlot NotificationReader::At(int64_t index) {
    Seek(index);
    std::vector<NotificationSlot> items = ReadItems(std::nullopt, 1);
    if (items.empty()) {
        throw std::out_of_range("No notification at index " + std::to_string(index));
    }
    return items.front();
}

bool NotificationReader::Next(NotificationSlot* slot) {
    std::vector<NotificationSlot> items = ReadItems(std::nullopt, 1);
    if (items.empty()) {
        return false;
    }
    *slot = std::move(items.front());
    return true;
}

std::string NotificationReader::InitialSectionId() const {
    std::optional<int64_t> section_size = log_->SectionSize();
    if (section_size) {
        const int64_t start = position_ / *section_size * *section_size;
        return FormatSectionId(start + 1, start + *section_size);
    }
    return FormatPositionSectionId(position_ + 1);
}

bool NotificationReader::Consume(NotificationSlot slot, std::vector<NotificationSlot>* out) {
    if (!slot) {
        switch (options_.gap_policy) {
            case GapPolicy::kWait:
                VLOG(1) << "Waiting at gap in position " << position_;
                return false;
            case GapPolicy::kSkip:
                VLOG(2) << "Skipping gap at position " << position_;
                ++position_;
                return true;
            case GapPolicy::kSurface:
                break;
        }
    }
    out->push_back(std::move(slot));
    ++position_;
    return true;
}

std::vector<NotificationSlot> NotificationReader::ReadItems(std::optional<int64_t> stop_position,
                                                            std::optional<int64_t> advance_by) {
    section_count_ = 0;
    std::vector<NotificationSlot> out;
    auto done = [&]() {
        return (stop_position && position_ >= *stop_position) ||
               (advance_by && static_cast<int64_t>(out.size()) >= *advance_by);
    };

    if (options_.use_direct_query && log_->SupportsDirectQuery()) {
        while (!done()) {
            // Skipped gaps don't count towards advance_by, so re-query until
            // the limit is met or the log runs dry.
            std::optional<int64_t> stop = stop_position;
            if (advance_by) {
                const int64_t wanted = position_ + (*advance_by - static_cast<int64_t>(out.size()));
                stop = stop ? std::min(*stop, wanted) : wanted;
            }
            std::vector<NotificationSlot> items = log_->ReadDirect(position_, stop);
            if (items.empty()) {
                break;
            }
            for (auto& item : items) {
                if (!Consume(std::move(item), &out)) {
                    return out;
                }
            }
        }
        return out;
    }

    const int64_t start_number = position_ + 1;
    NotificationSection section = log_->GetSection(InitialSectionId());

    // Walk back to the section holding the next notification.
    while (section.previous_id && SectionFirst(section.section_id) > start_number) {
        section = log_->GetSection(*section.previous_id);
    }
    section_count_ = 1;

    const int64_t from_index =
        std::max<int64_t>(0, start_number - SectionFirst(section.section_id));
    size_t index = static_cast<size_t>(from_index);

    while (true) {
        for (; index < section.items.size(); ++index) {
            if (done()) {
                return out;
            }
            if (!Consume(std::move(section.items[index]), &out)) {
                return out;
            }
        }
        if (done() || !section.next_id) {
            break;
        }
        section = log_->GetSection(*section.next_id);
        ++section_count_;
        index = 0;
    }
    return out;
}

} // namespace Chronicle
