#ifndef CHRONICLE_SRC_NOTIFICATION_NOTIFICATION_READER_H_
#define CHRONICLE_SRC_NOTIFICATION_NOTIFICATION_READER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "notification/notification.h"
#include "notification/notification_log.h"

namespace Chronicle {

// What a reader does on reaching an unassigned position.
enum class GapPolicy {
    kSurface,  // yield an empty slot and move past it
    kSkip,     // move past it without yielding
    kWait,     // stop before it; the next read retries the same position
};

struct ReaderOptions {
    // Range-read local logs directly instead of walking sections.
    bool use_direct_query = false;
    GapPolicy gap_policy = GapPolicy::kSurface;
};

/**
 * Resumable cursor over a notification log.
 *
 * position() is the number of notifications consumed so far, which is also
 * the 0-based position of the next one. The reader keeps nothing durable;
 * persist position() and Seek() to it after a restart.
 *
 * Not thread-safe: one reader per consumer.
 */
class NotificationReader {
public:
    explicit NotificationReader(std::shared_ptr<INotificationLog> log,
                                ReaderOptions options = ReaderOptions());

    // Throws InvalidPosition for a negative position.
    void Seek(int64_t position);
    int64_t position() const { return position_; }

    // Sections fetched by the most recent read.
    int section_count() const { return section_count_; }

    // Everything available after position(), or at most advance_by
    // notifications. Empty when nothing new has been committed.
    std::vector<NotificationSlot> Read(std::optional<int64_t> advance_by = std::nullopt);

    // Seek(start), then read up to position stop.
    std::vector<NotificationSlot> ReadSlice(int64_t start, std::optional<int64_t> stop = std::nullopt);

    // Seek(index), then read one. Throws std::out_of_range if nothing is
    // committed at index.
    NotificationSlot At(int64_t index);

    // Reads one notification into *slot. Returns false when none is available.
    bool Next(NotificationSlot* slot);

private:
    std::vector<NotificationSlot> ReadItems(std::optional<int64_t> stop_position,
                                            std::optional<int64_t> advance_by);

    // Section to start from: computed from position() when the log discloses
    // its section size, else the "first," form.
    std::string InitialSectionId() const;

    // Applies the gap policy to one slot. Returns false to stop reading.
    bool Consume(NotificationSlot slot, std::vector<NotificationSlot>* out);

    std::shared_ptr<INotificationLog> log_;
    const ReaderOptions options_;
    int64_t position_ = 0;
    int section_count_ = 0;
};

} // namespace Chronicle

#endif // CHRONICLE_SRC_NOTIFICATION_NOTIFICATION_READER_H_
