#ifndef CHRONICLE_SRC_NOTIFICATION_NOTIFICATION_LOG_H_
#define CHRONICLE_SRC_NOTIFICATION_NOTIFICATION_LOG_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "array/big_array.h"
#include "common/config.h"
#include "common/sequenced_item.h"
#include "notification/notification.h"
#include "storage/record_store.h"

namespace Chronicle {

/**
 * Interface for paged views of the application log. Sections are linked:
 * readers start anywhere and follow previous_id / next_id.
 */
class INotificationLog {
public:
    virtual ~INotificationLog() = default;

    // Throws InvalidSectionId for a malformed id. Ids past the end of the
    // log yield an empty section.
    virtual NotificationSection GetSection(const std::string& section_id) = 0;

    // Disclosed when known, so readers can address sections directly.
    virtual std::optional<int64_t> SectionSize() const = 0;

    virtual bool SupportsDirectQuery() const { return false; }

    // Slots for positions [start, stop), bounded by the high-water mark.
    // Only valid when SupportsDirectQuery().
    virtual std::vector<NotificationSlot> ReadDirect(int64_t start, std::optional<int64_t> stop);
};

/**
 * Sections computed from an in-process backend. Subclasses supply the next
 * unassigned position and the slots of a range below it.
 */
class LocalNotificationLog : public INotificationLog {
public:
    explicit LocalNotificationLog(int64_t section_size = kDefaultSectionSize);

    NotificationSection GetSection(const std::string& section_id) override;
    std::optional<int64_t> SectionSize() const override { return section_size_; }
    bool SupportsDirectQuery() const override { return true; }
    std::vector<NotificationSlot> ReadDirect(int64_t start, std::optional<int64_t> stop) override;

    virtual int64_t GetNextPosition() = 0;

protected:
    // Slots for [start, stop); stop is already bounded by the next position.
    virtual std::vector<NotificationSlot> GetItems(int64_t start, int64_t stop) = 0;

    static NotificationSlot ToNotification(std::optional<SequencedItem> item);

private:
    const int64_t section_size_;
};

// Reads the application sequence of a record store.
class RecordStoreNotificationLog : public LocalNotificationLog {
public:
    RecordStoreNotificationLog(std::shared_ptr<IRecordStore> store, SequenceId sequence_id,
                               int64_t section_size = kDefaultSectionSize);

    int64_t GetNextPosition() override;

protected:
    std::vector<NotificationSlot> GetItems(int64_t start, int64_t stop) override;

private:
    std::shared_ptr<IRecordStore> store_;
    const SequenceId sequence_id_;
};

// Reads a BigArray. section_size must divide the array size, so no section
// straddles two partitions.
class BigArrayNotificationLog : public LocalNotificationLog {
public:
    BigArrayNotificationLog(std::shared_ptr<BigArray> array,
                            int64_t section_size = kDefaultSectionSize);

    int64_t GetNextPosition() override;

protected:
    std::vector<NotificationSlot> GetItems(int64_t start, int64_t stop) override;

private:
    std::shared_ptr<BigArray> array_;
};

} // namespace Chronicle

#endif // CHRONICLE_SRC_NOTIFICATION_NOTIFICATION_LOG_H_
