#include <gtest/gtest.h>
#include "notification/notification_reader.h"

#include <memory>
#include <stdexcept>
#include <string>

#include "common/errors.h"
#include "common/sequence_id.h"
#include "log/log_writer.h"
#include "storage/in_memory_record_store.h"

using namespace Chronicle;

namespace {

// Hides the section size, as a remote log does.
class UndisclosedSizeLog : public INotificationLog {
public:
    explicit UndisclosedSizeLog(std::shared_ptr<INotificationLog> inner) : inner_(std::move(inner)) {}

    NotificationSection GetSection(const std::string& section_id) override {
        ++requests_;
        return inner_->GetSection(section_id);
    }
    std::optional<int64_t> SectionSize() const override { return std::nullopt; }

    int requests() const { return requests_; }

private:
    std::shared_ptr<INotificationLog> inner_;
    int requests_ = 0;
};

std::vector<int64_t> Ids(const std::vector<NotificationSlot>& slots) {
    std::vector<int64_t> ids;
    for (const auto& slot : slots) {
        ids.push_back(slot ? slot->id : 0);
    }
    return ids;
}

} // namespace

class NotificationReaderTest : public ::testing::Test {
protected:
    static constexpr int64_t kSectionSize = 5;

    void SetUp() override {
        store_ = std::make_shared<InMemoryRecordStore>();
        id_ = RandomSequenceId();
        writer_ = std::make_unique<RecordStoreAppender>(store_, id_);
        log_ = std::make_shared<RecordStoreNotificationLog>(store_, id_, kSectionSize);
    }

    void AppendItems(int count) {
        for (int i = 0; i < count; ++i) {
            writer_->Append("topic", "item");
        }
    }

    void InsertAt(int64_t position) {
        store_->ConditionalInsert(SequencedItem{id_, position, "topic", std::to_string(position)});
    }

    std::shared_ptr<InMemoryRecordStore> store_;
    SequenceId id_;
    std::unique_ptr<RecordStoreAppender> writer_;
    std::shared_ptr<RecordStoreNotificationLog> log_;
};

TEST_F(NotificationReaderTest, ReadsEverythingInOrder) {
    AppendItems(23);
    NotificationReader reader(log_);
    auto items = reader.Read();
    ASSERT_EQ(items.size(), 23u);
    for (size_t i = 0; i < items.size(); ++i) {
        ASSERT_TRUE(items[i].has_value());
        EXPECT_EQ(items[i]->id, static_cast<int64_t>(i) + 1);
    }
    EXPECT_EQ(reader.position(), 23);
    EXPECT_EQ(reader.section_count(), 5);
    EXPECT_TRUE(reader.Read().empty());
    EXPECT_EQ(reader.position(), 23);
}

// A reader rebuilt at the persisted position resumes without duplicates.
TEST_F(NotificationReaderTest, ResumesFromPersistedPosition) {
    AppendItems(9);
    {
        NotificationReader reader(log_);
        EXPECT_EQ(reader.Read().size(), 9u);
        EXPECT_EQ(reader.position(), 9);
    }

    NotificationReader resumed(log_);
    resumed.Seek(9);
    EXPECT_TRUE(resumed.Read().empty());
    EXPECT_EQ(resumed.position(), 9);

    AppendItems(2);
    auto items = resumed.Read();
    EXPECT_EQ(Ids(items), (std::vector<int64_t>{10, 11}));
    EXPECT_EQ(resumed.position(), 11);
}

TEST_F(NotificationReaderTest, AdvanceByLimitsTheRead) {
    AppendItems(12);
    NotificationReader reader(log_);
    EXPECT_EQ(Ids(reader.Read(3)), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(reader.position(), 3);
    EXPECT_EQ(Ids(reader.Read(4)), (std::vector<int64_t>{4, 5, 6, 7}));
    EXPECT_EQ(reader.section_count(), 2);
    EXPECT_EQ(reader.Read(0).size(), 0u);
    EXPECT_EQ(reader.position(), 7);
}

TEST_F(NotificationReaderTest, SliceIndexAndNext) {
    AppendItems(12);
    NotificationReader reader(log_);

    EXPECT_EQ(Ids(reader.ReadSlice(2, 6)), (std::vector<int64_t>{3, 4, 5, 6}));
    EXPECT_EQ(reader.position(), 6);

    NotificationSlot slot = reader.At(7);
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(slot->id, 8);
    EXPECT_EQ(reader.position(), 8);

    ASSERT_TRUE(reader.Next(&slot));
    EXPECT_EQ(slot->id, 9);

    EXPECT_EQ(Ids(reader.ReadSlice(10)), (std::vector<int64_t>{11, 12}));
    EXPECT_FALSE(reader.Next(&slot));
    EXPECT_THROW(reader.At(100), std::out_of_range);
}

TEST_F(NotificationReaderTest, NegativeSeekRejected) {
    NotificationReader reader(log_);
    EXPECT_THROW(reader.Seek(-1), InvalidPosition);
    EXPECT_THROW(reader.ReadSlice(-3), InvalidPosition);
}

TEST_F(NotificationReaderTest, GapIsSurfacedByDefault) {
    for (int64_t p : {0, 1, 2, 3, 5, 6}) {
        InsertAt(p);
    }
    NotificationReader reader(log_);
    auto items = reader.Read();
    EXPECT_EQ(Ids(items), (std::vector<int64_t>{1, 2, 3, 4, 0, 6, 7}));
    EXPECT_EQ(reader.position(), 7);
}

TEST_F(NotificationReaderTest, GapCanBeSkipped) {
    for (int64_t p : {0, 1, 2, 3, 5, 6}) {
        InsertAt(p);
    }
    ReaderOptions options;
    options.gap_policy = GapPolicy::kSkip;
    NotificationReader reader(log_, options);
    EXPECT_EQ(Ids(reader.Read()), (std::vector<int64_t>{1, 2, 3, 4, 6, 7}));
    EXPECT_EQ(reader.position(), 7);
}

TEST_F(NotificationReaderTest, WaitStopsBeforeGapUntilFilled) {
    for (int64_t p : {0, 1, 2, 3, 5, 6}) {
        InsertAt(p);
    }
    ReaderOptions options;
    options.gap_policy = GapPolicy::kWait;
    NotificationReader reader(log_, options);
    EXPECT_EQ(Ids(reader.Read()), (std::vector<int64_t>{1, 2, 3, 4}));
    EXPECT_EQ(reader.position(), 4);
    EXPECT_TRUE(reader.Read().empty());
    EXPECT_EQ(reader.position(), 4);

    InsertAt(4);
    EXPECT_EQ(Ids(reader.Read()), (std::vector<int64_t>{5, 6, 7}));
    EXPECT_EQ(reader.position(), 7);
}

TEST_F(NotificationReaderTest, DirectQueryMatchesSectionWalk) {
    for (int64_t p : {0, 1, 2, 3, 5, 6, 7, 8, 9, 10, 11}) {
        InsertAt(p);
    }
    ReaderOptions direct;
    direct.use_direct_query = true;
    direct.gap_policy = GapPolicy::kSkip;
    ReaderOptions walk;
    walk.gap_policy = GapPolicy::kSkip;

    NotificationReader direct_reader(log_, direct);
    NotificationReader walking_reader(log_, walk);
    direct_reader.Seek(2);
    walking_reader.Seek(2);
    EXPECT_EQ(Ids(direct_reader.Read(5)), Ids(walking_reader.Read(5)));
    EXPECT_EQ(direct_reader.position(), walking_reader.position());
    EXPECT_EQ(direct_reader.section_count(), 0);
    EXPECT_EQ(Ids(direct_reader.Read()), Ids(walking_reader.Read()));
    EXPECT_EQ(direct_reader.position(), 12);
}

TEST_F(NotificationReaderTest, UndisclosedSectionSizeStartsFromPositionForm) {
    AppendItems(14);
    auto remote_like = std::make_shared<UndisclosedSizeLog>(log_);
    NotificationReader reader(remote_like);
    reader.Seek(12);
    EXPECT_EQ(Ids(reader.Read()), (std::vector<int64_t>{13, 14}));
    EXPECT_EQ(remote_like->requests(), 1);
    EXPECT_EQ(reader.position(), 14);
}
