#include <gtest/gtest.h>
#include "notification/notification_log.h"

#include <functional>
#include <memory>
#include <string>

#include "common/errors.h"
#include "common/sequence_id.h"
#include "log/log_writer.h"
#include "sequencer/local_integer_sequencer.h"
#include "storage/in_memory_record_store.h"

using namespace Chronicle;

// Runs each case against both backends with section_size 5.
class NotificationLogTest : public ::testing::TestWithParam<std::string> {
protected:
    static constexpr int64_t kSectionSize = 5;

    void SetUp() override {
        store_ = std::make_shared<InMemoryRecordStore>();
        const SequenceId id = RandomSequenceId();
        if (GetParam() == "big_array") {
            auto array = std::make_shared<BigArray>(id, store_, 10);
            writer_ = std::make_shared<DiscoveringAppender>(array);
            log_ = std::make_shared<BigArrayNotificationLog>(array, kSectionSize);
            sparse_writer_ = [array](int64_t position, const std::string& data) {
                array->Set(position, "topic", data);
            };
        } else {
            writer_ = std::make_shared<RecordStoreAppender>(store_, id);
            log_ = std::make_shared<RecordStoreNotificationLog>(store_, id, kSectionSize);
            auto store = store_;
            sparse_writer_ = [store, id](int64_t position, const std::string& data) {
                store->ConditionalInsert(SequencedItem{id, position, "topic", data});
            };
        }
    }

    void AppendItems(int count) {
        for (int i = 0; i < count; ++i) {
            writer_->Append("topic", "item" + std::to_string(i));
        }
    }

    std::shared_ptr<InMemoryRecordStore> store_;
    std::shared_ptr<ILogWriter> writer_;
    std::shared_ptr<LocalNotificationLog> log_;
    std::function<void(int64_t, const std::string&)> sparse_writer_;
};

TEST_P(NotificationLogTest, EmptyLog) {
    NotificationSection section = log_->GetSection("current");
    EXPECT_EQ(section.section_id, "1,5");
    EXPECT_TRUE(section.items.empty());
    EXPECT_FALSE(section.previous_id.has_value());
    EXPECT_FALSE(section.next_id.has_value());
    EXPECT_FALSE(section.IsArchived());
}

TEST_P(NotificationLogTest, PaginationOfNineItems) {
    AppendItems(9);

    NotificationSection current = log_->GetSection("current");
    EXPECT_EQ(current.section_id, "6,10");
    ASSERT_EQ(current.items.size(), 4u);
    EXPECT_EQ(current.previous_id, std::optional<std::string>("1,5"));
    EXPECT_FALSE(current.next_id.has_value());
    ASSERT_TRUE(current.items[0].has_value());
    EXPECT_EQ(current.items[0]->id, 6);
    EXPECT_EQ(current.items[0]->data, "item5");
    EXPECT_EQ(current.items[3]->id, 9);

    NotificationSection first = log_->GetSection("1,5");
    EXPECT_EQ(first.section_id, "1,5");
    ASSERT_EQ(first.items.size(), 5u);
    EXPECT_FALSE(first.previous_id.has_value());
    EXPECT_EQ(first.next_id, std::optional<std::string>("6,10"));
    EXPECT_TRUE(first.IsArchived());
    EXPECT_EQ(first.items[0]->id, 1);
    EXPECT_EQ(first.items[0]->topic, "topic");
}

TEST_P(NotificationLogTest, NonAlignedAndPositionIdsSnapToSectionStart) {
    AppendItems(9);
    EXPECT_EQ(log_->GetSection("3,4").section_id, "1,5");
    EXPECT_EQ(log_->GetSection("3,4").items.size(), 5u);
    EXPECT_EQ(log_->GetSection("7,").section_id, "6,10");
    EXPECT_EQ(log_->GetSection("6,").items.size(), 4u);
}

TEST_P(NotificationLogTest, FullSectionLinksToFollowingWindow) {
    AppendItems(10);
    NotificationSection second = log_->GetSection("6,10");
    EXPECT_EQ(second.items.size(), 5u);
    EXPECT_EQ(second.next_id, std::optional<std::string>("11,15"));

    NotificationSection current = log_->GetSection("current");
    EXPECT_EQ(current.section_id, "11,15");
    EXPECT_TRUE(current.items.empty());
    EXPECT_EQ(current.previous_id, std::optional<std::string>("6,10"));
    EXPECT_FALSE(current.next_id.has_value());
}

TEST_P(NotificationLogTest, IdsBeyondRangeGiveEmptyBoundarySection) {
    AppendItems(3);
    NotificationSection section = log_->GetSection("21,25");
    EXPECT_EQ(section.section_id, "21,25");
    EXPECT_TRUE(section.items.empty());
    EXPECT_EQ(section.previous_id, std::optional<std::string>("16,20"));
    EXPECT_FALSE(section.next_id.has_value());
}

TEST_P(NotificationLogTest, MalformedIdsThrow) {
    EXPECT_THROW(log_->GetSection("latest"), InvalidSectionId);
    EXPECT_THROW(log_->GetSection("0,5"), InvalidSectionId);
    EXPECT_THROW(log_->GetSection("6,1"), InvalidSectionId);
}

TEST_P(NotificationLogTest, GapsBelowHighWaterMarkArePlaceholders) {
    sparse_writer_(0, "a");
    sparse_writer_(1, "b");
    sparse_writer_(3, "d");

    NotificationSection section = log_->GetSection("current");
    EXPECT_EQ(section.section_id, "1,5");
    ASSERT_EQ(section.items.size(), 4u);
    EXPECT_TRUE(section.items[0].has_value());
    EXPECT_TRUE(section.items[1].has_value());
    EXPECT_FALSE(section.items[2].has_value());
    ASSERT_TRUE(section.items[3].has_value());
    EXPECT_EQ(section.items[3]->id, 4);
    EXPECT_EQ(section.items[3]->data, "d");
}

TEST_P(NotificationLogTest, FullSectionWithGapIsNotArchived) {
    for (int64_t position : {0, 1, 3, 4, 5}) {
        sparse_writer_(position, std::to_string(position));
    }

    NotificationSection section = log_->GetSection("1,5");
    ASSERT_EQ(section.items.size(), 5u);
    EXPECT_FALSE(section.items[2].has_value());
    EXPECT_EQ(section.next_id, std::optional<std::string>("6,10"));
    EXPECT_FALSE(section.IsArchived());

    sparse_writer_(2, "2");
    section = log_->GetSection("1,5");
    ASSERT_TRUE(section.items[2].has_value());
    EXPECT_EQ(section.items[2]->id, 3);
    EXPECT_TRUE(section.IsArchived());
}

TEST_P(NotificationLogTest, DirectQuery) {
    AppendItems(7);
    EXPECT_TRUE(log_->SupportsDirectQuery());
    EXPECT_EQ(log_->SectionSize(), std::optional<int64_t>(kSectionSize));

    auto items = log_->ReadDirect(2, 5);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]->id, 3);
    EXPECT_EQ(items[2]->id, 5);

    EXPECT_EQ(log_->ReadDirect(4, std::nullopt).size(), 3u);
    EXPECT_EQ(log_->ReadDirect(5, 100).size(), 2u);
    EXPECT_TRUE(log_->ReadDirect(7, std::nullopt).empty());
    EXPECT_THROW(log_->ReadDirect(-1, 3), InvalidPosition);
}

INSTANTIATE_TEST_SUITE_P(Backends, NotificationLogTest,
                         ::testing::Values("record_store", "big_array"));

TEST(BigArrayNotificationLogTest, SectionSizeMustDivideArraySize) {
    auto store = std::make_shared<InMemoryRecordStore>();
    auto array = std::make_shared<BigArray>(RandomSequenceId(), store, 10);
    EXPECT_THROW(BigArrayNotificationLog(array, 3), std::invalid_argument);
    EXPECT_NO_THROW(BigArrayNotificationLog(array, 5));
    EXPECT_THROW(RecordStoreNotificationLog(store, RandomSequenceId(), 0), std::invalid_argument);
}

TEST(BigArrayNotificationLogTest, SectionsSpanPartitions) {
    auto store = std::make_shared<InMemoryRecordStore>();
    auto array = std::make_shared<BigArray>(RandomSequenceId(), store, 4);
    BigArrayNotificationLog log(array, 2);
    for (int i = 0; i < 11; ++i) {
        array->Append("topic", std::to_string(i));
    }
    NotificationSection section = log.GetSection("9,10");
    ASSERT_EQ(section.items.size(), 2u);
    EXPECT_EQ(section.items[0]->data, "8");
    EXPECT_EQ(section.items[1]->data, "9");
    EXPECT_EQ(section.next_id, std::optional<std::string>("11,12"));
    EXPECT_EQ(log.GetSection("current").section_id, "11,12");
}
