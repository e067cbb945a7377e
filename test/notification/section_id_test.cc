#include <gtest/gtest.h>
#include "notification/section_id.h"

#include "common/errors.h"

using namespace Chronicle;

TEST(SectionIdTest, ParsesAllForms) {
    SectionId id = ParseSectionId("current");
    EXPECT_EQ(id.kind, SectionId::Kind::kCurrent);

    id = ParseSectionId("6,10");
    EXPECT_EQ(id.kind, SectionId::Kind::kRange);
    EXPECT_EQ(id.first, 6);
    EXPECT_EQ(id.last, 10);

    id = ParseSectionId("21,");
    EXPECT_EQ(id.kind, SectionId::Kind::kFrom);
    EXPECT_EQ(id.first, 21);
}

TEST(SectionIdTest, RejectsMalformedIds) {
    for (const char* text : {"", "Current", "abc", "5", ",5", "0,5", "5,3", "1,2,3", "-1,5",
                             " 1,5", "1, 5", "+1,5", "99999999999999999999,1"}) {
        EXPECT_THROW(ParseSectionId(text), InvalidSectionId) << "'" << text << "'";
    }
}

TEST(SectionIdTest, Formatting) {
    EXPECT_EQ(FormatSectionId(1, 20), "1,20");
    EXPECT_EQ(FormatPositionSectionId(7), "7,");
    EXPECT_EQ(SectionFirst("41,60"), 41);
    EXPECT_EQ(SectionFirst("9,"), 9);
}
