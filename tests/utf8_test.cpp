#include "text/utf8.hpp"
#include <gtest/gtest.h>

TEST(Utf8Test, AcceptsWellFormedText) {
    EXPECT_TRUE(text::is_valid_utf8(""));
    EXPECT_TRUE(text::is_valid_utf8("plain ascii."));
    EXPECT_TRUE(text::is_valid_utf8("Ça va, 你好, \xF0\x9F\x93\xA1"));
}

TEST(Utf8Test, RejectsMalformedSequences) {
    EXPECT_FALSE(text::is_valid_utf8("hi \xff there"));
    EXPECT_FALSE(text::is_valid_utf8("cut \xE4\xBD"));        // truncated 3-byte
    EXPECT_FALSE(text::is_valid_utf8("\xC0\xAF"));            // overlong '/'
    EXPECT_FALSE(text::is_valid_utf8("\xED\xA0\x80"));        // surrogate
    EXPECT_FALSE(text::is_valid_utf8("\xF4\x90\x80\x80"));    // past U+10FFFF
    EXPECT_FALSE(text::is_valid_utf8("\x80"));                // stray continuation
}

TEST(Utf8Test, RepairReplacesOnlyTheBadBytes) {
    EXPECT_EQ(text::repair_utf8("Ça va"), "Ça va");
    EXPECT_EQ(text::repair_utf8("hi \xff there"), "hi \xEF\xBF\xBD there");
    EXPECT_EQ(text::repair_utf8("end \xE4\xBD"), "end \xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_TRUE(text::is_valid_utf8(text::repair_utf8("\xC0\xAF\xED\xA0\x80 ok")));
}
