#include "text/sentence_segmenter.hpp"
#include <gtest/gtest.h>

using text::SentenceSegmenter;

TEST(SentenceSegmenterTest, EmitsAtSentenceEnd) {
    SentenceSegmenter segmenter;
    std::vector<std::string> out;
    for (const auto& token : text::tokenize("Hi there. How are you? Great!")) {
        if (auto sentence = segmenter.add_token(token)) {
            out.push_back(*sentence);
        }
    }
    EXPECT_EQ(out, (std::vector<std::string>{"Hi there.", "How are you?", "Great!"}));
    EXPECT_TRUE(segmenter.empty());
}

TEST(SentenceSegmenterTest, FlushReturnsTheTrailingFragment) {
    SentenceSegmenter segmenter;
    for (const auto& token : text::tokenize("no punctuation at all")) {
        EXPECT_FALSE(segmenter.add_token(token).has_value());
    }
    EXPECT_EQ(segmenter.flush(), "no punctuation at all");
    EXPECT_FALSE(segmenter.flush().has_value());
}

TEST(SentenceSegmenterTest, NewlineEndsASentence) {
    EXPECT_EQ(text::segment("first line\nsecond line"),
              (std::vector<std::string>{"first line", "second line"}));
}

TEST(SentenceSegmenterTest, EllipsisDoesNotProduceEmptyUnits) {
    EXPECT_EQ(text::segment("Wait... what?"), (std::vector<std::string>{"Wait.", "what?"}));
    EXPECT_TRUE(text::segment("...!?").empty());
    EXPECT_TRUE(text::segment("   ").empty());
}

TEST(SentenceSegmenterTest, TokenizeKeepsMultiByteCharactersWhole) {
    const auto tokens = text::tokenize("aé你");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1], "é");
    EXPECT_EQ(tokens[2], "你");
    EXPECT_EQ(text::segment("你好。Ça va."), (std::vector<std::string>{"你好。Ça va."}));
}
