#include <gtest/gtest.h>

#include "scribe/edit/text_stats.hpp"

#include <string>

using scribe::edit::SelectionModel;

namespace edit = scribe::edit;

TEST(TextStats, CountsWhitespaceSeparatedWords)
{
    EXPECT_EQ(edit::wordCount(""), 0u);
    EXPECT_EQ(edit::wordCount("   \n\t"), 0u);
    EXPECT_EQ(edit::wordCount("one"), 1u);
    EXPECT_EQ(edit::wordCount("  one two\nthree\t four  "), 4u);
    EXPECT_EQ(edit::wordCount("# Heading - item"), 4u);
}

TEST(TextStats, RoundsReadingTimeUp)
{
    EXPECT_EQ(edit::readingTimeMinutes(0), 0u);
    EXPECT_EQ(edit::readingTimeMinutes(1), 1u);
    EXPECT_EQ(edit::readingTimeMinutes(225), 1u);
    EXPECT_EQ(edit::readingTimeMinutes(226), 2u);
}

TEST(TextStats, ReportsOneBasedCursorPosition)
{
    const std::string text = "ab\ncde\n";
    auto start = edit::cursorPosition(text, 0);
    EXPECT_EQ(start.line, 1u);
    EXPECT_EQ(start.column, 1u);

    auto middle = edit::cursorPosition(text, 5);
    EXPECT_EQ(middle.line, 2u);
    EXPECT_EQ(middle.column, 3u);

    auto end = edit::cursorPosition(text, 100);
    EXPECT_EQ(end.line, 3u);
    EXPECT_EQ(end.column, 1u);
}

TEST(TextStats, SelectionStatsNeedARange)
{
    auto none = edit::selectionStats(SelectionModel::caret("some words", 4));
    EXPECT_EQ(none.wordCount, 0u);
    EXPECT_EQ(none.charCount, 0u);

    auto picked = edit::selectionStats(SelectionModel::make("some more words", 0, 9));
    EXPECT_EQ(picked.wordCount, 2u);
    EXPECT_EQ(picked.charCount, 9u);
}

TEST(TextStats, SummarisesDocument)
{
    auto stats = edit::documentStats("hello markdown world");
    EXPECT_EQ(stats.wordCount, 3u);
    EXPECT_EQ(stats.charCount, 20u);
    EXPECT_EQ(stats.readingMinutes, 1u);
}
