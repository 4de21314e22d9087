#include <gtest/gtest.h>

#include "scribe/edit/find_replace.hpp"

#include <string>

using scribe::edit::MatchOutcome;
using scribe::edit::SelectionModel;
using scribe::edit::SelectionRange;

namespace edit = scribe::edit;

TEST(FindReplace, FindsForwardFromSelectionEnd)
{
    SelectionModel model = SelectionModel::make("cat Cat cAt", 0, 3);
    MatchOutcome outcome = edit::findNext(model, "cat");
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.range(), (SelectionRange{4, 7}));
    EXPECT_FALSE(outcome.wrapped);
}

TEST(FindReplace, WrapsToStart)
{
    SelectionModel model = SelectionModel::make("foo bar foo", 8, 11);
    MatchOutcome outcome = edit::findNext(model, "FOO");
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.range(), (SelectionRange{0, 3}));
    EXPECT_TRUE(outcome.wrapped);
}

TEST(FindReplace, FindsBackwardBeforeSelectionStart)
{
    SelectionModel model = SelectionModel::make("ab ab ab", 6, 8);
    MatchOutcome outcome = edit::findNext(model, "ab", true);
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.range(), (SelectionRange{3, 5}));
    EXPECT_FALSE(outcome.wrapped);
}

TEST(FindReplace, BackwardWrapsToEnd)
{
    SelectionModel model = SelectionModel::make("ab ab ab", 0, 2);
    MatchOutcome outcome = edit::findNext(model, "ab", true);
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.range(), (SelectionRange{6, 8}));
    EXPECT_TRUE(outcome.wrapped);
}

TEST(FindReplace, ReportsMissingAndEmptyQueries)
{
    SelectionModel model = SelectionModel::caret("hello", 0);
    EXPECT_FALSE(edit::findNext(model, "xyz").found());
    EXPECT_FALSE(edit::findNext(model, "").found());
}

TEST(FindReplace, QueryIsLiteral)
{
    SelectionModel model = SelectionModel::caret("a.b axb", 0);
    MatchOutcome outcome = edit::findNext(model, "x");
    ASSERT_TRUE(outcome.found());
    EXPECT_EQ(outcome.start, 5u);
    EXPECT_EQ(edit::findNext(model, "a.b").start, 0u);
    EXPECT_FALSE(edit::findNext(SelectionModel::caret("axb", 0), "a.b").found());
}

TEST(FindReplace, ReplaceOneOnlyReplacesMatchingSelection)
{
    SelectionModel model = SelectionModel::caret("one two one", 0);
    auto result = edit::replaceOne(model, "one", "1");
    EXPECT_FALSE(result.replaced());
    ASSERT_TRUE(result.next.found());
    EXPECT_EQ(result.next.range(), (SelectionRange{0, 3}));
}

TEST(FindReplace, ReplaceOneSubstitutesAndFindsNext)
{
    SelectionModel model = SelectionModel::make("One two one", 0, 3);
    auto result = edit::replaceOne(model, "one", "1");
    ASSERT_TRUE(result.replaced());
    EXPECT_EQ(result.edit->newText, "1 two one");
    EXPECT_EQ(result.edit->selection(), (SelectionRange{1, 1}));
    ASSERT_TRUE(result.next.found());
    EXPECT_EQ(result.next.range(), (SelectionRange{6, 9}));
}

TEST(FindReplace, ReplaceAllCountsEveryOccurrence)
{
    auto result = edit::replaceAll("banana", "a", "b");
    EXPECT_EQ(result.count, 3u);
    EXPECT_EQ(result.text, "bbnbnb");
}

TEST(FindReplace, ReplaceAllIgnoresCaseAndEscapesPattern)
{
    auto result = edit::replaceAll("A+b a+B ab", "a+b", "x");
    EXPECT_EQ(result.count, 2u);
    EXPECT_EQ(result.text, "x x ab");
}

TEST(FindReplace, ReplaceAllInsertsReplacementLiterally)
{
    auto result = edit::replaceAll("cost", "cost", "$& and $1");
    EXPECT_EQ(result.text, "$& and $1");
}

TEST(FindReplace, ReplaceAllWithoutMatchesKeepsText)
{
    auto result = edit::replaceAll("hello", "z", "y");
    EXPECT_EQ(result.count, 0u);
    EXPECT_EQ(result.text, "hello");

    auto empty = edit::replaceAll("hello", "", "y");
    EXPECT_EQ(empty.count, 0u);
    EXPECT_EQ(empty.text, "hello");
}

TEST(FindReplace, EscapesMetacharacters)
{
    EXPECT_EQ(edit::escapePattern("a.b*(c)"), "a\\.b\\*\\(c\\)");
    EXPECT_EQ(edit::escapePattern("plain"), "plain");
}

TEST(FindReplace, ComparesIgnoringAsciiCase)
{
    EXPECT_TRUE(edit::equalsIgnoreCase("MarkDown", "markdown"));
    EXPECT_FALSE(edit::equalsIgnoreCase("mark", "markdown"));
}
