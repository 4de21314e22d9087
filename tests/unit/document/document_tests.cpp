#include <gtest/gtest.h>

#include "scribe/edit/document.hpp"

#include <chrono>
#include <optional>
#include <string>

using scribe::edit::Document;
using scribe::edit::MutationResult;
using scribe::edit::SelectionRange;
using scribe::edit::TimerQueue;

namespace edit = scribe::edit;

using namespace std::chrono_literals;

namespace
{

class DocumentTest : public ::testing::Test
{
protected:
    TimerQueue::Clock::time_point now{};
    TimerQueue timers{[this] { return now; }};

    void advance(TimerQueue::Clock::duration delta)
    {
        now += delta;
        timers.runDue();
    }
};

} // namespace

TEST(AutoTitle, UsesFirstLineHeading)
{
    EXPECT_EQ(edit::autoTitleFor("# Shopping list\n- milk"), "Shopping list");
    EXPECT_EQ(edit::autoTitleFor("  #   Spaced  "), "Spaced");
    EXPECT_EQ(edit::autoTitleFor("   # Indented"), "Indented");
}

TEST(AutoTitle, TruncatesLongHeadings)
{
    auto title = edit::autoTitleFor("# A heading that is far too long to fit");
    ASSERT_TRUE(title);
    EXPECT_EQ(*title, "A heading that is fa");
    EXPECT_EQ(title->size(), edit::kMaxAutoTitleLength);
}

TEST(AutoTitle, TruncationKeepsMultiByteCharactersWhole)
{
    auto title = edit::autoTitleFor("# " + std::string(19, 'a') + "\xC3\xA9t\xC3\xA9");
    ASSERT_TRUE(title);
    EXPECT_EQ(*title, std::string(19, 'a'));

    title = edit::autoTitleFor("# " + std::string(18, 'b') + "\xC3\xA9z");
    ASSERT_TRUE(title);
    EXPECT_EQ(*title, std::string(18, 'b') + "\xC3\xA9");
}

TEST(AutoTitle, BlankDocumentIsUntitled)
{
    EXPECT_EQ(edit::autoTitleFor(""), "Untitled");
    EXPECT_EQ(edit::autoTitleFor(" \n\t"), "Untitled");
    EXPECT_EQ(edit::autoTitleFor("Plain first line"), std::nullopt);
    EXPECT_EQ(edit::autoTitleFor("## Second level"), std::nullopt);
}

TEST_F(DocumentTest, StartsSavedWithFallbackTitle)
{
    Document doc(timers, "doc-1", "", "", false);
    EXPECT_EQ(doc.title(), "Untitled");
    EXPECT_TRUE(doc.isSaved());
    EXPECT_FALSE(doc.canUndo());
    EXPECT_FALSE(doc.hasPendingSelection());
}

TEST_F(DocumentTest, UpdateRetitlesAndArmsCommit)
{
    Document doc(timers, "doc-1", "Untitled", "", false);
    doc.updateContent("# Plan\nsteps", {6, 6});

    EXPECT_EQ(doc.title(), "Plan");
    EXPECT_FALSE(doc.isSaved());
    EXPECT_TRUE(doc.hasPendingCommit());

    advance(700ms);
    EXPECT_FALSE(doc.hasPendingCommit());
    EXPECT_TRUE(doc.canUndo());
}

TEST_F(DocumentTest, RevisionTracksContentChanges)
{
    Document doc(timers, "doc-1", "", "", false);
    const auto initial = doc.revision();

    doc.setSelection({0, 0});
    EXPECT_EQ(doc.revision(), initial);

    doc.updateContent("a", {1, 1});
    EXPECT_GT(doc.revision(), initial);
    advance(700ms);

    const auto afterEdit = doc.revision();
    ASSERT_TRUE(doc.undo());
    EXPECT_GT(doc.revision(), afterEdit);
}

TEST_F(DocumentTest, CustomTitleIsKept)
{
    Document doc(timers, "doc-1", "Mine", "", true);
    doc.updateContent("# Other", {0, 0});
    EXPECT_EQ(doc.title(), "Mine");
    EXPECT_TRUE(doc.hasCustomTitle());
}

TEST_F(DocumentTest, ClampsSelectionToContent)
{
    Document doc(timers, "doc-1", "", "abc", false);
    doc.setSelection({10, 2});
    EXPECT_EQ(doc.selection(), (SelectionRange{2, 3}));
    EXPECT_EQ(doc.model().selectedText(), "c");
}

TEST_F(DocumentTest, MutationQueuesSelectionRestore)
{
    Document doc(timers, "doc-1", "", "ab", false);
    MutationResult result;
    result.newText = "a  b";
    result.newSelectionStart = 3;
    result.newSelectionEnd = 3;

    EXPECT_TRUE(doc.applyMutation(result));
    EXPECT_EQ(doc.content(), "a  b");
    auto pending = doc.takePendingSelection();
    ASSERT_TRUE(pending);
    EXPECT_EQ(*pending, (SelectionRange{3, 3}));
    EXPECT_FALSE(doc.hasPendingSelection());

    MutationResult caretOnly;
    caretOnly.newText = "a  b";
    caretOnly.newSelectionStart = 4;
    caretOnly.newSelectionEnd = 4;
    EXPECT_FALSE(doc.applyMutation(caretOnly));
    EXPECT_EQ(doc.selection(), (SelectionRange{4, 4}));
    EXPECT_TRUE(doc.hasPendingSelection());
}

TEST_F(DocumentTest, UndoRestoresContentAndSelection)
{
    Document doc(timers, "doc-1", "", "", false);
    doc.updateContent("first", {5, 5});
    advance(700ms);
    doc.updateContent("first second", {12, 12});
    advance(700ms);

    ASSERT_TRUE(doc.undo());
    EXPECT_EQ(doc.content(), "first");
    EXPECT_EQ(doc.takePendingSelection(), (SelectionRange{5, 5}));

    ASSERT_TRUE(doc.redo());
    EXPECT_EQ(doc.content(), "first second");
    EXPECT_FALSE(doc.redo());
}

TEST_F(DocumentTest, UndoDuringDebounceDropsUncommittedEdit)
{
    Document doc(timers, "doc-1", "", "", false);
    doc.updateContent("kept", {4, 4});
    advance(700ms);
    doc.updateContent("kept typing", {11, 11});

    ASSERT_TRUE(doc.undo());
    EXPECT_EQ(doc.content(), "");
    advance(1s);
    EXPECT_TRUE(doc.canRedo());
}

TEST_F(DocumentTest, RenameTrimsAndMarksCustom)
{
    Document doc(timers, "doc-1", "", "", false);
    doc.rename("  Notes ");
    EXPECT_EQ(doc.title(), "Notes");
    EXPECT_TRUE(doc.hasCustomTitle());

    doc.rename("   ");
    EXPECT_EQ(doc.title(), "Untitled");
}

TEST_F(DocumentTest, ResetReturnsToBlankState)
{
    Document doc(timers, "doc-1", "Custom", "text", true);
    doc.updateContent("more text", {0, 0});
    doc.reset();

    EXPECT_EQ(doc.content(), "");
    EXPECT_EQ(doc.title(), "Untitled");
    EXPECT_FALSE(doc.hasCustomTitle());
    EXPECT_FALSE(doc.hasPendingCommit());
    EXPECT_FALSE(doc.canUndo());
    EXPECT_TRUE(doc.isSaved());
    EXPECT_EQ(doc.takePendingSelection(), (SelectionRange{0, 0}));
}
