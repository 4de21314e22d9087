#include <gtest/gtest.h>

#include "scribe/edit/document.hpp"
#include "scribe/edit/document_file.hpp"

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>

using scribe::edit::Document;
using scribe::edit::TimerQueue;

namespace edit = scribe::edit;

namespace
{

class DocumentFileTest : public ::testing::Test
{
protected:
    std::filesystem::path directory;
    TimerQueue timers;

    void SetUp() override
    {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        std::uniform_int_distribution<std::uint64_t> dist;
        directory = std::filesystem::temp_directory_path() / ("scribe_file_test_" + std::to_string(dist(rng)));
        std::filesystem::create_directories(directory);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
    }
};

} // namespace

TEST(ExportFileName, SanitisesAndAddsExtension)
{
    EXPECT_EQ(edit::exportFileNameFor("Shopping list"), "Shopping list.md");
    EXPECT_EQ(edit::exportFileNameFor("a/b:c?"), "a_b_c_.md");
    EXPECT_EQ(edit::exportFileNameFor("notes.txt"), "notes.txt");
    EXPECT_EQ(edit::exportFileNameFor(""), "Untitled.md");
}

TEST_F(DocumentFileTest, SaveAsWritesContentAndMarksSaved)
{
    Document doc(timers, "doc-1", "", "", false);
    doc.updateContent("# Plan\n- [ ] ship", {0, 0});
    ASSERT_FALSE(doc.isSaved());

    const auto path = directory / "plan.md";
    ASSERT_TRUE(edit::saveDocumentAs(doc, path));
    EXPECT_TRUE(doc.isSaved());
    EXPECT_EQ(doc.filePath().string(), path.string());
    EXPECT_EQ(doc.title(), "plan.md");

    auto written = edit::readDocumentFile(path);
    ASSERT_TRUE(written);
    EXPECT_EQ(*written, "# Plan\n- [ ] ship");
}

TEST_F(DocumentFileTest, SavingAgainOverwritesTheFile)
{
    const auto path = directory / "notes.md";
    Document doc(timers, "doc-1", "notes.md", "first draft", true);
    ASSERT_TRUE(edit::saveDocumentAs(doc, path));

    doc.updateContent("short", {5, 5});
    ASSERT_TRUE(edit::saveDocumentAs(doc, doc.filePath()));
    EXPECT_EQ(edit::readDocumentFile(path), "short");
}

TEST_F(DocumentFileTest, UnwritablePathLeavesDocumentUnsaved)
{
    Document doc(timers, "doc-1", "", "", false);
    doc.updateContent("text", {4, 4});

    EXPECT_FALSE(edit::saveDocumentAs(doc, directory / "missing" / "out.md"));
    EXPECT_FALSE(edit::saveDocumentAs(doc, {}));
    EXPECT_FALSE(doc.isSaved());
    EXPECT_FALSE(doc.hasFilePath());
}

TEST_F(DocumentFileTest, ReadKeepsBytesAsWritten)
{
    const auto path = directory / "raw.md";
    const std::string bytes = "line\r\nabc\xFF\xFE";
    ASSERT_TRUE(edit::writeDocumentFile(path, bytes));
    EXPECT_EQ(edit::readDocumentFile(path), bytes);
    EXPECT_FALSE(edit::readDocumentFile(directory / "absent.md"));
}
