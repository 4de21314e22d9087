#include "scribe/edit/text_stats.hpp"

#include <algorithm>
#include <cctype>

namespace scribe::edit
{

std::size_t wordCount(std::string_view text) noexcept
{
    std::size_t count = 0;
    bool inWord = false;
    for (char ch : text)
    {
        const bool space = std::isspace(static_cast<unsigned char>(ch)) != 0;
        if (!space && !inWord)
            ++count;
        inWord = !space;
    }
    return count;
}

std::size_t readingTimeMinutes(std::size_t words) noexcept
{
    return (words + kWordsPerMinute - 1) / kWordsPerMinute;
}

CursorPosition cursorPosition(std::string_view text, std::size_t offset) noexcept
{
    offset = std::min(offset, text.size());
    CursorPosition position;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i < offset; ++i)
    {
        if (text[i] == '\n')
        {
            ++position.line;
            lineStart = i + 1;
        }
    }
    position.column = offset - lineStart + 1;
    return position;
}

SelectionStats selectionStats(const SelectionModel &model) noexcept
{
    if (!model.hasRange())
        return {};
    std::string_view selected = model.selectedText();
    return {wordCount(selected), selected.size()};
}

DocumentStats documentStats(std::string_view text) noexcept
{
    DocumentStats stats;
    stats.wordCount = wordCount(text);
    stats.charCount = text.size();
    stats.readingMinutes = readingTimeMinutes(stats.wordCount);
    return stats;
}

} // namespace scribe::edit
