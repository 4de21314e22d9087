#pragma once

#include "scribe/edit/selection.hpp"

#include <cstddef>
#include <string_view>

namespace scribe::edit
{

inline constexpr std::size_t kWordsPerMinute = 225;

struct CursorPosition
{
    std::size_t line = 1;   // 1-based
    std::size_t column = 1; // 1-based, in bytes
};

struct SelectionStats
{
    std::size_t wordCount = 0;
    std::size_t charCount = 0;
};

struct DocumentStats
{
    std::size_t wordCount = 0;
    std::size_t charCount = 0;
    std::size_t readingMinutes = 0;
};

std::size_t wordCount(std::string_view text) noexcept;
std::size_t readingTimeMinutes(std::size_t words) noexcept;
CursorPosition cursorPosition(std::string_view text, std::size_t offset) noexcept;
SelectionStats selectionStats(const SelectionModel &model) noexcept;
DocumentStats documentStats(std::string_view text) noexcept;

} // namespace scribe::edit
