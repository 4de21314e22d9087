#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace scribe::edit
{

// Byte offsets into a UTF-8 buffer. start <= end always holds.
struct SelectionRange
{
    std::size_t start = 0;
    std::size_t end = 0;

    bool isCaret() const noexcept { return start == end; }

    bool operator==(const SelectionRange &other) const noexcept
    {
        return start == other.start && end == other.end;
    }
    bool operator!=(const SelectionRange &other) const noexcept { return !(*this == other); }
};

struct SelectionModel
{
    std::string text;
    std::size_t selectionStart = 0;
    std::size_t selectionEnd = 0;

    // Builds a model from UI-supplied bounds, ordering and clamping them to the text.
    static SelectionModel make(std::string text, std::size_t start, std::size_t end)
    {
        if (start > end)
            std::swap(start, end);
        SelectionModel model;
        model.selectionEnd = std::min(end, text.size());
        model.selectionStart = std::min(start, model.selectionEnd);
        model.text = std::move(text);
        return model;
    }

    static SelectionModel caret(std::string text, std::size_t offset)
    {
        return make(std::move(text), offset, offset);
    }

    bool hasRange() const noexcept { return selectionStart != selectionEnd; }
    SelectionRange range() const noexcept { return {selectionStart, selectionEnd}; }

    std::string_view selectedText() const noexcept
    {
        return std::string_view(text).substr(selectionStart, selectionEnd - selectionStart);
    }
};

struct MutationResult
{
    std::string newText;
    std::size_t newSelectionStart = 0;
    std::size_t newSelectionEnd = 0;
    // Whether the triggering input event should be suppressed.
    bool consumed = true;

    SelectionRange selection() const noexcept { return {newSelectionStart, newSelectionEnd}; }
};

} // namespace scribe::edit
