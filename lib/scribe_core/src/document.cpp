#include "scribe/edit/document.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace scribe::edit
{
namespace
{
std::string_view trim(std::string_view view) noexcept
{
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front())))
        view.remove_prefix(1);
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back())))
        view.remove_suffix(1);
    return view;
}

// At most maxBytes long, never ending inside a UTF-8 sequence.
std::string_view truncateUtf8(std::string_view text, std::size_t maxBytes) noexcept
{
    if (text.size() <= maxBytes)
        return text;
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut);
}

} // namespace

std::optional<std::string> autoTitleFor(std::string_view content)
{
    std::string_view firstLine = trim(content.substr(0, content.find('\n')));
    if (firstLine.substr(0, 2) == "# ")
    {
        std::string_view heading = truncateUtf8(trim(firstLine.substr(2)), kMaxAutoTitleLength);
        if (heading.empty())
            return std::string(kUntitled);
        return std::string(heading);
    }
    if (trim(content).empty())
        return std::string(kUntitled);
    return std::nullopt;
}

Document::Document(TimerQueue &timers, std::string id, std::string title, std::string content, bool customTitle,
                   HistoryOptions historyOptions)
    : documentId(std::move(id)),
      documentTitle(std::move(title)),
      text(std::move(content)),
      history(timers, text, historyOptions),
      customTitle(customTitle)
{
    if (documentTitle.empty())
        documentTitle = kUntitled;
}

void Document::updateContent(std::string content, SelectionRange selection)
{
    saved = false;
    text = std::move(content);
    ++contentRevision;
    selected = clamp(selection);
    if (!customTitle)
    {
        if (auto title = autoTitleFor(text))
            documentTitle = std::move(*title);
    }
    history.commitContent(text, selected);
}

bool Document::applyMutation(const MutationResult &result)
{
    const bool changed = result.newText != text;
    if (changed)
        updateContent(result.newText, result.selection());
    else
        selected = clamp(result.selection());
    pendingSelection = selected;
    return changed;
}

void Document::setSelection(SelectionRange selection) noexcept
{
    selected = clamp(selection);
}

std::optional<SelectionRange> Document::takePendingSelection() noexcept
{
    std::optional<SelectionRange> pending = pendingSelection;
    pendingSelection.reset();
    return pending;
}

bool Document::undo()
{
    const HistoryEntry *entry = history.undo();
    if (!entry)
        return false;
    restoreFrom(*entry);
    return true;
}

bool Document::redo()
{
    const HistoryEntry *entry = history.redo();
    if (!entry)
        return false;
    restoreFrom(*entry);
    return true;
}

void Document::rename(std::string_view title)
{
    std::string_view trimmed = trim(title);
    documentTitle = trimmed.empty() ? std::string(kUntitled) : std::string(trimmed);
    customTitle = true;
}

void Document::reset()
{
    history.reset(std::string());
    text.clear();
    ++contentRevision;
    path.clear();
    saved = true;
    selected = {};
    pendingSelection = SelectionRange{};
    documentTitle = kUntitled;
    customTitle = false;
}

void Document::restoreFrom(const HistoryEntry &entry)
{
    text = entry.content;
    ++contentRevision;
    selected = clamp(entry.selection);
    pendingSelection = selected;
    saved = false;
}

SelectionRange Document::clamp(SelectionRange range) const noexcept
{
    if (range.start > range.end)
        std::swap(range.start, range.end);
    range.end = std::min(range.end, text.size());
    range.start = std::min(range.start, range.end);
    return range;
}

} // namespace scribe::edit
