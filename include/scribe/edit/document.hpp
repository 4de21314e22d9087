#pragma once

#include "scribe/edit/edit_history.hpp"
#include "scribe/edit/selection.hpp"
#include "scribe/edit/timer_queue.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scribe::edit
{

inline constexpr std::string_view kUntitled = "Untitled";
inline constexpr std::size_t kMaxAutoTitleLength = 20;

// Title derived from a heading on the first line. std::nullopt leaves the current title alone.
std::optional<std::string> autoTitleFor(std::string_view content);

class Document
{
public:
    Document(TimerQueue &timers, std::string id, std::string title, std::string content, bool customTitle,
             HistoryOptions historyOptions = {});

    Document(const Document &) = delete;
    Document &operator=(const Document &) = delete;

    const std::string &id() const noexcept { return documentId; }
    const std::string &title() const noexcept { return documentTitle; }
    const std::string &content() const noexcept { return text; }
    SelectionRange selection() const noexcept { return selected; }
    SelectionModel model() const { return SelectionModel::make(text, selected.start, selected.end); }
    bool hasCustomTitle() const noexcept { return customTitle; }
    bool isSaved() const noexcept { return saved; }
    void markSaved() noexcept { saved = true; }
    // Bumped on every content change, so views can skip work when nothing moved.
    std::uint64_t revision() const noexcept { return contentRevision; }

    const std::filesystem::path &filePath() const noexcept { return path; }
    bool hasFilePath() const noexcept { return !path.empty(); }
    void setFilePath(std::filesystem::path file) { path = std::move(file); }

    void updateContent(std::string content, SelectionRange selection);
    // Returns true when the text changed. The new selection is left pending for the view.
    bool applyMutation(const MutationResult &result);
    void setSelection(SelectionRange selection) noexcept;

    std::optional<SelectionRange> takePendingSelection() noexcept;
    bool hasPendingSelection() const noexcept { return pendingSelection.has_value(); }

    bool undo();
    bool redo();
    bool canUndo() const noexcept { return history.canUndo(); }
    bool canRedo() const noexcept { return history.canRedo(); }

    void rename(std::string_view title);
    void reset();

    void cancelPendingCommit() noexcept { history.cancelPending(); }
    bool flushPendingCommit() { return history.flush(); }
    bool hasPendingCommit() const noexcept { return history.hasPendingCommit(); }
    const HistoryManager &historyManager() const noexcept { return history; }

private:
    void restoreFrom(const HistoryEntry &entry);
    SelectionRange clamp(SelectionRange range) const noexcept;

    std::string documentId;
    std::string documentTitle;
    std::string text;
    SelectionRange selected;
    std::optional<SelectionRange> pendingSelection;
    HistoryManager history;
    std::filesystem::path path;
    std::uint64_t contentRevision = 0;
    bool customTitle = false;
    bool saved = true;
};

} // namespace scribe::edit
