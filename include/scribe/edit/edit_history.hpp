#pragma once

#include "scribe/edit/selection.hpp"
#include "scribe/edit/timer_queue.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace scribe::edit
{

inline constexpr std::size_t kDefaultHistoryLimit = 50;
inline constexpr std::chrono::milliseconds kDefaultHistoryDebounce{700};

struct HistoryEntry
{
    std::string content;
    SelectionRange selection;
};

// Capped undo timeline. entries()[index()] is always the last committed content.
class DocumentHistory
{
public:
    explicit DocumentHistory(std::string initialContent, std::size_t limit = kDefaultHistoryLimit);

    // Appends a snapshot after the cursor, discarding any redo branch.
    // Returns false when content equals the current entry.
    bool commit(std::string content, SelectionRange selection);

    // nullptr when there is nothing to step to.
    const HistoryEntry *undo() noexcept;
    const HistoryEntry *redo() noexcept;

    bool canUndo() const noexcept { return cursor > 0; }
    bool canRedo() const noexcept { return cursor + 1 < timeline.size(); }

    const HistoryEntry &current() const noexcept { return timeline[cursor]; }
    std::size_t index() const noexcept { return cursor; }
    std::size_t size() const noexcept { return timeline.size(); }
    std::size_t limit() const noexcept { return capacity; }
    const std::deque<HistoryEntry> &entries() const noexcept { return timeline; }

    void reset(std::string content);

private:
    std::deque<HistoryEntry> timeline;
    std::size_t cursor = 0;
    std::size_t capacity;
};

struct HistoryOptions
{
    std::chrono::milliseconds debounce = kDefaultHistoryDebounce;
    std::size_t limit = kDefaultHistoryLimit;
};

// Per-document history with a debounced commit. Live content is recorded on every
// change; it becomes a timeline entry once the debounce delay passes without edits.
class HistoryManager
{
public:
    HistoryManager(TimerQueue &timers, std::string initialContent, HistoryOptions options = {});

    HistoryManager(const HistoryManager &) = delete;
    HistoryManager &operator=(const HistoryManager &) = delete;

    // Records the live state and (re)arms the debounce.
    void commitContent(std::string content, SelectionRange selection);

    const HistoryEntry *undo();
    const HistoryEntry *redo();
    bool canUndo() const noexcept { return history.canUndo(); }
    bool canRedo() const noexcept { return history.canRedo(); }

    void cancelPending() noexcept;
    bool hasPendingCommit() const noexcept { return debounce.isArmed(); }
    // Commits the pending live state immediately, if any. Returns true when an entry was added.
    bool flush();

    void reset(std::string content);

    const DocumentHistory &timeline() const noexcept { return history; }
    const HistoryOptions &options() const noexcept { return settings; }

private:
    bool commitPendingNow();

    HistoryOptions settings;
    DocumentHistory history;
    PendingTimer debounce;
    std::string liveContent;
    SelectionRange liveSelection;
    bool hasLiveState = false;
};

} // namespace scribe::edit
