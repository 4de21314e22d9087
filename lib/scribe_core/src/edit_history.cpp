#include "scribe/edit/edit_history.hpp"

#include <algorithm>
#include <utility>

namespace scribe::edit
{

DocumentHistory::DocumentHistory(std::string initialContent, std::size_t limit)
    : capacity(std::max<std::size_t>(limit, 1))
{
    timeline.push_back(HistoryEntry{std::move(initialContent), SelectionRange{}});
}

bool DocumentHistory::commit(std::string content, SelectionRange selection)
{
    if (timeline[cursor].content == content)
        return false;

    timeline.erase(timeline.begin() + static_cast<std::ptrdiff_t>(cursor) + 1, timeline.end());
    timeline.push_back(HistoryEntry{std::move(content), selection});
    while (timeline.size() > capacity)
        timeline.pop_front();
    cursor = timeline.size() - 1;
    return true;
}

const HistoryEntry *DocumentHistory::undo() noexcept
{
    if (!canUndo())
        return nullptr;
    --cursor;
    return &timeline[cursor];
}

const HistoryEntry *DocumentHistory::redo() noexcept
{
    if (!canRedo())
        return nullptr;
    ++cursor;
    return &timeline[cursor];
}

void DocumentHistory::reset(std::string content)
{
    timeline.clear();
    timeline.push_back(HistoryEntry{std::move(content), SelectionRange{}});
    cursor = 0;
}

HistoryManager::HistoryManager(TimerQueue &timers, std::string initialContent, HistoryOptions options)
    : settings(options),
      history(std::move(initialContent), options.limit),
      debounce(timers)
{
}

void HistoryManager::commitContent(std::string content, SelectionRange selection)
{
    liveContent = std::move(content);
    liveSelection = selection;
    hasLiveState = true;
    debounce.arm(settings.debounce, [this]() { commitPendingNow(); });
}

const HistoryEntry *HistoryManager::undo()
{
    // A pending commit firing after this would resurrect the undone content.
    cancelPending();
    return history.undo();
}

const HistoryEntry *HistoryManager::redo()
{
    cancelPending();
    return history.redo();
}

void HistoryManager::cancelPending() noexcept
{
    debounce.cancel();
    hasLiveState = false;
}

bool HistoryManager::flush()
{
    if (!debounce.isArmed())
        return false;
    debounce.cancel();
    return commitPendingNow();
}

void HistoryManager::reset(std::string content)
{
    cancelPending();
    history.reset(std::move(content));
}

bool HistoryManager::commitPendingNow()
{
    if (!hasLiveState)
        return false;
    hasLiveState = false;
    return history.commit(std::move(liveContent), liveSelection);
}

} // namespace scribe::edit
