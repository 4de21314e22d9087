#pragma once

#include "scribe/edit/edit_history.hpp"
#include "scribe/edit/key_dispatch.hpp"

#include <chrono>
#include <cstddef>

namespace scribe::config
{
class OptionRegistry;
}

namespace scribe::edit
{

inline constexpr const char *kOptionHistoryDebounceMs = "historyDebounceMs";
inline constexpr const char *kOptionHistoryLimit = "historyLimit";
inline constexpr const char *kOptionSmartListContinuation = "smartListContinuation";
inline constexpr const char *kOptionAutoClosePairs = "autoClosePairs";
inline constexpr const char *kOptionRestoreSession = "restoreSession";

struct EditorSettings
{
    std::chrono::milliseconds historyDebounce = kDefaultHistoryDebounce;
    std::size_t historyLimit = kDefaultHistoryLimit;
    bool smartListContinuation = true;
    bool autoClosePairs = true;
    bool restoreSession = true;

    HistoryOptions historyOptions() const noexcept { return {historyDebounce, historyLimit}; }
    DispatchOptions dispatchOptions() const noexcept { return {smartListContinuation, autoClosePairs}; }
};

void registerEditorOptions(config::OptionRegistry &registry);
EditorSettings editorSettingsFrom(const config::OptionRegistry &registry);

} // namespace scribe::edit
