#include "scribe/edit/editor_settings.hpp"

#include "scribe/options.hpp"

#include <algorithm>

namespace scribe::edit
{

void registerEditorOptions(config::OptionRegistry &registry)
{
    using config::OptionDefinition;
    using config::OptionKind;
    using config::OptionValue;

    OptionDefinition debounce{kOptionHistoryDebounceMs,
                              OptionKind::Integer,
                              OptionValue(static_cast<std::int64_t>(kDefaultHistoryDebounce.count())),
                              "History debounce (ms)",
                              "Quiet period before a live edit becomes an undo step.",
                              0,
                              std::nullopt};
    registry.registerOption(debounce);

    OptionDefinition limit{kOptionHistoryLimit,
                           OptionKind::Integer,
                           OptionValue(static_cast<std::int64_t>(kDefaultHistoryLimit)),
                           "History limit",
                           "Maximum number of undo steps kept per document.",
                           1,
                           std::nullopt};
    registry.registerOption(limit);

    registry.registerOption({kOptionSmartListContinuation, OptionKind::Boolean, OptionValue(true),
                             "Smart list continuation",
                             "Continue bullet, numbered and task lists when Enter is pressed."});
    registry.registerOption({kOptionAutoClosePairs, OptionKind::Boolean, OptionValue(true), "Auto-close pairs",
                             "Insert closing brackets and quotes, skip over them and delete them in pairs."});
    registry.registerOption({kOptionRestoreSession, OptionKind::Boolean, OptionValue(true), "Restore session",
                             "Reopen the previous session's documents on start."});
}

EditorSettings editorSettingsFrom(const config::OptionRegistry &registry)
{
    EditorSettings settings;
    std::int64_t debounceMs = registry.getInteger(kOptionHistoryDebounceMs, kDefaultHistoryDebounce.count());
    settings.historyDebounce = std::chrono::milliseconds(std::max<std::int64_t>(debounceMs, 0));
    std::int64_t limit = registry.getInteger(kOptionHistoryLimit, static_cast<std::int64_t>(kDefaultHistoryLimit));
    settings.historyLimit = static_cast<std::size_t>(std::max<std::int64_t>(limit, 1));
    settings.smartListContinuation = registry.getBool(kOptionSmartListContinuation, true);
    settings.autoClosePairs = registry.getBool(kOptionAutoClosePairs, true);
    settings.restoreSession = registry.getBool(kOptionRestoreSession, true);
    return settings;
}

} // namespace scribe::edit
