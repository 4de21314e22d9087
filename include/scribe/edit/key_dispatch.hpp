#pragma once

#include "scribe/edit/selection.hpp"

#include <optional>
#include <string_view>

namespace scribe::edit
{

enum class EditKey
{
    Character,
    Tab,
    Enter,
    Backspace
};

struct KeyIntent
{
    EditKey key = EditKey::Character;
    char character = '\0';
    bool modifier = false; // Ctrl/Alt/Meta held

    static KeyIntent typed(char ch, bool withModifier = false) { return {EditKey::Character, ch, withModifier}; }
    static KeyIntent of(EditKey key) { return {key, '\0', false}; }
};

struct DispatchOptions
{
    bool smartListContinuation = true;
    bool autoClosePairs = true;
};

enum class FormatAction
{
    Bold,
    Italic,
    Strikethrough,
    InlineCode,
    Link,
    Heading1,
    Heading2,
    Heading3,
    BlockQuote,
    BulletList,
    NumberedList,
    TaskList
};

// Tries the structural key handlers in order; std::nullopt means "insert the key as usual".
std::optional<MutationResult> dispatchKey(const SelectionModel &model, const KeyIntent &intent,
                                          const DispatchOptions &options = {});

MutationResult applyFormatAction(const SelectionModel &model, FormatAction action);

std::string_view formatActionName(FormatAction action) noexcept;

} // namespace scribe::edit
