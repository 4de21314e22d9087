#include "scribe/edit/key_dispatch.hpp"

#include "scribe/edit/text_mutations.hpp"

namespace scribe::edit
{

std::optional<MutationResult> dispatchKey(const SelectionModel &model, const KeyIntent &intent,
                                          const DispatchOptions &options)
{
    switch (intent.key)
    {
    case EditKey::Tab:
        return indent(model);
    case EditKey::Character:
        if (intent.modifier || !options.autoClosePairs)
            return std::nullopt;
        if (auto skipped = overtypeCloser(model, intent.character))
            return skipped;
        return autoClosePair(model, intent.character);
    case EditKey::Enter:
        if (!options.smartListContinuation)
            return std::nullopt;
        return continueList(model);
    case EditKey::Backspace:
        if (!options.autoClosePairs)
            return std::nullopt;
        return smartBackspace(model);
    }
    return std::nullopt;
}

MutationResult applyFormatAction(const SelectionModel &model, FormatAction action)
{
    switch (action)
    {
    case FormatAction::Bold:
        return toggleWrapper(model, "**");
    case FormatAction::Italic:
        return toggleWrapper(model, "*");
    case FormatAction::Strikethrough:
        return toggleWrapper(model, "~~");
    case FormatAction::InlineCode:
        return toggleWrapper(model, "`");
    case FormatAction::Link:
        return insertLink(model);
    case FormatAction::Heading1:
        return toggleLinePrefix(model, "# ");
    case FormatAction::Heading2:
        return toggleLinePrefix(model, "## ");
    case FormatAction::Heading3:
        return toggleLinePrefix(model, "### ");
    case FormatAction::BlockQuote:
        return toggleLinePrefix(model, "> ");
    case FormatAction::BulletList:
        return toggleLinePrefix(model, "- ");
    case FormatAction::NumberedList:
        return toggleLinePrefix(model, "1. ");
    case FormatAction::TaskList:
        return toggleLinePrefix(model, "- [ ] ");
    }
    return toggleWrapper(model, "**");
}

std::string_view formatActionName(FormatAction action) noexcept
{
    switch (action)
    {
    case FormatAction::Bold:
        return "Bold";
    case FormatAction::Italic:
        return "Italic";
    case FormatAction::Strikethrough:
        return "Strikethrough";
    case FormatAction::InlineCode:
        return "Inline Code";
    case FormatAction::Link:
        return "Link";
    case FormatAction::Heading1:
        return "Heading 1";
    case FormatAction::Heading2:
        return "Heading 2";
    case FormatAction::Heading3:
        return "Heading 3";
    case FormatAction::BlockQuote:
        return "Block Quote";
    case FormatAction::BulletList:
        return "Bullet List";
    case FormatAction::NumberedList:
        return "Numbered List";
    case FormatAction::TaskList:
        return "Task List";
    }
    return {};
}

} // namespace scribe::edit
