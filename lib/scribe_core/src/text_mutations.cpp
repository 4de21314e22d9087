#include "scribe/edit/text_mutations.hpp"

#include "scribe/edit/line_grammar.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace scribe::edit
{
namespace
{
struct PairEntry
{
    char opener;
    char closer;
};

constexpr std::array<PairEntry, 5> kAutoClosePairs{{
    {'(', ')'},
    {'[', ']'},
    {'{', '}'},
    {'"', '"'},
    {'`', '`'},
}};

bool startsWith(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::string_view text, std::string_view suffix) noexcept
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

MutationResult makeResult(std::string text, std::size_t start, std::size_t end)
{
    MutationResult result;
    result.newText = std::move(text);
    result.newSelectionStart = start;
    result.newSelectionEnd = end;
    result.consumed = true;
    return result;
}

// Replaces [start, end) of the model's text.
std::string splice(const SelectionModel &model, std::size_t start, std::size_t end, std::string_view insertion)
{
    std::string text;
    text.reserve(model.text.size() - (end - start) + insertion.size());
    text.append(model.text, 0, start);
    text.append(insertion);
    text.append(model.text, end, std::string::npos);
    return text;
}

std::vector<std::string_view> splitLines(std::string_view block)
{
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (true)
    {
        std::size_t next = block.find('\n', pos);
        if (next == std::string_view::npos)
        {
            lines.push_back(block.substr(pos));
            break;
        }
        lines.push_back(block.substr(pos, next - pos));
        pos = next + 1;
    }
    return lines;
}

} // namespace

char closerFor(char opener) noexcept
{
    for (const auto &entry : kAutoClosePairs)
    {
        if (entry.opener == opener)
            return entry.closer;
    }
    return '\0';
}

bool isCloser(char ch) noexcept
{
    for (const auto &entry : kAutoClosePairs)
    {
        if (entry.closer == ch)
            return true;
    }
    return false;
}

MutationResult indent(const SelectionModel &model)
{
    const std::size_t caret = model.selectionStart + kIndentUnit.size();
    return makeResult(splice(model, model.selectionStart, model.selectionEnd, kIndentUnit), caret, caret);
}

std::optional<MutationResult> autoClosePair(const SelectionModel &model, char typed)
{
    const char closer = closerFor(typed);
    if (closer == '\0')
        return std::nullopt;

    std::string wrapped;
    wrapped.reserve(model.selectionEnd - model.selectionStart + 2);
    wrapped.push_back(typed);
    wrapped.append(model.selectedText());
    wrapped.push_back(closer);

    std::string text = splice(model, model.selectionStart, model.selectionEnd, wrapped);
    if (model.hasRange())
        return makeResult(std::move(text), model.selectionStart + 1, model.selectionEnd + 1);
    return makeResult(std::move(text), model.selectionStart + 1, model.selectionStart + 1);
}

std::optional<MutationResult> overtypeCloser(const SelectionModel &model, char typed)
{
    if (model.hasRange() || !isCloser(typed))
        return std::nullopt;
    if (model.selectionStart >= model.text.size() || model.text[model.selectionStart] != typed)
        return std::nullopt;
    const std::size_t caret = model.selectionStart + 1;
    return makeResult(model.text, caret, caret);
}

std::optional<MutationResult> smartBackspace(const SelectionModel &model)
{
    const std::size_t caret = model.selectionStart;
    if (model.hasRange() || caret == 0 || caret >= model.text.size())
        return std::nullopt;

    const char closer = closerFor(model.text[caret - 1]);
    if (closer == '\0' || model.text[caret] != closer)
        return std::nullopt;

    return makeResult(splice(model, caret - 1, caret + 1, {}), caret - 1, caret - 1);
}

std::optional<MutationResult> continueList(const SelectionModel &model)
{
    const std::size_t caret = model.selectionStart;
    const std::size_t lineStart = lineStartOf(model.text, caret);
    const std::string_view currentLine = std::string_view(model.text).substr(lineStart, caret - lineStart);

    std::optional<ListItemMatch> match = matchListItem(currentLine);
    if (!match)
        return std::nullopt;

    const std::string_view rest = currentLine.substr(match->length());
    bool emptyItem = true;
    for (char ch : rest)
    {
        if (!isInlineSpace(ch))
        {
            emptyItem = false;
            break;
        }
    }

    if (emptyItem)
    {
        // Breakout: the bullet line becomes empty and the caret moves below it.
        std::string text = splice(model, lineStart, caret, "\n");
        return makeResult(std::move(text), lineStart + 1, lineStart + 1);
    }

    std::string nextMarker;
    switch (match->kind)
    {
    case ListItemKind::Ordered:
        nextMarker = nextOrderedNumber(match->number) + ".";
        break;
    case ListItemKind::Task:
        nextMarker = std::string(1, match->bulletChar) + " [ ]";
        break;
    case ListItemKind::Bullet:
        nextMarker = match->marker;
        break;
    }

    std::string insertion = "\n" + match->indent + nextMarker + match->trailing;
    const std::size_t newCaret = caret + insertion.size();
    return makeResult(splice(model, caret, model.selectionEnd, insertion), newCaret, newCaret);
}

MutationResult toggleWrapper(const SelectionModel &model, std::string_view wrapper)
{
    const std::size_t start = model.selectionStart;
    const std::size_t end = model.selectionEnd;
    const std::size_t width = wrapper.size();
    if (width == 0)
        return makeResult(model.text, start, end);

    const std::string_view selected = model.selectedText();
    const std::string_view before = std::string_view(model.text).substr(0, start);
    const std::string_view after = std::string_view(model.text).substr(end);

    if (selected.size() > 2 * width && startsWith(selected, wrapper) && endsWith(selected, wrapper))
    {
        std::string_view inner = selected.substr(width, selected.size() - 2 * width);
        return makeResult(splice(model, start, end, inner), start, start + inner.size());
    }

    if (endsWith(before, wrapper) && startsWith(after, wrapper))
    {
        std::string text;
        text.reserve(model.text.size() - 2 * width);
        text.append(before.substr(0, before.size() - width));
        text.append(selected);
        text.append(after.substr(width));
        return makeResult(std::move(text), start - width, end - width);
    }

    std::string wrapped;
    wrapped.reserve(selected.size() + 2 * width);
    wrapped.append(wrapper);
    wrapped.append(selected);
    wrapped.append(wrapper);
    return makeResult(splice(model, start, end, wrapped), start + width, end + width);
}

MutationResult insertLink(const SelectionModel &model)
{
    const std::size_t start = model.selectionStart;
    if (!model.hasRange())
        return makeResult(splice(model, start, start, "[]()"), start + 1, start + 1);

    const std::string_view selected = model.selectedText();
    std::string link;
    link.reserve(selected.size() + 4);
    link.push_back('[');
    link.append(selected);
    link.append("]()");
    // Caret lands inside the parentheses, ready for the URL.
    const std::size_t caret = start + selected.size() + 3;
    return makeResult(splice(model, start, model.selectionEnd, link), caret, caret);
}

MutationResult toggleLinePrefix(const SelectionModel &model, std::string_view prefix)
{
    const std::size_t blockStart = lineStartOf(model.text, model.selectionStart);
    const std::size_t blockEnd = lineEndOf(model.text, model.selectionEnd);
    const std::vector<std::string_view> lines =
        splitLines(std::string_view(model.text).substr(blockStart, blockEnd - blockStart));

    bool allPrefixed = true;
    for (std::string_view line : lines)
    {
        if (!startsWith(line, prefix))
        {
            allPrefixed = false;
            break;
        }
    }

    std::string block;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            block.push_back('\n');
        std::string_view line = lines[i];
        if (allPrefixed)
        {
            block.append(line.substr(prefix.size()));
            continue;
        }
        block.append(prefix);
        block.append(line.substr(structuralPrefixLength(line)));
    }

    const std::size_t blockLength = block.size();
    return makeResult(splice(model, blockStart, blockEnd, block), blockStart, blockStart + blockLength);
}

} // namespace scribe::edit
