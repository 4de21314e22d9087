#include "scribe/edit/find_replace.hpp"

#include <cctype>
#include <regex>
#include <string_view>

namespace scribe::edit
{
namespace
{
constexpr std::string_view kPatternMetacharacters = ".*+?^${}()|[]\\";

std::string lower(std::string_view view)
{
    std::string result(view.begin(), view.end());
    for (char &ch : result)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

MatchOutcome foundAt(std::size_t index, std::size_t length, bool wrapped)
{
    MatchOutcome outcome;
    outcome.status = MatchStatus::Found;
    outcome.start = index;
    outcome.end = index + length;
    outcome.wrapped = wrapped;
    return outcome;
}

} // namespace

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size())
        return false;
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(lhs[i])));
        char b = static_cast<char>(std::tolower(static_cast<unsigned char>(rhs[i])));
        if (a != b)
            return false;
    }
    return true;
}

MatchOutcome findNext(const SelectionModel &model, std::string_view query, bool reverse)
{
    if (query.empty())
        return {};

    const std::string haystack = lower(model.text);
    const std::string needle = lower(query);

    if (!reverse)
    {
        std::size_t index = haystack.find(needle, model.selectionEnd);
        if (index != std::string::npos)
            return foundAt(index, needle.size(), false);
        index = haystack.find(needle);
        if (index != std::string::npos)
            return foundAt(index, needle.size(), true);
        return {};
    }

    // Backward: the match must end at or before the selection start.
    if (model.selectionStart >= needle.size())
    {
        std::size_t index = haystack.rfind(needle, model.selectionStart - needle.size());
        if (index != std::string::npos)
            return foundAt(index, needle.size(), false);
    }
    std::size_t index = haystack.rfind(needle);
    if (index != std::string::npos)
        return foundAt(index, needle.size(), true);
    return {};
}

ReplaceOneResult replaceOne(const SelectionModel &model, std::string_view find, std::string_view replacement)
{
    ReplaceOneResult result;
    if (find.empty())
        return result;

    if (!equalsIgnoreCase(model.selectedText(), find))
    {
        result.next = findNext(model, find);
        return result;
    }

    MutationResult edit;
    edit.newText.reserve(model.text.size() - find.size() + replacement.size());
    edit.newText.append(model.text, 0, model.selectionStart);
    edit.newText.append(replacement);
    edit.newText.append(model.text, model.selectionEnd, std::string::npos);
    edit.newSelectionStart = model.selectionStart + replacement.size();
    edit.newSelectionEnd = edit.newSelectionStart;
    edit.consumed = true;

    result.next = findNext(SelectionModel::caret(edit.newText, edit.newSelectionStart), find);
    result.edit = std::move(edit);
    return result;
}

ReplaceAllResult replaceAll(std::string_view text, std::string_view find, std::string_view replacement)
{
    ReplaceAllResult result;
    if (find.empty())
    {
        result.text = std::string(text);
        return result;
    }

    const std::regex pattern(escapePattern(find), std::regex::ECMAScript | std::regex::icase);
    const char *begin = text.data();
    const char *end = text.data() + text.size();

    // Replacement text is inserted literally; "$&" and friends are not expanded.
    std::size_t copied = 0;
    for (std::cregex_iterator it(begin, end, pattern), last; it != last; ++it)
    {
        const std::size_t position = static_cast<std::size_t>(it->position(0));
        result.text.append(text.substr(copied, position - copied));
        result.text.append(replacement);
        copied = position + static_cast<std::size_t>(it->length(0));
        ++result.count;
    }
    result.text.append(text.substr(copied));
    return result;
}

std::string escapePattern(std::string_view literal)
{
    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char ch : literal)
    {
        if (kPatternMetacharacters.find(ch) != std::string_view::npos)
            escaped.push_back('\\');
        escaped.push_back(ch);
    }
    return escaped;
}

} // namespace scribe::edit
