#include "scribe/edit/line_grammar.hpp"

#include <algorithm>
#include <cctype>

namespace scribe::edit
{
namespace
{
bool isDigit(char ch) noexcept
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

std::size_t skipSpaces(std::string_view line, std::size_t pos) noexcept
{
    while (pos < line.size() && isInlineSpace(line[pos]))
        ++pos;
    return pos;
}

bool isBulletChar(char ch) noexcept
{
    return ch == '-' || ch == '*';
}

// "[ ]" or "[x]" starting at pos.
bool isCheckbox(std::string_view line, std::size_t pos) noexcept
{
    return pos + 2 < line.size() && line[pos] == '[' && (line[pos + 1] == ' ' || line[pos + 1] == 'x') &&
           line[pos + 2] == ']';
}

} // namespace

bool isInlineSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\f' || ch == '\v';
}

std::optional<ListItemMatch> matchListItem(std::string_view line)
{
    const std::size_t markerStart = skipSpaces(line, 0);
    if (markerStart >= line.size())
        return std::nullopt;

    ListItemMatch match;
    std::size_t markerEnd = markerStart;
    const char first = line[markerStart];

    if (isBulletChar(first))
    {
        // A task marker is a bullet, exactly one space, then a checkbox.
        const std::size_t boxStart = markerStart + 2;
        if (markerStart + 1 < line.size() && isInlineSpace(line[markerStart + 1]) && isCheckbox(line, boxStart) &&
            boxStart + 3 < line.size() && isInlineSpace(line[boxStart + 3]))
        {
            match.kind = ListItemKind::Task;
            markerEnd = boxStart + 3;
        }
        else
        {
            match.kind = ListItemKind::Bullet;
            markerEnd = markerStart + 1;
        }
        match.bulletChar = first;
    }
    else if (isDigit(first))
    {
        std::size_t digitsEnd = markerStart;
        while (digitsEnd < line.size() && isDigit(line[digitsEnd]))
            ++digitsEnd;
        if (digitsEnd >= line.size() || line[digitsEnd] != '.')
            return std::nullopt;
        match.kind = ListItemKind::Ordered;
        match.number = std::string(line.substr(markerStart, digitsEnd - markerStart));
        markerEnd = digitsEnd + 1;
    }
    else
    {
        return std::nullopt;
    }

    const std::size_t trailingEnd = skipSpaces(line, markerEnd);
    if (trailingEnd == markerEnd)
        return std::nullopt;

    match.indent = std::string(line.substr(0, markerStart));
    match.marker = std::string(line.substr(markerStart, markerEnd - markerStart));
    match.trailing = std::string(line.substr(markerEnd, trailingEnd - markerEnd));
    return match;
}

std::size_t structuralPrefixLength(std::string_view line) noexcept
{
    const std::size_t pos = skipSpaces(line, 0);
    if (pos >= line.size())
        return 0;

    auto spaceAt = [&](std::size_t index) { return index < line.size() && isInlineSpace(line[index]); };

    const char ch = line[pos];
    if (ch == '#')
    {
        std::size_t end = pos;
        while (end < line.size() && line[end] == '#')
            ++end;
        return spaceAt(end) ? end + 1 : 0;
    }
    if (isBulletChar(ch))
    {
        if (!spaceAt(pos + 1))
            return 0;
        if (isCheckbox(line, pos + 2) && spaceAt(pos + 5))
            return pos + 6;
        return pos + 2;
    }
    if (isDigit(ch))
    {
        std::size_t end = pos;
        while (end < line.size() && isDigit(line[end]))
            ++end;
        if (end < line.size() && line[end] == '.' && spaceAt(end + 1))
            return end + 2;
        return 0;
    }
    if (ch == '>')
        return spaceAt(pos + 1) ? pos + 2 : 0;
    return 0;
}

std::string nextOrderedNumber(std::string_view digits)
{
    std::string value(digits);
    std::size_t firstNonZero = value.find_first_not_of('0');
    if (firstNonZero == std::string::npos)
        return "1";
    value.erase(0, firstNonZero);

    for (std::size_t i = value.size(); i-- > 0;)
    {
        if (value[i] != '9')
        {
            ++value[i];
            return value;
        }
        value[i] = '0';
    }
    value.insert(value.begin(), '1');
    return value;
}

std::size_t lineStartOf(std::string_view text, std::size_t offset) noexcept
{
    offset = std::min(offset, text.size());
    if (offset == 0)
        return 0;
    std::size_t newline = text.rfind('\n', offset - 1);
    return newline == std::string_view::npos ? 0 : newline + 1;
}

std::size_t lineEndOf(std::string_view text, std::size_t offset) noexcept
{
    offset = std::min(offset, text.size());
    std::size_t newline = text.find('\n', offset);
    return newline == std::string_view::npos ? text.size() : newline;
}

} // namespace scribe::edit
