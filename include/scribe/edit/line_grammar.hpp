#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace scribe::edit
{

enum class ListItemKind
{
    Bullet,
    Ordered,
    Task
};

// A list prefix recognised at the start of a line: indent, marker, trailing whitespace.
struct ListItemMatch
{
    ListItemKind kind = ListItemKind::Bullet;
    std::string indent;
    std::string marker;   // "-", "12.", "* [x]"
    std::string trailing; // at least one whitespace character
    char bulletChar = '-';
    std::string number; // digits of an ordered marker

    std::size_t length() const noexcept { return indent.size() + marker.size() + trailing.size(); }
};

bool isInlineSpace(char ch) noexcept;

std::optional<ListItemMatch> matchListItem(std::string_view line);

// Length of a heading, bullet, numbered, task or blockquote prefix (with its indent), 0 if none.
std::size_t structuralPrefixLength(std::string_view line) noexcept;

std::string nextOrderedNumber(std::string_view digits);

std::size_t lineStartOf(std::string_view text, std::size_t offset) noexcept;
std::size_t lineEndOf(std::string_view text, std::size_t offset) noexcept;

} // namespace scribe::edit
