#pragma once

#include "scribe/edit/selection.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace scribe::edit
{

enum class MatchStatus
{
    Found,
    NotFound
};

struct MatchOutcome
{
    MatchStatus status = MatchStatus::NotFound;
    std::size_t start = 0;
    std::size_t end = 0;
    bool wrapped = false; // found only after continuing from the opposite end

    bool found() const noexcept { return status == MatchStatus::Found; }
    SelectionRange range() const noexcept { return {start, end}; }
};

struct ReplaceOneResult
{
    // Set when the highlighted text matched and was substituted.
    std::optional<MutationResult> edit;
    // The follow-up search, run against the edited text when a replacement happened.
    MatchOutcome next;

    bool replaced() const noexcept { return edit.has_value(); }
};

struct ReplaceAllResult
{
    std::size_t count = 0;
    std::string text;
};

// Case-insensitive search from the selection end (or start, when reverse) with wraparound.
MatchOutcome findNext(const SelectionModel &model, std::string_view query, bool reverse = false);

// Replaces the selection only if it equals the query (ignoring case); otherwise just finds.
ReplaceOneResult replaceOne(const SelectionModel &model, std::string_view find, std::string_view replacement);

ReplaceAllResult replaceAll(std::string_view text, std::string_view find, std::string_view replacement);

// Neutralises ECMAScript pattern metacharacters so the query matches literally.
std::string escapePattern(std::string_view literal);

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace scribe::edit
