#pragma once

#include "scribe/edit/selection.hpp"

#include <optional>
#include <string_view>

namespace scribe::edit
{

// Pure buffer transformations. Each returns std::nullopt when its trigger does not
// apply, in which case the caller falls through to default input handling.

inline constexpr std::string_view kIndentUnit = "  ";

// Closing character paired with an opener, or '\0' when the character opens nothing.
char closerFor(char opener) noexcept;
bool isCloser(char ch) noexcept;

MutationResult indent(const SelectionModel &model);
std::optional<MutationResult> autoClosePair(const SelectionModel &model, char typed);
std::optional<MutationResult> overtypeCloser(const SelectionModel &model, char typed);
std::optional<MutationResult> smartBackspace(const SelectionModel &model);
std::optional<MutationResult> continueList(const SelectionModel &model);

MutationResult toggleWrapper(const SelectionModel &model, std::string_view wrapper);
MutationResult insertLink(const SelectionModel &model);
MutationResult toggleLinePrefix(const SelectionModel &model, std::string_view prefix);

} // namespace scribe::edit
