#pragma once

#include <cstdint>

namespace scribe::commands::edit
{

inline constexpr std::uint16_t cmDocumentUndo = 3000;
inline constexpr std::uint16_t cmDocumentRedo = 3001;

inline constexpr std::uint16_t cmBold = 3010;
inline constexpr std::uint16_t cmItalic = 3011;
inline constexpr std::uint16_t cmStrikethrough = 3012;
inline constexpr std::uint16_t cmInlineCode = 3013;
inline constexpr std::uint16_t cmInsertLink = 3014;
inline constexpr std::uint16_t cmHeading1 = 3020;
inline constexpr std::uint16_t cmHeading2 = 3021;
inline constexpr std::uint16_t cmHeading3 = 3022;
inline constexpr std::uint16_t cmBlockQuote = 3023;
inline constexpr std::uint16_t cmBulletList = 3024;
inline constexpr std::uint16_t cmNumberedList = 3025;
inline constexpr std::uint16_t cmTaskList = 3026;

inline constexpr std::uint16_t cmNewDocument = 3040;
inline constexpr std::uint16_t cmCloseDocument = 3041;
inline constexpr std::uint16_t cmRenameDocument = 3042;
inline constexpr std::uint16_t cmNextDocument = 3043;
inline constexpr std::uint16_t cmPreviousDocument = 3044;
inline constexpr std::uint16_t cmSaveSession = 3045;

inline constexpr std::uint16_t cmToggleSmartList = 3060;
inline constexpr std::uint16_t cmToggleAutoClose = 3061;
inline constexpr std::uint16_t cmSaveSettings = 3062;
inline constexpr std::uint16_t cmAbout = 3090;

} // namespace scribe::commands::edit
