#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scribe::edit
{

class Document;

inline constexpr std::string_view kMarkdownExtension = ".md";

// Name offered when a document has no file yet. Characters outside [A-Za-z0-9._- ] become '_'
// and ".md" is appended when the name has no extension.
std::string exportFileNameFor(std::string_view title);

std::optional<std::string> readDocumentFile(const std::filesystem::path &path);
bool writeDocumentFile(const std::filesystem::path &path, const std::string &content);

// Writes the document to path and makes path its file. On success the document is marked saved
// and takes the file name as its title.
bool saveDocumentAs(Document &document, const std::filesystem::path &path);

} // namespace scribe::edit
