#include "scribe/edit/document_file.hpp"

#include "scribe/edit/document.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace scribe::edit
{
namespace
{
bool isSafeFileNameChar(char ch) noexcept
{
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '.' || ch == '-' || ch == '_' || ch == ' ';
}

} // namespace

std::string exportFileNameFor(std::string_view title)
{
    std::string name;
    name.reserve(title.size() + kMarkdownExtension.size());
    for (char ch : title)
        name.push_back(isSafeFileNameChar(ch) ? ch : '_');
    if (name.empty())
        name = kUntitled;
    if (name.find('.') == std::string::npos)
        name += kMarkdownExtension;
    return name;
}

std::optional<std::string> readDocumentFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad())
        return std::nullopt;
    return content.str();
}

bool writeDocumentFile(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return false;
    out << content;
    out.flush();
    return static_cast<bool>(out);
}

bool saveDocumentAs(Document &document, const std::filesystem::path &path)
{
    if (path.empty() || !writeDocumentFile(path, document.content()))
        return false;
    document.setFilePath(path);
    document.markSaved();
    const std::string name = path.filename().string();
    if (!name.empty() && name != document.title())
        document.rename(name);
    return true;
}

} // namespace scribe::edit
