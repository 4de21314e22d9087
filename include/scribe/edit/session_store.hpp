#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scribe::edit
{

class Workspace;

struct DocumentSnapshot
{
    std::string id;
    std::string title;
    std::string content;
    bool customTitle = false;
    // File the document was imported from or last saved to. Empty when it has none.
    std::string filePath;
};

// Open documents as persisted between runs. Undo history is not part of it.
struct SessionSnapshot
{
    std::vector<DocumentSnapshot> documents;
    std::string activeId;
};

SessionSnapshot captureSession(const Workspace &workspace);
bool restoreSession(Workspace &workspace, const SessionSnapshot &snapshot);

std::string sessionToJson(const SessionSnapshot &snapshot);
std::optional<SessionSnapshot> sessionFromJson(const std::string &text);

bool saveSession(const std::filesystem::path &path, const SessionSnapshot &snapshot);
std::optional<SessionSnapshot> loadSession(const std::filesystem::path &path);

std::filesystem::path defaultSessionPath();

} // namespace scribe::edit
