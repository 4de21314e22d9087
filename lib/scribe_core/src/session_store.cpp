#include "scribe/edit/session_store.hpp"

#include "scribe/edit/workspace.hpp"
#include "scribe/options.hpp"

#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

namespace scribe::edit
{
namespace
{
constexpr int kSessionFormatVersion = 1;

std::string stringField(const nlohmann::json &object, const char *key, const std::string &fallback)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

std::optional<DocumentSnapshot> documentFromJson(const nlohmann::json &item)
{
    if (!item.is_object())
        return std::nullopt;
    auto id = item.find("id");
    auto content = item.find("content");
    if (id == item.end() || !id->is_string() || content == item.end() || !content->is_string())
        return std::nullopt;

    DocumentSnapshot doc;
    doc.id = id->get<std::string>();
    doc.content = content->get<std::string>();
    doc.title = stringField(item, "title", std::string(kUntitled));
    auto custom = item.find("customTitle");
    doc.customTitle = custom != item.end() && custom->is_boolean() && custom->get<bool>();
    doc.filePath = stringField(item, "path", std::string());
    if (doc.id.empty())
        return std::nullopt;
    return doc;
}

} // namespace

SessionSnapshot captureSession(const Workspace &workspace)
{
    SessionSnapshot snapshot;
    snapshot.documents.reserve(workspace.size());
    for (const auto &doc : workspace.documents())
        snapshot.documents.push_back(
            {doc->id(), doc->title(), doc->content(), doc->hasCustomTitle(), doc->filePath().string()});
    snapshot.activeId = workspace.active().id();
    return snapshot;
}

bool restoreSession(Workspace &workspace, const SessionSnapshot &snapshot)
{
    if (snapshot.documents.empty())
        return false;

    std::vector<std::unique_ptr<Document>> documents;
    std::size_t activeIndex = 0;
    for (const DocumentSnapshot &saved : snapshot.documents)
    {
        if (saved.id == snapshot.activeId)
            activeIndex = documents.size();
        auto doc = std::make_unique<Document>(workspace.timerQueue(), saved.id, saved.title, saved.content,
                                              saved.customTitle, workspace.historyOptions());
        doc->setFilePath(saved.filePath);
        documents.push_back(std::move(doc));
    }
    return workspace.replaceDocuments(std::move(documents), activeIndex);
}

std::string sessionToJson(const SessionSnapshot &snapshot)
{
    nlohmann::json documents = nlohmann::json::array();
    for (const DocumentSnapshot &doc : snapshot.documents)
    {
        nlohmann::json item = {{"id", doc.id},
                               {"title", doc.title},
                               {"content", doc.content},
                               {"customTitle", doc.customTitle}};
        if (!doc.filePath.empty())
            item["path"] = doc.filePath;
        documents.push_back(std::move(item));
    }
    nlohmann::json root = {{"version", kSessionFormatVersion},
                           {"activeId", snapshot.activeId},
                           {"documents", std::move(documents)}};
    // Invalid UTF-8 in imported text is written as U+FFFD rather than failing the whole session.
    return root.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<SessionSnapshot> sessionFromJson(const std::string &text)
{
    nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object())
        return std::nullopt;

    auto documents = root.find("documents");
    if (documents == root.end() || !documents->is_array() || documents->empty())
        return std::nullopt;

    SessionSnapshot snapshot;
    std::set<std::string> seen;
    for (const auto &item : *documents)
    {
        auto doc = documentFromJson(item);
        if (!doc || !seen.insert(doc->id).second)
            return std::nullopt;
        snapshot.documents.push_back(std::move(*doc));
    }
    snapshot.activeId = stringField(root, "activeId", snapshot.documents.front().id);
    return snapshot;
}

bool saveSession(const std::filesystem::path &path, const SessionSnapshot &snapshot)
{
    if (snapshot.documents.empty())
        return false;

    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream out(path);
    if (!out)
        return false;
    out << sessionToJson(snapshot) << '\n';
    return static_cast<bool>(out);
}

std::optional<SessionSnapshot> loadSession(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
        return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto snapshot = sessionFromJson(buffer.str());
    if (!snapshot)
        std::cerr << "scribe: ignoring malformed session file " << path.string() << '\n';
    return snapshot;
}

std::filesystem::path defaultSessionPath()
{
    return config::OptionRegistry::configRoot() / "scribe-edit" / "session.json";
}

} // namespace scribe::edit
