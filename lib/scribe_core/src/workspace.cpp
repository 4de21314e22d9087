#include "scribe/edit/workspace.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace scribe::edit
{
namespace
{
constexpr std::string_view kIdPrefix = "doc-";

std::uint64_t idNumber(std::string_view id) noexcept
{
    if (id.substr(0, kIdPrefix.size()) != kIdPrefix)
        return 0;
    id.remove_prefix(kIdPrefix.size());
    std::uint64_t number = 0;
    auto [end, error] = std::from_chars(id.data(), id.data() + id.size(), number);
    if (error != std::errc() || end != id.data() + id.size())
        return 0;
    return number;
}

} // namespace

Workspace::Workspace(TimerQueue &timers, HistoryOptions historyOptions)
    : timers(timers),
      options(historyOptions)
{
    openDocuments.push_back(std::make_unique<Document>(timers, nextId(), std::string(kUntitled), std::string(),
                                                       false, options));
}

Document &Workspace::createDocument(std::string_view title, std::string content)
{
    const bool custom = !title.empty();
    std::string name = custom ? std::string(title) : std::string(kUntitled);
    openDocuments.push_back(
        std::make_unique<Document>(timers, nextId(), std::move(name), std::move(content), custom, options));
    switchTo(openDocuments.size() - 1);
    return *openDocuments.back();
}

bool Workspace::closeDocument(const std::string &id)
{
    std::size_t index = indexOf(id);
    if (index == openDocuments.size())
        return false;

    Document &doc = *openDocuments[index];
    doc.cancelPendingCommit();
    if (openDocuments.size() == 1)
    {
        doc.reset();
        return true;
    }

    openDocuments.erase(openDocuments.begin() + static_cast<std::ptrdiff_t>(index));
    if (index == activePosition)
        activePosition = index > 0 ? index - 1 : 0;
    else if (index < activePosition)
        --activePosition;
    return true;
}

bool Workspace::activate(const std::string &id)
{
    std::size_t index = indexOf(id);
    if (index == openDocuments.size())
        return false;
    switchTo(index);
    return true;
}

void Workspace::activateNext()
{
    switchTo((activePosition + 1) % openDocuments.size());
}

void Workspace::activatePrevious()
{
    switchTo(activePosition == 0 ? openDocuments.size() - 1 : activePosition - 1);
}

bool Workspace::rename(const std::string &id, std::string_view title)
{
    Document *doc = find(id);
    if (!doc)
        return false;
    doc->rename(title);
    return true;
}

Document *Workspace::find(const std::string &id) noexcept
{
    std::size_t index = indexOf(id);
    return index == openDocuments.size() ? nullptr : openDocuments[index].get();
}

const Document *Workspace::find(const std::string &id) const noexcept
{
    std::size_t index = indexOf(id);
    return index == openDocuments.size() ? nullptr : openDocuments[index].get();
}

Document &Workspace::require(const std::string &id)
{
    if (Document *doc = find(id))
        return *doc;
    throw std::out_of_range("unknown document id: " + id);
}

std::size_t Workspace::unsavedCount() const noexcept
{
    return static_cast<std::size_t>(std::count_if(openDocuments.begin(), openDocuments.end(),
                                                  [](const std::unique_ptr<Document> &doc) { return !doc->isSaved(); }));
}

bool Workspace::replaceDocuments(std::vector<std::unique_ptr<Document>> documents, std::size_t activeIndex)
{
    documents.erase(std::remove(documents.begin(), documents.end(), nullptr), documents.end());
    if (documents.empty())
        return false;

    for (auto &doc : openDocuments)
        doc->cancelPendingCommit();
    openDocuments = std::move(documents);
    activePosition = std::min(activeIndex, openDocuments.size() - 1);
    for (const auto &doc : openDocuments)
        idCounter = std::max(idCounter, idNumber(doc->id()));
    return true;
}

std::size_t Workspace::indexOf(const std::string &id) const noexcept
{
    auto it = std::find_if(openDocuments.begin(), openDocuments.end(),
                           [&id](const std::unique_ptr<Document> &doc) { return doc->id() == id; });
    return static_cast<std::size_t>(it - openDocuments.begin());
}

void Workspace::switchTo(std::size_t index) noexcept
{
    if (index == activePosition)
        return;
    // The outgoing document's debounce must not commit into it after the switch.
    openDocuments[activePosition]->cancelPendingCommit();
    activePosition = index;
}

std::string Workspace::nextId()
{
    return std::string(kIdPrefix) + std::to_string(++idCounter);
}

} // namespace scribe::edit
