#pragma once

#include "scribe/edit/document.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace scribe::edit
{

// Ordered set of open documents with exactly one active. Never empty.
class Workspace
{
public:
    explicit Workspace(TimerQueue &timers, HistoryOptions historyOptions = {});

    Workspace(const Workspace &) = delete;
    Workspace &operator=(const Workspace &) = delete;

    Document &createDocument(std::string_view title = {}, std::string content = {});
    bool closeDocument(const std::string &id);
    bool activate(const std::string &id);
    void activateNext();
    void activatePrevious();
    bool rename(const std::string &id, std::string_view title);

    Document *find(const std::string &id) noexcept;
    const Document *find(const std::string &id) const noexcept;
    // Throws std::out_of_range for an unknown id.
    Document &require(const std::string &id);

    Document &active() noexcept { return *openDocuments[activePosition]; }
    const Document &active() const noexcept { return *openDocuments[activePosition]; }
    std::size_t activeIndex() const noexcept { return activePosition; }
    std::size_t size() const noexcept { return openDocuments.size(); }
    const std::vector<std::unique_ptr<Document>> &documents() const noexcept { return openDocuments; }
    std::size_t unsavedCount() const noexcept;

    const HistoryOptions &historyOptions() const noexcept { return options; }
    TimerQueue &timerQueue() noexcept { return timers; }

    // Swaps in a restored document set. Returns false (and keeps the current set) when it is empty.
    bool replaceDocuments(std::vector<std::unique_ptr<Document>> documents, std::size_t activeIndex);

private:
    std::size_t indexOf(const std::string &id) const noexcept;
    void switchTo(std::size_t index) noexcept;
    std::string nextId();

    TimerQueue &timers;
    HistoryOptions options;
    std::vector<std::unique_ptr<Document>> openDocuments;
    std::size_t activePosition = 0;
    std::uint64_t idCounter = 0;
};

} // namespace scribe::edit
