#pragma once

#include "scribe/commands/scribe_edit.hpp"
#include "scribe/edit/editor_settings.hpp"
#include "scribe/edit/find_replace.hpp"
#include "scribe/edit/key_dispatch.hpp"
#include "scribe/edit/timer_queue.hpp"
#include "scribe/edit/workspace.hpp"
#include "scribe/options.hpp"

#define Uses_TWindow
#define Uses_TFrame
#define Uses_TScrollBar
#define Uses_TIndicator
#define Uses_TView
#define Uses_TFileEditor
#define Uses_TRect
#define Uses_TMenu
#define Uses_TEvent
#define Uses_TPoint
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TSubMenu
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TDeskTop
#define Uses_TCommandSet
#define Uses_TApplication
#define Uses_MsgBox
#define Uses_TKeys
#define Uses_TProgram
#define Uses_TDialog
#define Uses_TObject
#define Uses_TInputLine
#define Uses_TLabel
#define Uses_THistory
#define Uses_TCheckBoxes
#define Uses_TSItem
#define Uses_TButton
#define Uses_TFileDialog
#include <tvision/tv.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace scribe::edit
{

inline constexpr std::string_view kAppName = "scribe-edit";
inline constexpr std::string_view kAppShortDescription = "Markdown editor with list continuation and debounced undo";

class MarkdownEditWindow;
class MarkdownEditorApp;

// Last find/replace request, shared by Find, Replace and Search again.
struct SearchRequest
{
    std::string find;
    std::string replacement;
    bool backward = false;
    bool replaceAll = false;
};

// TEditor bound to the workspace's active document. Structural keys and formatting commands
// are routed through the mutation engine; everything else is default TEditor editing whose
// result is pushed back into the document.
class MarkdownFileEditor : public TFileEditor
{
public:
    MarkdownFileEditor(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll,
                       TIndicator *indicator) noexcept;

    void attach(Workspace &workspace, EditorSettings &settings) noexcept;
    // Loads the active document into the buffer and restores its selection.
    void showActiveDocument();
    // Pushes the buffer into the active document when they differ.
    void syncFromBuffer();
    // Applies the document's pending selection restore and scrolls it into view.
    bool applyPendingSelection();

    SelectionModel currentModel();

    void applyFormat(FormatAction action);
    void undoEdit();
    void redoEdit();
    void find();
    void replace();
    void searchAgain();

    virtual void handleEvent(TEvent &event) override;
    virtual Boolean valid(ushort command) override;

private:
    Workspace *workspace = nullptr;
    EditorSettings *settings = nullptr;
    SearchRequest lastSearch;

    Document *document() noexcept;
    std::string bufferText();
    std::string readRange(uint start, uint end);
    SelectionRange bufferSelection() const noexcept;
    void writeBuffer(const std::string &target);
    void replaceRange(uint start, uint end, const std::string &text);
    bool handleStructuralKey(TEvent &event);
    void applyResult(const MutationResult &result);
    void runSearch();
    void showMatch(const MatchOutcome &outcome);
    void notify(const std::string &message);
};

class MarkdownEditWindow : public TWindow
{
public:
    MarkdownEditWindow(const TRect &bounds, Workspace &workspace) noexcept;

    MarkdownFileEditor *editor() noexcept { return fileEditor; }
    void updateWindowTitle();

    virtual void handleEvent(TEvent &event) override;

private:
    Workspace &workspace;
    MarkdownFileEditor *fileEditor = nullptr;
    TScrollBar *hScrollBar = nullptr;
    TScrollBar *vScrollBar = nullptr;
    TIndicator *indicator = nullptr;
    std::string appliedTitle;
};

class MarkdownEditorApp : public TApplication
{
public:
    MarkdownEditorApp(int argc, char **argv);

    static TMenuBar *initMenuBar(TRect);
    static TStatusLine *initStatusLine(TRect);

    virtual void handleEvent(TEvent &event) override;
    virtual void idle() override;

    void showStatusMessage(const std::string &message);
    // Writes the session file when session restore is enabled.
    bool persistSession();
    bool restoresSession() const noexcept { return settings.restoreSession; }

private:
    config::OptionRegistry optionRegistry;
    EditorSettings settings;
    TimerQueue timers;
    Workspace workspace;
    MarkdownEditWindow *window = nullptr;
    PendingTimer statusMessageClear;
    // What the status line was last computed from.
    std::string statusDocumentId;
    std::uint64_t statusRevision = 0;
    SelectionRange statusSelection;

    void importFile(const std::string &path);
    void newDocument();
    void closeDocument();
    void renameDocument();
    void switchDocument(bool forward);
    void saveSessionNow();
    void saveDocument(bool forceSaveAs);
    void toggleSmartLists();
    void toggleAutoClose();
    void saveSettings();
    void showAbout();
    void dispatchToEditor(ushort command);
    void refreshStatus();
    void afterDocumentSwitch();
};

} // namespace scribe::edit
