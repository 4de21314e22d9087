#include "scribe/edit/markdown_editor.hpp"

#include "scribe/edit/document_file.hpp"
#include "scribe/edit/session_store.hpp"
#include "scribe/edit/text_stats.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <optional>
#include <sstream>

#ifndef SCRIBE_EDIT_VERSION
#define SCRIBE_EDIT_VERSION "0.0.0"
#endif

namespace scribe::edit
{
    namespace
    {
        namespace cmds = scribe::commands::edit;

        constexpr std::chrono::seconds kStatusMessageDuration{3};

        EditorSettings loadSettings(config::OptionRegistry &registry)
        {
            registerEditorOptions(registry);
            registry.loadDefaults();
            return editorSettingsFrom(registry);
        }

        TStatusItem *makeStatusItems()
        {
            return new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit,
                   new TStatusItem("~F2~ Save", kbF2, cmSave,
                   new TStatusItem("~Ctrl-N~ New", kbNoKey, cmds::cmNewDocument,
                   new TStatusItem("~F6~ Next", kbF6, cmds::cmNextDocument,
                   new TStatusItem("~Ctrl-F~ Find", kbNoKey, cmFind, nullptr)))));
        }

        // Shows cursor and word statistics in the hint area, or a temporary notice.
        class MarkdownStatusLine : public TStatusLine
        {
        public:
            MarkdownStatusLine(TRect r)
                : TStatusLine(r, *new TStatusDef(0, 0xFFFF, makeStatusItems()))
            {
            }

            void setStats(const std::string &text)
            {
                if (stats == text)
                    return;
                stats = text;
                drawView();
            }

            void showTemporaryMessage(const std::string &message)
            {
                temporaryMessage = message;
                showingTemporaryMessage = true;
                drawView();
            }

            void clearTemporaryMessage()
            {
                if (!showingTemporaryMessage)
                    return;
                showingTemporaryMessage = false;
                temporaryMessage.clear();
                drawView();
            }

            const char *hint(ushort) override
            {
                if (showingTemporaryMessage)
                    return temporaryMessage.c_str();
                return stats.c_str();
            }

        private:
            std::string stats;
            std::string temporaryMessage;
            bool showingTemporaryMessage = false;
        };

        constexpr const char *kSmartListLabel = "Smart List Continuation";
        constexpr const char *kAutoCloseLabel = "Auto-close Pairs";
        TMenuItem *gSmartListMenuItem = nullptr;
        TMenuItem *gAutoCloseMenuItem = nullptr;

        void updateToggleLabel(TMenuItem *item, const char *baseLabel, bool enabled)
        {
            if (!item)
                return;
            std::string label = std::string(enabled ? "[x] " : "[ ] ") + baseLabel;
            delete[] const_cast<char *>(item->name);
            item->name = newStr(label.c_str());
        }

        TSubMenu &makeFileMenu()
        {
            return *new TSubMenu("~F~ile", kbNoKey) +
                   *new TMenuItem("~N~ew Document", cmds::cmNewDocument, kbCtrlN, hcNoContext, "Ctrl-N") +
                   *new TMenuItem("~C~lose Document", cmds::cmCloseDocument, kbCtrlW, hcNoContext, "Ctrl-W") +
                   *new TMenuItem("~R~ename Document...", cmds::cmRenameDocument, kbNoKey) +
                   newLine() +
                   *new TMenuItem("Ne~x~t Document", cmds::cmNextDocument, kbF6, hcNoContext, "F6") +
                   *new TMenuItem("~P~revious Document", cmds::cmPreviousDocument, kbShiftF6, hcNoContext, "Shift-F6") +
                   newLine() +
                   *new TMenuItem("~S~ave", cmSave, kbF2, hcNoContext, "F2") +
                   *new TMenuItem("S~a~ve As...", cmSaveAs, kbNoKey) +
                   *new TMenuItem("Save Sess~i~on", cmds::cmSaveSession, kbCtrlS, hcNoContext, "Ctrl-S") +
                   *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X");
        }

        TSubMenu &makeEditMenu()
        {
            return *new TSubMenu("~E~dit", kbNoKey) +
                   *new TMenuItem("~U~ndo", cmds::cmDocumentUndo, kbCtrlZ, hcNoContext, "Ctrl-Z") +
                   *new TMenuItem("~R~edo", cmds::cmDocumentRedo, kbCtrlY, hcNoContext, "Ctrl-Y") +
                   newLine() +
                   *new TMenuItem("Cu~t~", cmCut, kbShiftDel, hcNoContext, "Shift-Del") +
                   *new TMenuItem("~C~opy", cmCopy, kbCtrlIns, hcNoContext, "Ctrl-Ins") +
                   *new TMenuItem("~P~aste", cmPaste, kbShiftIns, hcNoContext, "Shift-Ins") +
                   newLine() +
                   *new TMenuItem("~F~ind...", cmFind, kbCtrlF, hcNoContext, "Ctrl-F") +
                   *new TMenuItem("R~e~place...", cmReplace, kbCtrlR, hcNoContext, "Ctrl-R") +
                   *new TMenuItem("Search ~A~gain", cmSearchAgain, kbF3, hcNoContext, "F3");
        }

        TSubMenu &makeFormatMenu()
        {
            return *new TSubMenu("F~o~rmat", kbNoKey) +
                   *new TMenuItem("~B~old", cmds::cmBold, kbCtrlB, hcNoContext, "Ctrl-B") +
                   *new TMenuItem("~I~talic", cmds::cmItalic, kbAltI, hcNoContext, "Alt-I") +
                   *new TMenuItem("~S~trikethrough", cmds::cmStrikethrough, kbNoKey) +
                   *new TMenuItem("Inline ~C~ode", cmds::cmInlineCode, kbNoKey) +
                   *new TMenuItem("~L~ink", cmds::cmInsertLink, kbCtrlL, hcNoContext, "Ctrl-L") +
                   newLine() +
                   *new TMenuItem("Heading ~1", cmds::cmHeading1, kbAlt1, hcNoContext, "Alt-1") +
                   *new TMenuItem("Heading ~2", cmds::cmHeading2, kbAlt2, hcNoContext, "Alt-2") +
                   *new TMenuItem("Heading ~3", cmds::cmHeading3, kbAlt3, hcNoContext, "Alt-3") +
                   *new TMenuItem("~Q~uote", cmds::cmBlockQuote, kbNoKey);
        }

        TSubMenu &makeListsMenu()
        {
            return *new TSubMenu("~L~ists", kbNoKey) +
                   *new TMenuItem("~B~ulleted List", cmds::cmBulletList, kbNoKey) +
                   *new TMenuItem("~N~umbered List", cmds::cmNumberedList, kbNoKey) +
                   *new TMenuItem("~T~ask List", cmds::cmTaskList, kbNoKey);
        }

        TSubMenu &makeOptionsMenu(const EditorSettings &settings)
        {
            auto *smartListItem = new TMenuItem(kSmartListLabel, cmds::cmToggleSmartList, kbNoKey);
            gSmartListMenuItem = smartListItem;
            updateToggleLabel(smartListItem, kSmartListLabel, settings.smartListContinuation);

            auto *autoCloseItem = new TMenuItem(kAutoCloseLabel, cmds::cmToggleAutoClose, kbNoKey);
            gAutoCloseMenuItem = autoCloseItem;
            updateToggleLabel(autoCloseItem, kAutoCloseLabel, settings.autoClosePairs);

            return *new TSubMenu("~O~ptions", kbNoKey) +
                   *smartListItem +
                   *autoCloseItem +
                   newLine() +
                   *new TMenuItem("~S~ave Settings", cmds::cmSaveSettings, kbNoKey);
        }

        TSubMenu &makeHelpMenu()
        {
            return *new TSubMenu("~H~elp", kbNoKey) +
                   *new TMenuItem("~A~bout", cmds::cmAbout, kbNoKey, hcNoContext);
        }

        // The menu bar is built before the application's members, so the toggles start from defaults
        // and are relabelled once the settings are loaded.
        const EditorSettings kDefaultSettings{};

        std::string statsLine(const Document &doc)
        {
            const DocumentStats stats = documentStats(doc.content());
            const SelectionRange range = doc.selection();
            const CursorPosition position = cursorPosition(doc.content(), range.end);

            std::ostringstream text;
            text << "Ln " << position.line << ", Col " << position.column << "  " << stats.wordCount << " words, "
                 << stats.readingMinutes << " min read";
            SelectionStats selected = selectionStats(doc.model());
            if (selected.charCount > 0)
                text << "  (" << selected.wordCount << " words, " << selected.charCount << " chars selected)";
            return text.str();
        }

    } // namespace

    MarkdownEditWindow::MarkdownEditWindow(const TRect &bounds, Workspace &workspace) noexcept
        : TWindowInit(&TWindow::initFrame), TWindow(bounds, nullptr, wnNoNumber), workspace(workspace)
    {
        options |= ofTileable;
        flags &= ~wfClose;

        indicator = new TIndicator(TRect(2, size.y - 1, 16, size.y));
        insert(indicator);

        hScrollBar = new TScrollBar(TRect(18, size.y - 1, size.x - 2, size.y));
        insert(hScrollBar);

        vScrollBar = new TScrollBar(TRect(size.x - 1, 1, size.x, size.y - 1));
        insert(vScrollBar);

        fileEditor = new MarkdownFileEditor(TRect(1, 1, size.x - 1, size.y - 1), hScrollBar, vScrollBar, indicator);
        insert(fileEditor);
        updateWindowTitle();
    }

    void MarkdownEditWindow::updateWindowTitle()
    {
        const Document &doc = workspace.active();
        std::string text = "[" + std::to_string(workspace.activeIndex() + 1) + "/" + std::to_string(workspace.size()) +
                           "] " + doc.title();
        if (!doc.isSaved())
            text += '*';
        if (text == appliedTitle)
            return;
        appliedTitle = text;

        if (title)
        {
            delete[] const_cast<char *>(title);
            title = nullptr;
        }
        title = newStr(text.c_str());
        if (frame)
            frame->drawView();
    }

    void MarkdownEditWindow::handleEvent(TEvent &event)
    {
        // Closing the window closes the current document instead.
        if (event.what == evCommand && event.message.command == cmClose)
            event.message.command = cmds::cmCloseDocument;

        TWindow::handleEvent(event);
        if (event.what == evBroadcast && event.message.command == cmUpdateTitle)
        {
            updateWindowTitle();
            clearEvent(event);
        }
    }

    MarkdownEditorApp::MarkdownEditorApp(int argc, char **argv)
        : TProgInit(&MarkdownEditorApp::initStatusLine, &MarkdownEditorApp::initMenuBar, &TApplication::initDeskTop),
          TApplication(),
          optionRegistry(std::string(kAppName)),
          settings(loadSettings(optionRegistry)),
          workspace(timers, settings.historyOptions()),
          statusMessageClear(timers)
    {
        updateToggleLabel(gSmartListMenuItem, kSmartListLabel, settings.smartListContinuation);
        updateToggleLabel(gAutoCloseMenuItem, kAutoCloseLabel, settings.autoClosePairs);

        TCommandSet fileCommands;
        fileCommands.enableCmd(cmSave);
        fileCommands.enableCmd(cmSaveAs);
        enableCommands(fileCommands);

        if (settings.restoreSession)
        {
            if (auto snapshot = loadSession(defaultSessionPath()))
                restoreSession(workspace, *snapshot);
        }

        while (--argc > 0)
            importFile(*++argv);

        auto *win = static_cast<MarkdownEditWindow *>(validView(new MarkdownEditWindow(deskTop->getExtent(), workspace)));
        if (!win)
            return;
        window = win;
        deskTop->insert(window);
        window->editor()->attach(workspace, settings);
        window->editor()->showActiveDocument();
        window->updateWindowTitle();
        refreshStatus();
    }

    void MarkdownEditorApp::importFile(const std::string &path)
    {
        auto content = readDocumentFile(path);
        if (!content)
        {
            std::string text = "Cannot read file " + path + ".";
            messageBox(text.c_str(), mfError | mfOKButton);
            return;
        }

        // A blank starting document is replaced by the first imported file.
        const Document &current = workspace.active();
        const bool replacePristine = workspace.size() == 1 && current.content().empty() && !current.hasCustomTitle();
        const std::string pristineId = current.id();

        std::string title = std::filesystem::path(path).filename().string();
        Document &doc = workspace.createDocument(title, std::move(*content));
        std::error_code ec;
        std::filesystem::path absolute = std::filesystem::absolute(path, ec);
        doc.setFilePath(ec ? std::filesystem::path(path) : absolute);
        if (replacePristine)
            workspace.closeDocument(pristineId);
    }

    void MarkdownEditorApp::newDocument()
    {
        window->editor()->syncFromBuffer();
        workspace.createDocument();
        afterDocumentSwitch();
    }

    void MarkdownEditorApp::closeDocument()
    {
        window->editor()->syncFromBuffer();
        const Document &doc = workspace.active();
        if (!doc.content().empty())
        {
            std::string text = "Close \"" + doc.title() + "\"?";
            if (messageBox(text.c_str(), mfConfirmation | mfYesButton | mfNoButton) != cmYes)
                return;
        }
        workspace.closeDocument(doc.id());
        afterDocumentSwitch();
    }

    void MarkdownEditorApp::renameDocument()
    {
        Document &doc = workspace.active();
        char buffer[256];
        std::strncpy(buffer, doc.title().c_str(), sizeof(buffer));
        buffer[sizeof(buffer) - 1] = '\0';
        if (inputBox("Rename Document", "~T~itle", buffer, sizeof(buffer) - 1) == cmCancel)
            return;
        workspace.rename(doc.id(), buffer);
        window->updateWindowTitle();
    }

    void MarkdownEditorApp::switchDocument(bool forward)
    {
        if (workspace.size() < 2)
            return;
        window->editor()->syncFromBuffer();
        if (forward)
            workspace.activateNext();
        else
            workspace.activatePrevious();
        afterDocumentSwitch();
    }

    void MarkdownEditorApp::afterDocumentSwitch()
    {
        window->editor()->showActiveDocument();
        window->updateWindowTitle();
        refreshStatus();
    }

    bool MarkdownEditorApp::persistSession()
    {
        if (window)
            window->editor()->syncFromBuffer();
        if (!edit::saveSession(defaultSessionPath(), captureSession(workspace)))
            return false;
        for (const auto &doc : workspace.documents())
            doc->markSaved();
        return true;
    }

    void MarkdownEditorApp::saveSessionNow()
    {
        if (persistSession())
            showStatusMessage("Session saved");
        else
            messageBox("Could not write the session file.", mfError | mfOKButton);
        window->updateWindowTitle();
    }

    void MarkdownEditorApp::saveDocument(bool forceSaveAs)
    {
        window->editor()->syncFromBuffer();
        Document &doc = workspace.active();

        std::filesystem::path target = doc.filePath();
        if (forceSaveAs || target.empty())
        {
            char name[MAXPATH];
            std::string suggested = target.empty() ? exportFileNameFor(doc.title()) : target.string();
            std::strncpy(name, suggested.c_str(), sizeof(name));
            name[sizeof(name) - 1] = '\0';
            auto *dialog = new TFileDialog("*.md", "Save file as", "~N~ame", fdOKButton, 101);
            if (executeDialog(dialog, name) == cmCancel)
                return;
            target = name;
        }

        if (!saveDocumentAs(doc, target))
        {
            std::string text = "Error writing file " + target.string() + ".";
            messageBox(text.c_str(), mfError | mfOKButton);
            return;
        }
        window->updateWindowTitle();
        showStatusMessage("Saved " + target.string());
    }

    void MarkdownEditorApp::toggleSmartLists()
    {
        settings.smartListContinuation = !settings.smartListContinuation;
        optionRegistry.set(kOptionSmartListContinuation, config::OptionValue(settings.smartListContinuation));
        updateToggleLabel(gSmartListMenuItem, kSmartListLabel, settings.smartListContinuation);
        showStatusMessage(settings.smartListContinuation ? "Smart list continuation on"
                                                         : "Smart list continuation off");
    }

    void MarkdownEditorApp::toggleAutoClose()
    {
        settings.autoClosePairs = !settings.autoClosePairs;
        optionRegistry.set(kOptionAutoClosePairs, config::OptionValue(settings.autoClosePairs));
        updateToggleLabel(gAutoCloseMenuItem, kAutoCloseLabel, settings.autoClosePairs);
        showStatusMessage(settings.autoClosePairs ? "Auto-close pairs on" : "Auto-close pairs off");
    }

    void MarkdownEditorApp::saveSettings()
    {
        if (optionRegistry.saveDefaults())
            showStatusMessage("Settings saved to " + optionRegistry.defaultOptionsPath().string());
        else
            messageBox("Could not write the settings file.", mfError | mfOKButton);
    }

    void MarkdownEditorApp::showAbout()
    {
        std::string text = std::string(kAppName) + " " + SCRIBE_EDIT_VERSION + "\n\n" +
                           std::string(kAppShortDescription);
        messageBox(text.c_str(), mfInformation | mfOKButton);
    }

    void MarkdownEditorApp::dispatchToEditor(ushort command)
    {
        if (!window)
            return;
        TEvent ev;
        ev.what = evCommand;
        ev.message.command = command;
        ev.message.infoPtr = nullptr;
        window->editor()->handleEvent(ev);
    }

    void MarkdownEditorApp::showStatusMessage(const std::string &message)
    {
        auto *line = dynamic_cast<MarkdownStatusLine *>(statusLine);
        if (!line)
            return;
        line->showTemporaryMessage(message);
        statusMessageClear.arm(kStatusMessageDuration, [this]() {
            if (auto *status = dynamic_cast<MarkdownStatusLine *>(statusLine))
                status->clearTemporaryMessage();
        });
    }

    void MarkdownEditorApp::refreshStatus()
    {
        const Document &doc = workspace.active();
        if (doc.id() == statusDocumentId && doc.revision() == statusRevision && doc.selection() == statusSelection)
            return;
        auto *line = dynamic_cast<MarkdownStatusLine *>(statusLine);
        if (!line)
            return;
        line->setStats(statsLine(doc));
        statusDocumentId = doc.id();
        statusRevision = doc.revision();
        statusSelection = doc.selection();
    }

    void MarkdownEditorApp::handleEvent(TEvent &event)
    {
        TApplication::handleEvent(event);
        if (event.what != evCommand || !window)
            return;

        bool handled = true;
        switch (event.message.command)
        {
        case cmds::cmNewDocument:
            newDocument();
            break;
        case cmds::cmCloseDocument:
            closeDocument();
            break;
        case cmds::cmRenameDocument:
            renameDocument();
            break;
        case cmds::cmNextDocument:
            switchDocument(true);
            break;
        case cmds::cmPreviousDocument:
            switchDocument(false);
            break;
        case cmds::cmSaveSession:
            saveSessionNow();
            break;
        case cmSave:
            saveDocument(false);
            break;
        case cmSaveAs:
            saveDocument(true);
            break;
        case cmds::cmToggleSmartList:
            toggleSmartLists();
            break;
        case cmds::cmToggleAutoClose:
            toggleAutoClose();
            break;
        case cmds::cmSaveSettings:
            saveSettings();
            break;
        case cmds::cmAbout:
            showAbout();
            break;
        case cmds::cmDocumentUndo:
        case cmds::cmDocumentRedo:
        case cmds::cmBold:
        case cmds::cmItalic:
        case cmds::cmStrikethrough:
        case cmds::cmInlineCode:
        case cmds::cmInsertLink:
        case cmds::cmHeading1:
        case cmds::cmHeading2:
        case cmds::cmHeading3:
        case cmds::cmBlockQuote:
        case cmds::cmBulletList:
        case cmds::cmNumberedList:
        case cmds::cmTaskList:
        case cmFind:
        case cmReplace:
        case cmSearchAgain:
            dispatchToEditor(event.message.command);
            break;
        default:
            handled = false;
            break;
        }
        if (handled)
            clearEvent(event);
    }

    void MarkdownEditorApp::idle()
    {
        TApplication::idle();

        // Debounced history commits first, then the selection restores queued by edits.
        timers.runDue();
        if (!window)
            return;
        window->editor()->applyPendingSelection();
        window->updateWindowTitle();
        refreshStatus();
    }

    TMenuBar *MarkdownEditorApp::initMenuBar(TRect r)
    {
        r.b.y = r.a.y + 1;
        return new TMenuBar(r, makeFileMenu() + makeEditMenu() + makeFormatMenu() + makeListsMenu() +
                                   makeOptionsMenu(kDefaultSettings) + makeHelpMenu());
    }

    TStatusLine *MarkdownEditorApp::initStatusLine(TRect r)
    {
        r.a.y = r.b.y - 1;
        return new MarkdownStatusLine(r);
    }

} // namespace scribe::edit
