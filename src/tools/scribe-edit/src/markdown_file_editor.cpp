#include "scribe/edit/markdown_editor.hpp"

#include <algorithm>
#include <cstring>
#include <optional>
#include <string>

namespace scribe::edit
{
    namespace
    {
        namespace cmds = scribe::commands::edit;

        constexpr int kFindHistoryId = 10;
        constexpr int kReplaceHistoryId = 11;
        constexpr std::size_t kInputLength = 256;

        std::optional<FormatAction> formatActionFor(ushort command)
        {
            switch (command)
            {
            case cmds::cmBold:
                return FormatAction::Bold;
            case cmds::cmItalic:
                return FormatAction::Italic;
            case cmds::cmStrikethrough:
                return FormatAction::Strikethrough;
            case cmds::cmInlineCode:
                return FormatAction::InlineCode;
            case cmds::cmInsertLink:
                return FormatAction::Link;
            case cmds::cmHeading1:
                return FormatAction::Heading1;
            case cmds::cmHeading2:
                return FormatAction::Heading2;
            case cmds::cmHeading3:
                return FormatAction::Heading3;
            case cmds::cmBlockQuote:
                return FormatAction::BlockQuote;
            case cmds::cmBulletList:
                return FormatAction::BulletList;
            case cmds::cmNumberedList:
                return FormatAction::NumberedList;
            case cmds::cmTaskList:
                return FormatAction::TaskList;
            default:
                return std::nullopt;
            }
        }

        std::optional<KeyIntent> intentFor(const KeyDownEvent &key)
        {
            const bool modifier = (key.controlKeyState & (kbCtrlShift | kbAltShift)) != 0;
            switch (key.keyCode)
            {
            case kbTab:
                return KeyIntent::of(EditKey::Tab);
            case kbEnter:
                return KeyIntent::of(EditKey::Enter);
            case kbBack:
                return KeyIntent::of(EditKey::Backspace);
            default:
                break;
            }
            const unsigned char ch = key.charScan.charCode;
            if (ch >= 32 && ch < 127)
                return KeyIntent::typed(static_cast<char>(ch), modifier);
            return std::nullopt;
        }

        void copyInto(char (&buffer)[kInputLength], const std::string &value)
        {
            std::strncpy(buffer, value.c_str(), sizeof(buffer));
            buffer[sizeof(buffer) - 1] = '\0';
        }

        ushort runFindDialog(SearchRequest &request)
        {
            auto *dialog = new TDialog(TRect(0, 0, 38, 11), "Find");
            dialog->options |= ofCentered;

            auto *findInput = new TInputLine(TRect(3, 3, 32, 4), kInputLength - 1);
            dialog->insert(findInput);
            dialog->insert(new TLabel(TRect(2, 2, 15, 3), "~T~ext to find", findInput));
            dialog->insert(new THistory(TRect(32, 3, 35, 4), findInput, kFindHistoryId));

            auto *optionBoxes = new TCheckBoxes(TRect(3, 5, 35, 6), new TSItem("Search ~b~ackward", nullptr));
            dialog->insert(optionBoxes);

            dialog->insert(new TButton(TRect(14, 8, 24, 10), "O~K~", cmOK, bfDefault));
            dialog->insert(new TButton(TRect(26, 8, 36, 10), "Cancel", cmCancel, bfNormal));

            char findText[kInputLength];
            copyInto(findText, request.find);
            findInput->setData(findText);
            ushort optionMask = request.backward ? 1 : 0;
            optionBoxes->setData(&optionMask);

            dialog->selectNext(False);

            TView *validated = TProgram::application->validView(dialog);
            if (!validated)
                return cmCancel;
            dialog = static_cast<TDialog *>(validated);

            ushort result = TProgram::deskTop->execView(dialog);
            if (result != cmCancel)
            {
                findInput->getData(findText);
                optionBoxes->getData(&optionMask);
                request.find = findText;
                request.backward = (optionMask & 1) != 0;
            }
            TObject::destroy(dialog);
            return result;
        }

        ushort runReplaceDialog(SearchRequest &request)
        {
            auto *dialog = new TDialog(TRect(0, 0, 40, 13), "Replace");
            dialog->options |= ofCentered;

            auto *findInput = new TInputLine(TRect(3, 3, 34, 4), kInputLength - 1);
            dialog->insert(findInput);
            dialog->insert(new TLabel(TRect(2, 2, 15, 3), "~T~ext to find", findInput));
            dialog->insert(new THistory(TRect(34, 3, 37, 4), findInput, kFindHistoryId));

            auto *replaceInput = new TInputLine(TRect(3, 6, 34, 7), kInputLength - 1);
            dialog->insert(replaceInput);
            dialog->insert(new TLabel(TRect(2, 5, 12, 6), "~N~ew text", replaceInput));
            dialog->insert(new THistory(TRect(34, 6, 37, 7), replaceInput, kReplaceHistoryId));

            auto *optionBoxes = new TCheckBoxes(TRect(3, 8, 37, 9), new TSItem("~R~eplace all", nullptr));
            dialog->insert(optionBoxes);

            dialog->insert(new TButton(TRect(17, 10, 27, 12), "O~K~", cmOK, bfDefault));
            dialog->insert(new TButton(TRect(28, 10, 38, 12), "Cancel", cmCancel, bfNormal));

            char findText[kInputLength];
            char replaceText[kInputLength];
            copyInto(findText, request.find);
            copyInto(replaceText, request.replacement);
            findInput->setData(findText);
            replaceInput->setData(replaceText);
            ushort optionMask = request.replaceAll ? 1 : 0;
            optionBoxes->setData(&optionMask);

            dialog->selectNext(False);

            TView *validated = TProgram::application->validView(dialog);
            if (!validated)
                return cmCancel;
            dialog = static_cast<TDialog *>(validated);

            ushort result = TProgram::deskTop->execView(dialog);
            if (result != cmCancel)
            {
                findInput->getData(findText);
                replaceInput->getData(replaceText);
                optionBoxes->getData(&optionMask);
                request.find = findText;
                request.replacement = replaceText;
                request.replaceAll = (optionMask & 1) != 0;
            }
            TObject::destroy(dialog);
            return result;
        }
    } // namespace

    MarkdownFileEditor::MarkdownFileEditor(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll,
                                           TIndicator *indicator) noexcept
        : TFileEditor(bounds, hScroll, vScroll, indicator, TStringView())
    {
    }

    void MarkdownFileEditor::attach(Workspace &ws, EditorSettings &editorSettings) noexcept
    {
        workspace = &ws;
        settings = &editorSettings;
    }

    Document *MarkdownFileEditor::document() noexcept
    {
        return workspace ? &workspace->active() : nullptr;
    }

    void MarkdownFileEditor::showActiveDocument()
    {
        Document *doc = document();
        if (!doc)
            return;
        writeBuffer(doc->content());

        // A queued restore wins over the stored selection.
        SelectionRange range = doc->takePendingSelection().value_or(doc->selection());
        uint end = std::min<uint>(static_cast<uint>(range.end), bufLen);
        uint start = std::min<uint>(static_cast<uint>(range.start), end);
        lock();
        setSelect(start, end, True);
        trackCursor(True);
        unlock();
        doc->setSelection({start, end});
    }

    void MarkdownFileEditor::syncFromBuffer()
    {
        Document *doc = document();
        if (!doc)
            return;
        std::string text = bufferText();
        SelectionRange range = bufferSelection();
        if (text != doc->content())
            doc->updateContent(std::move(text), range);
        else
            doc->setSelection(range);
    }

    bool MarkdownFileEditor::applyPendingSelection()
    {
        Document *doc = document();
        if (!doc)
            return false;
        auto pending = doc->takePendingSelection();
        if (!pending)
            return false;

        uint end = std::min<uint>(static_cast<uint>(pending->end), bufLen);
        uint start = std::min<uint>(static_cast<uint>(pending->start), end);
        lock();
        setSelect(start, end, True);
        trackCursor(True);
        unlock();
        doc->setSelection({start, end});
        return true;
    }

    SelectionModel MarkdownFileEditor::currentModel()
    {
        SelectionRange range = bufferSelection();
        return SelectionModel::make(bufferText(), range.start, range.end);
    }

    std::string MarkdownFileEditor::bufferText()
    {
        return readRange(0, bufLen);
    }

    std::string MarkdownFileEditor::readRange(uint start, uint end)
    {
        std::string result;
        result.reserve(end > start ? end - start : 0);
        for (uint i = start; i < end && i < bufLen; ++i)
            result.push_back(bufChar(i));
        return result;
    }

    SelectionRange MarkdownFileEditor::bufferSelection() const noexcept
    {
        if (selStart != selEnd)
            return {std::min(selStart, selEnd), std::max(selStart, selEnd)};
        return {curPtr, curPtr};
    }

    void MarkdownFileEditor::writeBuffer(const std::string &target)
    {
        std::string current = bufferText();
        if (current == target)
            return;

        std::size_t prefix = 0;
        const std::size_t shorter = std::min(current.size(), target.size());
        while (prefix < shorter && current[prefix] == target[prefix])
            ++prefix;
        std::size_t suffix = 0;
        while (suffix < shorter - prefix &&
               current[current.size() - 1 - suffix] == target[target.size() - 1 - suffix])
            ++suffix;

        lock();
        replaceRange(static_cast<uint>(prefix), static_cast<uint>(current.size() - suffix),
                     target.substr(prefix, target.size() - prefix - suffix));
        unlock();
    }

    void MarkdownFileEditor::replaceRange(uint start, uint end, const std::string &text)
    {
        if (end > start)
            deleteRange(start, end, False);
        setCurPtr(start, 0);
        if (text.empty())
            return;
        if (!insertText(text.c_str(), static_cast<uint>(text.size()), False))
        {
            // The buffer refused the text; keep the document in line with what is shown.
            notify("Not enough memory for this operation");
            syncFromBuffer();
        }
    }

    bool MarkdownFileEditor::handleStructuralKey(TEvent &event)
    {
        auto intent = intentFor(event.keyDown);
        if (!intent)
            return false;

        SelectionModel model = currentModel();
        std::optional<MutationResult> result = dispatchKey(model, *intent, settings->dispatchOptions());
        if (!result && intent->key == EditKey::Enter)
        {
            // Plain line break, kept as "\n" regardless of the buffer's native line ending.
            MutationResult lineBreak;
            lineBreak.newText = model.text.substr(0, model.selectionStart) + "\n" +
                                model.text.substr(model.selectionEnd);
            lineBreak.newSelectionStart = lineBreak.newSelectionEnd = model.selectionStart + 1;
            result = std::move(lineBreak);
        }
        if (!result || !result->consumed)
            return false;

        applyResult(*result);
        clearEvent(event);
        return true;
    }

    void MarkdownFileEditor::applyResult(const MutationResult &result)
    {
        Document *doc = document();
        if (!doc)
            return;
        // Content goes in now; the selection is restored on the next idle turn.
        doc->applyMutation(result);
        writeBuffer(result.newText);
    }

    void MarkdownFileEditor::applyFormat(FormatAction action)
    {
        applyResult(applyFormatAction(currentModel(), action));
    }

    void MarkdownFileEditor::undoEdit()
    {
        Document *doc = document();
        if (!doc)
            return;
        syncFromBuffer();
        if (!doc->undo())
        {
            notify("Nothing to undo");
            return;
        }
        writeBuffer(doc->content());
    }

    void MarkdownFileEditor::redoEdit()
    {
        Document *doc = document();
        if (!doc)
            return;
        syncFromBuffer();
        if (!doc->redo())
        {
            notify("Nothing to redo");
            return;
        }
        writeBuffer(doc->content());
    }

    void MarkdownFileEditor::find()
    {
        SearchRequest request = lastSearch;
        if (hasSelection())
            request.find = currentModel().selectedText();
        if (runFindDialog(request) == cmCancel)
            return;
        lastSearch.find = request.find;
        lastSearch.backward = request.backward;
        runSearch();
    }

    void MarkdownFileEditor::replace()
    {
        SearchRequest request = lastSearch;
        if (runReplaceDialog(request) == cmCancel)
            return;
        lastSearch = request;
        if (lastSearch.find.empty())
            return;

        SelectionModel model = currentModel();
        if (lastSearch.replaceAll)
        {
            ReplaceAllResult result = edit::replaceAll(model.text, lastSearch.find, lastSearch.replacement);
            if (result.count == 0)
            {
                notify("No occurrences found");
                return;
            }
            MutationResult mutation;
            mutation.newSelectionEnd = std::min(model.selectionEnd, result.text.size());
            mutation.newSelectionStart = std::min(model.selectionStart, mutation.newSelectionEnd);
            mutation.newText = std::move(result.text);
            applyResult(mutation);
            notify("Replaced " + std::to_string(result.count) + " occurrences");
            return;
        }

        ReplaceOneResult result = replaceOne(model, lastSearch.find, lastSearch.replacement);
        if (!result.replaced())
        {
            showMatch(result.next);
            return;
        }
        MutationResult mutation = *result.edit;
        if (result.next.found())
        {
            mutation.newSelectionStart = result.next.start;
            mutation.newSelectionEnd = result.next.end;
        }
        else
        {
            notify("No matches found");
        }
        applyResult(mutation);
    }

    void MarkdownFileEditor::searchAgain()
    {
        if (lastSearch.find.empty())
        {
            find();
            return;
        }
        runSearch();
    }

    void MarkdownFileEditor::runSearch()
    {
        if (lastSearch.find.empty())
            return;
        showMatch(findNext(currentModel(), lastSearch.find, lastSearch.backward));
    }

    void MarkdownFileEditor::showMatch(const MatchOutcome &outcome)
    {
        if (!outcome.found())
        {
            notify("No matches found");
            return;
        }
        lock();
        setSelect(static_cast<uint>(outcome.start), static_cast<uint>(outcome.end), False);
        trackCursor(True);
        unlock();
        if (Document *doc = document())
            doc->setSelection(outcome.range());
        if (outcome.wrapped)
            notify(lastSearch.backward ? "Search wrapped to the end" : "Search wrapped to the beginning");
    }

    void MarkdownFileEditor::notify(const std::string &message)
    {
        if (auto *app = dynamic_cast<MarkdownEditorApp *>(TProgram::application))
            app->showStatusMessage(message);
    }

    void MarkdownFileEditor::handleEvent(TEvent &event)
    {
        if (!workspace || !settings)
        {
            TFileEditor::handleEvent(event);
            return;
        }

        // A restore queued by the previous edit lands before the next input is interpreted.
        if (event.what == evKeyDown || event.what == evCommand || event.what == evMouseDown)
            applyPendingSelection();

        if (event.what == evKeyDown)
        {
            if (event.keyDown.keyCode == kbCtrlU)
            {
                undoEdit();
                clearEvent(event);
                return;
            }
            if (handleStructuralKey(event))
                return;
        }

        if (event.what == evCommand)
        {
            if (auto action = formatActionFor(event.message.command))
            {
                applyFormat(*action);
                clearEvent(event);
                return;
            }
            switch (event.message.command)
            {
            case cmds::cmDocumentUndo:
                undoEdit();
                clearEvent(event);
                return;
            case cmds::cmDocumentRedo:
                redoEdit();
                clearEvent(event);
                return;
            case cmFind:
                find();
                clearEvent(event);
                return;
            case cmReplace:
                replace();
                clearEvent(event);
                return;
            case cmSearchAgain:
                searchAgain();
                clearEvent(event);
                return;
            case cmUndo:
                undoEdit();
                clearEvent(event);
                return;
            case cmSave:
            case cmSaveAs:
                // The application writes the active document; TFileEditor's own file is never used.
                syncFromBuffer();
                return;
            default:
                break;
            }
        }

        const bool mayChange = event.what == evKeyDown || event.what == evCommand || event.what == evMouseDown;
        TFileEditor::handleEvent(event);
        if (mayChange)
            syncFromBuffer();
    }

    Boolean MarkdownFileEditor::valid(ushort command)
    {
        if (command != cmQuit || !workspace || !settings)
            return TEditor::valid(command);
        // With session restore on, everything open is written to the session on exit.
        if (settings->restoreSession)
            return True;

        syncFromBuffer();
        const std::size_t unsaved = workspace->unsavedCount();
        if (unsaved == 0)
            return True;
        std::string text = unsaved == 1 ? std::string("1 document has unsaved changes. Quit anyway?")
                                        : std::to_string(unsaved) + " documents have unsaved changes. Quit anyway?";
        return messageBox(text.c_str(), mfConfirmation | mfYesButton | mfNoButton) == cmYes ? True : False;
    }

} // namespace scribe::edit
