#include "scribe/edit/markdown_editor.hpp"

#include "scribe/edit/session_store.hpp"

#include <iostream>
#include <string_view>

namespace
{

void printHelp()
{
    std::cout << scribe::edit::kAppName << " - " << scribe::edit::kAppShortDescription << "\n\n";
    std::cout << "Usage: " << scribe::edit::kAppName << " [FILE...]\n";
    std::cout << "Open each FILE as a document next to the documents of the previous session.\n";
    std::cout << "Settings are read from " << scribe::config::OptionRegistry::configRoot().string() << "/"
              << scribe::edit::kAppName << "/defaults.json" << std::endl;
}

bool isHelpFlag(std::string_view arg)
{
    return arg == "--help" || arg == "-h";
}

} // namespace

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        if (isHelpFlag(std::string_view{argv[i]}))
        {
            printHelp();
            return 0;
        }
    }

    scribe::edit::MarkdownEditorApp app(argc, argv);
    app.run();
    const bool sessionSaved = !app.restoresSession() || app.persistSession();
    app.shutDown();

    if (!sessionSaved)
    {
        std::cerr << scribe::edit::kAppName << ": could not write session file "
                  << scribe::edit::defaultSessionPath().string() << std::endl;
        return 1;
    }
    return 0;
}
