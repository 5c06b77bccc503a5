// signal_export: Signal Desktop chats to Markdown + HTML with attachments.

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "cli_args.hpp"
#include "db_decrypt.hpp"
#include "export_config.hpp"
#include "export_merge.hpp"
#include "html_pages.hpp"
#include "log.hpp"
#include "signal_data.hpp"
#include "transcript_writer.hpp"

namespace fs = std::filesystem;

#ifndef SIGNAL_EXPORT_STYLESHEET
#define SIGNAL_EXPORT_STYLESHEET ""
#endif

static int fail(const std::string& message)
{
    Logger::error(message);
    return 1;
}

// style.css next to the executable, else the one from the source tree.
static fs::path locateStylesheet(const char* argv0)
{
    std::error_code ec;
    fs::path exe = fs::weakly_canonical(fs::path(argv0), ec);
    if (!ec)
    {
        fs::path beside = exe.parent_path() / STYLESHEET_NAME;
        if (fs::is_regular_file(beside, ec))
            return beside;
    }
    return fs::path(SIGNAL_EXPORT_STYLESHEET);
}

static bool prepareDestination(const fs::path& dest, bool overwrite, std::string& errorOut)
{
    try
    {
        if (!fs::is_directory(dest))
        {
            fs::create_directories(dest);
        }
        else if (overwrite)
        {
            Logger::warn("Overwriting existing directory: " + dest.string());
            fs::remove_all(dest);
            fs::create_directories(dest);
        }
        else
        {
            errorOut = "Output directory already exists: " + dest.string() +
                       "\nOptions:"
                       "\n  1. Use --overwrite to replace the existing export"
                       "\n  2. Use --old to merge with the existing export"
                       "\n  3. Specify a different output directory";
            return false;
        }
        errorOut.clear();
        return true;
    }
    catch (const fs::filesystem_error& ex)
    {
        errorOut = std::string("Could not prepare output directory: ") + ex.what();
        return false;
    }
}

int main(int argc, char* argv[])
{
    ExportOptions options;
    std::string   error;

    switch (ParseCommandLine(argc, argv, options, error))
    {
    case ParseResult::Help:
        PrintUsage(argv[0]);
        return 0;
    case ParseResult::Error:
        std::cerr << error << "\n\n";
        PrintUsage(argv[0]);
        return 2;
    case ParseResult::Run:
        break;
    }

    Logger::setVerbose(options.verbose);
    Logger::info("Verbose logging enabled");

    std::cout << "Signal Export Tool\n"
              << "==================================================\n";

    fs::path sourceRoot;
    if (options.source)
    {
        sourceRoot = *options.source;
    }
    else if (!DefaultSignalSource(sourceRoot, error))
    {
        return fail(error);
    }

    const SignalPaths paths = ResolveSignalPaths(sourceRoot);

    Logger::info("Signal directory: " + paths.root.string());
    Logger::info("Database: " + paths.database.string());
    Logger::info("Output: " + options.dest.string());
    if (options.mode == DecryptMode::Manual)
        Logger::info("Mode: Manual decryption");

    std::string key;
    std::string keyField;
    if (!ReadSignalKey(paths.config, key, keyField, error))
        return fail(error);

    if (!fs::is_regular_file(paths.database))
    {
        return fail("Signal database not found: " + paths.database.string() +
                    "\nPossible solutions:"
                    "\n  1. Ensure Signal Desktop is installed and has been run at least once"
                    "\n  2. Use --source to specify the correct Signal directory"
                    "\n  3. Close Signal Desktop if it's currently running");
    }

    Logger::info("Fetching data from " + paths.database.string());

    SignalData data;
    {
        DirectDecryptStrategy       direct;
        ExternalToolDecryptStrategy external;

        // The decrypted handle (and any plaintext copy) lives only for this scope.
        auto db = OpenSignalDatabase(paths.database, key, options.mode, direct, external, error);
        if (!db)
            return fail(error);

        if (!LoadSignalData(db->handle(), options.chats, data, error))
            return fail(error);
    }

    if (options.listChats)
    {
        for (const auto& name : ListChatNames(data.contacts))
            std::cout << name << "\n";
        return 0;
    }

    if (!prepareDestination(options.dest, options.overwrite, error))
        return fail(error);

    const ExportLayout layout = SanitizeContactNames(data.contacts);

    std::cout << "\nCopying and renaming attachments\n";
    if (!CopyAttachments(paths.attachments, options.dest, data, layout, error))
        return fail(error);

    std::cout << "\nCreating markdown files\n";
    if (!WriteTranscripts(options.dest, data, layout, error))
        return fail(error);

    if (options.old)
    {
        std::cout << "\nMerging old at " << options.old->string() << " into output directory\n"
                  << "No existing files will be deleted or overwritten!\n";
        MergeSummary summary;
        if (!MergeWithOld(options.dest, *options.old, summary, error))
            return fail(error);
    }

    std::cout << "\nCreating HTML files\n";
    if (!CreateHtml(options.dest, locateStylesheet(argv[0]), options.msgsPerPage, error))
        return fail(error);

    std::cout << "\nDone! Files exported to " << options.dest.string() << ".\n\n";
    return 0;
}
