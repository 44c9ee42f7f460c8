#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for ClassReview.
 * 
 * Supported commands:
 * - build: Build a review document from class photos
 * - annotate: Stamp the header band onto existing PDFs
 * - community: Manage the community descriptions used as overlay text
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,
    Help,
    Version,
    Build,          ///< classreview build <image>...
    Annotate,       ///< classreview annotate <pdf|dir>...
    Community       ///< classreview community <action> ...
};

/// How results are printed: --verbose, --json, or neither.
enum class OutputMode {
    Simple,
    Verbose,
    Json
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Process exit codes.
 *
 * A build that was skipped because its output exists counts as a partial
 * failure. A failed build maps its error kind: invalid input gives
 * InvalidArgs, I/O gives IoError, anything else TotalFailure.
 */
namespace ExitCode {
    constexpr int Success = 0;
    constexpr int PartialFailure = 1; ///< At least one document failed or was skipped
    constexpr int TotalFailure = 2;   ///< Every document failed
    constexpr int InvalidArgs = 3;
    constexpr int IoError = 4;
    constexpr int Cancelled = 5;      ///< SIGINT/SIGTERM arrived
}

/**
 * @brief Command keyword in argv[1].
 *
 * "-h"/"--help" and "-v"/"--version" map to Help and Version.
 */
Command parseCommand(int argc, char* argv[]);

/// Keyword of @p cmd as typed on the command line ("build", "annotate", ...).
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Register the options and positionals of @p cmd.
 *
 * build, annotate and community take --communities; build and annotate
 * also take --verbose and --json.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/// Print usage to stdout: the command list for None/Help, else the command's options.
void showHelp(const QCommandLineParser& parser, Command cmd);

void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Dispatch argv to the matching command handler.
 *
 * Installs the SIGINT/SIGTERM handlers before anything else.
 *
 * @return One of the ExitCode values
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
