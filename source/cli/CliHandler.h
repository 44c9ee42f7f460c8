#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the ClassReview CLI.
 * 
 * Each handler parses command-specific options, resolves the overlay text
 * from the community store where needed, runs the operation, and reports
 * results.
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the build command.
 * 
 * Collects the images into a deck, applies --move-up/--move-down in the
 * order given, resolves the overlay text and output path, and builds one
 * document. The output directory is remembered after a successful build.
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleBuild(const QCommandLineParser& parser);

/**
 * @brief Handle the annotate command.
 * 
 * Expands input paths to a PDF list and annotates each into the
 * destination directory. Results are printed as each file completes.
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleAnnotate(const QCommandLineParser& parser);

/**
 * @brief Handle the community command (list, show, add, update, remove).
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleCommunity(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 * 
 * Priority: --json > --verbose > Simple
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Determine exit code from batch result.
 * 
 * - All succeeded → Success (0)
 * - Some failed → PartialFailure (1)
 * - All failed → TotalFailure (2)
 * 
 * @param result The batch operation result
 * @return Exit code
 */
int exitCodeFromResult(const BatchOps::BatchResult& result);

/**
 * @brief Determine exit code from a single build result.
 * 
 * A successful build is Success even when @p cancelled is set. Otherwise
 * cancellation wins; invalid input maps to InvalidArgs, I/O failures to
 * IoError and anything else that failed to TotalFailure.
 */
int exitCodeFromBuild(const BatchOps::FileResult& result, bool cancelled = false);

} // namespace Cli

#endif // CLIHANDLER_H
