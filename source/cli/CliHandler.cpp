#include "CliHandler.h"
#include "CliProgress.h"
#include "CliSignal.h"
#include "../batch/PdfDiscovery.h"
#include "../community/CommunityStore.h"
#include "../core/AppSettings.h"
#include "../deck/ImageDeck.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QDir>
#include <QTextStream>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 * 
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

int exitCodeFromResult(const BatchOps::BatchResult& result)
{
    if (result.totalCount() == 0) {
        // No files processed - treat as error
        return ExitCode::InvalidArgs;
    }
    if (result.errorCount == 0) {
        return ExitCode::Success;
    }
    if (result.successCount == 0 && result.skippedCount == 0) {
        // All files failed
        return ExitCode::TotalFailure;
    }
    // Some files failed
    return ExitCode::PartialFailure;
}

int exitCodeFromBuild(const BatchOps::FileResult& result, bool cancelled)
{
    switch (result.status) {
        case BatchOps::FileStatus::Success:
            return ExitCode::Success;
        case BatchOps::FileStatus::Skipped:
            return cancelled ? ExitCode::Cancelled : ExitCode::PartialFailure;
        case BatchOps::FileStatus::Error:
            break;
    }
    
    if (cancelled) {
        return ExitCode::Cancelled;
    }
    
    switch (result.error) {
        case ErrorKind::InvalidInput: return ExitCode::InvalidArgs;
        case ErrorKind::Io:           return ExitCode::IoError;
        default:                      return ExitCode::TotalFailure;
    }
}

static QString storePath(const QCommandLineParser& parser)
{
    const QString overridePath = parser.value(QStringLiteral("communities"));
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(QDir::current().absoluteFilePath(overridePath));
    }
    return AppSettings::communitiesFilePath();
}

/**
 * Overlay text for a command: --text wins, otherwise the description of
 * --community (or "No data for NAME"). Empty if neither is given.
 */
static QString resolveOverlayText(const QCommandLineParser& parser, ConsoleProgress& progress)
{
    if (parser.isSet(QStringLiteral("text"))) {
        return parser.value(QStringLiteral("text"));
    }
    
    const QString community = parser.value(QStringLiteral("community")).trimmed();
    if (community.isEmpty()) {
        return QString();
    }
    
    CommunityStore store(storePath(parser));
    if (!store.load()) {
        progress.reportWarning(store.lastError());
    }
    return store.resolveOverlayText(community);
}

/**
 * Apply --move-up/--move-down to the deck in command-line order.
 * Positions are 1-based.
 */
static bool applyMoves(const QCommandLineParser& parser, ImageDeck& deck, QString* errorMessage)
{
    const QStringList ups = parser.values(QStringLiteral("move-up"));
    const QStringList downs = parser.values(QStringLiteral("move-down"));
    int upIndex = 0;
    int downIndex = 0;
    
    // optionNames() lists every occurrence in the order it was given
    for (const QString& name : parser.optionNames()) {
        const bool up = (name == QLatin1String("move-up"));
        if (!up && name != QLatin1String("move-down")) {
            continue;
        }
        
        const QString value = up ? ups.value(upIndex++) : downs.value(downIndex++);
        bool ok = false;
        const int position = value.toInt(&ok);
        const bool moved = ok && (up ? deck.moveUp(position - 1) : deck.moveDown(position - 1));
        if (!moved) {
            *errorMessage = up
                ? QCoreApplication::translate("CLI", "Cannot move image %1 up").arg(value)
                : QCoreApplication::translate("CLI", "Cannot move image %1 down").arg(value);
            return false;
        }
    }
    return true;
}

// =============================================================================
// Build Handler
// =============================================================================

int handleBuild(const QCommandLineParser& parser)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);
    
    ImageDeck deck;
    for (const QString& path : parser.positionalArguments()) {
        deck.append(QDir::cleanPath(QDir::current().absoluteFilePath(path)));
    }
    
    QString moveError;
    if (!applyMoves(parser, deck, &moveError)) {
        progress.reportError(moveError);
        return ExitCode::InvalidArgs;
    }
    
    bool minOk = false;
    const int minimumImages = parser.value(QStringLiteral("min-images")).toInt(&minOk);
    if (!minOk || minimumImages < 0) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Invalid --min-images value: %1").arg(parser.value(QStringLiteral("min-images"))));
        return ExitCode::InvalidArgs;
    }
    
    BatchOps::BuildRequest request;
    request.images = deck.paths();
    request.date = parser.value(QStringLiteral("date"));
    request.classNumber = parser.value(QStringLiteral("class"));
    request.community = parser.value(QStringLiteral("community"));
    request.variant = parser.isSet(QStringLiteral("full-bleed"))
        ? PlacementVariant::FullBleed : PlacementVariant::HeaderBand;
    request.minimumImages = minimumImages;
    request.overwrite = parser.isSet(QStringLiteral("overwrite"));
    request.dryRun = parser.isSet(QStringLiteral("dry-run"));
    
    // Full-bleed pages carry no text, so the store is not needed
    if (request.variant == PlacementVariant::HeaderBand) {
        request.overlayText = resolveOverlayText(parser, progress);
    }
    
    // Output: explicit path, else last output directory, else current directory
    request.outputPath = parser.value(QStringLiteral("output"));
    if (request.outputPath.isEmpty()) {
        const QString lastDir = AppSettings::lastOutputDirectory();
        request.outputPath = (!lastDir.isEmpty() && QFileInfo(lastDir).isDir())
            ? lastDir : QDir::currentPath();
    }
    
    BatchOps::FileResult fileResult = BatchOps::buildDocument(request, progress.callback());
    
    BatchOps::BatchResult result;
    result.results.append(fileResult);
    switch (fileResult.status) {
        case BatchOps::FileStatus::Success:
            result.successCount = 1;
            result.totalOutputSize = fileResult.outputSize;
            break;
        case BatchOps::FileStatus::Skipped:
            result.skippedCount = 1;
            break;
        case BatchOps::FileStatus::Error:
            result.errorCount = 1;
            break;
    }
    
    progress.reportFile(1, 1, fileResult);
    progress.reportSummary(result, request.dryRun);
    
    if (fileResult.status == BatchOps::FileStatus::Success && !request.dryRun) {
        AppSettings::setLastOutputDirectory(QFileInfo(fileResult.outputPath).absolutePath());
    }
    
    // A finished document stands even if Ctrl+C arrived while it was written
    const bool cancelled = fileResult.status != BatchOps::FileStatus::Success && wasCancelled();
    return exitCodeFromBuild(fileResult, cancelled);
}

// =============================================================================
// Annotate Handler
// =============================================================================

int handleAnnotate(const QCommandLineParser& parser)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);
    
    QStringList inputPaths = parser.positionalArguments();
    if (inputPaths.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No input files specified. Use 'classreview annotate --help' for usage."));
        return ExitCode::InvalidArgs;
    }
    
    QString destDir = parser.value(QStringLiteral("dest"));
    if (destDir.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Destination directory required. Use -d or --dest to specify."));
        return ExitCode::InvalidArgs;
    }
    
    destDir = QDir::cleanPath(QDir::current().absoluteFilePath(destDir));
    
    QFileInfo destInfo(destDir);
    if (destInfo.exists() && !destInfo.isDir()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Destination must be a directory, not a file."));
        return ExitCode::InvalidArgs;
    }
    
    if (!parser.isSet(QStringLiteral("text")) && !parser.isSet(QStringLiteral("community"))) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Overlay text required. Use --community or --text."));
        return ExitCode::InvalidArgs;
    }
    
    const QString overlayText = resolveOverlayText(parser, progress);
    if (overlayText.trimmed().isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI", "Overlay text is required"));
        return ExitCode::InvalidArgs;
    }
    
    bool recursive = parser.isSet(QStringLiteral("recursive"));
    QStringList pdfs = BatchOps::expandPdfPaths(inputPaths, recursive);
    if (pdfs.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No PDF files found in the specified paths."));
        return ExitCode::InvalidArgs;
    }
    
    BatchOps::AnnotateOptions options;
    options.destDir = destDir;
    options.overlayText = overlayText;
    options.overwrite = parser.isSet(QStringLiteral("overwrite"));
    options.dryRun = parser.isSet(QStringLiteral("dry-run"));
    
    bool failFast = parser.isSet(QStringLiteral("fail-fast"));
    
    // Get global cancellation flag (set by Ctrl+C signal handler)
    std::atomic<bool>* cancelled = getCancellationFlag();
    
    // Print each result as soon as the file is done
    auto onResult = [&progress, failFast](int current, int total,
                                          const BatchOps::FileResult& fileResult) {
        progress.reportFile(current, total, fileResult);
        if (failFast && fileResult.status == BatchOps::FileStatus::Error) {
            if (current < total) {
                progress.reportWarning(QCoreApplication::translate("CLI",
                    "Stopping due to --fail-fast flag."));
            }
            return false;
        }
        return true;
    };
    
    BatchOps::BatchResult result = BatchOps::annotatePdfBatch(
        pdfs, options, progress.callback(), cancelled, onResult);
    
    progress.reportSummary(result, options.dryRun);
    
    if (wasCancelled()) {
        return ExitCode::Cancelled;
    }
    
    return exitCodeFromResult(result);
}

// =============================================================================
// Community Handler
// =============================================================================

int handleCommunity(const QCommandLineParser& parser)
{
    QTextStream out(stdout);
    ConsoleProgress progress(OutputMode::Simple);
    
    const QStringList args = parser.positionalArguments();
    const QString action = args.value(0);
    const QString name = args.value(1);
    const QString description = args.value(2);
    
    const bool mutates = (action == QLatin1String("add") || action == QLatin1String("update")
                          || action == QLatin1String("remove"));
    const bool reads = (action == QLatin1String("list") || action == QLatin1String("show"));
    if (!mutates && !reads) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Unknown action '%1'. Use 'classreview community --help' for usage.").arg(action));
        return ExitCode::InvalidArgs;
    }
    
    if (action != QLatin1String("list") && name.trimmed().isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI", "Community name is required"));
        return ExitCode::InvalidArgs;
    }
    
    CommunityStore store(storePath(parser));
    if (!store.load()) {
        // Saving would replace the unreadable file, so only reading is allowed
        if (mutates) {
            progress.reportError(store.lastError());
            return ExitCode::IoError;
        }
        progress.reportWarning(store.lastError());
    }
    
    if (action == QLatin1String("list")) {
        for (const QString& community : store.names()) {
            out << community << "\n";
        }
        out.flush();
        return ExitCode::Success;
    }
    
    if (action == QLatin1String("show")) {
        if (!store.contains(name)) {
            progress.reportError(QCoreApplication::translate("CLI",
                "Unknown community: %1").arg(name.trimmed()));
            return ExitCode::InvalidArgs;
        }
        out << store.description(name) << "\n";
        out.flush();
        return ExitCode::Success;
    }
    
    // A rejected request is an argument error; anything else failed to save
    bool invalid = false;
    bool ok = false;
    if (action == QLatin1String("add")) {
        invalid = description.trimmed().isEmpty() || store.contains(name);
        ok = store.add(name, description);
    } else if (action == QLatin1String("update")) {
        invalid = description.trimmed().isEmpty() || !store.contains(name);
        ok = store.update(name, description);
    } else {
        invalid = !store.contains(name);
        ok = store.remove(name);
    }
    
    if (!ok) {
        progress.reportError(store.lastError());
        return invalid ? ExitCode::InvalidArgs : ExitCode::IoError;
    }
    return ExitCode::Success;
}

} // namespace Cli
