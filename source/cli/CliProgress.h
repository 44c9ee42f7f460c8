#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Console progress reporter for the ClassReview CLI.
 * 
 * Output modes:
 * - Simple: One line per document (`[1/3] week1.pdf... OK (4 pages)`)
 * - Verbose: Per-page progress plus output path, size and error kind
 * - JSON: One compact object per line on stdout; errors and warnings go
 *   to stderr as objects as well
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"

#include <QJsonObject>
#include <QTextStream>

namespace Cli {

/**
 * @brief Progress reporter for console output.
 * 
 * Usage:
 * @code
 *   ConsoleProgress progress(OutputMode::Simple);
 *   auto result = BatchOps::annotatePdfBatch(pdfs, options, progress.callback(), nullptr,
 *       [&](int i, int n, const BatchOps::FileResult& r) { progress.reportFile(i, n, r); return true; });
 *   progress.reportSummary(result, options.dryRun);
 * @endcode
 */
class ConsoleProgress {
public:
    explicit ConsoleProgress(OutputMode mode = OutputMode::Simple);
    
    /**
     * @brief Progress callback for BatchOps functions.
     * 
     * Prints a line before each file or page in Verbose mode; silent otherwise.
     */
    BatchOps::ProgressCallback callback();
    
    /**
     * @brief Report completion of a file operation.
     * 
     * @param index 1-based position of the file in the batch
     * @param total Number of files in the batch
     * @param result The file operation result
     */
    void reportFile(int index, int total, const BatchOps::FileResult& result);
    
    /**
     * @brief Report final batch summary.
     * 
     * @param result The batch result
     * @param dryRun Whether this was a dry run (affects messaging)
     */
    void reportSummary(const BatchOps::BatchResult& result, bool dryRun);
    
    /// Error message on stderr (JSON object in JSON mode).
    void reportError(const QString& message);
    
    /// Warning message on stderr (JSON object in JSON mode).
    void reportWarning(const QString& message);

private:
    void writeJson(QTextStream& stream, const QJsonObject& object);
    void reportFileText(int index, int total, const BatchOps::FileResult& result);
    void reportSummaryText(const BatchOps::BatchResult& result, bool dryRun);
    void reportMessage(const char* type, const QString& label, const QString& message);
    
    // "OK (4 pages)", "SKIPPED (Output file already exists)", "ERROR: Not a valid PDF"
    static QString statusText(const BatchOps::FileResult& result);
    static QJsonObject fileJson(const BatchOps::FileResult& result);
    static QString formatDuration(qint64 ms);

    OutputMode m_mode;
    QTextStream m_out;
    QTextStream m_err;
};

} // namespace Cli

#endif // CLIPROGRESS_H
