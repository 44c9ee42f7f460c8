#ifndef BATCHOPERATIONS_H
#define BATCHOPERATIONS_H

/**
 * @file BatchOperations.h
 * @brief Headless document operations for class review PDFs.
 * 
 * This module provides the operations behind the command line:
 * - Build one review document from an ordered image deck
 * - Stamp the header band onto a batch of existing PDFs
 * 
 * Both report per-file results in the same shape so the console reporter
 * can print them the same way.
 */

#include "../layout/PageGeometry.h"
#include "../pdf/PdfResults.h"

#include <QString>
#include <QStringList>
#include <QList>
#include <functional>
#include <atomic>

namespace BatchOps {

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief Status of a single file operation.
 */
enum class FileStatus {
    Success,        ///< Operation completed successfully
    Skipped,        ///< Skipped (output exists, cancelled)
    Error           ///< Operation failed
};

/**
 * @brief Result for a single file operation.
 */
struct FileResult {
    QString inputPath;              ///< Input PDF, or the first image of a build
    QString outputPath;             ///< Path to output file (empty if not determined)
    FileStatus status = FileStatus::Error;
    ErrorKind error = ErrorKind::None;
    QString message;                ///< Error message or skip reason
    qint64 outputSize = 0;          ///< Output file size in bytes (0 if not created)
    int pagesProcessed = 0;         ///< Pages built or annotated
};

/**
 * @brief Summary result for a batch operation.
 */
struct BatchResult {
    QList<FileResult> results;      ///< Per-file results
    int successCount = 0;           ///< Number of successful operations
    int skippedCount = 0;           ///< Number of skipped files
    int errorCount = 0;             ///< Number of failed operations
    qint64 totalOutputSize = 0;     ///< Total size of all output files
    qint64 elapsedMs = 0;           ///< Total elapsed time in milliseconds
    
    /// @brief Check if any errors occurred.
    bool hasErrors() const { return errorCount > 0; }
    
    /// @brief Check if all files were processed successfully (no errors or skips).
    bool allSucceeded() const { return errorCount == 0 && skippedCount == 0; }
    
    /// @brief Get total number of files processed.
    int totalCount() const { return successCount + skippedCount + errorCount; }
};

// =============================================================================
// Callbacks
// =============================================================================

/**
 * @brief Progress callback signature.
 * 
 * Called before processing each file (or each page of a build).
 * 
 * @param current Current file index (1-based)
 * @param total Total number of files to process
 * @param currentFile Path to file being processed
 * @param status Brief status message (e.g., "Annotating...")
 */
using ProgressCallback = std::function<void(int current, int total,
                                            const QString& currentFile,
                                            const QString& status)>;

/**
 * @brief Result callback signature.
 * 
 * Called after each file is processed with the result, so results can be
 * printed as files complete.
 * 
 * Return true to continue processing the next file, or false to stop
 * early (fail-fast). Files that were never attempted get no result.
 * 
 * @param current Current file index (1-based)
 * @param total Total number of files to process
 * @param result The completed file result
 * @return true to continue, false to stop processing remaining files
 */
using ResultCallback = std::function<bool(int current, int total,
                                         const FileResult& result)>;

// =============================================================================
// Build
// =============================================================================

/**
 * @brief Everything needed to build one review document.
 */
struct BuildRequest {
    QStringList images;             ///< Image paths in page order
    QString date;                   ///< Class date, used in the file name
    QString classNumber;            ///< Class number, used in the file name
    QString community;              ///< Community name, used in the file name
    QString overlayText;            ///< Resolved header-band text
    PlacementVariant variant = PlacementVariant::HeaderBand;
    QString outputPath;             ///< Output directory or explicit .pdf path
    int minimumImages = 2;          ///< Fewer images are rejected
    bool overwrite = false;         ///< Overwrite an existing output file
    bool dryRun = false;            ///< Validate and report, don't create files
};

/**
 * @brief Check a build request before any drawing.
 * 
 * @return Human-readable reason, or an empty string if the request is valid
 */
QString validateBuildRequest(const BuildRequest& request);

/**
 * @brief File name of a new review document.
 * 
 * "{date}_classreview_{community}_{classNumber}.pdf". Characters that are
 * not allowed in file names are replaced by '_'.
 */
QString classReviewFileName(const QString& date, const QString& community,
                            const QString& classNumber);

/**
 * @brief Absolute output path of a build.
 * 
 * An explicit .pdf path is used as-is; anything else is a directory that
 * receives classReviewFileName().
 */
QString resolveBuildOutputPath(const BuildRequest& request);

/**
 * @brief Validate the request and build the document.
 * 
 * The destination directory must already exist. An existing output file is
 * skipped unless overwrite is set. The first failing image aborts the build
 * and nothing is written.
 * 
 * @param request Build request
 * @param progress Optional progress callback (called before each page)
 * @return Result of the single build
 */
FileResult buildDocument(const BuildRequest& request,
                         ProgressCallback progress = nullptr);

// =============================================================================
// Annotate
// =============================================================================

/**
 * @brief Options for batch annotation.
 */
struct AnnotateOptions {
    QString destDir;                ///< Output directory (original names are kept)
    QString overlayText;            ///< Header-band text shared by all documents
    bool overwrite = false;         ///< Overwrite existing output files
    bool dryRun = false;            ///< Report page counts only, don't create files
};

/**
 * @brief Stamp the header band onto multiple PDFs.
 * 
 * Each document is processed independently: a failing document is recorded
 * and the batch continues with the next one, unless @p resultCb asks to stop.
 * 
 * @param pdfPaths List of input PDF paths
 * @param options Annotate options
 * @param progress Optional progress callback (called before each file)
 * @param cancelled Optional cancellation flag (checked between files)
 * @param resultCb Optional result callback (called after each file)
 * @return BatchResult with per-file results and summary
 */
BatchResult annotatePdfBatch(const QStringList& pdfPaths,
                             const AnnotateOptions& options,
                             ProgressCallback progress = nullptr,
                             std::atomic<bool>* cancelled = nullptr,
                             ResultCallback resultCb = nullptr);

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Output path of an annotated copy.
 * 
 * Example: "/in/Week 3.pdf" + "/out" -> "/out/Week 3.pdf"
 * 
 * @param inputPath Input PDF path
 * @param outputDir Output directory
 * @return Full output file path
 */
QString generateOutputPath(const QString& inputPath, const QString& outputDir);

/**
 * @brief Determine if output path represents a single file or directory.
 * 
 * Heuristics:
 * - Ends with the extension: single file
 * - Ends with / or is existing directory: directory
 * - Otherwise: assumed to be directory
 * 
 * @param outputPath Output path to check
 * @param extension Expected extension for single-file mode (e.g., ".pdf")
 * @return true if output path is a single file, false if directory
 */
bool isSingleFileOutput(const QString& outputPath, const QString& extension);

} // namespace BatchOps

#endif // BATCHOPERATIONS_H
