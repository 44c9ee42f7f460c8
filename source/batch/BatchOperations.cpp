#include "BatchOperations.h"

#include "../deck/ImageDeck.h"
#include "../pdf/DocumentAnnotator.h"
#include "../pdf/DocumentBuilder.h"
#include "../pdf/PdfInspector.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QDebug>

/**
 * @file BatchOperations.cpp
 * @brief Implementation of the build and annotate operations.
 * 
 * @see BatchOperations.h for API documentation
 */

namespace BatchOps {

// =============================================================================
// Utility Functions
// =============================================================================

QString generateOutputPath(const QString& inputPath, const QString& outputDir)
{
    QString outDir = outputDir;
    if (!outDir.endsWith('/') && !outDir.endsWith('\\')) {
        outDir += '/';
    }
    
    return QDir::cleanPath(outDir + QFileInfo(inputPath).fileName());
}

bool isSingleFileOutput(const QString& outputPath, const QString& extension)
{
    if (outputPath.isEmpty()) {
        return false;
    }
    
    // Check if ends with the expected extension
    if (outputPath.endsWith(extension, Qt::CaseInsensitive)) {
        return true;
    }
    
    // Check if ends with directory separator
    if (outputPath.endsWith('/') || outputPath.endsWith('\\')) {
        return false;
    }
    
    // Default: assume directory
    return false;
}

static void recordResult(BatchResult& result, const FileResult& fr)
{
    result.results.append(fr);
    switch (fr.status) {
        case FileStatus::Success:
            result.successCount++;
            result.totalOutputSize += fr.outputSize;
            break;
        case FileStatus::Skipped:
            result.skippedCount++;
            break;
        case FileStatus::Error:
            result.errorCount++;
            break;
    }
}

static FileResult errorResult(FileResult fr, ErrorKind kind, const QString& message)
{
    fr.status = FileStatus::Error;
    fr.error = kind;
    fr.message = message;
    return fr;
}

// =============================================================================
// Build
// =============================================================================

QString validateBuildRequest(const BuildRequest& request)
{
    if (request.date.trimmed().isEmpty()) {
        return QObject::tr("Date is required");
    }
    if (request.classNumber.trimmed().isEmpty()) {
        return QObject::tr("Class number is required");
    }
    if (request.community.trimmed().isEmpty()) {
        return QObject::tr("Community is required");
    }
    
    const QString deckError = ImageDeck(request.images).validate(request.minimumImages);
    if (!deckError.isEmpty()) {
        return deckError;
    }
    if (request.images.isEmpty()) {
        return QObject::tr("Please select an image");
    }
    
    if (request.variant == PlacementVariant::HeaderBand && request.overlayText.trimmed().isEmpty()) {
        return QObject::tr("Overlay text is required");
    }
    
    return QString();
}

QString classReviewFileName(const QString& date, const QString& community,
                            const QString& classNumber)
{
    QString name = QStringLiteral("%1_classreview_%2_%3.pdf")
                       .arg(date.trimmed(), community.trimmed(), classNumber.trimmed());
    
    static const QString illegal = QStringLiteral("/\\:*?\"<>|");
    for (QChar& c : name) {
        if (illegal.contains(c) || c.unicode() < 0x20) {
            c = QLatin1Char('_');
        }
    }
    return name;
}

QString resolveBuildOutputPath(const BuildRequest& request)
{
    const QString base = request.outputPath.isEmpty() ? QDir::currentPath() : request.outputPath;
    
    if (isSingleFileOutput(base, ".pdf")) {
        return QDir::cleanPath(QDir::current().absoluteFilePath(base));
    }
    
    const QString dir = QDir::cleanPath(QDir::current().absoluteFilePath(base));
    return QDir(dir).filePath(classReviewFileName(request.date, request.community,
                                                  request.classNumber));
}

FileResult buildDocument(const BuildRequest& request, ProgressCallback progress)
{
    FileResult fr;
    fr.inputPath = request.images.value(0);
    
    const QString reason = validateBuildRequest(request);
    if (!reason.isEmpty()) {
        return errorResult(fr, ErrorKind::InvalidInput, reason);
    }
    
    const QString outputPath = resolveBuildOutputPath(request);
    fr.outputPath = outputPath;
    
    const QFileInfo outputInfo(outputPath);
    if (!outputInfo.absoluteDir().exists()) {
        return errorResult(fr, ErrorKind::Io,
                           QObject::tr("Output directory does not exist: %1")
                               .arg(outputInfo.absolutePath()));
    }
    
    if (outputInfo.exists() && !request.overwrite) {
        fr.status = FileStatus::Skipped;
        fr.message = QObject::tr("Output file already exists");
        return fr;
    }
    
    if (request.dryRun) {
        fr.status = FileStatus::Success;
        fr.pagesProcessed = request.images.size();
        fr.message = QObject::tr("Would build %1 pages to: %2")
                         .arg(request.images.size())
                         .arg(outputPath);
        return fr;
    }
    
    DocumentBuilder builder;
    if (progress) {
        const QStringList& images = request.images;
        QObject::connect(&builder, &DocumentBuilder::progressUpdated,
                         [&progress, &images](int current, int total) {
            progress(current, total, images.value(current - 1),
                     QObject::tr("Composing page..."));
        });
    }
    
    DeckBuildOptions options;
    options.overlayText = request.overlayText;
    options.variant = request.variant;
    options.title = outputInfo.completeBaseName();
    
    const DeckBuildResult built = builder.buildToFile(request.images, options, outputPath);
    if (!built.success) {
        return errorResult(fr, built.error, built.errorMessage);
    }
    
    fr.status = FileStatus::Success;
    fr.pagesProcessed = built.pagesBuilt;
    fr.outputSize = built.fileSizeBytes;
    
    qDebug() << "[BatchOps] Built" << built.pagesBuilt << "pages to" << outputPath;
    return fr;
}

// =============================================================================
// Annotate
// =============================================================================

static FileResult annotateOne(const QString& pdfPath, const QString& outputPath,
                              const AnnotateOptions& options)
{
    FileResult fr;
    fr.inputPath = pdfPath;
    fr.outputPath = outputPath;
    
    const QFileInfo inputInfo(pdfPath);
    if (!inputInfo.exists() || !inputInfo.isFile()) {
        return errorResult(fr, ErrorKind::Io, QObject::tr("File not found"));
    }
    
    if (inputInfo.absoluteFilePath() == QFileInfo(outputPath).absoluteFilePath()) {
        return errorResult(fr, ErrorKind::InvalidInput,
                           QObject::tr("Output would overwrite the input"));
    }
    
    if (QFile::exists(outputPath) && !options.overwrite) {
        fr.status = FileStatus::Skipped;
        fr.message = QObject::tr("Output file already exists");
        return fr;
    }
    
    if (options.dryRun) {
        PdfInspector inspector(pdfPath);
        if (!inspector.isValid()) {
            return errorResult(fr, ErrorKind::Format, inspector.errorMessage());
        }
        fr.status = FileStatus::Success;
        fr.pagesProcessed = inspector.pageCount();
        fr.message = QObject::tr("Would annotate %1 pages to: %2")
                         .arg(inspector.pageCount())
                         .arg(outputPath);
        return fr;
    }
    
    DocumentAnnotator annotator;
    const AnnotateResult annotated = annotator.annotateFile(pdfPath, outputPath,
                                                            options.overlayText);
    if (!annotated.success) {
        return errorResult(fr, annotated.error, annotated.errorMessage);
    }
    
    fr.status = FileStatus::Success;
    fr.pagesProcessed = annotated.pagesAnnotated;
    fr.outputSize = annotated.fileSizeBytes;
    return fr;
}

BatchResult annotatePdfBatch(const QStringList& pdfPaths,
                             const AnnotateOptions& options,
                             ProgressCallback progress,
                             std::atomic<bool>* cancelled,
                             ResultCallback resultCb)
{
    BatchResult result;
    QElapsedTimer timer;
    timer.start();
    
    const int total = pdfPaths.size();
    
    if (pdfPaths.isEmpty()) {
        result.elapsedMs = timer.elapsed();
        return result;
    }
    
    if (options.destDir.isEmpty()) {
        for (const QString& pdfPath : pdfPaths) {
            FileResult fr;
            fr.inputPath = pdfPath;
            recordResult(result, errorResult(fr, ErrorKind::InvalidInput,
                                             QObject::tr("No output directory specified")));
        }
        result.elapsedMs = timer.elapsed();
        return result;
    }
    
    // Ensure output directory exists
    QDir dir(options.destDir);
    if (!dir.exists() && !options.dryRun) {
        if (!dir.mkpath(".")) {
            for (const QString& pdfPath : pdfPaths) {
                FileResult fr;
                fr.inputPath = pdfPath;
                recordResult(result, errorResult(fr, ErrorKind::Io,
                    QObject::tr("Failed to create output directory: %1").arg(options.destDir)));
            }
            result.elapsedMs = timer.elapsed();
            return result;
        }
    }
    
    for (int i = 0; i < total; ++i) {
        const QString& pdfPath = pdfPaths.at(i);
        FileResult fr;
        fr.inputPath = pdfPath;
        
        // Check cancellation
        if (cancelled && cancelled->load()) {
            fr.status = FileStatus::Skipped;
            fr.message = QObject::tr("Cancelled");
            recordResult(result, fr);
            continue;
        }
        
        if (progress) {
            progress(i + 1, total, pdfPath, QObject::tr("Annotating..."));
        }
        
        fr = annotateOne(pdfPath, generateOutputPath(pdfPath, options.destDir), options);
        if (fr.status == FileStatus::Error) {
            qWarning() << "[BatchOps] Failed to annotate" << pdfPath << ":" << fr.message;
        }
        recordResult(result, fr);
        
        if (resultCb && !resultCb(i + 1, total, fr)) {
            break;
        }
    }
    
    result.elapsedMs = timer.elapsed();
    
#ifdef CLASSREVIEW_DEBUG
    qDebug() << "[BatchOps] annotatePdfBatch complete:"
             << result.successCount << "success,"
             << result.skippedCount << "skipped,"
             << result.errorCount << "errors,"
             << result.elapsedMs << "ms";
#endif
    
    return result;
}

} // namespace BatchOps
