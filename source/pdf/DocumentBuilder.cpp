// ============================================================================
// DocumentBuilder - Builds a PDF from an ordered image deck
// ============================================================================

#include "DocumentBuilder.h"

#include "MuPdfFontMetrics.h"
#include "PdfSupport.h"
#include "../images/ImageSource.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFileInfo>

// ============================================================================
// Construction / Destruction
// ============================================================================

DocumentBuilder::DocumentBuilder(QObject* parent)
    : QObject(parent)
{
}

DocumentBuilder::~DocumentBuilder()
{
    cleanup();
}

// ============================================================================
// Public API
// ============================================================================

DeckBuildResult DocumentBuilder::build(const QStringList& imagePaths, const DeckBuildOptions& options)
{
    DeckBuildResult result;

    if (imagePaths.isEmpty()) {
        return fail(result, ErrorKind::InvalidInput, tr("No images to build"));
    }

    qDebug() << "[DocumentBuilder] Starting build:" << imagePaths.size() << "images,"
             << (options.variant == PlacementVariant::HeaderBand ? "header band" : "full bleed");

    if (!initContext()) {
        cleanup();
        return fail(result, ErrorKind::Internal, tr("Failed to initialize PDF engine"));
    }

    MuPdfFontMetrics metrics;
    if (!metrics.isValid()) {
        cleanup();
        return fail(result, ErrorKind::Internal, tr("Failed to load the Helvetica font"));
    }

    const int total = imagePaths.size();
    ErrorKind failure = ErrorKind::None;
    QString failureMessage;

    // The compositor holds objects of the output document and must be gone
    // before cleanup() drops it
    {
        PageCompositor compositor(m_ctx, m_outputDoc, metrics);

        for (int i = 0; i < total; ++i) {
            emit progressUpdated(i + 1, total);

            // Decoded pixels live only for the duration of this page
            ImageSource image(imagePaths.at(i));
            if (!image.load()) {
                failure = ErrorKind::Io;
                failureMessage = image.errorMessage();
                break;
            }

            PageSpec page;
            page.pageNumber = i + 1;
            page.pageCount = total;
            page.variant = options.variant;
            page.overlayText = options.overlayText;

            const bool composed = compositor.appendImagePage(page, image);
            image.release();

            if (!composed) {
                failure = ErrorKind::Internal;
                failureMessage = tr("Failed to build page %1: %2").arg(i + 1).arg(compositor.lastError());
                break;
            }

            result.pagesBuilt++;
        }
    }

    if (failure != ErrorKind::None) {
        cleanup();
        return fail(result, failure, failureMessage);
    }

    if (!PdfSupport::writeMetadata(m_ctx, m_outputDoc, options.title)) {
        qWarning() << "[DocumentBuilder] Failed to write metadata (non-fatal)";
    }

    QString saveError;
    if (!PdfSupport::saveToBytes(m_ctx, m_outputDoc, &result.pdfData, &saveError)) {
        cleanup();
        return fail(result, ErrorKind::Internal, tr("Failed to serialize PDF: %1").arg(saveError));
    }

    cleanup();
    result.success = true;

    qDebug() << "[DocumentBuilder] Build complete:" << result.pagesBuilt << "pages,"
             << (result.pdfData.size() / 1024) << "KB";

    return result;
}

DeckBuildResult DocumentBuilder::buildToFile(const QStringList& imagePaths,
                                             const DeckBuildOptions& options,
                                             const QString& outputPath)
{
    if (outputPath.isEmpty()) {
        DeckBuildResult result;
        return fail(result, ErrorKind::InvalidInput, tr("No output path specified"));
    }

    DeckBuildResult result = build(imagePaths, options);
    if (!result.success) {
        return result;
    }

    QString writeError;
    if (!PdfSupport::writeFileAtomically(result.pdfData, outputPath, &writeError)) {
        result.success = false;
        result.pdfData.clear();
        return fail(result, ErrorKind::Io, writeError);
    }

    result.fileSizeBytes = QFileInfo(outputPath).size();
    return result;
}

// ============================================================================
// Internals
// ============================================================================

bool DocumentBuilder::initContext()
{
    cleanup();

    m_ctx = PdfSupport::newContext();
    if (!m_ctx) {
        return false;
    }

    m_outputDoc = PdfSupport::newDocument(m_ctx);
    if (!m_outputDoc) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return false;
    }

    return true;
}

void DocumentBuilder::cleanup()
{
    if (m_outputDoc) {
        pdf_drop_document(m_ctx, m_outputDoc);
        m_outputDoc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

DeckBuildResult DocumentBuilder::fail(DeckBuildResult result, ErrorKind kind, const QString& message)
{
    result.success = false;
    result.error = kind;
    result.errorMessage = message;
    result.pdfData.clear();

    qWarning() << "[DocumentBuilder] Build failed:" << message;
    return result;
}
