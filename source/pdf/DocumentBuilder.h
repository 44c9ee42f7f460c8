#pragma once

// ============================================================================
// DocumentBuilder - Builds a PDF from an ordered image deck
// ============================================================================
// One Letter page per image, in deck order. Each image is decoded, rotated
// upright and converted to RGB right before its page is composed, and
// released right after. The document is serialized in memory; the first
// failing image aborts the build and nothing is written.
// ============================================================================

#include "PageCompositor.h"
#include "PdfResults.h"

#include <QObject>
#include <QString>
#include <QStringList>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct pdf_document;

/**
 * @brief Options for building a document from images.
 */
struct DeckBuildOptions {
    QString overlayText;        ///< Header-band text (ignored for full bleed)
    PlacementVariant variant = PlacementVariant::HeaderBand;
    QString title;              ///< Document Title metadata (optional)
};

/**
 * @brief Image deck to PDF builder using MuPDF.
 *
 * Thread Safety: This class is NOT thread-safe. Builds run on the calling
 * thread; progress signals are emitted once per page.
 *
 * Usage:
 * @code
 * DocumentBuilder builder;
 * DeckBuildOptions options;
 * options.overlayText = QStringLiteral("Welcome to Maple Street");
 *
 * DeckBuildResult result = builder.buildToFile(imagePaths, options, "/path/out.pdf");
 * if (!result.success) {
 *     qWarning() << "Build failed:" << result.errorMessage;
 * }
 * @endcode
 */
class DocumentBuilder : public QObject {
    Q_OBJECT

public:
    explicit DocumentBuilder(QObject* parent = nullptr);
    ~DocumentBuilder() override;

    // Disable copy (MuPDF context is not copyable)
    DocumentBuilder(const DocumentBuilder&) = delete;
    DocumentBuilder& operator=(const DocumentBuilder&) = delete;

    /**
     * @brief Build the document in memory.
     * @param imagePaths Images in page order
     * @param options Overlay text, placement variant and title
     * @return Result with the serialized PDF in pdfData on success
     *
     * Fails with InvalidInput for an empty deck, Io for an image that cannot
     * be opened or decoded and Internal for PDF engine failures.
     */
    DeckBuildResult build(const QStringList& imagePaths, const DeckBuildOptions& options);

    /**
     * @brief Build the document and commit it to @p outputPath.
     *
     * The file is replaced atomically; on any failure the destination is
     * left untouched.
     */
    DeckBuildResult buildToFile(const QStringList& imagePaths, const DeckBuildOptions& options,
                                const QString& outputPath);

signals:
    /**
     * @brief Emitted before each page is composed.
     * @param current Page being composed (1-based)
     * @param total Total pages
     */
    void progressUpdated(int current, int total);

private:
    bool initContext();
    void cleanup();

    DeckBuildResult fail(DeckBuildResult result, ErrorKind kind, const QString& message);

    fz_context* m_ctx = nullptr;
    pdf_document* m_outputDoc = nullptr;
};
