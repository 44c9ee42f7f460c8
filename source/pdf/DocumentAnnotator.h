#pragma once

// ============================================================================
// DocumentAnnotator - Stamps the header band onto an existing PDF
// ============================================================================
// Pages are stamped in place: the original content streams are wrapped in
// q/Q and followed by one that draws a Form XObject holding the header band
// (overlay text and "Page i of N" caption). The form is laid out upright in
// the displayed page and mapped back through /Rotate and the crop box, so
// annotations, links, transparency groups and page boxes stay as they were.
// The caption uses the source document's own page count. The input bytes
// are never modified; output is produced in memory.
// ============================================================================

#include "PdfResults.h"

#include <QByteArray>
#include <QRectF>
#include <QString>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct pdf_document;
struct pdf_obj;

class DocumentAnnotator {
public:
    DocumentAnnotator() = default;
    ~DocumentAnnotator();

    // Disable copy (MuPDF context is not copyable)
    DocumentAnnotator(const DocumentAnnotator&) = delete;
    DocumentAnnotator& operator=(const DocumentAnnotator&) = delete;

    /**
     * @brief Overlay @p overlayText on every page of a PDF.
     * @param input Source PDF bytes
     * @param overlayText Text drawn in the header band of every page
     * @return Result with the annotated PDF in pdfData on success
     *
     * Fails with Format if @p input is not a readable PDF or has no pages.
     */
    AnnotateResult annotate(const QByteArray& input, const QString& overlayText);

    /**
     * @brief Read @p inputPath, annotate it and commit to @p outputPath.
     *
     * @p outputPath must differ from @p inputPath. Nothing is written when
     * any step fails.
     */
    AnnotateResult annotateFile(const QString& inputPath, const QString& outputPath,
                                const QString& overlayText);

    /**
     * @brief Content-space transform that shows a page upright.
     * @param rotation Page /Rotate value (normalized to 0, 90, 180 or 270)
     * @param width Unrotated page box width
     * @param height Unrotated page box height
     * @param matrix Receives a b c d e f
     */
    static void rotationMatrix(int rotation, qreal width, qreal height, qreal matrix[6]);

    /**
     * @brief Content-space transform that draws an upright overlay on a page.
     * @param rotation Page /Rotate value
     * @param box Visible page box (CropBox, else MediaBox) in user space
     * @param matrix Receives a b c d e f
     *
     * Maps the displayed page, origin at its lower-left corner, into the
     * page's user space. This is the inverse of rotationMatrix() applied
     * after removing the box origin.
     */
    static void overlayMatrix(int rotation, const QRectF& box, qreal matrix[6]);

    /**
     * @brief Normalize a /Rotate value to 0, 90, 180 or 270.
     */
    static int normalizeRotation(int rotation);

private:
    bool openSource(const QByteArray& input, QString* errorMessage);
    bool readPage(int pageIndex, QRectF* box, int* rotation, QByteArray* overlayName);
    bool stampPage(int pageIndex, pdf_obj* overlay, const QByteArray& overlayName,
                   const QByteArray& before, const QByteArray& after);
    void cleanup();

    fz_context* m_ctx = nullptr;
    pdf_document* m_doc = nullptr;
    QString m_lastError;
};
