#pragma once

// ============================================================================
// PdfInspector - Read-only view of a PDF through MuPDF
// ============================================================================
// Opens a PDF from a file or from memory and answers simple questions about
// it: page count, page sizes, extracted text, where text sits on a page,
// annotations and the size of placed images.
// Used by the annotate dry run and by the pipeline tests.
// ============================================================================

#include <QByteArray>
#include <QRectF>
#include <QSize>
#include <QSizeF>
#include <QString>
#include <QVector>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct fz_document;

class PdfInspector {
public:
    /**
     * @brief Open the PDF at @p pdfPath.
     *
     * Check isValid() after construction to verify the PDF loaded.
     */
    explicit PdfInspector(const QString& pdfPath);

    /**
     * @brief Open a PDF held in memory.
     * @param data PDF bytes (copied; the caller may discard them)
     */
    explicit PdfInspector(const QByteArray& data);

    ~PdfInspector();

    // Disable copy (MuPDF context is not copyable)
    PdfInspector(const PdfInspector&) = delete;
    PdfInspector& operator=(const PdfInspector&) = delete;

    /// True when the document opened and has at least one page.
    bool isValid() const;

    int pageCount() const { return m_pageCount; }
    QString errorMessage() const { return m_errorMessage; }

    /**
     * @brief Displayed page size in points (rotation applied).
     * @return Empty size for an invalid index
     */
    QSizeF pageSize(int pageIndex) const;

    /**
     * @brief Plain text of a page, lines separated by '\n'.
     */
    QString pageText(int pageIndex) const;

    /**
     * @brief Bounds of the first occurrence of @p needle on a page.
     *
     * Displayed coordinates: origin at the top-left of the visible page,
     * y down, rotation applied. A match must lie within one text line.
     * @return Null rect when the text is not found
     */
    QRectF textBounds(int pageIndex, const QString& needle) const;

    /**
     * @brief Number of entries in the page's /Annots array.
     */
    int annotationCount(int pageIndex) const;

    /**
     * @brief Pixel sizes of the image XObjects in a page's resources.
     */
    QVector<QSize> imageSizes(int pageIndex) const;

    /**
     * @brief Value of an Info dictionary entry (e.g. "info:Producer").
     */
    QString metadata(const char* key) const;

private:
    void openFromBuffer();
    void countPages();

    fz_context* m_ctx = nullptr;
    fz_document* m_doc = nullptr;
    QByteArray m_data;              ///< Backing store when opened from memory
    QString m_errorMessage;
    int m_pageCount = 0;
};
