#pragma once

// ============================================================================
// PageCompositor - Draws single pages into an output PDF
// ============================================================================
// Two kinds of output:
// - An image page: optional header band (fill, wrapped overlay text and the
//   "Page i of N" caption) plus one scaled image, appended to the document.
// - An overlay form: the same header band as a transparent Form XObject the
//   size of an existing page, used by the annotator.
//
// Content operators are generated with Qt before entering MuPDF, so no Qt
// object is constructed inside fz_try blocks.
// ============================================================================

#include "../layout/HeaderLayout.h"
#include "../layout/PageGeometry.h"

#include <QByteArray>
#include <QSizeF>
#include <QString>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct pdf_document;
struct pdf_obj;

class ImageSource;
class TextMeasurer;

/**
 * @brief Everything needed to draw one page.
 */
struct PageSpec {
    int pageNumber = 1;         ///< 1-based
    int pageCount = 1;          ///< Total pages, for the caption
    PlacementVariant variant = PlacementVariant::HeaderBand;
    QString overlayText;        ///< Drawn in the header band (may be empty)
};

class PageCompositor {
public:
    /**
     * @param ctx MuPDF context owning @p doc
     * @param doc Output document pages and objects are added to
     * @param measurer Body font metrics used for wrapping
     */
    PageCompositor(fz_context* ctx, pdf_document* doc, const TextMeasurer& measurer);
    ~PageCompositor();

    PageCompositor(const PageCompositor&) = delete;
    PageCompositor& operator=(const PageCompositor&) = delete;

    /**
     * @brief Append one image page at the end of the document.
     * @param page Page number, count, variant and overlay text
     * @param image A loaded image
     * @return false on failure; lastError() holds the reason
     */
    bool appendImagePage(const PageSpec& page, const ImageSource& image);

    /**
     * @brief Create a transparent Form XObject holding the header band.
     * @param page Page number, count and overlay text (variant is ignored)
     * @param pageSize Size of the page the form is drawn over, in points
     * @return New indirect reference (caller drops), or nullptr on failure
     */
    pdf_obj* createOverlayForm(const PageSpec& page, const QSizeF& pageSize);

    QString lastError() const { return m_lastError; }

    /**
     * @brief Content operators for a header band.
     *
     * White band, black wrapped lines in the body font and the caption in
     * the caption font. Uses the font resource named "Helv".
     */
    static QByteArray headerBandContent(const HeaderLayout& layout);

    /**
     * @brief Content operators for a complete image page.
     * @param band Header layout, or nullptr for the full-bleed variant
     * @param placement Where the image resource "Img0" is drawn
     */
    static QByteArray imagePageContent(const HeaderLayout* band, const ScaledPlacement& placement);

private:
    /**
     * @brief Indirect Helvetica font dictionary, created on first use.
     * @return Borrowed reference owned by the compositor
     */
    pdf_obj* fontObject();

    fz_context* m_ctx = nullptr;
    pdf_document* m_doc = nullptr;
    const TextMeasurer& m_measurer;
    pdf_obj* m_font = nullptr;
    QString m_lastError;
};
