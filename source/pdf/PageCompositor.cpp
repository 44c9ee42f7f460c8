// ============================================================================
// PageCompositor - Draws single pages into an output PDF
// ============================================================================

#include "PageCompositor.h"

#include "ContentStreamWriter.h"
#include "MuPdfFontMetrics.h"
#include "../images/ImageSource.h"
#include "../layout/TextWrapper.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFileInfo>

namespace {
const char* const kFontResource = "Helv";
const char* const kImageResource = "Img0";
}

PageCompositor::PageCompositor(fz_context* ctx, pdf_document* doc, const TextMeasurer& measurer)
    : m_ctx(ctx)
    , m_doc(doc)
    , m_measurer(measurer)
{
}

PageCompositor::~PageCompositor()
{
    if (m_font && m_ctx) {
        pdf_drop_obj(m_ctx, m_font);
        m_font = nullptr;
    }
}

QByteArray PageCompositor::headerBandContent(const HeaderLayout& layout)
{
    ContentStreamWriter writer;
    writer.saveState();

    writer.setFillGray(1.0);
    writer.fillRect(layout.band);

    writer.setFillGray(0.0);
    for (const PlacedLine& line : layout.lines) {
        writer.showText(kFontResource, PageGeometry::BodyFontSizePt, line.origin,
                        MuPdfFontMetrics::encodeWinAnsi(line.text));
    }
    writer.showText(kFontResource, PageGeometry::CaptionFontSizePt, layout.captionOrigin,
                    MuPdfFontMetrics::encodeWinAnsi(layout.caption));

    writer.restoreState();
    return writer.data();
}

QByteArray PageCompositor::imagePageContent(const HeaderLayout* band, const ScaledPlacement& placement)
{
    ContentStreamWriter writer;
    if (band) {
        writer.append(headerBandContent(*band));
    }
    writer.drawImage(kImageResource, placement.rect);
    return writer.data();
}

bool PageCompositor::appendImagePage(const PageSpec& page, const ImageSource& image)
{
    m_lastError.clear();

    if (!m_ctx || !m_doc) {
        m_lastError = QStringLiteral("PDF engine not initialized");
        return false;
    }

    if (!image.isLoaded()) {
        m_lastError = QStringLiteral("Image not loaded: %1").arg(image.path());
        return false;
    }

    const QSizeF pageSize = PageGeometry::letterSize();
    const bool hasBand = page.variant == PlacementVariant::HeaderBand;

    const ScaledPlacement placement = computePlacement(
        image.pixelSize(), imageDrawArea(pageSize, page.variant), page.variant);
    if (!placement.isValid()) {
        m_lastError = QStringLiteral("Image has no drawable area: %1").arg(image.path());
        return false;
    }

    HeaderLayout layout;
    if (hasBand) {
        layout = HeaderLayout::build(pageSize, page.overlayText,
                                     page.pageNumber, page.pageCount, m_measurer);
        if (!m_measurer.isValid()) {
            m_lastError = QStringLiteral("Cannot measure the overlay text of page %1").arg(page.pageNumber);
            qWarning() << "[PageCompositor]" << m_lastError;
            return false;
        }
    }
    const QByteArray content = imagePageContent(hasBand ? &layout : nullptr, placement);

    const QByteArray jpeg = image.encodeJpeg(PageGeometry::JpegQuality);
    if (jpeg.isEmpty()) {
        m_lastError = QStringLiteral("Cannot encode image: %1").arg(image.path());
        return false;
    }

    const fz_rect mediabox = fz_make_rect(0, 0,
                                          static_cast<float>(pageSize.width()),
                                          static_cast<float>(pageSize.height()));

    fz_buffer* imageBuf = nullptr;
    fz_image* fzImage = nullptr;
    pdf_obj* imageObj = nullptr;
    pdf_obj* resources = nullptr;
    fz_buffer* contentBuf = nullptr;
    pdf_obj* pageObj = nullptr;

    fz_var(imageBuf);
    fz_var(fzImage);
    fz_var(imageObj);
    fz_var(resources);
    fz_var(contentBuf);
    fz_var(pageObj);

    fz_try(m_ctx) {
        imageBuf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(jpeg.constData()),
            static_cast<size_t>(jpeg.size()));
        fzImage = fz_new_image_from_buffer(m_ctx, imageBuf);
        imageObj = pdf_add_image(m_ctx, m_doc, fzImage);

        resources = pdf_new_dict(m_ctx, m_doc, 2);
        pdf_obj* xobjects = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(XObject), 1);
        pdf_dict_puts(m_ctx, xobjects, kImageResource, imageObj);

        if (hasBand) {
            pdf_obj* fonts = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(Font), 1);
            pdf_dict_puts(m_ctx, fonts, kFontResource, fontObject());
        }

        contentBuf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(content.constData()),
            static_cast<size_t>(content.size()));

        pageObj = pdf_add_page(m_ctx, m_doc, mediabox, 0, resources, contentBuf);
        pdf_insert_page(m_ctx, m_doc, -1, pageObj);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, pageObj);
        fz_drop_buffer(m_ctx, contentBuf);
        pdf_drop_obj(m_ctx, resources);
        pdf_drop_obj(m_ctx, imageObj);
        fz_drop_image(m_ctx, fzImage);
        fz_drop_buffer(m_ctx, imageBuf);
    }
    fz_catch(m_ctx) {
        m_lastError = QStringLiteral("Failed to compose page %1: %2")
                          .arg(page.pageNumber)
                          .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        qWarning() << "[PageCompositor]" << m_lastError;
        return false;
    }

    qDebug() << "[PageCompositor] Page" << page.pageNumber << "of" << page.pageCount
             << QFileInfo(image.path()).fileName()
             << "at (" << placement.rect.x() << "," << placement.rect.y() << ")"
             << "size" << placement.rect.width() << "x" << placement.rect.height()
             << (hasBand ? "with header band" : "full bleed");
    return true;
}

pdf_obj* PageCompositor::createOverlayForm(const PageSpec& page, const QSizeF& pageSize)
{
    m_lastError.clear();

    if (!m_ctx || !m_doc) {
        m_lastError = QStringLiteral("PDF engine not initialized");
        return nullptr;
    }

    if (pageSize.isEmpty()) {
        m_lastError = QStringLiteral("Page %1 has an empty size").arg(page.pageNumber);
        return nullptr;
    }

    const HeaderLayout layout = HeaderLayout::build(pageSize, page.overlayText,
                                                    page.pageNumber, page.pageCount, m_measurer);
    if (!m_measurer.isValid()) {
        m_lastError = QStringLiteral("Cannot measure the overlay text of page %1").arg(page.pageNumber);
        qWarning() << "[PageCompositor]" << m_lastError;
        return nullptr;
    }
    const QByteArray content = headerBandContent(layout);
    const fz_rect bbox = fz_make_rect(0, 0,
                                      static_cast<float>(pageSize.width()),
                                      static_cast<float>(pageSize.height()));

    fz_buffer* contentBuf = nullptr;
    pdf_obj* form = nullptr;

    fz_var(contentBuf);
    fz_var(form);

    fz_try(m_ctx) {
        contentBuf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(content.constData()),
            static_cast<size_t>(content.size()));

        form = pdf_add_new_dict(m_ctx, m_doc, 6);
        pdf_dict_put(m_ctx, form, PDF_NAME(Type), PDF_NAME(XObject));
        pdf_dict_put(m_ctx, form, PDF_NAME(Subtype), PDF_NAME(Form));
        pdf_dict_put_int(m_ctx, form, PDF_NAME(FormType), 1);
        pdf_dict_put_rect(m_ctx, form, PDF_NAME(BBox), bbox);

        pdf_obj* resources = pdf_dict_put_dict(m_ctx, form, PDF_NAME(Resources), 1);
        pdf_obj* fonts = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(Font), 1);
        pdf_dict_puts(m_ctx, fonts, kFontResource, fontObject());

        pdf_update_stream(m_ctx, m_doc, form, contentBuf, 0);
    }
    fz_always(m_ctx) {
        fz_drop_buffer(m_ctx, contentBuf);
    }
    fz_catch(m_ctx) {
        pdf_drop_obj(m_ctx, form);
        m_lastError = QStringLiteral("Failed to create overlay for page %1: %2")
                          .arg(page.pageNumber)
                          .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        qWarning() << "[PageCompositor]" << m_lastError;
        return nullptr;
    }

    return form;
}

// Throws through MuPDF on failure; only call inside fz_try.
pdf_obj* PageCompositor::fontObject()
{
    if (!m_font) {
        pdf_obj* font = pdf_add_new_dict(m_ctx, m_doc, 4);
        fz_try(m_ctx) {
            pdf_dict_put(m_ctx, font, PDF_NAME(Type), PDF_NAME(Font));
            pdf_dict_put(m_ctx, font, PDF_NAME(Subtype), PDF_NAME(Type1));
            pdf_dict_put_name(m_ctx, font, PDF_NAME(BaseFont), "Helvetica");
            pdf_dict_put(m_ctx, font, PDF_NAME(Encoding), PDF_NAME(WinAnsiEncoding));
        }
        fz_catch(m_ctx) {
            pdf_drop_obj(m_ctx, font);
            fz_rethrow(m_ctx);
        }
        m_font = font;
    }
    return m_font;
}
