// ============================================================================
// PdfInspector - Read-only view of a PDF through MuPDF
// ============================================================================

#include "PdfInspector.h"

#include "PdfSupport.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>

// ============================================================================
// Construction / Destruction
// ============================================================================

PdfInspector::PdfInspector(const QString& pdfPath)
{
    m_ctx = PdfSupport::newContext();
    if (!m_ctx) {
        m_errorMessage = QStringLiteral("Failed to create MuPDF context");
        return;
    }

    const QByteArray pathUtf8 = pdfPath.toUtf8();
    fz_try(m_ctx) {
        m_doc = fz_open_document(m_ctx, pathUtf8.constData());
    }
    fz_catch(m_ctx) {
        m_errorMessage = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[PdfInspector] Failed to open" << pdfPath << "-" << m_errorMessage;
        m_doc = nullptr;
        return;
    }

    countPages();
}

PdfInspector::PdfInspector(const QByteArray& data)
    : m_data(data)
{
    m_ctx = PdfSupport::newContext();
    if (!m_ctx) {
        m_errorMessage = QStringLiteral("Failed to create MuPDF context");
        return;
    }

    openFromBuffer();
    countPages();
}

PdfInspector::~PdfInspector()
{
    if (m_doc) {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

void PdfInspector::openFromBuffer()
{
    if (m_data.isEmpty()) {
        m_errorMessage = QStringLiteral("Empty PDF data");
        return;
    }

    fz_stream* stream = nullptr;
    fz_var(stream);

    fz_try(m_ctx) {
        stream = fz_open_memory(m_ctx,
            reinterpret_cast<const unsigned char*>(m_data.constData()),
            static_cast<size_t>(m_data.size()));
        m_doc = fz_open_document_with_stream(m_ctx, "application/pdf", stream);
    }
    fz_always(m_ctx) {
        fz_drop_stream(m_ctx, stream);
    }
    fz_catch(m_ctx) {
        m_errorMessage = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[PdfInspector] Failed to open PDF from memory -" << m_errorMessage;
        m_doc = nullptr;
    }
}

void PdfInspector::countPages()
{
    if (!m_doc) {
        return;
    }

    fz_try(m_ctx) {
        m_pageCount = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        m_errorMessage = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[PdfInspector] Failed to get page count -" << m_errorMessage;
        m_pageCount = 0;
    }

    if (m_pageCount == 0 && m_errorMessage.isEmpty()) {
        m_errorMessage = QStringLiteral("Document has no pages");
    }
}

// ============================================================================
// Queries
// ============================================================================

bool PdfInspector::isValid() const
{
    return m_ctx != nullptr && m_doc != nullptr && m_pageCount > 0;
}

QSizeF PdfInspector::pageSize(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QSizeF();
    }

    fz_page* page = nullptr;
    fz_rect bounds = fz_empty_rect;
    fz_var(page);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
    }
    fz_always(m_ctx) {
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PdfInspector] Failed to load page" << pageIndex;
        return QSizeF();
    }

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

QString PdfInspector::pageText(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QString();
    }

    fz_buffer* buffer = nullptr;
    QByteArray utf8;

    fz_try(m_ctx) {
        buffer = fz_new_buffer_from_page_number(m_ctx, m_doc, pageIndex, nullptr);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PdfInspector] Failed to extract text from page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return QString();
    }

    unsigned char* data = nullptr;
    const size_t length = fz_buffer_storage(m_ctx, buffer, &data);
    utf8 = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(length));
    fz_drop_buffer(m_ctx, buffer);

    return QString::fromUtf8(utf8);
}

QRectF PdfInspector::textBounds(int pageIndex, const QString& needle) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount || needle.isEmpty()) {
        return QRectF();
    }

    fz_page* page = nullptr;
    fz_stext_page* text = nullptr;
    fz_rect bounds = fz_empty_rect;
    fz_var(page);

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
        text = fz_new_stext_page_from_page(m_ctx, page, nullptr);
    }
    fz_always(m_ctx) {
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[PdfInspector] Failed to extract text from page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return QRectF();
    }

    QRectF found;
    for (fz_stext_block* block = text->first_block; block && found.isNull(); block = block->next) {
        if (block->type != FZ_STEXT_BLOCK_TEXT) {
            continue;
        }
        for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            // One rect per UTF-16 unit so indexes line up with lineText
            QString lineText;
            QVector<QRectF> charRects;
            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                const char32_t codePoint = static_cast<char32_t>(ch->c);
                const QString unit = QString::fromUcs4(&codePoint, 1);
                const fz_rect r = fz_rect_from_quad(ch->quad);
                for (int i = 0; i < unit.size(); ++i) {
                    charRects.append(QRectF(QPointF(r.x0 - bounds.x0, r.y0 - bounds.y0),
                                            QPointF(r.x1 - bounds.x0, r.y1 - bounds.y0)));
                }
                lineText += unit;
            }

            const int at = lineText.indexOf(needle);
            if (at < 0) {
                continue;
            }
            for (int i = at; i < at + needle.size(); ++i) {
                found = found.isNull() ? charRects.at(i) : found.united(charRects.at(i));
            }
            break;
        }
    }

    fz_drop_stext_page(m_ctx, text);
    return found;
}

int PdfInspector::annotationCount(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return 0;
    }

    pdf_document* pdf = pdf_document_from_fz_document(m_ctx, m_doc);
    if (!pdf) {
        return 0;
    }

    int count = 0;
    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, pdf, pageIndex);
        count = pdf_array_len(m_ctx, pdf_dict_get(m_ctx, pageObj, PDF_NAME(Annots)));
    }
    fz_catch(m_ctx) {
        qWarning() << "[PdfInspector] Failed to read annotations of page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return 0;
    }

    return count;
}

QVector<QSize> PdfInspector::imageSizes(int pageIndex) const
{
    QVector<QSize> sizes;
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return sizes;
    }

    pdf_document* pdf = pdf_document_from_fz_document(m_ctx, m_doc);
    if (!pdf) {
        return sizes;
    }

    // Collected as plain ints; the QVector is filled after leaving fz_try
    int found[16][2] = {};
    int count = 0;

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, pdf, pageIndex);
        pdf_obj* resources = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Resources));
        pdf_obj* xobjects = pdf_dict_get(m_ctx, resources, PDF_NAME(XObject));
        const int n = pdf_dict_len(m_ctx, xobjects);
        for (int i = 0; i < n && count < 16; ++i) {
            pdf_obj* xobj = pdf_dict_get_val(m_ctx, xobjects, i);
            if (!pdf_name_eq(m_ctx, pdf_dict_get(m_ctx, xobj, PDF_NAME(Subtype)), PDF_NAME(Image))) {
                continue;
            }
            found[count][0] = pdf_dict_get_int(m_ctx, xobj, PDF_NAME(Width));
            found[count][1] = pdf_dict_get_int(m_ctx, xobj, PDF_NAME(Height));
            ++count;
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[PdfInspector] Failed to read images of page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return sizes;
    }

    for (int i = 0; i < count; ++i) {
        sizes.append(QSize(found[i][0], found[i][1]));
    }
    return sizes;
}

QString PdfInspector::metadata(const char* key) const
{
    if (!m_doc) {
        return QString();
    }

    char buf[256] = {0};
    fz_try(m_ctx) {
        fz_lookup_metadata(m_ctx, m_doc, key, buf, sizeof(buf));
    }
    fz_catch(m_ctx) {
        return QString();
    }

    return QString::fromUtf8(buf);
}
