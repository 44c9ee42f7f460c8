// ============================================================================
// DocumentAnnotator - Stamps the header band onto an existing PDF
// ============================================================================

#include "DocumentAnnotator.h"

#include "ContentStreamWriter.h"
#include "MuPdfFontMetrics.h"
#include "PageCompositor.h"
#include "PdfSupport.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QTransform>

namespace {

AnnotateResult failed(AnnotateResult result, ErrorKind kind, const QString& message)
{
    result.success = false;
    result.error = kind;
    result.errorMessage = message;
    result.pdfData.clear();
    qWarning() << "[DocumentAnnotator] Annotate failed:" << message;
    return result;
}

} // namespace

DocumentAnnotator::~DocumentAnnotator()
{
    cleanup();
}

// ============================================================================
// Public API
// ============================================================================

AnnotateResult DocumentAnnotator::annotate(const QByteArray& input, const QString& overlayText)
{
    AnnotateResult result;
    cleanup();

    if (input.isEmpty()) {
        return failed(result, ErrorKind::Format, QStringLiteral("Input document is empty"));
    }

    m_ctx = PdfSupport::newContext();
    if (!m_ctx) {
        return failed(result, ErrorKind::Internal, QStringLiteral("Failed to initialize PDF engine"));
    }

    QString openError;
    if (!openSource(input, &openError)) {
        cleanup();
        return failed(result, ErrorKind::Format, QStringLiteral("Not a valid PDF: %1").arg(openError));
    }

    int pageCount = 0;
    fz_try(m_ctx) {
        pageCount = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        openError = QString::fromUtf8(fz_caught_message(m_ctx));
        pageCount = -1;
    }
    if (pageCount < 0) {
        cleanup();
        return failed(result, ErrorKind::Format, QStringLiteral("Not a valid PDF: %1").arg(openError));
    }
    if (pageCount == 0) {
        cleanup();
        return failed(result, ErrorKind::Format, QStringLiteral("Document has no pages"));
    }

    MuPdfFontMetrics metrics;
    if (!metrics.isValid()) {
        cleanup();
        return failed(result, ErrorKind::Internal, QStringLiteral("Failed to load the Helvetica font"));
    }

    ErrorKind failure = ErrorKind::None;
    QString failureMessage;

    // The compositor holds objects of the document and must be gone before
    // cleanup() drops it
    {
        PageCompositor compositor(m_ctx, m_doc, metrics);

        for (int i = 0; i < pageCount; ++i) {
            QRectF box;
            int rotation = 0;
            QByteArray overlayName;

            if (!readPage(i, &box, &rotation, &overlayName)) {
                failure = ErrorKind::Format;
                failureMessage = QStringLiteral("Cannot read page %1: %2").arg(i + 1).arg(m_lastError);
                break;
            }

            const bool quarterTurn = rotation == 90 || rotation == 270;
            const QSizeF displayed = quarterTurn ? box.size().transposed() : box.size();

            PageSpec page;
            page.pageNumber = i + 1;
            page.pageCount = pageCount;
            page.overlayText = overlayText;

            pdf_obj* overlay = compositor.createOverlayForm(page, displayed);
            if (!overlay) {
                failure = ErrorKind::Internal;
                failureMessage = compositor.lastError();
                break;
            }

            qreal m[6];
            overlayMatrix(rotation, box, m);

            // Whatever state the original content leaves behind is undone
            // before the overlay is drawn
            ContentStreamWriter before;
            before.saveState();

            ContentStreamWriter after;
            after.restoreState();
            after.saveState();
            after.concat(m[0], m[1], m[2], m[3], m[4], m[5]);
            after.drawXObject(overlayName.constData());
            after.restoreState();

            const bool stamped = stampPage(i, overlay, overlayName, before.data(), after.data());
            pdf_drop_obj(m_ctx, overlay);

            if (!stamped) {
                failure = ErrorKind::Internal;
                failureMessage = QStringLiteral("Failed to annotate page %1: %2").arg(i + 1).arg(m_lastError);
                break;
            }

            result.pagesAnnotated++;
        }
    }

    if (failure != ErrorKind::None) {
        cleanup();
        return failed(result, failure, failureMessage);
    }

    if (!PdfSupport::writeMetadata(m_ctx, m_doc, QString())) {
        qWarning() << "[DocumentAnnotator] Failed to write metadata (non-fatal)";
    }

    QString saveError;
    if (!PdfSupport::saveToBytes(m_ctx, m_doc, &result.pdfData, &saveError)) {
        cleanup();
        return failed(result, ErrorKind::Internal, QStringLiteral("Failed to serialize PDF: %1").arg(saveError));
    }

    cleanup();
    result.success = true;

    qDebug() << "[DocumentAnnotator] Annotated" << result.pagesAnnotated << "pages,"
             << (result.pdfData.size() / 1024) << "KB";
    return result;
}

AnnotateResult DocumentAnnotator::annotateFile(const QString& inputPath, const QString& outputPath,
                                               const QString& overlayText)
{
    AnnotateResult result;

    if (outputPath.isEmpty()) {
        return failed(result, ErrorKind::InvalidInput, QStringLiteral("No output path specified"));
    }

    const QFileInfo inputInfo(inputPath);
    const QFileInfo outputInfo(outputPath);
    if (inputInfo.absoluteFilePath() == outputInfo.absoluteFilePath()
        || (outputInfo.exists() && inputInfo.canonicalFilePath() == outputInfo.canonicalFilePath())) {
        return failed(result, ErrorKind::InvalidInput,
                      QStringLiteral("Output would overwrite the input: %1").arg(inputPath));
    }

    QFile file(inputPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return failed(result, ErrorKind::Io,
                      QStringLiteral("Cannot read %1: %2").arg(inputPath, file.errorString()));
    }
    const QByteArray input = file.readAll();
    file.close();

    result = annotate(input, overlayText);
    if (!result.success) {
        return result;
    }

    QString writeError;
    if (!PdfSupport::writeFileAtomically(result.pdfData, outputPath, &writeError)) {
        return failed(result, ErrorKind::Io, writeError);
    }

    result.fileSizeBytes = QFileInfo(outputPath).size();
    return result;
}

int DocumentAnnotator::normalizeRotation(int rotation)
{
    int normalized = ((rotation % 360) + 360) % 360;
    // Only quarter turns are meaningful for /Rotate
    normalized = (normalized / 90) * 90;
    return normalized;
}

void DocumentAnnotator::rotationMatrix(int rotation, qreal width, qreal height, qreal matrix[6])
{
    // Maps the unrotated box (0,0)-(width,height) onto the upright page
    switch (normalizeRotation(rotation)) {
        case 90:
            matrix[0] = 0;  matrix[1] = -1; matrix[2] = 1;  matrix[3] = 0;
            matrix[4] = 0;  matrix[5] = width;
            break;
        case 180:
            matrix[0] = -1; matrix[1] = 0;  matrix[2] = 0;  matrix[3] = -1;
            matrix[4] = width; matrix[5] = height;
            break;
        case 270:
            matrix[0] = 0;  matrix[1] = 1;  matrix[2] = -1; matrix[3] = 0;
            matrix[4] = height; matrix[5] = 0;
            break;
        default:
            matrix[0] = 1;  matrix[1] = 0;  matrix[2] = 0;  matrix[3] = 1;
            matrix[4] = 0;  matrix[5] = 0;
            break;
    }
}

void DocumentAnnotator::overlayMatrix(int rotation, const QRectF& box, qreal matrix[6])
{
    qreal r[6];
    rotationMatrix(rotation, box.width(), box.height(), r);

    // Row-vector convention as in PDF: upright^-1 first, then the box origin
    const QTransform upright(r[0], r[1], r[2], r[3], r[4], r[5]);
    const QTransform placement = upright.inverted() * QTransform::fromTranslate(box.x(), box.y());

    matrix[0] = placement.m11();
    matrix[1] = placement.m12();
    matrix[2] = placement.m21();
    matrix[3] = placement.m22();
    matrix[4] = placement.dx();
    matrix[5] = placement.dy();
}

// ============================================================================
// Internals
// ============================================================================

bool DocumentAnnotator::openSource(const QByteArray& input, QString* errorMessage)
{
    fz_stream* stream = nullptr;
    fz_var(stream);

    // input outlives the document: annotate() holds it for the whole call
    fz_try(m_ctx) {
        stream = fz_open_memory(m_ctx,
            reinterpret_cast<const unsigned char*>(input.constData()),
            static_cast<size_t>(input.size()));
        m_doc = pdf_open_document_with_stream(m_ctx, stream);
        if (pdf_needs_password(m_ctx, m_doc)) {
            fz_throw(m_ctx, FZ_ERROR_GENERIC, "document is password protected");
        }
    }
    fz_always(m_ctx) {
        fz_drop_stream(m_ctx, stream);
    }
    fz_catch(m_ctx) {
        if (errorMessage) {
            *errorMessage = QString::fromUtf8(fz_caught_message(m_ctx));
        }
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
        return false;
    }

    return m_doc != nullptr;
}

bool DocumentAnnotator::readPage(int pageIndex, QRectF* box, int* rotation, QByteArray* overlayName)
{
    m_lastError.clear();

    fz_rect rect = fz_empty_rect;
    int rotate = 0;
    char name[32] = "CROverlay";

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);

        // CropBox is the visible area; fall back to MediaBox
        pdf_obj* boxObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(CropBox));
        if (!boxObj) {
            boxObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(MediaBox));
        }
        rect = pdf_to_rect(m_ctx, boxObj);
        if (fz_is_empty_rect(rect)) {
            fz_throw(m_ctx, FZ_ERROR_GENERIC, "page has no usable MediaBox");
        }

        rotate = pdf_to_int(m_ctx, pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Rotate)));

        // The overlay needs a resource name the page does not use yet
        pdf_obj* resources = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Resources));
        pdf_obj* xobjects = pdf_dict_get(m_ctx, resources, PDF_NAME(XObject));
        for (int k = 1; pdf_dict_gets(m_ctx, xobjects, name); ++k) {
            fz_snprintf(name, sizeof(name), "CROverlay%d", k);
        }
    }
    fz_catch(m_ctx) {
        m_lastError = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[DocumentAnnotator] Failed to read page" << pageIndex << ":" << m_lastError;
        return false;
    }

    *box = QRectF(rect.x0, rect.y0, rect.x1 - rect.x0, rect.y1 - rect.y0);
    *rotation = normalizeRotation(rotate);
    *overlayName = QByteArray(name);
    return true;
}

bool DocumentAnnotator::stampPage(int pageIndex, pdf_obj* overlay, const QByteArray& overlayName,
                                  const QByteArray& before, const QByteArray& after)
{
    m_lastError.clear();

    pdf_obj* resources = nullptr;
    pdf_obj* xobjects = nullptr;
    pdf_obj* contents = nullptr;
    pdf_obj* beforeStream = nullptr;
    pdf_obj* afterStream = nullptr;
    fz_buffer* beforeBuf = nullptr;
    fz_buffer* afterBuf = nullptr;

    fz_var(resources);
    fz_var(xobjects);
    fz_var(contents);
    fz_var(beforeStream);
    fz_var(afterStream);
    fz_var(beforeBuf);
    fz_var(afterBuf);

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);

        // Resources may be inherited or shared with other pages, so the page
        // gets its own copy before the overlay is added
        pdf_obj* oldResources = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Resources));
        resources = pdf_is_dict(m_ctx, oldResources)
            ? pdf_copy_dict(m_ctx, oldResources)
            : pdf_new_dict(m_ctx, m_doc, 1);

        pdf_obj* oldXObjects = pdf_dict_get(m_ctx, resources, PDF_NAME(XObject));
        xobjects = pdf_is_dict(m_ctx, oldXObjects)
            ? pdf_copy_dict(m_ctx, oldXObjects)
            : pdf_new_dict(m_ctx, m_doc, 1);
        pdf_dict_puts(m_ctx, xobjects, overlayName.constData(), overlay);
        pdf_dict_put(m_ctx, resources, PDF_NAME(XObject), xobjects);
        pdf_dict_put(m_ctx, pageObj, PDF_NAME(Resources), resources);

        beforeBuf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(before.constData()),
            static_cast<size_t>(before.size()));
        afterBuf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(after.constData()),
            static_cast<size_t>(after.size()));
        beforeStream = pdf_add_stream(m_ctx, m_doc, beforeBuf, nullptr, 0);
        afterStream = pdf_add_stream(m_ctx, m_doc, afterBuf, nullptr, 0);

        // Contents can be missing, a single stream or an array of streams
        pdf_obj* oldContents = pdf_dict_get(m_ctx, pageObj, PDF_NAME(Contents));
        contents = pdf_new_array(m_ctx, m_doc, 4);
        pdf_array_push(m_ctx, contents, beforeStream);
        if (pdf_is_array(m_ctx, oldContents)) {
            const int numStreams = pdf_array_len(m_ctx, oldContents);
            for (int i = 0; i < numStreams; ++i) {
                pdf_array_push(m_ctx, contents, pdf_array_get(m_ctx, oldContents, i));
            }
        } else if (pdf_is_stream(m_ctx, oldContents)) {
            pdf_array_push(m_ctx, contents, oldContents);
        }
        pdf_array_push(m_ctx, contents, afterStream);
        pdf_dict_put(m_ctx, pageObj, PDF_NAME(Contents), contents);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, contents);
        pdf_drop_obj(m_ctx, afterStream);
        pdf_drop_obj(m_ctx, beforeStream);
        fz_drop_buffer(m_ctx, afterBuf);
        fz_drop_buffer(m_ctx, beforeBuf);
        pdf_drop_obj(m_ctx, xobjects);
        pdf_drop_obj(m_ctx, resources);
    }
    fz_catch(m_ctx) {
        m_lastError = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[DocumentAnnotator] Failed to stamp page" << pageIndex << ":" << m_lastError;
        return false;
    }

    return true;
}

void DocumentAnnotator::cleanup()
{
    if (m_doc) {
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}
