// ============================================================================
// PdfSupport - MuPDF plumbing shared by the builder and the annotator
// ============================================================================

#include "PdfSupport.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QCoreApplication>
#include <QDebug>
#include <QSaveFile>

namespace PdfSupport {

QString producerString()
{
    QString version = QCoreApplication::applicationVersion();
    if (version.isEmpty()) {
        version = QStringLiteral("1.0");
    }
    return QStringLiteral("ClassReview %1").arg(version);
}

fz_context* newContext()
{
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        qWarning() << "[PdfSupport] Failed to create MuPDF context";
        return nullptr;
    }

    fz_try(ctx) {
        fz_register_document_handlers(ctx);
    }
    fz_catch(ctx) {
        qWarning() << "[PdfSupport] Failed to register handlers:" << fz_caught_message(ctx);
        fz_drop_context(ctx);
        return nullptr;
    }

    return ctx;
}

pdf_document* newDocument(fz_context* ctx)
{
    if (!ctx) {
        return nullptr;
    }

    pdf_document* doc = nullptr;
    fz_try(ctx) {
        doc = pdf_create_document(ctx);
    }
    fz_catch(ctx) {
        qWarning() << "[PdfSupport] Failed to create output PDF:" << fz_caught_message(ctx);
        return nullptr;
    }
    return doc;
}

bool writeMetadata(fz_context* ctx, pdf_document* doc, const QString& title)
{
    if (!ctx || !doc) {
        return false;
    }

    const QByteArray producer = producerString().toUtf8();
    const QByteArray titleUtf8 = title.toUtf8();

    fz_try(ctx) {
        pdf_obj* trailer = pdf_trailer(ctx, doc);
        pdf_obj* info = pdf_dict_get(ctx, trailer, PDF_NAME(Info));
        if (!info) {
            info = pdf_add_new_dict(ctx, doc, 4);
            pdf_dict_put_drop(ctx, trailer, PDF_NAME(Info), info);
        }

        pdf_dict_put_text_string(ctx, info, PDF_NAME(Producer), producer.constData());
        if (!titleUtf8.isEmpty()) {
            pdf_dict_put_text_string(ctx, info, PDF_NAME(Title), titleUtf8.constData());
        }
    }
    fz_catch(ctx) {
        qWarning() << "[PdfSupport] Failed to write metadata:" << fz_caught_message(ctx);
        return false;
    }

    return true;
}

bool saveToBytes(fz_context* ctx, pdf_document* doc, QByteArray* out, QString* errorMessage)
{
    if (!ctx || !doc || !out) {
        return false;
    }

    fz_buffer* buffer = nullptr;
    fz_output* output = nullptr;
    bool saved = false;

    fz_var(buffer);
    fz_var(output);
    fz_var(saved);

    fz_try(ctx) {
        buffer = fz_new_buffer(ctx, 64 * 1024);
        output = fz_new_output_with_buffer(ctx, buffer);

        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;       // Compress streams
        opts.do_compress_images = 1;
        opts.do_compress_fonts = 1;

        pdf_write_document(ctx, doc, output, &opts);
        fz_close_output(ctx, output);
        saved = true;
    }
    fz_always(ctx) {
        fz_drop_output(ctx, output);
    }
    fz_catch(ctx) {
        if (errorMessage) {
            *errorMessage = QString::fromUtf8(fz_caught_message(ctx));
        }
        qWarning() << "[PdfSupport] Failed to serialize document:" << fz_caught_message(ctx);
        fz_drop_buffer(ctx, buffer);
        return false;
    }

    if (saved) {
        unsigned char* data = nullptr;
        const size_t length = fz_buffer_storage(ctx, buffer, &data);
        *out = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(length));
    }
    fz_drop_buffer(ctx, buffer);
    return saved;
}

bool writeFileAtomically(const QByteArray& data, const QString& path, QString* errorMessage)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        }
        qWarning() << "[PdfSupport] Cannot open" << path << "for writing:" << file.errorString();
        return false;
    }

    if (file.write(data) != data.size()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        }
        qWarning() << "[PdfSupport] Short write to" << path << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        }
        qWarning() << "[PdfSupport] Failed to commit" << path << ":" << file.errorString();
        return false;
    }

    qDebug() << "[PdfSupport] Wrote" << path << "(" << data.size() << "bytes)";
    return true;
}

} // namespace PdfSupport
