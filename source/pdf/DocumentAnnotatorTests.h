#pragma once

// ============================================================================
// DocumentAnnotatorTests - Tests for stamping the header band onto PDFs
// ============================================================================
// Run with: classreview --test-annotator
//
// Source documents are produced with DocumentBuilder so the tests need no
// checked-in fixtures.
// ============================================================================

#include "DocumentAnnotator.h"
#include "DocumentBuilderTests.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFile>
#include <QTemporaryDir>

namespace DocumentAnnotatorTests {

/// Build a source PDF with @p pages pages (full bleed unless told otherwise).
inline QByteArray makeSourcePdf(const QTemporaryDir& dir, int pages,
                                PlacementVariant variant = PlacementVariant::FullBleed,
                                const QString& text = QString())
{
    QStringList images;
    for (int i = 0; i < pages; ++i) {
        images << DocumentBuilderTests::writeImage(dir, QStringLiteral("src%1.png").arg(i),
                                                   QSize(200 + 10 * i, 300), Qt::gray);
    }

    DeckBuildOptions options;
    options.variant = variant;
    options.overlayText = text;

    DocumentBuilder builder;
    return builder.build(images, options).pdfData;
}

/**
 * @brief Rewrite every page of @p pdf as other producers lay pages out.
 * @param rotate /Rotate value (0 leaves it unset)
 * @param cropBox CropBox in user space (null leaves it unset)
 * @param addAnnotation Add one Square annotation to each page
 * @return The edited PDF, or empty bytes on failure
 */
inline QByteArray reshapePages(const QByteArray& pdf, int rotate, const QRectF& cropBox,
                               bool addAnnotation)
{
    fz_context* ctx = PdfSupport::newContext();
    if (!ctx) {
        return QByteArray();
    }

    const fz_rect crop = fz_make_rect(static_cast<float>(cropBox.left()),
                                      static_cast<float>(cropBox.top()),
                                      static_cast<float>(cropBox.right()),
                                      static_cast<float>(cropBox.bottom()));
    const bool setCrop = !cropBox.isNull();

    fz_stream* stream = nullptr;
    pdf_document* doc = nullptr;
    pdf_obj* annot = nullptr;
    bool edited = false;

    fz_var(stream);
    fz_var(doc);
    fz_var(annot);
    fz_var(edited);

    fz_try(ctx) {
        stream = fz_open_memory(ctx, reinterpret_cast<const unsigned char*>(pdf.constData()),
                                static_cast<size_t>(pdf.size()));
        doc = pdf_open_document_with_stream(ctx, stream);

        const int pages = pdf_count_pages(ctx, doc);
        for (int i = 0; i < pages; ++i) {
            pdf_obj* pageObj = pdf_lookup_page_obj(ctx, doc, i);
            if (rotate != 0) {
                pdf_dict_put_int(ctx, pageObj, PDF_NAME(Rotate), rotate);
            }
            if (setCrop) {
                pdf_dict_put_rect(ctx, pageObj, PDF_NAME(CropBox), crop);
            }
            if (addAnnotation) {
                annot = pdf_add_new_dict(ctx, doc, 4);
                pdf_dict_put(ctx, annot, PDF_NAME(Type), PDF_NAME(Annot));
                pdf_dict_put(ctx, annot, PDF_NAME(Subtype), PDF_NAME(Square));
                pdf_dict_put_rect(ctx, annot, PDF_NAME(Rect), fz_make_rect(100, 100, 200, 200));
                pdf_obj* annots = pdf_dict_put_array(ctx, pageObj, PDF_NAME(Annots), 1);
                pdf_array_push(ctx, annots, annot);
                pdf_drop_obj(ctx, annot);
                annot = nullptr;
            }
        }
        edited = true;
    }
    fz_always(ctx) {
        fz_drop_stream(ctx, stream);
    }
    fz_catch(ctx) {
        pdf_drop_obj(ctx, annot);
        qDebug() << "reshapePages failed:" << fz_caught_message(ctx);
    }

    QByteArray out;
    if (edited && !PdfSupport::saveToBytes(ctx, doc, &out, nullptr)) {
        out.clear();
    }
    pdf_drop_document(ctx, doc);
    fz_drop_context(ctx);
    return out;
}

inline bool testPageCountPreserved()
{
    qDebug() << "=== Test: Annotation Preserves Page Count ===";

    QTemporaryDir dir;
    const QByteArray source = makeSourcePdf(dir, 3);
    if (source.isEmpty()) {
        qDebug() << "FAIL: could not build source document";
        return false;
    }

    DocumentAnnotator annotator;
    const AnnotateResult result = annotator.annotate(source, QStringLiteral("Hello class"));
    if (!result.success) {
        qDebug() << "FAIL: annotate failed:" << result.errorMessage;
        return false;
    }

    bool success = true;
    PdfInspector pdf(result.pdfData);
    if (result.pagesAnnotated != 3 || pdf.pageCount() != 3) {
        qDebug() << "FAIL: page count" << result.pagesAnnotated << pdf.pageCount();
        return false;
    }

    for (int i = 0; i < 3; ++i) {
        const QString text = pdf.pageText(i);
        // The caption counts pages of the source document
        if (!text.contains(QStringLiteral("Hello class"))
            || !text.contains(QStringLiteral("Page %1 of 3").arg(i + 1))) {
            qDebug() << "FAIL: page" << i << "text" << text;
            success = false;
        }
        if (pdf.pageSize(i) != QSizeF(612, 792)) {
            qDebug() << "FAIL: page" << i << "size" << pdf.pageSize(i);
            success = false;
        }
    }

    // The input bytes are only read
    if (PdfInspector(source).pageText(0).contains(QStringLiteral("Hello class"))) {
        qDebug() << "FAIL: source document changed";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Page count preserved";
    }
    return success;
}

inline bool testOriginalContentKept()
{
    qDebug() << "=== Test: Original Page Content Is Kept ===";

    QTemporaryDir dir;
    const QByteArray source = makeSourcePdf(dir, 2, PlacementVariant::HeaderBand,
                                            QStringLiteral("Original body"));
    if (source.isEmpty()) {
        qDebug() << "FAIL: could not build source document";
        return false;
    }

    DocumentAnnotator annotator;
    const AnnotateResult result = annotator.annotate(source, QStringLiteral("Hello class"));
    if (!result.success) {
        qDebug() << "FAIL: annotate failed:" << result.errorMessage;
        return false;
    }

    bool success = true;
    PdfInspector pdf(result.pdfData);
    for (int i = 0; i < 2; ++i) {
        const QString text = pdf.pageText(i);
        if (!text.contains(QStringLiteral("Original body")) || !text.contains(QStringLiteral("Hello class"))) {
            qDebug() << "FAIL: page" << i << "text" << text;
            success = false;
        }

        // The source photo is still placed on the page
        const QVector<QSize> expected{QSize(200 + 10 * i, 300)};
        if (pdf.imageSizes(i) != expected) {
            qDebug() << "FAIL: page" << i << "images" << pdf.imageSizes(i);
            success = false;
        }
    }

    if (success) {
        qDebug() << "PASS: Original content kept";
    }
    return success;
}

inline bool testAnnotationsPreserved()
{
    qDebug() << "=== Test: Page Annotations Survive ===";

    QTemporaryDir dir;
    const QByteArray source = reshapePages(makeSourcePdf(dir, 2), 0, QRectF(), true);
    if (PdfInspector(source).annotationCount(1) != 1) {
        qDebug() << "FAIL: could not build annotated source document";
        return false;
    }

    DocumentAnnotator annotator;
    const AnnotateResult result = annotator.annotate(source, QStringLiteral("Hello class"));
    if (!result.success) {
        qDebug() << "FAIL: annotate failed:" << result.errorMessage;
        return false;
    }

    bool success = true;
    PdfInspector pdf(result.pdfData);
    for (int i = 0; i < 2; ++i) {
        if (pdf.annotationCount(i) != 1) {
            qDebug() << "FAIL: page" << i << "has" << pdf.annotationCount(i) << "annotations";
            success = false;
        }
    }

    if (success) {
        qDebug() << "PASS: Annotations survive";
    }
    return success;
}

inline bool testRotatedPage()
{
    qDebug() << "=== Test: Header Band On A Rotated Page ===";

    QTemporaryDir dir;
    const QByteArray source = reshapePages(makeSourcePdf(dir, 1), 90, QRectF(), false);
    if (PdfInspector(source).pageSize(0) != QSizeF(792, 612)) {
        qDebug() << "FAIL: could not build rotated source document";
        return false;
    }

    DocumentAnnotator annotator;
    const AnnotateResult result = annotator.annotate(source, QStringLiteral("Hello class"));
    if (!result.success) {
        qDebug() << "FAIL: annotate failed:" << result.errorMessage;
        return false;
    }

    bool success = true;
    PdfInspector pdf(result.pdfData);
    if (pdf.pageSize(0) != QSizeF(792, 612)) {
        qDebug() << "FAIL: displayed size" << pdf.pageSize(0);
        success = false;
    }

    // The caption starts 80pt from the right edge of the landscape page and
    // sits on a baseline 15pt below its top
    const QRectF caption = pdf.textBounds(0, QStringLiteral("Page 1 of 1"));
    if (caption.isNull() || caption.left() < 705 || caption.left() > 720 || caption.bottom() > 30) {
        qDebug() << "FAIL: caption at" << caption;
        success = false;
    }
    if (caption.width() <= caption.height()) {
        qDebug() << "FAIL: caption is not upright:" << caption;
        success = false;
    }

    const QRectF body = pdf.textBounds(0, QStringLiteral("Hello class"));
    if (body.isNull() || body.left() > 20 || body.top() > 60) {
        qDebug() << "FAIL: overlay text at" << body;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Rotated page";
    }
    return success;
}

inline bool testCropBoxOrigin()
{
    qDebug() << "=== Test: Header Band On A Cropped Page ===";

    QTemporaryDir dir;
    const QByteArray source = reshapePages(makeSourcePdf(dir, 1), 0, QRectF(50, 50, 512, 692), false);
    if (PdfInspector(source).pageSize(0) != QSizeF(512, 692)) {
        qDebug() << "FAIL: could not build cropped source document";
        return false;
    }

    DocumentAnnotator annotator;
    const AnnotateResult result = annotator.annotate(source, QStringLiteral("Hello class"));
    if (!result.success) {
        qDebug() << "FAIL: annotate failed:" << result.errorMessage;
        return false;
    }

    bool success = true;
    PdfInspector pdf(result.pdfData);
    if (pdf.pageSize(0) != QSizeF(512, 692)) {
        qDebug() << "FAIL: displayed size" << pdf.pageSize(0);
        success = false;
    }

    const QRectF caption = pdf.textBounds(0, QStringLiteral("Page 1 of 1"));
    if (caption.isNull() || caption.left() < 425 || caption.left() > 440 || caption.bottom() > 30) {
        qDebug() << "FAIL: caption at" << caption;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Cropped page";
    }
    return success;
}

inline bool testInvalidInput()
{
    qDebug() << "=== Test: Invalid Input Is A Format Error ===";

    DocumentAnnotator annotator;
    bool success = true;

    const AnnotateResult empty = annotator.annotate(QByteArray(), QStringLiteral("x"));
    if (empty.success || empty.error != ErrorKind::Format) {
        qDebug() << "FAIL: empty input";
        success = false;
    }

    const AnnotateResult garbage = annotator.annotate(QByteArray("this is plain text"), QStringLiteral("x"));
    if (garbage.success || garbage.error != ErrorKind::Format || !garbage.pdfData.isEmpty()) {
        qDebug() << "FAIL: plain text accepted, kind" << errorKindName(garbage.error);
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Invalid input rejected";
    }
    return success;
}

inline bool testFileHandling()
{
    qDebug() << "=== Test: Annotate Files ===";

    QTemporaryDir dir;
    const QString input = dir.filePath("week1.pdf");
    QFile file(input);
    if (!file.open(QIODevice::WriteOnly)) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }
    file.write(makeSourcePdf(dir, 2));
    file.close();

    DocumentAnnotator annotator;
    bool success = true;

    const AnnotateResult same = annotator.annotateFile(input, input, QStringLiteral("x"));
    if (same.success || same.error != ErrorKind::InvalidInput) {
        qDebug() << "FAIL: in-place annotation allowed";
        success = false;
    }

    const AnnotateResult noDir = annotator.annotateFile(input, dir.filePath("missing/week1.pdf"),
                                                        QStringLiteral("x"));
    if (noDir.success || noDir.error != ErrorKind::Io) {
        qDebug() << "FAIL: write into missing directory, kind" << errorKindName(noDir.error);
        success = false;
    }

    const QString output = dir.filePath("week1-stamped.pdf");
    const AnnotateResult ok = annotator.annotateFile(input, output, QStringLiteral("Maple Street"));
    if (!ok.success || !QFile::exists(output) || ok.fileSizeBytes <= 0) {
        qDebug() << "FAIL: annotateFile" << ok.errorMessage;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Annotate files";
    }
    return success;
}

inline bool testRotationMatrices()
{
    qDebug() << "=== Test: Rotation Matrices ===";

    const qreal w = 612.0;
    const qreal h = 792.0;
    bool success = true;

    for (int rotation : {0, 90, 180, 270, -90, 450}) {
        qreal m[6];
        DocumentAnnotator::rotationMatrix(rotation, w, h, m);

        const int normalized = DocumentAnnotator::normalizeRotation(rotation);
        const bool quarter = (normalized == 90 || normalized == 270);
        const qreal displayedW = quarter ? h : w;
        const qreal displayedH = quarter ? w : h;

        // Every corner of the box lands on a corner of the displayed page
        const QPointF corners[] = {QPointF(0, 0), QPointF(w, 0), QPointF(0, h), QPointF(w, h)};
        for (const QPointF& p : corners) {
            const qreal x = m[0] * p.x() + m[2] * p.y() + m[4];
            const qreal y = m[1] * p.x() + m[3] * p.y() + m[5];
            const bool onCornerX = qFuzzyIsNull(x) || qFuzzyCompare(x, displayedW);
            const bool onCornerY = qFuzzyIsNull(y) || qFuzzyCompare(y, displayedH);
            if (!onCornerX || !onCornerY) {
                qDebug() << "FAIL: rotation" << rotation << "maps" << p << "to" << x << y;
                success = false;
            }
        }
    }

    // Known interior points of a 612x792 box for each quarter turn
    struct Case { int rotation; QPointF from; QPointF to; };
    const Case cases[] = {
        {90, QPointF(10, 772), QPointF(772, 602)},
        {180, QPointF(10, 20), QPointF(602, 772)},
        {270, QPointF(10, 20), QPointF(772, 10)},
    };
    for (const Case& c : cases) {
        qreal m[6];
        DocumentAnnotator::rotationMatrix(c.rotation, w, h, m);
        const QPointF mapped(m[0] * c.from.x() + m[2] * c.from.y() + m[4],
                             m[1] * c.from.x() + m[3] * c.from.y() + m[5]);
        if (mapped != c.to) {
            qDebug() << "FAIL: rotation" << c.rotation << "maps" << c.from << "to" << mapped;
            success = false;
        }

        // The overlay transform takes the displayed point back, here with a
        // crop box starting at (50, 50)
        qreal back[6];
        DocumentAnnotator::overlayMatrix(c.rotation, QRectF(50, 50, w, h), back);
        const QPointF source(back[0] * c.to.x() + back[2] * c.to.y() + back[4],
                             back[1] * c.to.x() + back[3] * c.to.y() + back[5]);
        if (!qFuzzyCompare(source.x(), c.from.x() + 50) || !qFuzzyCompare(source.y(), c.from.y() + 50)) {
            qDebug() << "FAIL: overlay for rotation" << c.rotation << "maps" << c.to << "to" << source;
            success = false;
        }
    }

    if (DocumentAnnotator::normalizeRotation(-90) != 270 || DocumentAnnotator::normalizeRotation(450) != 90) {
        qDebug() << "FAIL: normalizeRotation";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Rotation matrices";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running DocumentAnnotator Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testPageCountPreserved();
    allPass &= testOriginalContentKept();
    allPass &= testAnnotationsPreserved();
    allPass &= testRotatedPage();
    allPass &= testCropBoxOrigin();
    allPass &= testInvalidInput();
    allPass &= testFileHandling();
    allPass &= testRotationMatrices();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace DocumentAnnotatorTests
