#pragma once

// ============================================================================
// DocumentBuilderTests - End-to-end tests for building PDFs from images
// ============================================================================
// Run with: classreview --test-builder
//
// Fixtures are generated into a temporary directory; results are read back
// through PdfInspector.
// ============================================================================

#include "DocumentBuilder.h"
#include "ContentStreamWriter.h"
#include "MuPdfFontMetrics.h"
#include "PageCompositor.h"
#include "PdfInspector.h"
#include "PdfSupport.h"
#include "../images/ImageSource.h"
#include "../layout/HeaderLayout.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFile>
#include <QImage>
#include <QTemporaryDir>

namespace DocumentBuilderTests {

/// Write a solid-color PNG and return its path (empty on failure).
inline QString writeImage(const QTemporaryDir& dir, const QString& name,
                          const QSize& size, const QColor& color)
{
    QImage image(size, QImage::Format_RGB888);
    image.fill(color);
    const QString path = dir.filePath(name);
    return image.save(path, "PNG") ? path : QString();
}

inline bool testContentStreamFormatting()
{
    qDebug() << "=== Test: Content Stream Formatting ===";

    bool success = true;

    if (ContentStreamWriter::number(12.0) != "12" || ContentStreamWriter::number(0.715) != "0.715"
        || ContentStreamWriter::number(-0.5) != "-0.5" || ContentStreamWriter::number(166.49999999) != "166.5") {
        qDebug() << "FAIL: number formatting";
        success = false;
    }

    if (ContentStreamWriter::literalString("a(b)\\") != "(a\\(b\\)\\\\)"
        || ContentStreamWriter::literalString("\xE9") != "(\\351)") {
        qDebug() << "FAIL: string escaping";
        success = false;
    }

    ContentStreamWriter writer;
    writer.drawImage("Img0", QRectF(20, 0, 572, 429));
    if (writer.data() != "q\n572 0 0 429 20 0 cm\n/Img0 Do\nQ\n") {
        qDebug() << "FAIL: image operators" << writer.data();
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Content stream formatting";
    }
    return success;
}

inline bool testSingleImageHeaderBand()
{
    qDebug() << "=== Test: One Image With Header Band ===";

    QTemporaryDir dir;
    const QString image = writeImage(dir, "board.png", QSize(800, 600), Qt::darkGreen);
    if (image.isEmpty()) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }

    DeckBuildOptions options;
    options.overlayText = QStringLiteral("Welcome to Maple Street");
    options.variant = PlacementVariant::HeaderBand;
    options.title = QStringLiteral("2024-03-01_classreview_Maple Street_7");

    DocumentBuilder builder;
    const DeckBuildResult result = builder.build({image}, options);
    if (!result.success) {
        qDebug() << "FAIL: build failed:" << result.errorMessage;
        return false;
    }

    bool success = true;
    if (result.pagesBuilt != 1) {
        qDebug() << "FAIL: pagesBuilt" << result.pagesBuilt;
        success = false;
    }

    PdfInspector pdf(result.pdfData);
    if (!pdf.isValid() || pdf.pageCount() != 1) {
        qDebug() << "FAIL: page count" << pdf.pageCount() << pdf.errorMessage();
        return false;
    }

    if (pdf.pageSize(0) != QSizeF(612, 792)) {
        qDebug() << "FAIL: page size" << pdf.pageSize(0);
        success = false;
    }

    const QVector<QSize> images = pdf.imageSizes(0);
    if (images.size() != 1 || images.first() != QSize(800, 600)) {
        qDebug() << "FAIL: placed images" << images;
        success = false;
    }

    const QString text = pdf.pageText(0);
    if (!text.contains(QStringLiteral("Welcome to Maple Street")) || !text.contains(QStringLiteral("Page 1 of 1"))) {
        qDebug() << "FAIL: page text" << text;
        success = false;
    }

    // Image area below the band is 692pt high; the text takes one line
    MuPdfFontMetrics metrics;
    const HeaderLayout layout = HeaderLayout::build(PageGeometry::letterSize(), options.overlayText,
                                                    1, 1, metrics);
    if (imageDrawArea(PageGeometry::letterSize(), PlacementVariant::HeaderBand).height() != 692.0
        || layout.lines.size() != 1) {
        qDebug() << "FAIL: header layout has" << layout.lines.size() << "lines";
        success = false;
    }

    if (!pdf.metadata("info:Producer").startsWith(QStringLiteral("ClassReview"))
        || pdf.metadata("info:Title") != options.title) {
        qDebug() << "FAIL: metadata" << pdf.metadata("info:Producer") << pdf.metadata("info:Title");
        success = false;
    }

    if (success) {
        qDebug() << "PASS: One image with header band";
    }
    return success;
}

inline bool testTwoImagesFullBleed()
{
    qDebug() << "=== Test: Two Images Full Bleed ===";

    QTemporaryDir dir;
    const QString first = writeImage(dir, "first.png", QSize(800, 600), Qt::red);
    const QString second = writeImage(dir, "second.png", QSize(300, 500), Qt::blue);

    DeckBuildOptions options;
    options.variant = PlacementVariant::FullBleed;

    DocumentBuilder builder;
    int progressCalls = 0;
    QObject::connect(&builder, &DocumentBuilder::progressUpdated,
                     [&progressCalls](int, int) { ++progressCalls; });

    const DeckBuildResult result = builder.build({first, second}, options);
    if (!result.success) {
        qDebug() << "FAIL: build failed:" << result.errorMessage;
        return false;
    }

    PdfInspector pdf(result.pdfData);
    bool success = true;

    if (pdf.pageCount() != 2 || progressCalls != 2) {
        qDebug() << "FAIL: pages" << pdf.pageCount() << "progress" << progressCalls;
        return false;
    }

    // Deck order is page order
    if (pdf.imageSizes(0) != QVector<QSize>{QSize(800, 600)}
        || pdf.imageSizes(1) != QVector<QSize>{QSize(300, 500)}) {
        qDebug() << "FAIL: image order";
        success = false;
    }

    for (int i = 0; i < 2; ++i) {
        if (!pdf.pageText(i).trimmed().isEmpty()) {
            qDebug() << "FAIL: full-bleed page" << i << "has text:" << pdf.pageText(i);
            success = false;
        }
    }

    if (success) {
        qDebug() << "PASS: Two images full bleed";
    }
    return success;
}

inline bool testBadImageAborts()
{
    qDebug() << "=== Test: Undecodable Image Aborts The Build ===";

    QTemporaryDir dir;
    const QString good = writeImage(dir, "good.png", QSize(100, 100), Qt::white);
    const QString bad = dir.filePath("bad.jpg");
    QFile file(bad);
    if (!file.open(QIODevice::WriteOnly)) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }
    file.write("not a jpeg");
    file.close();

    const QString output = dir.filePath("out.pdf");
    DocumentBuilder builder;
    const DeckBuildResult result = builder.buildToFile({good, bad}, DeckBuildOptions(), output);

    bool success = true;
    if (result.success || result.error != ErrorKind::Io) {
        qDebug() << "FAIL: expected an I/O error, got" << errorKindName(result.error);
        success = false;
    }
    if (QFile::exists(output)) {
        qDebug() << "FAIL: partial output was written";
        success = false;
    }

    const DeckBuildResult empty = builder.build(QStringList(), DeckBuildOptions());
    if (empty.success || empty.error != ErrorKind::InvalidInput) {
        qDebug() << "FAIL: empty deck accepted";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Bad image aborts with nothing written";
    }
    return success;
}

inline bool testMeasurementFailureRejectsPage()
{
    qDebug() << "=== Test: Failed Text Measurement Rejects The Page ===";

    // Reports every width as zero and then admits the failure
    class FailingMeasurer : public TextMeasurer {
    public:
        qreal textWidth(const QString&, qreal) const override
        {
            m_failed = true;
            return 0.0;
        }
        bool isValid() const override { return !m_failed; }

    private:
        mutable bool m_failed = false;
    };

    QTemporaryDir dir;
    ImageSource image(writeImage(dir, "photo.png", QSize(120, 80), Qt::blue));
    if (!image.load()) {
        qDebug() << "FAIL: could not load fixture";
        return false;
    }

    fz_context* ctx = PdfSupport::newContext();
    pdf_document* doc = ctx ? PdfSupport::newDocument(ctx) : nullptr;
    if (!doc) {
        qDebug() << "FAIL: could not create a PDF document";
        if (ctx) {
            fz_drop_context(ctx);
        }
        return false;
    }

    bool success = true;
    {
        FailingMeasurer measurer;
        PageCompositor compositor(ctx, doc, measurer);

        PageSpec page;
        page.overlayText = QStringLiteral("Welcome to Maple Street");

        if (compositor.appendImagePage(page, image)) {
            qDebug() << "FAIL: header page composed with broken metrics";
            success = false;
        } else if (!compositor.lastError().contains(QStringLiteral("measure"))) {
            qDebug() << "FAIL: unexpected error" << compositor.lastError();
            success = false;
        }

        pdf_obj* form = compositor.createOverlayForm(page, QSizeF(612, 792));
        if (form) {
            qDebug() << "FAIL: overlay created with broken metrics";
            pdf_drop_obj(ctx, form);
            success = false;
        }

        if (pdf_count_pages(ctx, doc) != 0) {
            qDebug() << "FAIL: a page was added";
            success = false;
        }
    }

    pdf_drop_document(ctx, doc);
    fz_drop_context(ctx);

    if (success) {
        qDebug() << "PASS: Failed measurement rejects the page";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running DocumentBuilder Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testContentStreamFormatting();
    allPass &= testSingleImageHeaderBand();
    allPass &= testTwoImagesFullBleed();
    allPass &= testBadImageAborts();
    allPass &= testMeasurementFailureRejectsPage();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace DocumentBuilderTests
