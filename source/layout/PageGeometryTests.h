#pragma once

// ============================================================================
// PageGeometryTests - Unit tests for image placement and header layout
// ============================================================================
// Run with: classreview --test-geometry
// ============================================================================

#include "PageGeometry.h"
#include "HeaderLayout.h"
#include "TextWrapperTests.h"

#include <QDebug>
#include <QtMath>

namespace PageGeometryTests {

inline bool fuzzyEqual(qreal a, qreal b)
{
    return qAbs(a - b) < 0.001;
}

inline bool testDrawAreas()
{
    qDebug() << "=== Test: Drawable Areas ===";

    const QRectF band = imageDrawArea(PageGeometry::letterSize(), PlacementVariant::HeaderBand);
    if (band != QRectF(20.0, 0.0, 572.0, 692.0)) {
        qDebug() << "FAIL: header-band area" << band;
        return false;
    }

    const QRectF full = imageDrawArea(PageGeometry::letterSize(), PlacementVariant::FullBleed);
    if (full != QRectF(0.0, 0.0, 612.0, 792.0)) {
        qDebug() << "FAIL: full-bleed area" << full;
        return false;
    }

    qDebug() << "PASS: Drawable areas";
    return true;
}

inline bool testLandscapePlacement()
{
    qDebug() << "=== Test: 800x600 Placement ===";

    // Header band: width-bound, bottom-anchored
    const QRectF bandArea = imageDrawArea(PageGeometry::letterSize(), PlacementVariant::HeaderBand);
    const ScaledPlacement band = computePlacement(QSize(800, 600), bandArea, PlacementVariant::HeaderBand);
    if (!fuzzyEqual(band.scale, 0.715) || !fuzzyEqual(band.rect.width(), 572.0)
        || !fuzzyEqual(band.rect.height(), 429.0) || !fuzzyEqual(band.rect.x(), 20.0)
        || !fuzzyEqual(band.rect.y(), 0.0)) {
        qDebug() << "FAIL: header-band placement" << band.scale << band.rect;
        return false;
    }

    // Full bleed: centered both ways
    const QRectF fullArea = imageDrawArea(PageGeometry::letterSize(), PlacementVariant::FullBleed);
    const ScaledPlacement full = computePlacement(QSize(800, 600), fullArea, PlacementVariant::FullBleed);
    if (!fuzzyEqual(full.rect.width(), 612.0) || !fuzzyEqual(full.rect.height(), 459.0)
        || !fuzzyEqual(full.rect.x(), 0.0) || !fuzzyEqual(full.rect.y(), 166.5)) {
        qDebug() << "FAIL: full-bleed placement" << full.rect;
        return false;
    }

    qDebug() << "PASS: 800x600 placement";
    return true;
}

inline bool testPlacementBounds()
{
    qDebug() << "=== Test: Placement Bounds and Aspect Ratio ===";

    const QList<QSize> sizes = {
        QSize(1, 1), QSize(10000, 10), QSize(10, 10000),
        QSize(3000, 4000), QSize(4000, 3000), QSize(612, 792)
    };
    const QList<PlacementVariant> variants = {
        PlacementVariant::HeaderBand, PlacementVariant::FullBleed
    };

    bool success = true;
    for (PlacementVariant variant : variants) {
        const QRectF area = imageDrawArea(PageGeometry::letterSize(), variant);
        for (const QSize& size : sizes) {
            const ScaledPlacement p = computePlacement(size, area, variant);
            if (!p.isValid()) {
                qDebug() << "FAIL: invalid placement for" << size;
                success = false;
                continue;
            }
            if (p.rect.left() < area.left() - 0.001 || p.rect.right() > area.right() + 0.001
                || p.rect.top() < area.top() - 0.001 || p.rect.bottom() > area.bottom() + 0.001) {
                qDebug() << "FAIL: placement" << p.rect << "outside" << area;
                success = false;
            }
            const qreal expectedRatio = qreal(size.width()) / size.height();
            const qreal ratio = p.rect.width() / p.rect.height();
            if (qAbs(ratio - expectedRatio) > expectedRatio * 1e-6) {
                qDebug() << "FAIL: aspect ratio changed for" << size;
                success = false;
            }
            // One dimension always touches the area
            if (!fuzzyEqual(p.rect.width(), area.width()) && !fuzzyEqual(p.rect.height(), area.height())) {
                qDebug() << "FAIL: placement does not fit the area for" << size;
                success = false;
            }
        }
    }

    if (computePlacement(QSize(0, 10), QRectF(0, 0, 100, 100), PlacementVariant::FullBleed).isValid()) {
        qDebug() << "FAIL: empty image produced a placement";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Placements stay inside the area";
    }
    return success;
}

inline bool testHeaderLayout()
{
    qDebug() << "=== Test: Header Layout ===";

    TextWrapperTests::FixedWidthMeasurer measurer;
    const HeaderLayout layout = HeaderLayout::build(PageGeometry::letterSize(),
                                                    QStringLiteral("A\n\nB"), 2, 5, measurer);

    bool success = true;

    if (layout.band != QRectF(0.0, 692.0, 612.0, 100.0)) {
        qDebug() << "FAIL: band" << layout.band;
        success = false;
    }

    // Gap advances 8pt instead of 15pt
    if (layout.lines.size() != 2
        || layout.lines[0].origin != QPointF(10.0, 772.0)
        || layout.lines[1].origin != QPointF(10.0, 749.0)) {
        qDebug() << "FAIL: line positions";
        success = false;
    }

    if (layout.caption != QStringLiteral("Page 2 of 5")
        || layout.captionOrigin != QPointF(532.0, 777.0)) {
        qDebug() << "FAIL: caption" << layout.caption << layout.captionOrigin;
        success = false;
    }

    const HeaderLayout empty = HeaderLayout::build(PageGeometry::letterSize(), QString(), 1, 1, measurer);
    if (!empty.lines.isEmpty() || empty.caption != QStringLiteral("Page 1 of 1")) {
        qDebug() << "FAIL: empty overlay text drew lines";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Header layout";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running PageGeometry Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testDrawAreas();
    allPass &= testLandscapePlacement();
    allPass &= testPlacementBounds();
    allPass &= testHeaderLayout();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PageGeometryTests
