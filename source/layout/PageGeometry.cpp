#include "PageGeometry.h"

#include <QtGlobal>

QRectF imageDrawArea(const QSizeF& pageSize, PlacementVariant variant)
{
    if (variant == PlacementVariant::FullBleed) {
        return QRectF(0.0, 0.0, pageSize.width(), pageSize.height());
    }

    const qreal width = qMax<qreal>(0.0, pageSize.width() - 2.0 * PageGeometry::ImageSideMarginPt);
    const qreal height = qMax<qreal>(0.0, pageSize.height() - PageGeometry::HeaderBandHeightPt);
    return QRectF(PageGeometry::ImageSideMarginPt, 0.0, width, height);
}

ScaledPlacement computePlacement(const QSize& imageSizePx, const QRectF& drawable,
                                 PlacementVariant variant)
{
    ScaledPlacement placement;

    if (imageSizePx.width() <= 0 || imageSizePx.height() <= 0 || drawable.isEmpty()) {
        return placement;
    }

    const qreal widthScale = drawable.width() / imageSizePx.width();
    const qreal heightScale = drawable.height() / imageSizePx.height();
    placement.scale = qMin(widthScale, heightScale);

    const qreal scaledWidth = imageSizePx.width() * placement.scale;
    const qreal scaledHeight = imageSizePx.height() * placement.scale;

    const qreal x = drawable.left() + (drawable.width() - scaledWidth) / 2.0;
    qreal y = drawable.top();  // QRectF::top() is the smallest y, i.e. the PDF bottom
    if (variant == PlacementVariant::FullBleed) {
        y += (drawable.height() - scaledHeight) / 2.0;
    }

    placement.rect = QRectF(x, y, scaledWidth, scaledHeight);
    return placement;
}
