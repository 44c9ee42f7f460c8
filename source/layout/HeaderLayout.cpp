#include "HeaderLayout.h"
#include "TextWrapper.h"

HeaderLayout HeaderLayout::build(const QSizeF& pageSize, const QString& overlayText,
                                 int pageNumber, int pageCount,
                                 const TextMeasurer& measurer)
{
    using namespace PageGeometry;

    HeaderLayout layout;
    const qreal pageWidth = pageSize.width();
    const qreal pageHeight = pageSize.height();

    layout.band = QRectF(0.0, pageHeight - HeaderBandHeightPt, pageWidth, HeaderBandHeightPt);

    const qreal maxWidth = pageWidth - 2.0 * TextLeftMarginPt;
    const QStringList wrapped = TextWrapper::wrap(overlayText, maxWidth, measurer, BodyFontSizePt);

    qreal y = pageHeight - TextTopOffsetPt;
    for (const QString& line : wrapped) {
        if (TextWrapper::isGap(line)) {
            y -= BlankLinePitchPt;
        } else {
            layout.lines.append({line, QPointF(TextLeftMarginPt, y)});
            y -= LinePitchPt;
        }
    }
    layout.cursorEndY = y;

    layout.caption = captionText(pageNumber, pageCount);
    layout.captionOrigin = QPointF(pageWidth - CaptionRightOffsetPt, pageHeight - CaptionTopOffsetPt);

    return layout;
}

QString HeaderLayout::captionText(int pageNumber, int pageCount)
{
    return QStringLiteral("Page %1 of %2").arg(pageNumber).arg(pageCount);
}
