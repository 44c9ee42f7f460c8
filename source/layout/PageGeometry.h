#pragma once

// ============================================================================
// PageGeometry - Fixed page geometry and image placement
// ============================================================================
// All values are PDF points (1/72 inch) with the PDF convention of a
// bottom-left origin. The constants are part of the output contract:
// changing any of them changes the produced documents byte-for-byte.
// ============================================================================

#include <QRectF>
#include <QSize>
#include <QSizeF>

namespace PageGeometry {

constexpr qreal PageWidthPt = 612.0;        ///< US Letter width
constexpr qreal PageHeightPt = 792.0;       ///< US Letter height
constexpr qreal HeaderBandHeightPt = 100.0; ///< Reserved band at the top of the page

constexpr qreal BodyFontSizePt = 12.0;
constexpr qreal CaptionFontSizePt = 8.0;

constexpr qreal TextLeftMarginPt = 10.0;    ///< Left edge of overlay lines
constexpr qreal TextTopOffsetPt = 20.0;     ///< First baseline, below the page top
constexpr qreal LinePitchPt = 15.0;         ///< Advance after a drawn line
constexpr qreal BlankLinePitchPt = 8.0;     ///< Advance for a paragraph gap

constexpr qreal CaptionRightOffsetPt = 80.0; ///< Caption start, from the right edge
constexpr qreal CaptionTopOffsetPt = 15.0;   ///< Caption baseline, below the page top

constexpr qreal ImageSideMarginPt = 20.0;   ///< Per side, header-band variant only

constexpr int JpegQuality = 95;

inline QSizeF letterSize() { return QSizeF(PageWidthPt, PageHeightPt); }

} // namespace PageGeometry

/**
 * @brief How a page is divided between overlay and image.
 */
enum class PlacementVariant {
    HeaderBand,     ///< Band + text at the top, image below it (bottom-anchored)
    FullBleed       ///< Image centered on the whole page, no band, no text
};

/**
 * @brief Size and position of an image scaled into a drawable rectangle.
 */
struct ScaledPlacement {
    qreal scale = 0.0;  ///< Uniform scale factor (points per pixel)
    QRectF rect;        ///< Placed image rectangle, PDF coordinates

    bool isValid() const { return scale > 0.0 && !rect.isEmpty(); }
};

/**
 * @brief Rectangle available to the image on a page.
 *
 * Header-band variant: the page minus the top band, with ImageSideMarginPt
 * removed on the left and right. Full-bleed variant: the whole page.
 */
QRectF imageDrawArea(const QSizeF& pageSize, PlacementVariant variant);

/**
 * @brief Fit an image into a drawable rectangle without cropping or distortion.
 * @param imageSizePx Decoded image size in pixels
 * @param drawable Target rectangle (PDF coordinates)
 * @param variant HeaderBand anchors at the bottom of @p drawable, FullBleed
 *                centers vertically. Both center horizontally.
 * @return Invalid placement (scale 0) if the image or rectangle is empty.
 *
 * scale = min(drawable.width / image.width, drawable.height / image.height)
 */
ScaledPlacement computePlacement(const QSize& imageSizePx, const QRectF& drawable,
                                 PlacementVariant variant);
