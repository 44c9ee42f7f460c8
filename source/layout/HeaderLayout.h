#pragma once

// ============================================================================
// HeaderLayout - Positions of everything drawn in the header band
// ============================================================================
// Pure layout: wraps the overlay text and walks a vertical cursor down from
// the top of the page. The PDF compositor only turns the result into
// content-stream operators.
// ============================================================================

#include "PageGeometry.h"

#include <QPointF>
#include <QString>
#include <QVector>

class TextMeasurer;

/**
 * @brief One line of overlay text with its baseline origin.
 */
struct PlacedLine {
    QString text;
    QPointF origin;     ///< Baseline start, PDF coordinates
};

/**
 * @brief Layout of a header band for one page.
 */
struct HeaderLayout {
    QRectF band;                ///< Filled band rectangle, PDF coordinates
    QVector<PlacedLine> lines;  ///< Drawn overlay lines (gaps are not listed)
    QString caption;            ///< "Page i of N"
    QPointF captionOrigin;      ///< Caption baseline start
    qreal cursorEndY = 0.0;     ///< Vertical cursor after the last entry

    /**
     * @brief Build the layout for a page.
     * @param pageSize Page size in points
     * @param overlayText Text to wrap (may be empty)
     * @param pageNumber 1-based page number
     * @param pageCount Total pages in the document
     * @param measurer Width measurement for the body font
     */
    static HeaderLayout build(const QSizeF& pageSize, const QString& overlayText,
                              int pageNumber, int pageCount,
                              const TextMeasurer& measurer);

    /**
     * @brief Format the page caption, e.g. "Page 2 of 5".
     */
    static QString captionText(int pageNumber, int pageCount);
};
