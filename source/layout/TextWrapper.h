#pragma once

// ============================================================================
// TextWrapper - Greedy word wrapping against measured text width
// ============================================================================
// Used for the overlay text drawn into the page header band. Explicit line
// breaks in the source text are kept as paragraph boundaries; a blank source
// line produces a gap marker (an empty string) instead of a drawn line.
// ============================================================================

#include <QString>
#include <QStringList>

/**
 * @brief Measures rendered text width for a fixed font.
 *
 * The wrapper only needs widths, so the font backend stays behind this
 * interface (see MuPdfFontMetrics for the PDF implementation).
 */
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    /**
     * @brief Width of @p text in points at @p fontSize.
     */
    virtual qreal textWidth(const QString& text, qreal fontSize) const = 0;

    /**
     * @brief False once the backend failed to measure something.
     *
     * Widths returned after a failure are meaningless; callers must not
     * lay out text with them.
     */
    virtual bool isValid() const { return true; }
};

namespace TextWrapper {

/**
 * @brief Check whether a wrapped entry is a paragraph gap marker.
 */
inline bool isGap(const QString& line) { return line.isEmpty(); }

/**
 * @brief Wrap @p text into lines no wider than @p maxWidth.
 * @param text Free-form text, may contain '\n' (and "\r\n") line breaks
 * @param maxWidth Maximum line width in points
 * @param measurer Width measurement for the target font
 * @param fontSize Font size in points
 * @return Ordered lines; empty strings mark paragraph gaps
 *
 * A word that is wider than @p maxWidth on its own is emitted as a single
 * line and is not hyphenated.
 */
QStringList wrap(const QString& text, qreal maxWidth,
                 const TextMeasurer& measurer, qreal fontSize);

} // namespace TextWrapper
