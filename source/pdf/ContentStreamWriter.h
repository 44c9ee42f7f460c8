#pragma once

// ============================================================================
// ContentStreamWriter - Builds PDF page content operators
// ============================================================================
// Produces the raw operator text of a content stream. Numbers are written
// with '.' as decimal separator regardless of the process locale.
// ============================================================================

#include <QByteArray>
#include <QPointF>
#include <QRectF>

class ContentStreamWriter {
public:
    void saveState();                       ///< q
    void restoreState();                    ///< Q

    /// a b c d e f cm
    void concat(qreal a, qreal b, qreal c, qreal d, qreal e, qreal f);

    /// g (non-stroking gray, 0 = black, 1 = white)
    void setFillGray(qreal gray);

    /// x y w h re f
    void fillRect(const QRectF& rect);

    /**
     * @brief Draw one line of text.
     * @param fontResource Resource name without the slash (e.g. "Helv")
     * @param fontSize Size in points
     * @param origin Baseline start
     * @param encoded Text already encoded for the font (WinAnsi bytes)
     */
    void showText(const char* fontResource, qreal fontSize,
                  const QPointF& origin, const QByteArray& encoded);

    /// /Name Do
    void drawXObject(const char* resourceName);

    /**
     * @brief Draw an image XObject into @p rect.
     *
     * Image XObjects occupy the unit square, so the matrix scales it to the
     * rectangle size and translates it to the rectangle origin.
     */
    void drawImage(const char* resourceName, const QRectF& rect);

    void append(const QByteArray& raw);

    const QByteArray& data() const { return m_data; }
    bool isEmpty() const { return m_data.isEmpty(); }

    /**
     * @brief Format a number for a content stream ("12", "0.5", "-3.25").
     *
     * At most four decimals, trailing zeros removed.
     */
    static QByteArray number(qreal value);

    /**
     * @brief Wrap bytes as a PDF literal string, escaping as required.
     *
     * Parentheses and backslashes are escaped; bytes outside printable
     * ASCII are written as three-digit octal escapes.
     */
    static QByteArray literalString(const QByteArray& bytes);

private:
    QByteArray m_data;
};
