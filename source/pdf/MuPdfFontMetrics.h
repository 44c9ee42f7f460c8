#pragma once

// ============================================================================
// MuPdfFontMetrics - Helvetica text measurement through MuPDF
// ============================================================================
// Overlay text is set in the standard (non-embedded) Helvetica font with
// WinAnsiEncoding. Widths come from MuPDF's built-in base-14 Helvetica,
// measured on the same WinAnsi-encoded text that is written to the page,
// so wrapped lines match what a viewer renders.
// ============================================================================

#include "../layout/TextWrapper.h"

#include <QByteArray>
#include <QString>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct fz_font;

class MuPdfFontMetrics : public TextMeasurer {
public:
    MuPdfFontMetrics();
    ~MuPdfFontMetrics() override;

    // Disable copy (MuPDF context is not copyable)
    MuPdfFontMetrics(const MuPdfFontMetrics&) = delete;
    MuPdfFontMetrics& operator=(const MuPdfFontMetrics&) = delete;

    /**
     * @brief Check that the font loaded and no measurement has failed.
     *
     * An invalid instance measures every string as zero width.
     */
    bool isValid() const override { return m_ctx != nullptr && m_font != nullptr && !m_failed; }

    qreal textWidth(const QString& text, qreal fontSize) const override;

    /**
     * @brief Encode text as WinAnsi (Windows-1252) bytes.
     *
     * Characters without a WinAnsi code point become '?'. Tabs and other
     * control characters become a space.
     */
    static QByteArray encodeWinAnsi(const QString& text);

    /**
     * @brief Unicode code point for a WinAnsi byte (0 if undefined).
     */
    static uint unicodeForWinAnsi(unsigned char byte);

private:
    fz_context* m_ctx = nullptr;
    fz_font* m_font = nullptr;
    mutable bool m_failed = false;
};
