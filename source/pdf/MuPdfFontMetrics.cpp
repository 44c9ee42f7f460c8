// ============================================================================
// MuPdfFontMetrics - Helvetica text measurement through MuPDF
// ============================================================================

#include "MuPdfFontMetrics.h"

#include <mupdf/fitz.h>

#include <QDebug>
#include <QVector>

namespace {

// Windows-1252 code points 0x80-0x9F; zero marks an undefined slot
const uint kWinAnsiHighTable[32] = {
    0x20AC, 0x0000, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x0000, 0x017D, 0x0000,
    0x0000, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x0000, 0x017E, 0x0178
};

char winAnsiByte(uint codePoint)
{
    if (codePoint == '\t' || codePoint == '\n' || codePoint == '\r') {
        return ' ';
    }
    if (codePoint < 0x20 || codePoint == 0x7F) {
        return ' ';
    }
    if (codePoint < 0x80) {
        return static_cast<char>(codePoint);
    }
    if (codePoint >= 0xA0 && codePoint <= 0xFF) {
        return static_cast<char>(codePoint);
    }
    for (int i = 0; i < 32; ++i) {
        if (kWinAnsiHighTable[i] != 0 && kWinAnsiHighTable[i] == codePoint) {
            return static_cast<char>(0x80 + i);
        }
    }
    return '?';
}

} // namespace

MuPdfFontMetrics::MuPdfFontMetrics()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfFontMetrics] Failed to create MuPDF context";
        return;
    }

    fz_try(m_ctx) {
        m_font = fz_new_base14_font(m_ctx, "Helvetica");
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfFontMetrics] Failed to load Helvetica:" << fz_caught_message(m_ctx);
        m_font = nullptr;
    }
}

MuPdfFontMetrics::~MuPdfFontMetrics()
{
    if (m_font) {
        fz_drop_font(m_ctx, m_font);
        m_font = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

qreal MuPdfFontMetrics::textWidth(const QString& text, qreal fontSize) const
{
    if (!isValid() || text.isEmpty()) {
        return 0.0;
    }

    const QByteArray encoded = encodeWinAnsi(text);
    float units = 0.0f;

    fz_try(m_ctx) {
        for (const char ch : encoded) {
            const uint unicode = unicodeForWinAnsi(static_cast<unsigned char>(ch));
            const int glyph = fz_encode_character(m_ctx, m_font, static_cast<int>(unicode));
            units += fz_advance_glyph(m_ctx, m_font, glyph, 0);
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfFontMetrics] Measurement failed:" << fz_caught_message(m_ctx);
        m_failed = true;
        return 0.0;
    }

    return static_cast<qreal>(units) * fontSize;
}

QByteArray MuPdfFontMetrics::encodeWinAnsi(const QString& text)
{
    QByteArray out;
    out.reserve(text.size());

    const QVector<uint> codePoints = text.toUcs4();
    for (const uint codePoint : codePoints) {
        out.append(winAnsiByte(codePoint));
    }
    return out;
}

uint MuPdfFontMetrics::unicodeForWinAnsi(unsigned char byte)
{
    if (byte >= 0x80 && byte <= 0x9F) {
        return kWinAnsiHighTable[byte - 0x80];
    }
    return byte;
}
