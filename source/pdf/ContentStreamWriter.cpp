// ============================================================================
// ContentStreamWriter - Builds PDF page content operators
// ============================================================================

#include "ContentStreamWriter.h"

#include <QtMath>

void ContentStreamWriter::saveState()
{
    m_data.append("q\n");
}

void ContentStreamWriter::restoreState()
{
    m_data.append("Q\n");
}

void ContentStreamWriter::concat(qreal a, qreal b, qreal c, qreal d, qreal e, qreal f)
{
    m_data.append(number(a)).append(' ')
          .append(number(b)).append(' ')
          .append(number(c)).append(' ')
          .append(number(d)).append(' ')
          .append(number(e)).append(' ')
          .append(number(f)).append(" cm\n");
}

void ContentStreamWriter::setFillGray(qreal gray)
{
    m_data.append(number(gray)).append(" g\n");
}

void ContentStreamWriter::fillRect(const QRectF& rect)
{
    m_data.append(number(rect.x())).append(' ')
          .append(number(rect.y())).append(' ')
          .append(number(rect.width())).append(' ')
          .append(number(rect.height())).append(" re f\n");
}

void ContentStreamWriter::showText(const char* fontResource, qreal fontSize,
                                   const QPointF& origin, const QByteArray& encoded)
{
    m_data.append("BT\n/").append(fontResource).append(' ')
          .append(number(fontSize)).append(" Tf\n")
          .append(number(origin.x())).append(' ')
          .append(number(origin.y())).append(" Td\n")
          .append(literalString(encoded)).append(" Tj\nET\n");
}

void ContentStreamWriter::drawXObject(const char* resourceName)
{
    m_data.append('/').append(resourceName).append(" Do\n");
}

void ContentStreamWriter::drawImage(const char* resourceName, const QRectF& rect)
{
    saveState();
    concat(rect.width(), 0.0, 0.0, rect.height(), rect.x(), rect.y());
    drawXObject(resourceName);
    restoreState();
}

void ContentStreamWriter::append(const QByteArray& raw)
{
    m_data.append(raw);
    if (!raw.isEmpty() && !raw.endsWith('\n')) {
        m_data.append('\n');
    }
}

QByteArray ContentStreamWriter::number(qreal value)
{
    // Snap values that only differ from an integer by rounding noise
    if (qAbs(value - qRound64(value)) < 0.00005) {
        return QByteArray::number(qRound64(value));
    }

    QByteArray text = QByteArray::number(value, 'f', 4);
    while (text.endsWith('0')) {
        text.chop(1);
    }
    if (text.endsWith('.')) {
        text.chop(1);
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

QByteArray ContentStreamWriter::literalString(const QByteArray& bytes)
{
    QByteArray out;
    out.reserve(bytes.size() + 2);
    out.append('(');

    for (const char ch : bytes) {
        const unsigned char byte = static_cast<unsigned char>(ch);
        if (byte == '(' || byte == ')' || byte == '\\') {
            out.append('\\').append(ch);
        } else if (byte < 0x20 || byte >= 0x7F) {
            out.append('\\');
            out.append(static_cast<char>('0' + ((byte >> 6) & 0x7)));
            out.append(static_cast<char>('0' + ((byte >> 3) & 0x7)));
            out.append(static_cast<char>('0' + (byte & 0x7)));
        } else {
            out.append(ch);
        }
    }

    out.append(')');
    return out;
}
