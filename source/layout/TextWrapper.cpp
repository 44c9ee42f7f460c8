#include "TextWrapper.h"

#include <QRegularExpression>

namespace TextWrapper {

QStringList wrap(const QString& text, qreal maxWidth,
                 const TextMeasurer& measurer, qreal fontSize)
{
    QStringList lines;

    QString normalized = text;
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    normalized.replace(QLatin1Char('\r'), QLatin1Char('\n'));

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));

    const QStringList paragraphs = normalized.split(QLatin1Char('\n'));
    for (const QString& rawParagraph : paragraphs) {
        const QString paragraph = rawParagraph.trimmed();
        if (paragraph.isEmpty()) {
            lines.append(QString());
            continue;
        }

        const QStringList words = paragraph.split(whitespace, Qt::SkipEmptyParts);
        QString current;

        for (const QString& word : words) {
            const QString candidate = current.isEmpty()
                ? word
                : current + QLatin1Char(' ') + word;

            if (measurer.textWidth(candidate, fontSize) <= maxWidth) {
                current = candidate;
            } else {
                if (!current.isEmpty()) {
                    lines.append(current);
                }
                current = word;
            }
        }

        if (!current.isEmpty()) {
            lines.append(current);
        }
    }

    return lines;
}

} // namespace TextWrapper
