#include "ImageDeck.h"

#include <QCoreApplication>
#include <QFileInfo>

ImageDeck::ImageDeck(const QStringList& paths)
{
    for (const QString& path : paths) {
        append(path);
    }
}

void ImageDeck::append(const QString& path)
{
    if (!path.isEmpty()) {
        m_paths.append(path);
    }
}

bool ImageDeck::replace(int index, const QString& path)
{
    if (index < 0 || index >= m_paths.size() || path.isEmpty()) {
        return false;
    }
    m_paths[index] = path;
    return true;
}

bool ImageDeck::removeAt(int index)
{
    if (index < 0 || index >= m_paths.size()) {
        return false;
    }
    m_paths.removeAt(index);
    return true;
}

bool ImageDeck::moveUp(int index)
{
    if (index <= 0 || index >= m_paths.size()) {
        return false;
    }
    m_paths.swapItemsAt(index, index - 1);
    return true;
}

bool ImageDeck::moveDown(int index)
{
    if (index < 0 || index >= m_paths.size() - 1) {
        return false;
    }
    m_paths.swapItemsAt(index, index + 1);
    return true;
}

void ImageDeck::clear()
{
    m_paths.clear();
}

QString ImageDeck::at(int index) const
{
    if (index < 0 || index >= m_paths.size()) {
        return QString();
    }
    return m_paths.at(index);
}

QString ImageDeck::validate(int minimumCount) const
{
    if (m_paths.size() < minimumCount) {
        if (minimumCount == 1) {
            return QCoreApplication::translate("ImageDeck", "Please select an image");
        }
        return QCoreApplication::translate("ImageDeck", "Please select %1 images (%2 selected)")
            .arg(minimumCount)
            .arg(m_paths.size());
    }

    for (const QString& path : m_paths) {
        QFileInfo info(path);
        if (!info.exists() || !info.isFile()) {
            return QCoreApplication::translate("ImageDeck", "Image not found: %1").arg(path);
        }
        if (!info.isReadable()) {
            return QCoreApplication::translate("ImageDeck", "Image not readable: %1").arg(path);
        }
    }

    return QString();
}
