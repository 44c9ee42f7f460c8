#include "ImageSource.h"

#include <QBuffer>
#include <QDebug>
#include <QFileInfo>
#include <QImageReader>
#include <QPainter>
#include <QTransform>

ImageSource::ImageSource(const QString& path)
    : m_path(path)
{
}

bool ImageSource::load()
{
    m_errorMessage.clear();
    m_image = QImage();

    if (!QFileInfo::exists(m_path)) {
        m_errorMessage = QStringLiteral("Image not found: %1").arg(m_path);
        return false;
    }

    QImageReader reader(m_path);
    reader.setAutoTransform(false);
    m_sourceFormat = reader.format();

    // Read the orientation before read(); some handlers reset it afterwards
    const QImageIOHandler::Transformations transformation = reader.transformation();

    QImage decoded = reader.read();
    if (decoded.isNull()) {
        m_errorMessage = QStringLiteral("Cannot decode image %1: %2")
                             .arg(m_path, reader.errorString());
        qWarning() << "[ImageSource]" << m_errorMessage;
        return false;
    }

    decoded = normalizeOrientation(decoded, transformation);
    m_image = toRgb(decoded);

    if (m_image.isNull()) {
        m_errorMessage = QStringLiteral("Cannot convert image to RGB: %1").arg(m_path);
        qWarning() << "[ImageSource]" << m_errorMessage;
        return false;
    }

    qDebug() << "[ImageSource] Loaded" << QFileInfo(m_path).fileName()
             << m_image.width() << "x" << m_image.height()
             << "format" << m_sourceFormat
             << "rotation" << rotationDegrees(transformation);
    return true;
}

void ImageSource::release()
{
    m_image = QImage();
}

QByteArray ImageSource::encodeJpeg(int quality) const
{
    if (m_image.isNull()) {
        return QByteArray();
    }

    QByteArray result;
    QBuffer buffer(&result);
    buffer.open(QIODevice::WriteOnly);

    if (!m_image.save(&buffer, "JPEG", quality)) {
        qWarning() << "[ImageSource] Failed to encode JPEG for" << m_path;
        return QByteArray();
    }

    buffer.close();
    return result;
}

int ImageSource::rotationDegrees(QImageIOHandler::Transformations transformation)
{
    // EXIF 6 -> Rotate90, 3 -> Rotate180, 8 -> Rotate270
    if (transformation == QImageIOHandler::TransformationRotate90) {
        return 90;
    }
    if (transformation == QImageIOHandler::TransformationRotate180) {
        return 180;
    }
    if (transformation == QImageIOHandler::TransformationRotate270) {
        return 270;
    }
    return 0;
}

QImage ImageSource::normalizeOrientation(const QImage& image,
                                         QImageIOHandler::Transformations transformation)
{
    const int degrees = rotationDegrees(transformation);
    if (degrees == 0 || image.isNull()) {
        return image;
    }

    QTransform rotation;
    rotation.rotate(degrees);
    return image.transformed(rotation);
}

QImage ImageSource::toRgb(const QImage& image)
{
    if (image.isNull()) {
        return QImage();
    }

    if (image.format() == QImage::Format_RGB888) {
        return image;
    }

    if (image.hasAlphaChannel()) {
        QImage rgb(image.size(), QImage::Format_RGB888);
        rgb.fill(Qt::white);
        QPainter painter(&rgb);
        painter.drawImage(0, 0, image);
        painter.end();
        return rgb;
    }

    return image.convertToFormat(QImage::Format_RGB888);
}
