#pragma once

// ============================================================================
// ImageSource - Decoded raster image for one page
// ============================================================================
// Opened right before a page is composed and released right after. Decoding
// applies the embedded orientation (EXIF) and converts to 8-bit RGB, which
// is the only pixel format the compositor embeds.
// ============================================================================

#include <QByteArray>
#include <QImage>
#include <QImageIOHandler>
#include <QString>

class ImageSource {
public:
    explicit ImageSource(const QString& path);

    /**
     * @brief Decode the image from disk.
     * @return true on success; errorMessage() explains a failure.
     *
     * Steps: decode (without Qt's automatic transform), rotate upright from
     * the orientation metadata, flatten alpha onto white, convert to RGB888.
     */
    bool load();

    /**
     * @brief Drop the decoded pixels.
     */
    void release();

    bool isLoaded() const { return !m_image.isNull(); }
    QString path() const { return m_path; }
    QString errorMessage() const { return m_errorMessage; }

    /// Decoded (upright) size in pixels, or an empty size when not loaded.
    QSize pixelSize() const { return m_image.size(); }

    /// Format reported by the decoder before conversion (e.g. "jpeg", "png").
    QByteArray sourceFormat() const { return m_sourceFormat; }

    const QImage& image() const { return m_image; }

    /**
     * @brief Re-encode the decoded pixels as JPEG.
     * @param quality JPEG quality (0-100)
     * @return Encoded bytes, or empty on failure / when not loaded
     */
    QByteArray encodeJpeg(int quality) const;

    /**
     * @brief Rotate an image upright from its orientation metadata.
     * @param image Decoded pixels as stored in the file
     * @param transformation Orientation reported by QImageReader::transformation()
     * @return The rotated image (unchanged when no rotation is required)
     *
     * Only the rotation part is applied, in multiples of 90 degrees
     * (EXIF orientations 3, 6 and 8). Mirroring flags are ignored.
     */
    static QImage normalizeOrientation(const QImage& image,
                                       QImageIOHandler::Transformations transformation);

    /**
     * @brief Clockwise rotation in degrees encoded by @p transformation.
     * @return 0, 90, 180 or 270
     */
    static int rotationDegrees(QImageIOHandler::Transformations transformation);

    /**
     * @brief Convert to RGB888, compositing any alpha channel onto white.
     */
    static QImage toRgb(const QImage& image);

private:
    QString m_path;
    QImage m_image;
    QByteArray m_sourceFormat;
    QString m_errorMessage;
};
