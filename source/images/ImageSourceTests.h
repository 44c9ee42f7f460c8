#pragma once

// ============================================================================
// ImageSourceTests - Unit tests for image decoding and normalization
// ============================================================================
// Run with: classreview --test-image
// ============================================================================

#include "ImageSource.h"

#include <QDebug>
#include <QFile>
#include <QTemporaryDir>

namespace ImageSourceTests {

inline bool testLoadTransparentPng()
{
    qDebug() << "=== Test: Transparent PNG Is Flattened To RGB ===";

    QTemporaryDir dir;
    const QString path = dir.filePath("transparent.png");
    QImage source(40, 20, QImage::Format_ARGB32);
    source.fill(Qt::transparent);
    if (!source.save(path, "PNG")) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }

    ImageSource image(path);
    if (!image.load()) {
        qDebug() << "FAIL: load failed:" << image.errorMessage();
        return false;
    }

    bool success = true;
    if (image.pixelSize() != QSize(40, 20)) {
        qDebug() << "FAIL: size" << image.pixelSize();
        success = false;
    }
    if (image.image().format() != QImage::Format_RGB888) {
        qDebug() << "FAIL: not RGB888";
        success = false;
    }
    if (image.image().pixel(5, 5) != qRgb(255, 255, 255)) {
        qDebug() << "FAIL: transparent pixel not composited on white";
        success = false;
    }

    const QByteArray jpeg = image.encodeJpeg(95);
    if (!jpeg.startsWith("\xFF\xD8")) {
        qDebug() << "FAIL: JPEG encoding";
        success = false;
    }

    image.release();
    if (image.isLoaded()) {
        qDebug() << "FAIL: release kept the pixels";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Transparent PNG flattened";
    }
    return success;
}

inline bool testLoadFailures()
{
    qDebug() << "=== Test: Missing and Corrupt Images ===";

    QTemporaryDir dir;
    bool success = true;

    ImageSource missing(dir.filePath("missing.jpg"));
    if (missing.load() || !missing.errorMessage().contains("not found")) {
        qDebug() << "FAIL: missing file" << missing.errorMessage();
        success = false;
    }

    const QString corruptPath = dir.filePath("corrupt.jpg");
    QFile corrupt(corruptPath);
    if (!corrupt.open(QIODevice::WriteOnly)) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }
    corrupt.write("this is not an image");
    corrupt.close();

    ImageSource broken(corruptPath);
    if (broken.load() || broken.errorMessage().isEmpty() || broken.isLoaded()) {
        qDebug() << "FAIL: corrupt file loaded";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Load failures reported";
    }
    return success;
}

inline bool testOrientation()
{
    qDebug() << "=== Test: Orientation Normalization ===";

    QImage wide(40, 20, QImage::Format_RGB888);
    wide.fill(Qt::black);
    wide.setPixel(0, 0, qRgb(255, 0, 0));

    bool success = true;

    const QImage upright = ImageSource::normalizeOrientation(wide, QImageIOHandler::TransformationNone);
    if (upright.size() != QSize(40, 20)) {
        qDebug() << "FAIL: no-op rotation changed size";
        success = false;
    }

    // EXIF orientation 6: rotate 90 degrees clockwise, the top-left pixel moves to the top-right
    const QImage rotated = ImageSource::normalizeOrientation(wide, QImageIOHandler::TransformationRotate90);
    if (rotated.size() != QSize(20, 40) || rotated.pixel(19, 0) != qRgb(255, 0, 0)) {
        qDebug() << "FAIL: 90 degree rotation" << rotated.size();
        success = false;
    }

    if (ImageSource::normalizeOrientation(wide, QImageIOHandler::TransformationRotate180).size() != QSize(40, 20)
        || ImageSource::rotationDegrees(QImageIOHandler::TransformationRotate270) != 270
        || ImageSource::rotationDegrees(QImageIOHandler::TransformationMirror) != 0) {
        qDebug() << "FAIL: rotation degrees";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Orientation normalization";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running ImageSource Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testLoadTransparentPng();
    allPass &= testLoadFailures();
    allPass &= testOrientation();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace ImageSourceTests
