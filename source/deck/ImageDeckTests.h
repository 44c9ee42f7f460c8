#ifndef IMAGEDECKTESTS_H
#define IMAGEDECKTESTS_H

/**
 * @file ImageDeckTests.h
 * @brief Unit tests for ImageDeck ordering and validation.
 * 
 * Run with: classreview --test-deck
 */

#include "ImageDeck.h"

#include <QDebug>
#include <QImage>
#include <QTemporaryDir>

namespace ImageDeckTests {

inline bool testReordering()
{
    qDebug() << "=== Test: Deck Reordering ===";

    ImageDeck deck({"a.jpg", "b.jpg", "c.jpg"});
    bool success = true;

    // Boundaries are rejected and leave the deck untouched
    if (deck.moveUp(0) || deck.moveDown(2) || deck.moveUp(3) || deck.moveDown(-1)) {
        qDebug() << "FAIL: boundary move accepted";
        success = false;
    }
    if (deck.paths() != QStringList{"a.jpg", "b.jpg", "c.jpg"}) {
        qDebug() << "FAIL: rejected move changed the deck" << deck.paths();
        success = false;
    }

    if (!deck.moveUp(2) || deck.paths() != QStringList{"a.jpg", "c.jpg", "b.jpg"}) {
        qDebug() << "FAIL: moveUp" << deck.paths();
        success = false;
    }
    if (!deck.moveDown(0) || deck.paths() != QStringList{"c.jpg", "a.jpg", "b.jpg"}) {
        qDebug() << "FAIL: moveDown" << deck.paths();
        success = false;
    }

    // Moving only permutes; the same images remain
    QStringList sorted = deck.paths();
    sorted.sort();
    if (sorted != QStringList{"a.jpg", "b.jpg", "c.jpg"} || deck.count() != 3) {
        qDebug() << "FAIL: reordering changed the set of images";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Deck reordering";
    }
    return success;
}

inline bool testEditing()
{
    qDebug() << "=== Test: Deck Editing ===";

    ImageDeck deck;
    deck.append("a.jpg");
    deck.append(QString());
    deck.append("b.jpg");

    bool success = true;
    if (deck.count() != 2) {
        qDebug() << "FAIL: empty path was added";
        success = false;
    }
    if (!deck.replace(1, "z.jpg") || deck.at(1) != "z.jpg" || deck.replace(5, "x.jpg")) {
        qDebug() << "FAIL: replace";
        success = false;
    }
    if (!deck.removeAt(0) || deck.removeAt(4) || deck.paths() != QStringList{"z.jpg"}) {
        qDebug() << "FAIL: removeAt" << deck.paths();
        success = false;
    }
    if (!deck.at(-1).isEmpty()) {
        qDebug() << "FAIL: out-of-range at()";
        success = false;
    }
    deck.clear();
    if (!deck.isEmpty()) {
        qDebug() << "FAIL: clear";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Deck editing";
    }
    return success;
}

inline bool testValidation()
{
    qDebug() << "=== Test: Deck Validation ===";

    QTemporaryDir dir;
    const QString first = dir.filePath("first.png");
    const QString second = dir.filePath("second.png");
    QImage image(8, 8, QImage::Format_RGB888);
    image.fill(Qt::gray);
    if (!image.save(first) || !image.save(second)) {
        qDebug() << "FAIL: could not write fixtures";
        return false;
    }

    bool success = true;

    if (ImageDeck().validate(1) != QStringLiteral("Please select an image")) {
        qDebug() << "FAIL: empty deck message" << ImageDeck().validate(1);
        success = false;
    }

    const QString tooFew = ImageDeck(QStringList() << first).validate(2);
    if (tooFew != QStringLiteral("Please select 2 images (1 selected)")) {
        qDebug() << "FAIL: too few message" << tooFew;
        success = false;
    }

    const QString missing = dir.filePath("missing.png");
    if (!ImageDeck({first, missing}).validate(2).startsWith(QStringLiteral("Image not found"))) {
        qDebug() << "FAIL: missing image accepted";
        success = false;
    }

    if (!ImageDeck({first, second}).validate(2).isEmpty()) {
        qDebug() << "FAIL: valid deck rejected";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Deck validation";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running ImageDeck Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testReordering();
    allPass &= testEditing();
    allPass &= testValidation();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace ImageDeckTests

#endif // IMAGEDECKTESTS_H
