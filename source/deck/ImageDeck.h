#ifndef IMAGEDECK_H
#define IMAGEDECK_H

/**
 * @file ImageDeck.h
 * @brief Ordered list of image paths that become document pages.
 *
 * The deck order is the page order. Reordering is limited to swapping an
 * image with its neighbour, which is what the front-ends expose.
 */

#include <QString>
#include <QStringList>

class ImageDeck {
public:
    ImageDeck() = default;
    explicit ImageDeck(const QStringList& paths);

    /// Append an image at the end of the deck. Empty paths are ignored.
    void append(const QString& path);

    /**
     * @brief Replace the image at @p index.
     * @return false if @p index is out of range
     */
    bool replace(int index, const QString& path);

    /// Remove the image at @p index. Returns false if out of range.
    bool removeAt(int index);

    /**
     * @brief Swap the image at @p index with its predecessor.
     * @return false for the first image or an invalid index
     */
    bool moveUp(int index);

    /**
     * @brief Swap the image at @p index with its successor.
     * @return false for the last image or an invalid index
     */
    bool moveDown(int index);

    void clear();

    int count() const { return m_paths.size(); }
    bool isEmpty() const { return m_paths.isEmpty(); }
    QString at(int index) const;
    QStringList paths() const { return m_paths; }

    /**
     * @brief Check the deck before a build.
     * @param minimumCount Required number of images
     * @return Empty string if valid, otherwise a human-readable reason
     */
    QString validate(int minimumCount) const;

private:
    QStringList m_paths;
};

#endif // IMAGEDECK_H
