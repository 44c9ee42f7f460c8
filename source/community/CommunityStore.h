#ifndef COMMUNITYSTORE_H
#define COMMUNITYSTORE_H

#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>

/**
 * @brief Persisted map of community name to description.
 *
 * The description of the selected community becomes the overlay text of
 * generated documents. The whole map is loaded from and saved to a JSON
 * file in one piece; every successful mutation saves immediately.
 *
 * File format:
 * @code
 * {
 *     "version": 1,
 *     "communities": {
 *         "Maple Street": "Welcome to Maple Street"
 *     }
 * }
 * @endcode
 *
 * Names and descriptions are trimmed before validation and storage.
 */
class CommunityStore : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Create a store backed by @p filePath.
     *
     * Call load() to read the file.
     */
    explicit CommunityStore(const QString& filePath, QObject* parent = nullptr);

    QString filePath() const { return m_filePath; }

    /**
     * @brief Read the file into memory.
     * @return false if the file exists but cannot be read or parsed
     *
     * A missing file yields an empty store and an empty file is created.
     * An unreadable or malformed file yields an empty store and is left
     * untouched.
     */
    bool load();

    /// Community names in ascending order.
    QStringList names() const { return m_communities.keys(); }

    int count() const { return m_communities.size(); }
    bool contains(const QString& name) const;

    /// Description of @p name, or an empty string if unknown.
    QString description(const QString& name) const;

    /**
     * @brief Add a new community.
     * @return false for an empty name, an empty description or a name that
     *         already exists; lastError() holds the reason
     */
    bool add(const QString& name, const QString& description);

    /**
     * @brief Replace the description of an existing community.
     * @return false for an unknown name or an empty description
     */
    bool update(const QString& name, const QString& description);

    /**
     * @brief Delete a community.
     * @return false for an unknown name
     */
    bool remove(const QString& name);

    /**
     * @brief Overlay text for @p name.
     * @return The description, or "No data for NAME" when there is none
     */
    QString resolveOverlayText(const QString& name) const;

    QString lastError() const { return m_lastError; }

signals:
    /**
     * @brief Emitted after every successful add, update or remove.
     */
    void communitiesChanged();

private:
    bool save();
    bool fail(const QString& message);

    QString m_filePath;
    QMap<QString, QString> m_communities;
    QString m_lastError;

    static constexpr int STORE_VERSION = 1;
};

#endif // COMMUNITYSTORE_H
