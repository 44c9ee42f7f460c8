#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>

/**
 * @brief Persistent user settings.
 *
 * Thin wrapper over QSettings("ClassReview", "ClassReview"). Values are read
 * and written through on every call; there is no in-memory cache.
 */
class AppSettings {
public:
    /**
     * @brief Location of the community store.
     * @return Stored path, or AppDataLocation/communities.json by default
     */
    static QString communitiesFilePath();
    static void setCommunitiesFilePath(const QString& path);

    /**
     * @brief Directory of the last successful build, or empty if none.
     */
    static QString lastOutputDirectory();
    static void setLastOutputDirectory(const QString& path);

    /// Default community store location in the app data directory.
    static QString defaultCommunitiesFilePath();
};

#endif // APPSETTINGS_H
