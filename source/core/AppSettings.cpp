#include "AppSettings.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace {
const char* const kCommunitiesFileKey = "store/communitiesFile";
const char* const kLastOutputDirKey = "build/lastOutputDirectory";
}

QString AppSettings::defaultCommunitiesFilePath()
{
    const QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dataPath).filePath(QStringLiteral("communities.json"));
}

QString AppSettings::communitiesFilePath()
{
    QSettings settings("ClassReview", "ClassReview");
    const QString stored = settings.value(kCommunitiesFileKey).toString();
    return stored.isEmpty() ? defaultCommunitiesFilePath() : stored;
}

void AppSettings::setCommunitiesFilePath(const QString& path)
{
    QSettings settings("ClassReview", "ClassReview");
    settings.setValue(kCommunitiesFileKey, path);
}

QString AppSettings::lastOutputDirectory()
{
    QSettings settings("ClassReview", "ClassReview");
    return settings.value(kLastOutputDirKey).toString();
}

void AppSettings::setLastOutputDirectory(const QString& path)
{
    QSettings settings("ClassReview", "ClassReview");
    settings.setValue(kLastOutputDirKey, path);
}
