#include "CommunityStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

CommunityStore::CommunityStore(const QString& filePath, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath)
{
}

bool CommunityStore::load()
{
    m_communities.clear();
    m_lastError.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        // Start fresh and leave an empty store on disk for the user to find
        QDir().mkpath(QFileInfo(m_filePath).absolutePath());
        if (!save()) {
            qWarning() << "[CommunityStore] Could not create" << m_filePath;
        }
        return true;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return fail(tr("Cannot read %1: %2").arg(m_filePath, file.errorString()));
    }

    const QByteArray data = file.readAll();
    file.close();

    if (data.trimmed().isEmpty()) {
        return true;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(tr("Malformed community file %1: %2")
                        .arg(m_filePath, parseError.errorString()));
    }

    const QJsonObject root = doc.object();

    const int version = root["version"].toInt(STORE_VERSION);
    if (version > STORE_VERSION) {
        qWarning() << "[CommunityStore] File version" << version
                   << "is newer than supported version" << STORE_VERSION;
    }

    const QJsonObject communities = root["communities"].toObject();
    for (auto it = communities.constBegin(); it != communities.constEnd(); ++it) {
        const QString name = it.key().trimmed();
        const QString text = it.value().toString().trimmed();
        if (name.isEmpty()) {
            continue;
        }
        m_communities.insert(name, text);
    }

    qDebug() << "[CommunityStore] Loaded" << m_communities.size() << "communities from" << m_filePath;
    return true;
}

bool CommunityStore::contains(const QString& name) const
{
    return m_communities.contains(name.trimmed());
}

QString CommunityStore::description(const QString& name) const
{
    return m_communities.value(name.trimmed());
}

bool CommunityStore::add(const QString& name, const QString& description)
{
    m_lastError.clear();
    const QString key = name.trimmed();
    const QString text = description.trimmed();

    if (key.isEmpty()) {
        return fail(tr("Community name is required"));
    }
    if (text.isEmpty()) {
        return fail(tr("Description is required"));
    }
    if (m_communities.contains(key)) {
        return fail(tr("Community already exists: %1").arg(key));
    }

    m_communities.insert(key, text);
    if (!save()) {
        m_communities.remove(key);
        return false;
    }

    emit communitiesChanged();
    return true;
}

bool CommunityStore::update(const QString& name, const QString& description)
{
    m_lastError.clear();
    const QString key = name.trimmed();
    const QString text = description.trimmed();

    if (!m_communities.contains(key)) {
        return fail(tr("Unknown community: %1").arg(key));
    }
    if (text.isEmpty()) {
        return fail(tr("Description is required"));
    }

    const QString previous = m_communities.value(key);
    m_communities.insert(key, text);
    if (!save()) {
        m_communities.insert(key, previous);
        return false;
    }

    emit communitiesChanged();
    return true;
}

bool CommunityStore::remove(const QString& name)
{
    m_lastError.clear();
    const QString key = name.trimmed();

    if (!m_communities.contains(key)) {
        return fail(tr("Unknown community: %1").arg(key));
    }

    const QString previous = m_communities.take(key);
    if (!save()) {
        m_communities.insert(key, previous);
        return false;
    }

    emit communitiesChanged();
    return true;
}

QString CommunityStore::resolveOverlayText(const QString& name) const
{
    const QString text = description(name);
    if (text.isEmpty()) {
        return QStringLiteral("No data for %1").arg(name.trimmed());
    }
    return text;
}

bool CommunityStore::save()
{
    QJsonObject communities;
    for (auto it = m_communities.constBegin(); it != m_communities.constEnd(); ++it) {
        communities.insert(it.key(), it.value());
    }

    QJsonObject root;
    root["version"] = STORE_VERSION;
    root["communities"] = communities;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return fail(tr("Cannot write %1: %2").arg(m_filePath, file.errorString()));
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return fail(tr("Cannot write %1: %2").arg(m_filePath, file.errorString()));
    }
    return true;
}

bool CommunityStore::fail(const QString& message)
{
    m_lastError = message;
    qWarning() << "[CommunityStore]" << message;
    return false;
}
