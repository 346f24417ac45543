// ============================================================================
// LocalImageStore - Implementation
// ============================================================================

#include "LocalImageStore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>
#include <QDebug>
#include <algorithm>

LocalImageStore::LocalImageStore(const QString& dataDir, QObject* parent)
    : QObject(parent)
    , m_rootDir(QDir(dataDir).filePath("images"))
{
    QDir().mkpath(m_rootDir);
    loadMetadata();
}

LocalImageStore::~LocalImageStore() = default;

// ===== Layout =====

QString LocalImageStore::projectDir(const QString& projectId) const
{
    return QDir(m_rootDir).filePath(projectId);
}

QString LocalImageStore::pagePath(const QString& projectId, int index, const QString& url) const
{
    return QDir(projectDir(projectId)).filePath(
        QString("%1.%2").arg(index).arg(extensionForUrl(url)));
}

QString LocalImageStore::findPage(const QString& projectId, int index) const
{
    if (projectId.isEmpty() || index < 0) {
        return QString();
    }
    QDir dir(projectDir(projectId));
    if (!dir.exists()) {
        return QString();
    }

    // File name is "<index>.<ext>"; the extension is not known up front
    const QStringList matches = dir.entryList({QString("%1.*").arg(index)}, QDir::Files);
    for (const QString& name : matches) {
        if (QFileInfo(name).completeBaseName() == QString::number(index)) {
            return dir.filePath(name);
        }
    }
    return QString();
}

QString LocalImageStore::extensionForUrl(const QString& url)
{
    const QString path = QUrl(url).path().toLower();
    static const QStringList known = {"png", "jpg", "jpeg", "webp"};
    for (const QString& ext : known) {
        if (path.endsWith("." + ext)) {
            return ext;
        }
    }
    return "jpg";
}

QString LocalImageStore::contentTypeForExtension(const QString& extension)
{
    const QString ext = extension.toLower();
    if (ext == "png") {
        return "image/png";
    }
    if (ext == "webp") {
        return "image/webp";
    }
    return "image/jpeg";
}

QByteArray LocalImageStore::readFile(const QString& path, QString* contentType)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "LocalImageStore: Failed to open" << path << file.errorString();
        return QByteArray();
    }
    if (contentType) {
        *contentType = contentTypeForExtension(QFileInfo(path).suffix());
    }
    return file.readAll();
}

// ===== Projects =====

bool LocalImageStore::hasProject(const QString& projectId) const
{
    return !projectId.isEmpty() && QDir(projectDir(projectId)).exists();
}

bool LocalImageStore::removeProject(const QString& projectId)
{
    if (projectId.isEmpty()) {
        return false;
    }

    bool ok = true;
    QDir dir(projectDir(projectId));
    if (dir.exists() && !dir.removeRecursively()) {
        qWarning() << "LocalImageStore: Failed to remove" << dir.path();
        ok = false;
    }

    if (m_projects.remove(projectId) > 0) {
        saveMetadata();
    }
    emit projectsChanged();
    return ok;
}

QList<CachedProjectInfo> LocalImageStore::cachedProjects() const
{
    QList<CachedProjectInfo> result = m_projects.values();
    std::sort(result.begin(), result.end(), [](const CachedProjectInfo& a, const CachedProjectInfo& b) {
        return a.cachedAt > b.cachedAt;
    });
    return result;
}

CachedProjectInfo LocalImageStore::projectInfo(const QString& projectId) const
{
    return m_projects.value(projectId);
}

void LocalImageStore::upsertProjectInfo(const CachedProjectInfo& info)
{
    if (!info.isValid()) {
        return;
    }
    m_projects.insert(info.projectId, info);
    saveMetadata();
    emit projectsChanged();
}

void LocalImageStore::measureProject(const QString& projectId, qint64* fileCount, qint64* totalSizeBytes) const
{
    qint64 count = 0;
    qint64 total = 0;
    const QFileInfoList files = QDir(projectDir(projectId)).entryInfoList(QDir::Files);
    for (const QFileInfo& info : files) {
        count++;
        total += info.size();
    }
    if (fileCount) {
        *fileCount = count;
    }
    if (totalSizeBytes) {
        *totalSizeBytes = total;
    }
}

// ===== Persistence =====

QString LocalImageStore::metadataPath() const
{
    return QDir(m_rootDir).filePath("cache.json");
}

bool LocalImageStore::saveMetadata() const
{
    QJsonArray projects;
    for (const CachedProjectInfo& info : m_projects) {
        QJsonObject obj;
        obj["project_id"] = info.projectId;
        obj["project_name"] = info.projectName;
        obj["status"] = info.status;
        obj["file_count"] = static_cast<double>(info.fileCount);
        obj["total_size_bytes"] = static_cast<double>(info.totalSizeBytes);
        obj["cached_at"] = static_cast<double>(info.cachedAt.toSecsSinceEpoch());
        projects.append(obj);
    }

    QJsonObject root;
    root["version"] = METADATA_VERSION;
    root["projects"] = projects;

    QFile file(metadataPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "LocalImageStore: Failed to save to" << metadataPath();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

void LocalImageStore::loadMetadata()
{
    m_projects.clear();

    QFile file(metadataPath());
    if (!file.exists()) {
        return; // Nothing downloaded yet
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "LocalImageStore: Failed to open" << metadataPath();
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "LocalImageStore: JSON parse error:" << parseError.errorString();
        return;
    }

    const QJsonObject root = doc.object();
    const int version = root["version"].toInt(1);
    if (version > METADATA_VERSION) {
        qWarning() << "LocalImageStore: File version" << version
                   << "is newer than supported version" << METADATA_VERSION;
    }

    const QJsonArray projects = root["projects"].toArray();
    for (const auto& value : projects) {
        const QJsonObject obj = value.toObject();
        CachedProjectInfo info;
        info.projectId = obj["project_id"].toString();
        info.projectName = obj["project_name"].toString();
        info.status = obj["status"].toString();
        info.fileCount = static_cast<qint64>(obj["file_count"].toDouble());
        info.totalSizeBytes = static_cast<qint64>(obj["total_size_bytes"].toDouble());
        info.cachedAt = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(obj["cached_at"].toDouble()));
        if (info.isValid()) {
            m_projects.insert(info.projectId, info);
        }
    }
}
