#pragma once

// ============================================================================
// LocalImageStore - On-disk copy of a project's page images
// ============================================================================
// Part of the TransDesk workbench engine
//
// Layout under the data directory:
//   <dataDir>/images/<projectId>/<index>.<ext>   page image, ext from its url
//   <dataDir>/images/cache.json                   per-project metadata
//
// ProjectImageDownloader fills the store; ImageCache reads from it before
// going to the network.
// ============================================================================

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QDateTime>
#include <QHash>
#include <QByteArray>

/**
 * @brief Metadata of one downloaded project.
 */
struct CachedProjectInfo {
    QString projectId;
    QString projectName;
    QString status;             ///< "completed" or "failed"
    qint64 fileCount = 0;       ///< Files present on disk
    qint64 totalSizeBytes = 0;  ///< Sum of their sizes
    QDateTime cachedAt;

    bool isValid() const { return !projectId.isEmpty(); }
    bool isComplete() const { return status == QLatin1String("completed"); }
};

/**
 * @brief Directory-backed page image store with a JSON metadata index.
 */
class LocalImageStore : public QObject {
    Q_OBJECT

public:
    static constexpr int METADATA_VERSION = 1;

    /**
     * @param dataDir Root data directory; "images" is created below it.
     */
    explicit LocalImageStore(const QString& dataDir, QObject* parent = nullptr);
    ~LocalImageStore() override;

    QString rootDir() const { return m_rootDir; }

    // ===== Layout =====

    /**
     * @brief Directory holding a project's page files.
     */
    QString projectDir(const QString& projectId) const;

    /**
     * @brief Path a page is stored at, derived from the page's url.
     */
    QString pagePath(const QString& projectId, int index, const QString& url) const;

    /**
     * @brief Existing file for a page index, whatever its extension; empty if missing.
     */
    QString findPage(const QString& projectId, int index) const;

    /**
     * @brief File extension for an image url: png, jpg, jpeg or webp; jpg otherwise.
     *
     * Query strings are ignored.
     */
    static QString extensionForUrl(const QString& url);

    /**
     * @brief MIME type for a file extension; image/jpeg for anything unknown.
     */
    static QString contentTypeForExtension(const QString& extension);

    /**
     * @brief Read a stored page file. Safe to call from a worker thread.
     * @param contentType Receives the MIME type derived from the extension.
     * @return File bytes, or an empty array on error.
     */
    static QByteArray readFile(const QString& path, QString* contentType = nullptr);

    // ===== Projects =====

    /**
     * @brief True if the project's directory exists.
     */
    bool hasProject(const QString& projectId) const;

    /**
     * @brief Delete the project's files and metadata.
     * @return False if the directory could not be removed.
     */
    bool removeProject(const QString& projectId);

    QList<CachedProjectInfo> cachedProjects() const;
    CachedProjectInfo projectInfo(const QString& projectId) const;

    /**
     * @brief Insert or replace a project's metadata and persist it.
     */
    void upsertProjectInfo(const CachedProjectInfo& info);

    /**
     * @brief Count the files of a project on disk and sum their sizes.
     */
    void measureProject(const QString& projectId, qint64* fileCount, qint64* totalSizeBytes) const;

signals:
    void projectsChanged();

private:
    QString metadataPath() const;
    void loadMetadata();
    bool saveMetadata() const;

    QString m_rootDir;
    QHash<QString, CachedProjectInfo> m_projects;
};
