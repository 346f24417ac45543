// ============================================================================
// TransDesk - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QTranslator>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMainWindow>
#include <QDockWidget>
#include <QStatusBar>
#include <QCloseEvent>
#include <QPainter>
#include <QBuffer>
#include <QDebug>

#include "compat/qt_compat.h"
#include "core/WorkbenchConfig.h"
#include "core/WorkbenchEngine.h"
#include "core/PageDescriptor.h"
#include "core/ShortcutManager.h"
#include "cache/LocalImageStore.h"
#include "cache/ProjectImageDownloader.h"
#include "net/MockBackend.h"
#include "net/RestBackend.h"
#include "viewport/WorkbenchViewport.h"
#include "viewport/TranslationEditorPanel.h"

// Test includes (desktop only)
#ifndef Q_OS_ANDROID
#include <QTest>
#include "core/ViewportTransformTests.h"
#include "core/SourceModelTests.h"
#include "core/EditSyncQueueTests.h"
#include "core/InputDispatcherTests.h"
#include "core/ShortcutManagerTests.h"
#include "core/WorkbenchEngineTests.h"
#include "cache/ImageCacheTests.h"
#include "cache/LocalImageStoreTests.h"
#include "net/RestBackendTests.h"
#include "viewport/TranslationEditorPanelTests.h"
#endif

// ============================================================================
// Session
// ============================================================================

/**
 * @brief What to open: one project, one target language, its pages.
 *
 * Read from a JSON file:
 *   { "project_id": "...", "project_name": "...", "target_language_id": "...",
 *     "pages": [ { "id": "...", "name": "...", "url": "...", "source_count": 0 } ] }
 */
struct Session {
    QString projectId;
    QString projectName;
    QString targetLanguageId;
    QVector<PageDescriptor> pages;
};

static bool loadSession(const QString& path, Session* session, QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorOut = QString("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *errorOut = QString("invalid session file %1: %2").arg(path, parseError.errorString());
        return false;
    }

    const QJsonObject root = doc.object();
    session->projectId = root["project_id"].toString();
    session->projectName = root["project_name"].toString();
    session->targetLanguageId = root["target_language_id"].toString();

    const QJsonArray pages = root["pages"].toArray();
    for (int i = 0; i < pages.size(); ++i) {
        const PageDescriptor page = PageDescriptor::fromJson(pages.at(i).toObject(), i);
        if (page.isValid()) {
            session->pages.append(page);
        }
    }

    if (session->projectId.isEmpty() || session->pages.isEmpty()) {
        *errorOut = QString("session file %1 has no project id or no pages").arg(path);
        return false;
    }
    return true;
}

/**
 * @brief Offline demo: an in-memory backend with a few generated pages.
 */
static Session buildDemoSession(MockBackend* backend)
{
    Session session;
    session.projectId = "demo";
    session.projectName = "Demo project";
    session.targetLanguageId = "en";

    const QColor tints[] = { QColor(250, 245, 235), QColor(235, 245, 250), QColor(240, 250, 235) };
    for (int i = 0; i < 6; ++i) {
        QImage image(800, 1200, QImage::Format_RGB32);
        image.fill(tints[i % 3]);
        QPainter painter(&image);
        painter.setPen(Qt::darkGray);
        QFont font = painter.font();
        font.setPointSize(48);
        painter.setFont(font);
        painter.drawText(image.rect(), Qt::AlignCenter, QString("Page %1").arg(i + 1));
        painter.end();

        QByteArray bytes;
        QBuffer buffer(&bytes);
        buffer.open(QIODevice::WriteOnly);
        image.save(&buffer, "PNG");

        PageDescriptor page;
        page.fileId = QString("file-%1").arg(i + 1);
        page.index = i;
        page.name = QString("%1.png").arg(i + 1);
        page.url = QString("demo://pages/%1.png").arg(i + 1);
        backend->setImage(page.url, bytes, "image/png");
        session.pages.append(page);
    }
    return session;
}

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QApplication& app, QTranslator& translator)
{
    QSettings settings("TransDesk", "App");
    bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/transdesk/translations",
        "/usr/local/share/transdesk/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "transdesk/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (!path.isEmpty() && translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Workbench Window
// ============================================================================

/**
 * @brief Main window: the canvas, the text fields of the active marker and a
 * status bar for notices.
 *
 * Closing the window flushes pending edits before the application quits.
 */
class WorkbenchWindow : public QMainWindow {
public:
    WorkbenchWindow(WorkbenchEngine* engine, const QString& title)
        : m_engine(engine)
    {
        setWindowTitle(QString("TransDesk - %1").arg(title));
        resize(1000, 1300);
        setCentralWidget(new WorkbenchViewport(engine, this));

        auto* dock = new QDockWidget(tr("Text"), this);
        dock->setObjectName("textDock");
        dock->setFeatures(QDockWidget::DockWidgetMovable);
        dock->setWidget(new TranslationEditorPanel(engine->sourceModel(), dock));
        addDockWidget(Qt::RightDockWidgetArea, dock);

        QObject::connect(engine, &WorkbenchEngine::errorRaised, this, [this](const QString& message) {
            statusBar()->showMessage(message, 5000);
        });
        QObject::connect(engine, &WorkbenchEngine::pageChanged, this, [this](int index) {
            statusBar()->showMessage(tr("Page %1 / %2").arg(index + 1).arg(m_engine->pageCount()));
        });
    }

protected:
    void closeEvent(QCloseEvent* event) override {
        if (m_closing) {
            event->accept();
            return;
        }
        // Flush first, then close for real
        event->ignore();
        m_closing = true;
        statusBar()->showMessage(tr("Saving..."));
        TD_CONNECT_ONCE(m_engine, &WorkbenchEngine::shutdownFinished, this, [this]() {
            close();
        });
        m_engine->shutdown();
    }

private:
    WorkbenchEngine* m_engine = nullptr;
    bool m_closing = false;
};

// ============================================================================
// Offline Download
// ============================================================================

static int runDownload(QApplication& app, WorkbenchBackend* backend, const WorkbenchConfig& config,
                       const Session& session)
{
    LocalImageStore store(config.resolvedDataDir());
    ProjectImageDownloader downloader(backend, &store);

    QObject::connect(&downloader, &ProjectImageDownloader::progress, [](int finished, int total) {
        qInfo().noquote() << QString("downloaded %1/%2").arg(finished).arg(total);
    });

    int exitCode = 0;
    QObject::connect(&downloader, &ProjectImageDownloader::finished, [&app, &exitCode](bool ok, const QString& message) {
        if (ok) {
            qInfo().noquote() << message;
        } else {
            qWarning().noquote() << message;
            exitCode = 1;
        }
        app.quit();
    });

    if (!downloader.start(session.projectId, session.projectName, session.pages)) {
        qWarning() << "download could not be started";
        return 1;
    }
    app.exec();
    return exitCode;
}

static int listCachedProjects(const WorkbenchConfig& config)
{
    LocalImageStore store(config.resolvedDataDir());
    const QList<CachedProjectInfo> projects = store.cachedProjects();
    if (projects.isEmpty()) {
        qInfo() << "no cached projects";
        return 0;
    }
    for (const CachedProjectInfo& info : projects) {
        qInfo().noquote() << QString("%1\t%2\t%3\t%4 files\t%5 bytes\t%6")
            .arg(info.projectId, info.projectName, info.status)
            .arg(info.fileCount)
            .arg(info.totalSizeBytes)
            .arg(info.cachedAt.toString(Qt::ISODate));
    }
    return 0;
}

// ============================================================================
// Test Runners (Desktop Only)
// ============================================================================

#ifndef Q_OS_ANDROID
template<typename T>
static int runTestClass()
{
    T tests;
    return QTest::qExec(&tests);
}

static int runTests(const QString& testType)
{
    if (testType == "viewport") {
        return runTestClass<ViewportTransformTests>();
    } else if (testType == "sources") {
        return runTestClass<SourceModelTests>();
    } else if (testType == "sync") {
        return runTestClass<EditSyncQueueTests>();
    } else if (testType == "input") {
        return runTestClass<InputDispatcherTests>();
    } else if (testType == "shortcuts") {
        return runTestClass<ShortcutManagerTests>();
    } else if (testType == "engine") {
        return runTestClass<WorkbenchEngineTests>();
    } else if (testType == "cache") {
        return runTestClass<ImageCacheTests>();
    } else if (testType == "store") {
        return runTestClass<LocalImageStoreTests>();
    } else if (testType == "rest") {
        return runTestClass<RestBackendTests>();
    } else if (testType == "editor") {
        return runTestClass<TranslationEditorPanelTests>();
    } else if (testType == "all") {
        int failures = 0;
        for (const QString& type : { "viewport", "sources", "sync", "input", "shortcuts",
                                     "engine", "cache", "store", "rest", "editor" }) {
            failures += runTests(type) != 0 ? 1 : 0;
        }
        return failures == 0 ? 0 : 1;
    }

    qWarning() << "unknown test suite" << testType;
    return 2;
}
#endif

static int listShortcuts()
{
    ShortcutManager* shortcuts = ShortcutManager::instance();
    for (const QString& actionId : shortcuts->actionIds()) {
        qInfo().noquote() << QString("%1\t%2\t%3%4")
            .arg(shortcuts->categoryForAction(actionId),
                 shortcuts->shortcutForAction(actionId),
                 shortcuts->displayNameForAction(actionId),
                 shortcuts->isUserOverridden(actionId) ? QString(" (custom)") : QString());
    }
    return 0;
}

static void printUsage()
{
    qInfo().noquote()
        << "usage: transdesk [options] <session.json>\n"
           "  --demo              open a generated project against an in-memory backend\n"
           "  --api <url>         API base url (overrides settings)\n"
           "  --token <token>     bearer token (or TRANSDESK_TOKEN)\n"
           "  --page <n>          first page to open (1-based)\n"
           "  --download          download all page images of the session and exit\n"
           "  --list-cache        list projects stored for offline use and exit\n"
           "  --list-shortcuts    list key bindings and exit\n"
           "  --test-<suite>      run a test suite (viewport, sources, sync, input,\n"
           "                      shortcuts, engine, cache, store, rest, editor, all)";
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("TransDesk");
    app.setApplicationName("App");

    qRegisterMetaType<TranslationRecord>();
    qRegisterMetaType<TranslationSource::Category>();

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString sessionFile;
    QString apiUrl;
    QString token = qEnvironmentVariable("TRANSDESK_TOKEN");
    int firstPage = 1;
    bool demo = false;
    bool download = false;
    bool listCache = false;

#ifndef Q_OS_ANDROID
    QString testToRun;
#endif

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--demo") {
            demo = true;
        } else if (arg == "--api" && i + 1 < argc) {
            apiUrl = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--token" && i + 1 < argc) {
            token = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--page" && i + 1 < argc) {
            firstPage = QString::fromLocal8Bit(argv[++i]).toInt();
        } else if (arg == "--download") {
            download = true;
        } else if (arg == "--list-cache") {
            listCache = true;
        } else if (arg == "--list-shortcuts") {
            return listShortcuts();
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
#ifndef Q_OS_ANDROID
        else if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        }
#endif
        else if (!arg.startsWith("--") && sessionFile.isEmpty()) {
            sessionFile = arg;
        }
    }

#ifndef Q_OS_ANDROID
    // Handle test commands
    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }
#endif

    WorkbenchConfig config = WorkbenchConfig::loadDefault();
    if (!apiUrl.isEmpty()) {
        config.apiBaseUrl = QUrl(apiUrl);
    }
    config.apiToken = token;

    if (listCache) {
        return listCachedProjects(config);
    }

    // ========== Backend and Session ==========
    MockBackend* mock = nullptr;
    RestBackend* rest = nullptr;
    WorkbenchBackend* backend = nullptr;
    Session session;

    if (demo) {
        mock = new MockBackend(&app);
        mock->setLatency(150);
        backend = mock;
        session = buildDemoSession(mock);
    } else {
        if (sessionFile.isEmpty()) {
            printUsage();
            return 2;
        }
        QString error;
        if (!loadSession(sessionFile, &session, &error)) {
            qCritical().noquote() << error;
            return 1;
        }
        rest = new RestBackend(config.apiBaseUrl, config.apiToken, &app);
        rest->setTimeout(config.requestTimeoutMs);
        rest->setUserId(config.userId);
        backend = rest;
    }

    if (download) {
        return runDownload(app, backend, config, session);
    }

    // ========== Launch Application ==========
    ShortcutManager::instance();

    LocalImageStore store(config.resolvedDataDir());
    WorkbenchEngine engine(config, backend, &store);
    engine.setProject(session.projectId, session.targetLanguageId, session.pages);

    auto* window = new WorkbenchWindow(&engine, session.projectName.isEmpty() ? session.projectId
                                                                               : session.projectName);
    window->setAttribute(Qt::WA_DeleteOnClose);
    window->show();

    engine.goToPage(qBound(0, firstPage - 1, session.pages.size() - 1));

    return app.exec();
}
