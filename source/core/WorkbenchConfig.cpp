#include "WorkbenchConfig.h"

#include <QSettings>
#include <QStandardPaths>
#include <QDebug>

WorkbenchConfig WorkbenchConfig::load(QSettings& settings)
{
    WorkbenchConfig cfg;

    settings.beginGroup("backend");
    const QUrl baseUrl = settings.value("baseUrl", cfg.apiBaseUrl).toUrl();
    if (baseUrl.isValid() && !baseUrl.isEmpty()) {
        cfg.apiBaseUrl = baseUrl;
    } else {
        qWarning() << "WorkbenchConfig: ignoring invalid backend/baseUrl" << baseUrl;
    }
    cfg.userId = settings.value("userId", cfg.userId).toString();
    cfg.requestTimeoutMs = qMax(500, settings.value("requestTimeoutMs", cfg.requestTimeoutMs).toInt());
    settings.endGroup();

    settings.beginGroup("sync");
    cfg.debounceMs = qMax(0, settings.value("debounceMs", cfg.debounceMs).toInt());
    cfg.autoSyncMs = qMax(100, settings.value("autoSyncMs", cfg.autoSyncMs).toInt());
    cfg.maxBackoffTicks = qMax(1, settings.value("maxBackoffTicks", cfg.maxBackoffTicks).toInt());
    cfg.maxTransientAttempts = qMax(1, settings.value("maxTransientAttempts", cfg.maxTransientAttempts).toInt());
    settings.endGroup();

    settings.beginGroup("cache");
    cfg.imageCacheCapacity = qMax(1, settings.value("imageCapacity", cfg.imageCacheCapacity).toInt());
    cfg.sourceCacheCapacity = qMax(1, settings.value("sourceCapacity", cfg.sourceCacheCapacity).toInt());
    cfg.prefetchEnabled = settings.value("prefetch", cfg.prefetchEnabled).toBool();
    cfg.dataDir = settings.value("dataDir", cfg.dataDir).toString();
    settings.endGroup();

    settings.beginGroup("input");
    cfg.dragThresholdPx = qMax(0.0, settings.value("dragThresholdPx", cfg.dragThresholdPx).toDouble());
    cfg.markerHitRadiusPx = qMax(1.0, settings.value("markerHitRadiusPx", cfg.markerHitRadiusPx).toDouble());
    cfg.keyboardPanStepPx = settings.value("panStepPx", cfg.keyboardPanStepPx).toDouble();
    cfg.keyboardZoomFactor = settings.value("zoomFactor", cfg.keyboardZoomFactor).toDouble();
    if (cfg.keyboardZoomFactor <= 1.0) {
        cfg.keyboardZoomFactor = 1.1;
    }
    settings.endGroup();

    return cfg;
}

WorkbenchConfig WorkbenchConfig::loadDefault()
{
    QSettings settings("TransDesk", "App");
    WorkbenchConfig cfg = load(settings);

    // Token comes from the environment so it never lands in the settings file
    cfg.apiToken = qEnvironmentVariable("TRANSDESK_TOKEN");
    return cfg;
}

void WorkbenchConfig::save(QSettings& settings) const
{
    settings.beginGroup("backend");
    settings.setValue("baseUrl", apiBaseUrl);
    settings.setValue("userId", userId);
    settings.setValue("requestTimeoutMs", requestTimeoutMs);
    settings.endGroup();

    settings.beginGroup("sync");
    settings.setValue("debounceMs", debounceMs);
    settings.setValue("autoSyncMs", autoSyncMs);
    settings.setValue("maxBackoffTicks", maxBackoffTicks);
    settings.setValue("maxTransientAttempts", maxTransientAttempts);
    settings.endGroup();

    settings.beginGroup("cache");
    settings.setValue("imageCapacity", imageCacheCapacity);
    settings.setValue("sourceCapacity", sourceCacheCapacity);
    settings.setValue("prefetch", prefetchEnabled);
    settings.setValue("dataDir", dataDir);
    settings.endGroup();

    settings.beginGroup("input");
    settings.setValue("dragThresholdPx", dragThresholdPx);
    settings.setValue("markerHitRadiusPx", markerHitRadiusPx);
    settings.setValue("panStepPx", keyboardPanStepPx);
    settings.setValue("zoomFactor", keyboardZoomFactor);
    settings.endGroup();
}

QString WorkbenchConfig::resolvedDataDir() const
{
    if (!dataDir.isEmpty()) {
        return dataDir;
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}
