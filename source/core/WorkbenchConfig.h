#pragma once

// ============================================================================
// WorkbenchConfig - Tunables for a workbench session
// ============================================================================
// Part of the TransDesk workbench engine
//
// Values are read from QSettings("TransDesk", "App"). Every field has a
// default so a fresh install works without any settings file, and tests can
// build a config directly without touching QSettings.
// ============================================================================

#include <QString>
#include <QUrl>

class QSettings;

/**
 * @brief Session configuration for WorkbenchEngine and its collaborators.
 */
struct WorkbenchConfig {
    // ===== Backend =====
    QUrl apiBaseUrl = QUrl("https://api.moetran.com/v1/");
    QString apiToken;                   ///< Bearer token, supplied externally (never stored here)
    QString userId;                     ///< Local user id, used to mark own records
    int requestTimeoutMs = 5000;        ///< Per-request transfer timeout

    // ===== Edit sync =====
    int debounceMs = 500;               ///< Pause in typing before a flush
    int autoSyncMs = 2000;              ///< Periodic flush regardless of typing
    int maxBackoffTicks = 8;            ///< Upper bound for transient-failure backoff
    int maxTransientAttempts = 6;       ///< Consecutive failures before an edit is parked

    // ===== Image cache =====
    int imageCacheCapacity = 8;         ///< Decoded page images kept in memory
    int sourceCacheCapacity = 32;       ///< Pages whose source lists are kept in memory
    bool prefetchEnabled = true;
    QString dataDir;                    ///< Root for the offline image store (empty = AppDataLocation)

    // ===== Input =====
    qreal dragThresholdPx = 4.0;        ///< Movement before a press becomes a pan
    qreal markerHitRadiusPx = 12.0;     ///< Pointer distance that counts as hitting a marker
    qreal keyboardPanStepPx = 60.0;     ///< Screen pixels per pan key press
    qreal keyboardZoomFactor = 1.1;     ///< Multiplicative step per zoom key press

    /**
     * @brief Load configuration from settings, falling back to defaults.
     */
    static WorkbenchConfig load(QSettings& settings);

    /**
     * @brief Load from the application's default settings store.
     */
    static WorkbenchConfig loadDefault();

    /**
     * @brief Persist the user-tunable fields (the token is never written).
     */
    void save(QSettings& settings) const;

    /**
     * @brief Resolved data directory (dataDir or AppDataLocation).
     */
    QString resolvedDataDir() const;
};
