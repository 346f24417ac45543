#include "ShortcutManager.h"
#include "../compat/qt_compat.h"

#include <QStandardPaths>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

#include <algorithm>

// ============================================================================
// Shortcut Normalization Helper
// ============================================================================

/**
 * @brief Store "Ctrl+Shift+1" rather than the shifted symbol Qt may report.
 */
static QString normalizeShortcut(const QString& shortcut)
{
    if (shortcut.isEmpty() || !shortcut.contains("Shift+", Qt::CaseInsensitive)) {
        return shortcut;
    }

    static const QHash<QChar, QChar> shiftedToNumber = {
        {'!', '1'}, {'@', '2'}, {'#', '3'}, {'$', '4'}, {'%', '5'},
        {'^', '6'}, {'&', '7'}, {'*', '8'}, {'(', '9'}, {')', '0'}
    };

    const QChar lastChar = shortcut.at(shortcut.length() - 1);
    if (!shiftedToNumber.contains(lastChar)) {
        return shortcut;
    }
    QString normalized = shortcut;
    normalized.chop(1);
    normalized.append(shiftedToNumber.value(lastChar));
    return normalized;
}

// ============================================================================
// Singleton Instance
// ============================================================================

ShortcutManager* ShortcutManager::s_instance = nullptr;

ShortcutManager* ShortcutManager::instance()
{
    if (!s_instance) {
        s_instance = new ShortcutManager();
        s_instance->registerDefaults();  // Defaults first
        s_instance->loadUserShortcuts(); // Then user overrides
    }
    return s_instance;
}

ShortcutManager::ShortcutManager(QObject* parent)
    : QObject(parent)
{
    const QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    QDir dir(configDir);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    m_configPath = configDir + "/shortcuts.json";

#ifdef TRANSDESK_DEBUG
    qDebug() << "[ShortcutManager] Config path:" << m_configPath;
#endif
}

// ============================================================================
// Default Shortcuts Registration
// ============================================================================

void ShortcutManager::registerDefaults()
{
    // ===== View =====
    registerAction("view.zoom_in", "Ctrl+=", tr("Zoom In"), tr("View"));
    registerAction("view.zoom_in_alt", "Ctrl++", tr("Zoom In (Alternative)"), tr("View"));
    registerAction("view.zoom_out", "Ctrl+-", tr("Zoom Out"), tr("View"));
    registerAction("view.zoom_reset", "Ctrl+0", tr("Zoom to 100%"), tr("View"));
    registerAction("view.zoom_fit", "Ctrl+9", tr("Zoom to Fit"), tr("View"));
    registerAction("view.pan_up", "Up", tr("Pan Up"), tr("View"));
    registerAction("view.pan_down", "Down", tr("Pan Down"), tr("View"));
    registerAction("view.pan_left", "Left", tr("Pan Left"), tr("View"));
    registerAction("view.pan_right", "Right", tr("Pan Right"), tr("View"));

    // ===== Navigation =====
    registerAction("navigation.prev_page", "PgUp", tr("Previous Page"), tr("Navigation"));
    registerAction("navigation.next_page", "PgDown", tr("Next Page"), tr("Navigation"));
    registerAction("navigation.prev_page_alt", "Ctrl+Left", tr("Previous Page (Alternative)"), tr("Navigation"));
    registerAction("navigation.next_page_alt", "Ctrl+Right", tr("Next Page (Alternative)"), tr("Navigation"));
    registerAction("navigation.escape", "Esc", tr("Cancel Gesture"), tr("Navigation"));

    // ===== Markers =====
    registerAction("marker.toggle_placement", "Ctrl+Q", tr("Toggle Placement Type"), tr("Markers"));
    registerAction("marker.toggle_category", "Ctrl+T", tr("Toggle Marker Type"), tr("Markers"), true);
    registerAction("marker.delete", "Del", tr("Delete Marker"), tr("Markers"), true);

    // ===== Application =====
    registerAction("app.toggle_edit", "Ctrl+E", tr("Toggle Edit Mode"), tr("Application"));

#ifdef TRANSDESK_DEBUG
    qDebug() << "[ShortcutManager] Registered" << m_shortcuts.size() << "default shortcuts";
#endif
}

// ============================================================================
// Action Registration
// ============================================================================

void ShortcutManager::registerAction(const QString& actionId,
                                     const QString& defaultShortcut,
                                     const QString& displayName,
                                     const QString& category,
                                     bool requiresEdit)
{
    if (actionId.isEmpty()) {
        qWarning() << "[ShortcutManager] Cannot register action with empty ID";
        return;
    }

    // An entry may exist already: a loaded override or an earlier registration
    ShortcutEntry& entry = m_shortcuts[actionId];
    entry.defaultShortcut = defaultShortcut;
    entry.displayName = displayName;
    entry.category = category;
    entry.requiresEdit = requiresEdit;
}

bool ShortcutManager::actionRequiresEdit(const QString& actionId) const
{
    auto it = m_shortcuts.constFind(actionId);
    return it != m_shortcuts.constEnd() && it.value().requiresEdit;
}

// ============================================================================
// Shortcut Retrieval
// ============================================================================

QString ShortcutManager::shortcutForAction(const QString& actionId) const
{
    auto it = m_shortcuts.constFind(actionId);
    if (it == m_shortcuts.constEnd()) {
        return QString();
    }
    const ShortcutEntry& entry = it.value();
    return entry.userShortcut.isEmpty() ? entry.defaultShortcut : entry.userShortcut;
}

QKeySequence ShortcutManager::keySequenceForAction(const QString& actionId) const
{
    const QString shortcut = shortcutForAction(actionId);
    return shortcut.isEmpty() ? QKeySequence() : QKeySequence(shortcut);
}

bool ShortcutManager::isUserOverridden(const QString& actionId) const
{
    auto it = m_shortcuts.constFind(actionId);
    return it != m_shortcuts.constEnd() && !it.value().userShortcut.isEmpty();
}

QString ShortcutManager::actionForKey(int key, Qt::KeyboardModifiers modifiers) const
{
    if (key == 0 || key == Qt::Key_unknown) {
        return QString();
    }

    const Qt::KeyboardModifiers mods = modifiers & ~Qt::KeyboardModifiers(Qt::KeypadModifier);
    const QKeySequence pressed = TD_KEY_CHORD(key, mods);

    // "+" is typed with Shift on most layouts; match "Ctrl++" either way
    const QKeySequence withoutShift = TD_KEY_CHORD(key, mods & ~Qt::KeyboardModifiers(Qt::ShiftModifier));

    QString fallback;
    for (auto it = m_shortcuts.constBegin(); it != m_shortcuts.constEnd(); ++it) {
        const QString shortcut = shortcutForAction(it.key());
        if (shortcut.isEmpty()) {
            continue;
        }
        const QKeySequence bound(shortcut);
        if (bound == pressed) {
            return it.key();
        }
        if (fallback.isEmpty() && (mods & Qt::ShiftModifier) && bound == withoutShift) {
            fallback = it.key();
        }
    }
    return fallback;
}

// ============================================================================
// User Customization
// ============================================================================

void ShortcutManager::setUserShortcut(const QString& actionId, const QString& shortcut)
{
    auto it = m_shortcuts.find(actionId);
    if (it == m_shortcuts.end()) {
        qWarning() << "[ShortcutManager] Cannot set shortcut for unregistered action:" << actionId;
        return;
    }

    const QString normalized = normalizeShortcut(shortcut);
    const QString oldShortcut = shortcutForAction(actionId);

    // Matching the default clears the override instead of storing a duplicate
    ShortcutEntry& entry = it.value();
    if (normalized == entry.defaultShortcut) {
        entry.userShortcut.clear();
    } else {
        entry.userShortcut = normalized;
    }

    const QString newShortcut = shortcutForAction(actionId);
    if (oldShortcut != newShortcut) {
        emit shortcutChanged(actionId, newShortcut);
    }
}

void ShortcutManager::clearUserShortcut(const QString& actionId)
{
    auto it = m_shortcuts.find(actionId);
    if (it == m_shortcuts.end() || it.value().userShortcut.isEmpty()) {
        return;
    }

    const QString oldShortcut = it.value().userShortcut;
    it.value().userShortcut.clear();
    if (oldShortcut != it.value().defaultShortcut) {
        emit shortcutChanged(actionId, it.value().defaultShortcut);
    }
}

void ShortcutManager::resetAllToDefaults()
{
    int changed = 0;
    for (auto it = m_shortcuts.begin(); it != m_shortcuts.end(); ++it) {
        if (it.value().userShortcut.isEmpty()) {
            continue;
        }
        it.value().userShortcut.clear();
        changed++;
        emit shortcutChanged(it.key(), it.value().defaultShortcut);
    }

#ifdef TRANSDESK_DEBUG
    qDebug() << "[ShortcutManager] Reset" << changed << "shortcuts to defaults";
#else
    Q_UNUSED(changed);
#endif
}

// ============================================================================
// Persistence
// ============================================================================

void ShortcutManager::loadUserShortcuts()
{
    QFile file(m_configPath);
    if (!file.exists()) {
        return; // No overrides yet
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[ShortcutManager] Failed to open shortcuts.json:" << file.errorString();
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "[ShortcutManager] JSON parse error:" << parseError.errorString();
        return;
    }
    if (!doc.isObject()) {
        qWarning() << "[ShortcutManager] Invalid shortcuts.json format (not an object)";
        return;
    }

    const QJsonObject root = doc.object();
    const int version = root.value("version").toInt(1);
    if (version > 1) {
        qWarning() << "[ShortcutManager] Unsupported shortcuts.json version:" << version;
    }

    const QJsonObject overrides = root.value("overrides").toObject();
    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        // Unknown ids are kept so that a later registerAction() picks them up
        ShortcutEntry& entry = m_shortcuts[it.key()];
        entry.userShortcut = normalizeShortcut(it.value().toString());
        if (entry.displayName.isEmpty()) {
            entry.displayName = it.key();
        }
    }

#ifdef TRANSDESK_DEBUG
    qDebug() << "[ShortcutManager] Loaded" << overrides.size() << "shortcut overrides";
#endif
}

void ShortcutManager::saveUserShortcuts()
{
    QJsonObject overrides;
    for (auto it = m_shortcuts.constBegin(); it != m_shortcuts.constEnd(); ++it) {
        if (!it.value().userShortcut.isEmpty()) {
            overrides.insert(it.key(), it.value().userShortcut);
        }
    }

    QJsonObject root;
    root.insert("version", 1);
    root.insert("overrides", overrides);

    QFile file(m_configPath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[ShortcutManager] Failed to save shortcuts.json:" << file.errorString();
        return;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    file.close();
}

QString ShortcutManager::configFilePath() const
{
    return m_configPath;
}

// ============================================================================
// Conflict Detection
// ============================================================================

QStringList ShortcutManager::findConflicts(const QString& shortcut,
                                           const QString& excludeActionId) const
{
    QStringList conflicts;
    const QKeySequence target(shortcut);
    if (target.isEmpty()) {
        return conflicts;
    }

    for (auto it = m_shortcuts.constBegin(); it != m_shortcuts.constEnd(); ++it) {
        if (it.key() == excludeActionId) {
            continue;
        }
        const QString current = shortcutForAction(it.key());
        if (!current.isEmpty() && QKeySequence(current) == target) {
            conflicts.append(it.key());
        }
    }
    conflicts.sort();
    return conflicts;
}

// ============================================================================
// Listing
// ============================================================================

QStringList ShortcutManager::actionIds() const
{
    QStringList ids = m_shortcuts.keys();
    std::sort(ids.begin(), ids.end(), [this](const QString& a, const QString& b) {
        const QString ca = m_shortcuts.value(a).category;
        const QString cb = m_shortcuts.value(b).category;
        return ca == cb ? a < b : ca < cb;
    });
    return ids;
}

QString ShortcutManager::displayNameForAction(const QString& actionId) const
{
    return m_shortcuts.value(actionId).displayName;
}

QString ShortcutManager::categoryForAction(const QString& actionId) const
{
    return m_shortcuts.value(actionId).category;
}
