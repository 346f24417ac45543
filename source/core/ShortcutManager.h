#ifndef SHORTCUTMANAGER_H
#define SHORTCUTMANAGER_H

#include <QObject>
#include <QString>
#include <QHash>
#include <QKeySequence>
#include <QStringList>

/**
 * @brief Keyboard chords of the workbench, user-overridable.
 *
 * ShortcutManager is a singleton that maps workbench actions to key chords.
 * It provides:
 * - Registration of actions with default chords
 * - User customization (overrides stored in shortcuts.json)
 * - Reverse lookup from a key press to the action it triggers
 * - Conflict detection
 *
 * Usage:
 *   // Which action does this key press trigger?
 *   QString action = ShortcutManager::instance()->actionForKey(Qt::Key_Equal, Qt::ControlModifier);
 *
 *   // Let the user rebind a chord
 *   ShortcutManager::instance()->setUserShortcut("view.zoom_in", "Ctrl+Up");
 *   ShortcutManager::instance()->saveUserShortcuts();
 */
class ShortcutManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Get the singleton instance.
     * Creates the instance on first call.
     */
    static ShortcutManager* instance();

    /**
     * @brief Register all default workbench chords.
     * Called once by instance().
     */
    void registerDefaults();

    /**
     * @brief Register an action with its default chord.
     *
     * @param actionId Unique identifier (e.g., "view.zoom_in", "marker.delete")
     * @param defaultShortcut Default key sequence string (e.g., "Ctrl+=", "Del")
     * @param displayName Human-readable name for UI
     * @param category Category for grouping in UI (e.g., "View", "Markers")
     * @param requiresEdit True if the action mutates markers and needs edit mode
     *
     * A user override loaded before registration is kept.
     */
    void registerAction(const QString& actionId,
                        const QString& defaultShortcut,
                        const QString& displayName,
                        const QString& category,
                        bool requiresEdit = false);

    /**
     * @brief True if the action mutates state and is refused when editing is off.
     */
    bool actionRequiresEdit(const QString& actionId) const;

    // ========== Shortcut Retrieval ==========

    /**
     * @brief Current chord for an action: user override if set, else default.
     * Returns empty string if the action is not registered.
     */
    QString shortcutForAction(const QString& actionId) const;

    QKeySequence keySequenceForAction(const QString& actionId) const;

    bool isUserOverridden(const QString& actionId) const;

    /**
     * @brief Action bound to a key press, or empty if none.
     *
     * Keypad and shift-only modifiers are ignored so that "Ctrl++" matches
     * on both the main keyboard and the keypad.
     */
    QString actionForKey(int key, Qt::KeyboardModifiers modifiers) const;

    // ========== User Customization ==========

    /**
     * @brief Set a user override for an action's chord.
     * Emits shortcutChanged. Does NOT auto-save; call saveUserShortcuts().
     */
    void setUserShortcut(const QString& actionId, const QString& shortcut);

    /**
     * @brief Clear user override, reverting to default.
     */
    void clearUserShortcut(const QString& actionId);

    /**
     * @brief Clear all user overrides.
     */
    void resetAllToDefaults();

    // ========== Persistence ==========

    /**
     * @brief Load user overrides from shortcuts.json.
     * Called automatically on first instance() access.
     */
    void loadUserShortcuts();

    /**
     * @brief Save user overrides (not defaults) to shortcuts.json.
     */
    void saveUserShortcuts();

    QString configFilePath() const;

    /**
     * @brief Point persistence at another file (tests, portable installs).
     */
    void setConfigFilePath(const QString& path) { m_configPath = path; }

    // ========== Conflict Detection ==========

    /**
     * @brief Find actions that use the given chord.
     */
    QStringList findConflicts(const QString& shortcut,
                              const QString& excludeActionId = QString()) const;

    // ========== Listing ==========

    /**
     * @brief Registered action IDs, grouped by category then sorted by ID.
     */
    QStringList actionIds() const;
    QString displayNameForAction(const QString& actionId) const;
    QString categoryForAction(const QString& actionId) const;

signals:
    /**
     * @brief Emitted when a chord changes (user override or clear).
     */
    void shortcutChanged(const QString& actionId, const QString& newShortcut);

private:
    explicit ShortcutManager(QObject* parent = nullptr);
    ~ShortcutManager() override = default;

    ShortcutManager(const ShortcutManager&) = delete;
    ShortcutManager& operator=(const ShortcutManager&) = delete;

    struct ShortcutEntry {
        QString defaultShortcut;   ///< The built-in default
        QString userShortcut;      ///< User override (empty = use default)
        QString displayName;       ///< Shown by the host's key binding editor
        QString category;          ///< "View", "Navigation", "Markers" or "Application"
        bool requiresEdit = false; ///< Refused when editing is disabled
    };

    /// All registered chords, keyed by action ID
    QHash<QString, ShortcutEntry> m_shortcuts;

    /// Path to shortcuts.json
    QString m_configPath;

    static ShortcutManager* s_instance;
};

#endif // SHORTCUTMANAGER_H
