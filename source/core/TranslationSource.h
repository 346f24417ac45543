#pragma once

// ============================================================================
// TranslationSource - A marker placed on a page and its translations
// ============================================================================
// Part of the TransDesk workbench engine
//
// TranslationSource is a pure data class. It knows how to derive its status
// and primary record and how to merge an authoritative record from the
// backend, but it never talks to the network. SourceModel owns the list of
// sources for the current page and performs the remote calls.
// ============================================================================

#include <QString>
#include <QPointF>
#include <QVector>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>

/**
 * @brief One candidate translation attached to a source.
 */
struct TranslationRecord {
    QString id;                 ///< Backend id of the record
    QString content;            ///< Translation text
    QString proofreadContent;   ///< Proofread text (empty if not proofread)
    bool selected = false;      ///< Chosen candidate (at most one per source)
    bool isMine = false;        ///< Written by the local user (at most one per source)
    QString translatorName;     ///< Display name of the translator
    QString proofreaderName;    ///< Display name of the proofreader
    QDateTime updatedAt;        ///< Last edit time reported by the backend

    bool isValid() const { return !id.isEmpty(); }

    /**
     * @brief Parse a record from backend JSON.
     * @param obj Object using the backend's snake_case keys.
     * @param myUserId Id of the local user, used to derive isMine when the
     *                 backend does not send a "mine" flag.
     */
    static TranslationRecord fromJson(const QJsonObject& obj, const QString& myUserId = QString());
    QJsonObject toJson() const;
};

/**
 * @brief A marker ("source") on a page image.
 *
 * Position is normalized to the unscaled image size and is kept in [0,1].
 */
class TranslationSource {
public:
    enum class Category {
        Inside,     ///< Text inside a speech bubble
        Outside     ///< Text outside bubbles (sound effects, captions)
    };

    enum class Status {
        Empty,      ///< No text on the primary record
        Translated, ///< Primary record has translation text
        Proofed     ///< Primary record has proofread text
    };

    QString id;
    Category category = Category::Inside;
    Status status = Status::Empty;
    QPointF position;                   ///< Normalized [0,1] x [0,1]
    QVector<TranslationRecord> records;

    QString myTranslationId;            ///< Record written by the local user, or empty
    QString selectedTranslationId;      ///< Chosen record, or empty
    QString primaryTranslationId;       ///< Record treated as authoritative for display

    // Last values acknowledged by the backend: translation text of the local
    // user's record and proofread text of the proof target. Local edits are
    // diffed against these to decide whether a sync is needed.
    QString serverTranslationText;
    QString serverProofText;

    bool pendingCreate = false;         ///< Optimistic placeholder awaiting its backend id

    // ===== Records =====

    TranslationRecord* record(const QString& recordId);
    const TranslationRecord* record(const QString& recordId) const;

    /**
     * @brief Record of the local user, or nullptr.
     */
    const TranslationRecord* myRecord() const { return record(myTranslationId); }

    /**
     * @brief Primary record: selected > mine > first.
     */
    const TranslationRecord* primaryRecord() const { return record(primaryTranslationId); }

    /**
     * @brief Record to proofread when the user has not chosen one.
     * @return The primary record if present, else the first record, else nullptr.
     */
    const TranslationRecord* proofTarget() const;

    /**
     * @brief Merge an authoritative record from the backend.
     *
     * Replaces or appends the record, clears the isMine/selected flags on the
     * other records so at most one record carries each, refreshes the id
     * pointers, the server baselines and the status.
     */
    void applyRecord(const TranslationRecord& rec);

    /**
     * @brief Re-derive id pointers, baselines and status from the records.
     *
     * Called after loading or after any structural change to the record list.
     */
    void refreshDerivedState();

    /**
     * @brief Derive status from the primary record.
     */
    Status deriveStatus() const;

    // ===== Serialization =====

    static int positionTypeFor(Category category) { return category == Category::Inside ? 1 : 2; }
    static Category categoryForPositionType(int positionType) {
        return positionType == 2 ? Category::Outside : Category::Inside;
    }

    static TranslationSource fromJson(const QJsonObject& obj, const QString& myUserId = QString());
    QJsonObject toJson() const;

    /**
     * @brief Clamp a normalized point to [0,1] on both axes.
     */
    static QPointF clampPosition(const QPointF& pt);
};

Q_DECLARE_METATYPE(TranslationRecord)
Q_DECLARE_METATYPE(TranslationSource::Category)
