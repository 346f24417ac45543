#pragma once

// ============================================================================
// SourceModel - Markers of the current page and their remote operations
// ============================================================================
// Part of the TransDesk workbench engine
//
// SourceModel owns the list of TranslationSource objects for the page being
// edited and performs marker CRUD against the backend:
// - place()          optimistic insert, replaced by the backend's answer
// - drag()/endDrag() local updates while moving, one remote write per gesture
// - toggleCategory() remote first, local flip only after confirmation
// - remove()         local first, best-effort remote delete
//
// Records held by each source mirror what the backend acknowledged. Local
// typing lives in the editor buffers and in EditSyncQueue until a flush is
// acknowledged; applyRecordToSource() then moves the baselines.
//
// Every mutation emits an explicit signal; views never poll.
// ============================================================================

#include "TranslationSource.h"

#include <QObject>
#include <QHash>
#include <QSet>
#include <QVector>
#include <QPointF>

class WorkbenchBackend;
class EditSyncQueue;
class ViewportTransform;

/**
 * @brief Live marker list of one page plus the marker API.
 */
class SourceModel : public QObject {
    Q_OBJECT

public:
    using Category = TranslationSource::Category;

    SourceModel(WorkbenchBackend* backend, EditSyncQueue* queue, QObject* parent = nullptr);
    ~SourceModel() override;

    // ===== Context =====

    /**
     * @brief Set the page and target language new markers are created for.
     */
    void setTargetContext(const QString& fileId, const QString& targetLanguageId);
    void clearTargetContext();
    bool hasTargetContext() const { return !m_fileId.isEmpty() && !m_targetLanguageId.isEmpty(); }
    QString fileId() const { return m_fileId; }
    QString targetLanguageId() const { return m_targetLanguageId; }

    /**
     * @brief Transform used to map screen points (not owned).
     */
    void setViewport(const ViewportTransform* viewport) { m_viewport = viewport; }

    /**
     * @brief Capability flag; when false every mutating call is refused.
     */
    void setEditEnabled(bool enabled);
    bool isEditEnabled() const { return m_editEnabled; }

    // ===== Sources =====

    const QVector<TranslationSource>& sources() const { return m_sources; }
    int count() const { return m_sources.size(); }

    /**
     * @brief Replace the whole list (page hydration). Clears the active source.
     */
    void setSources(const QVector<TranslationSource>& sources);

    /**
     * @brief Drop all sources and the target context.
     */
    void clear();

    const TranslationSource* source(const QString& sourceId) const;
    int indexOf(const QString& sourceId) const;

    /**
     * @brief Source owning a record, or nullptr.
     */
    const TranslationSource* sourceOfRecord(const QString& recordId) const;

    /**
     * @brief Topmost marker within radiusPx of a screen point, or empty.
     */
    QString sourceAt(const QPointF& screen, qreal radiusPx) const;

    // ===== Active source and editor =====

    QString activeSourceId() const { return m_activeSourceId; }
    const TranslationSource* activeSource() const { return source(m_activeSourceId); }

    /**
     * @brief Make a source active and open it in the editor. Empty id clears.
     */
    void setActiveSource(const QString& sourceId);

    /**
     * @brief Cycle the active source in list order, wrapping at the ends.
     */
    void activateNext();
    void activatePrevious();

    QString editorTranslationText() const { return m_editorTranslation; }
    QString editorProofText() const { return m_editorProof; }

    // ===== Marker operations =====

    /**
     * @brief Place a marker at a screen point.
     * @param silent Keep the current active source (secondary-button placement).
     * @param errorOut Receives a user-facing message when rejected.
     * @return False if rejected synchronously (no network call was made).
     */
    bool place(Category category, const QPointF& screen, bool silent = false, QString* errorOut = nullptr);

    /**
     * @brief Place a marker at a normalized position.
     *
     * Points outside [0,1] are rejected.
     */
    bool placeNormalized(Category category, const QPointF& normalized, bool silent = false,
                         QString* errorOut = nullptr);

    /**
     * @brief Start moving a marker. Remembers the position to restore on cancel.
     */
    bool beginDrag(const QString& sourceId);

    /**
     * @brief Move a marker under the pointer. Position is clamped to [0,1].
     */
    void drag(const QString& sourceId, const QPointF& screen);

    /**
     * @brief Finish a drag; issues one position update if the marker moved.
     */
    void endDrag(const QString& sourceId);

    /**
     * @brief Abort a drag and restore the pre-drag position (no network call).
     */
    void cancelDrag(const QString& sourceId);

    bool isDragging() const { return !m_dragSourceId.isEmpty(); }

    /**
     * @brief True while a marker create or a first translation write is unanswered.
     *
     * Their answers carry backend ids that later edits depend on, so a page
     * must not be left before writesSettled().
     */
    bool hasOutstandingWrites() const { return m_outstandingWrites > 0; }

    /**
     * @brief Flip inside/outside once the backend confirms.
     */
    void toggleCategory(const QString& sourceId);

    /**
     * @brief Remove locally now, delete remotely best-effort.
     */
    void remove(const QString& sourceId);

    // ===== Text operations =====

    /**
     * @brief The user typed into the translation field of a source.
     *
     * Without an own record the first write goes through submitTranslation;
     * afterwards edits are dirty-checked and queued.
     */
    bool editTranslation(const QString& sourceId, const QString& text);

    /**
     * @brief The user typed into the proofread field.
     * @param recordId Record to proofread, or empty for resolveProofTarget().
     */
    bool editProofread(const QString& sourceId, const QString& text, const QString& recordId = QString());

    /**
     * @brief Choose (or un-choose) a record as the source's selected candidate.
     */
    bool selectRecord(const QString& sourceId, const QString& recordId, bool selected = true);

    /**
     * @brief Record to proofread when none was chosen explicitly.
     * @return The primary record, else the first record, else nullptr.
     */
    const TranslationRecord* resolveProofTarget(const TranslationSource& source) const;

    /**
     * @brief Merge an authoritative record into a source.
     *
     * Keeps the at-most-one invariants, moves the baselines, recomputes the
     * status and refreshes the editor buffers when the source is open.
     */
    void applyRecordToSource(const QString& sourceId, const TranslationRecord& record);

    /**
     * @brief Forget a record that no longer exists on the backend.
     */
    void dropRecord(const QString& recordId);

signals:
    void sourcesReset();
    void sourceAdded(const QString& sourceId);
    void sourceChanged(const QString& sourceId);
    void sourceRemoved(const QString& sourceId);

    /**
     * @brief A placeholder got its backend id.
     */
    void sourceIdChanged(const QString& oldId, const QString& newId);

    void activeSourceChanged(const QString& sourceId);
    void editorBuffersChanged(const QString& sourceId);
    void editEnabledChanged(bool enabled);

    /**
     * @brief The last outstanding create or first write has answered.
     */
    void writesSettled();

    /**
     * @brief User-visible error (rejected action or failed remote call).
     */
    void errorRaised(const QString& message);

private:
    TranslationSource* mutableSource(const QString& sourceId);
    bool checkEditable(QString* errorOut);
    void loadEditorBuffers();
    void submitFirstTranslation(const QString& sourceId, const QString& text);
    void onSourceCreated(const QString& placeholderId, const TranslationSource& created);
    void removeLocal(const QString& sourceId);
    void writeFinished();

    WorkbenchBackend* m_backend = nullptr;
    EditSyncQueue* m_queue = nullptr;
    const ViewportTransform* m_viewport = nullptr;

    QString m_fileId;
    QString m_targetLanguageId;
    bool m_editEnabled = true;

    QVector<TranslationSource> m_sources;
    QString m_activeSourceId;
    QString m_editorTranslation;
    QString m_editorProof;

    // Drag gesture
    QString m_dragSourceId;
    QPointF m_dragStartPosition;

    // Placeholders and in-flight bookkeeping
    int m_placeholderCounter = 0;
    QSet<QString> m_abandonedPlaceholders;          ///< Removed before the backend answered
    QHash<QString, QString> m_placeholderText;      ///< Text typed into a placeholder
    QSet<QString> m_categoryInFlight;
    QSet<QString> m_submitInFlight;                 ///< Sources awaiting their first record
    QHash<QString, QString> m_textAfterSubmit;      ///< Typed while the first write was in flight
    int m_outstandingWrites = 0;
};
