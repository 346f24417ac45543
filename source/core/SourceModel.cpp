// ============================================================================
// SourceModel - Implementation
// ============================================================================
// Part of the TransDesk workbench engine
// ============================================================================

#include "SourceModel.h"
#include "EditSyncQueue.h"
#include "ViewportTransform.h"
#include "../net/WorkbenchBackend.h"

#include <QPointer>
#include <QLineF>
#include <QDebug>

SourceModel::SourceModel(WorkbenchBackend* backend, EditSyncQueue* queue, QObject* parent)
    : QObject(parent)
    , m_backend(backend)
    , m_queue(queue)
{
}

SourceModel::~SourceModel() = default;

// ===== Context =====

void SourceModel::setTargetContext(const QString& fileId, const QString& targetLanguageId)
{
    m_fileId = fileId;
    m_targetLanguageId = targetLanguageId;
}

void SourceModel::clearTargetContext()
{
    m_fileId.clear();
    m_targetLanguageId.clear();
}

void SourceModel::setEditEnabled(bool enabled)
{
    if (m_editEnabled == enabled) {
        return;
    }
    m_editEnabled = enabled;

    // Leaving edit mode mid-gesture puts the marker back
    if (!enabled && isDragging()) {
        cancelDrag(m_dragSourceId);
    }
    emit editEnabledChanged(enabled);
}

bool SourceModel::checkEditable(QString* errorOut)
{
    if (m_editEnabled) {
        return true;
    }
    const QString message = tr("Editing is disabled");
    if (errorOut) {
        *errorOut = message;
    }
    emit errorRaised(message);
    return false;
}

// ===== Sources =====

void SourceModel::setSources(const QVector<TranslationSource>& sources)
{
    m_sources = sources;
    for (TranslationSource& source : m_sources) {
        source.position = TranslationSource::clampPosition(source.position);
        source.refreshDerivedState();
    }

    m_dragSourceId.clear();
    m_activeSourceId.clear();
    m_editorTranslation.clear();
    m_editorProof.clear();

    emit sourcesReset();
    emit activeSourceChanged(QString());
}

void SourceModel::clear()
{
    clearTargetContext();
    setSources({});
}

const TranslationSource* SourceModel::source(const QString& sourceId) const
{
    const int index = indexOf(sourceId);
    return index >= 0 ? &m_sources.at(index) : nullptr;
}

TranslationSource* SourceModel::mutableSource(const QString& sourceId)
{
    const int index = indexOf(sourceId);
    return index >= 0 ? &m_sources[index] : nullptr;
}

int SourceModel::indexOf(const QString& sourceId) const
{
    if (sourceId.isEmpty()) {
        return -1;
    }
    for (int i = 0; i < m_sources.size(); ++i) {
        if (m_sources.at(i).id == sourceId) {
            return i;
        }
    }
    return -1;
}

const TranslationSource* SourceModel::sourceOfRecord(const QString& recordId) const
{
    for (const TranslationSource& source : m_sources) {
        if (source.record(recordId)) {
            return &source;
        }
    }
    return nullptr;
}

QString SourceModel::sourceAt(const QPointF& screen, qreal radiusPx) const
{
    if (!m_viewport || !m_viewport->hasImage()) {
        return QString();
    }

    // Later markers are painted on top, so search back to front
    QString best;
    qreal bestDistance = radiusPx;
    for (int i = m_sources.size() - 1; i >= 0; --i) {
        const QPointF markerPos = m_viewport->normalizedToScreen(m_sources.at(i).position);
        const qreal distance = QLineF(markerPos, screen).length();
        if (distance <= bestDistance) {
            if (best.isEmpty() || distance < bestDistance) {
                best = m_sources.at(i).id;
                bestDistance = distance;
            }
        }
    }
    return best;
}

// ===== Active source and editor =====

void SourceModel::setActiveSource(const QString& sourceId)
{
    const QString id = indexOf(sourceId) >= 0 ? sourceId : QString();
    if (id == m_activeSourceId) {
        return;
    }
    m_activeSourceId = id;
    loadEditorBuffers();

    emit activeSourceChanged(m_activeSourceId);
    emit editorBuffersChanged(m_activeSourceId);
}

void SourceModel::activateNext()
{
    if (m_sources.isEmpty()) {
        return;
    }
    const int current = indexOf(m_activeSourceId);
    const int next = (current + 1) % m_sources.size();
    setActiveSource(m_sources.at(next).id);
}

void SourceModel::activatePrevious()
{
    if (m_sources.isEmpty()) {
        return;
    }
    const int current = indexOf(m_activeSourceId);
    const int previous = current <= 0 ? m_sources.size() - 1 : current - 1;
    setActiveSource(m_sources.at(previous).id);
}

void SourceModel::loadEditorBuffers()
{
    m_editorTranslation.clear();
    m_editorProof.clear();

    const TranslationSource* active = source(m_activeSourceId);
    if (!active) {
        return;
    }

    // Unsent local text takes precedence over the acknowledged text
    if (active->pendingCreate) {
        m_editorTranslation = m_placeholderText.value(active->id);
    } else if (m_textAfterSubmit.contains(active->id)) {
        m_editorTranslation = m_textAfterSubmit.value(active->id);
    } else if (const TranslationRecord* mine = active->myRecord()) {
        const TranslationUpdate pending = m_queue ? m_queue->pendingUpdate(mine->id) : TranslationUpdate();
        m_editorTranslation = pending.content ? *pending.content : mine->content;
    }

    if (const TranslationRecord* target = resolveProofTarget(*active)) {
        const TranslationUpdate pending = m_queue ? m_queue->pendingUpdate(target->id) : TranslationUpdate();
        m_editorProof = pending.proofreadContent ? *pending.proofreadContent : target->proofreadContent;
    }
}

// ===== Marker operations =====

bool SourceModel::place(Category category, const QPointF& screen, bool silent, QString* errorOut)
{
    if (!m_viewport || !m_viewport->hasImage()) {
        const QString message = tr("No page image to place a marker on");
        if (errorOut) {
            *errorOut = message;
        }
        emit errorRaised(message);
        return false;
    }

    bool inBounds = false;
    const QPointF normalized = m_viewport->screenToNormalized(screen, &inBounds);
    if (!inBounds) {
        const QString message = tr("Markers must be placed on the page image");
        if (errorOut) {
            *errorOut = message;
        }
        emit errorRaised(message);
        return false;
    }
    return placeNormalized(category, normalized, silent, errorOut);
}

bool SourceModel::placeNormalized(Category category, const QPointF& normalized, bool silent,
                                  QString* errorOut)
{
    if (!checkEditable(errorOut)) {
        return false;
    }

    if (normalized.x() < 0.0 || normalized.x() > 1.0 || normalized.y() < 0.0 || normalized.y() > 1.0) {
        const QString message = tr("Markers must be placed on the page image");
        if (errorOut) {
            *errorOut = message;
        }
        emit errorRaised(message);
        return false;
    }

    if (!hasTargetContext()) {
        const QString message = tr("No target language selected");
        if (errorOut) {
            *errorOut = message;
        }
        emit errorRaised(message);
        return false;
    }

    if (!m_backend) {
        qWarning() << "SourceModel: no backend, cannot create marker";
        return false;
    }

    // Optimistic placeholder; replaced by the backend's answer
    TranslationSource placeholder;
    placeholder.id = QString("pending:%1").arg(++m_placeholderCounter);
    placeholder.category = category;
    placeholder.position = normalized;
    placeholder.pendingCreate = true;
    placeholder.refreshDerivedState();

    const QString placeholderId = placeholder.id;
    m_sources.append(placeholder);
    emit sourceAdded(placeholderId);

    if (!silent) {
        setActiveSource(placeholderId);
    }

    const QString fileId = m_fileId;
    m_outstandingWrites++;
    QPointer<SourceModel> self(this);
    m_backend->createSource(fileId, m_targetLanguageId, TranslationSource::positionTypeFor(category),
                            normalized.x(), normalized.y(),
        [self, placeholderId, fileId](const TranslationSource& created, const BackendError& error) {
            if (!self) {
                return;
            }
            if (!error.isNull()) {
                qWarning() << "SourceModel: create failed:" << error.message;
                self->m_placeholderText.remove(placeholderId);
                if (!self->m_abandonedPlaceholders.remove(placeholderId)) {
                    self->removeLocal(placeholderId);
                }
                emit self->errorRaised(tr("Could not create marker: %1").arg(error.message));
            } else if (self->m_fileId != fileId && !self->m_abandonedPlaceholders.contains(placeholderId)) {
                // The context moved on without waiting for writesSettled(); the
                // marker exists remotely and shows up when that page is listed again.
                qWarning() << "SourceModel: marker" << created.id << "created after its page was left";
                self->removeLocal(placeholderId);
                self->m_placeholderText.remove(placeholderId);
            } else {
                self->onSourceCreated(placeholderId, created);
            }
            self->writeFinished();
        });

    return true;
}

void SourceModel::onSourceCreated(const QString& placeholderId, const TranslationSource& created)
{
    // Deleted by the user before the backend answered
    if (m_abandonedPlaceholders.remove(placeholderId)) {
        m_placeholderText.remove(placeholderId);
        if (m_backend && !created.id.isEmpty()) {
            m_backend->deleteSource(created.id, [](const BackendError& error) {
                if (!error.isNull() && !error.isNotFound()) {
                    qWarning() << "SourceModel: delete of abandoned marker failed:" << error.message;
                }
            });
        }
        return;
    }

    TranslationSource* source = mutableSource(placeholderId);
    if (!source) {
        return;
    }

    // Keep a position the user dragged to while waiting; take the rest from
    // the backend.
    const QPointF localPosition = source->position;
    *source = created;
    source->position = TranslationSource::clampPosition(localPosition);
    source->pendingCreate = false;
    source->refreshDerivedState();

    const QString newId = created.id;
    const QPointF committedPosition = source->position;
    if (m_dragSourceId == placeholderId) {
        m_dragSourceId = newId;
    }
    if (m_activeSourceId == placeholderId) {
        m_activeSourceId = newId;
    }
    emit sourceIdChanged(placeholderId, newId);
    emit sourceChanged(newId);
    if (m_activeSourceId == newId) {
        emit activeSourceChanged(newId);
    }

    // Slots connected to the signals above may have reshaped m_sources
    if (created.position != committedPosition && m_backend && m_dragSourceId != newId && indexOf(newId) >= 0) {
        QPointer<SourceModel> self(this);
        m_backend->updateSourcePosition(newId, committedPosition.x(), committedPosition.y(),
            [self](const BackendError& error) {
                if (self && !error.isNull()) {
                    qWarning() << "SourceModel: position update failed:" << error.message;
                    emit self->errorRaised(tr("Could not move marker: %1").arg(error.message));
                }
            });
    }

    // Text typed into the placeholder becomes the first translation
    const QString text = m_placeholderText.take(placeholderId);
    if (!text.isEmpty()) {
        editTranslation(newId, text);
    }
}

bool SourceModel::beginDrag(const QString& sourceId)
{
    if (!m_editEnabled) {
        return false;
    }
    const TranslationSource* source = this->source(sourceId);
    if (!source) {
        return false;
    }
    m_dragSourceId = sourceId;
    m_dragStartPosition = source->position;
    return true;
}

void SourceModel::drag(const QString& sourceId, const QPointF& screen)
{
    if (sourceId != m_dragSourceId || !m_viewport) {
        return;
    }
    TranslationSource* source = mutableSource(sourceId);
    if (!source) {
        return;
    }

    const QPointF normalized = m_viewport->screenToNormalized(screen);
    if (normalized == source->position) {
        return;
    }
    source->position = normalized;
    emit sourceChanged(sourceId);
}

void SourceModel::endDrag(const QString& sourceId)
{
    if (sourceId.isEmpty() || sourceId != m_dragSourceId) {
        return;
    }
    m_dragSourceId.clear();

    const TranslationSource* source = this->source(sourceId);
    if (!source || source->position == m_dragStartPosition) {
        return;
    }

    // Placeholders commit their position once the create call answers
    if (source->pendingCreate || !m_backend) {
        return;
    }

    QPointer<SourceModel> self(this);
    m_backend->updateSourcePosition(sourceId, source->position.x(), source->position.y(),
        [self](const BackendError& error) {
            if (self && !error.isNull()) {
                qWarning() << "SourceModel: position update failed:" << error.message;
                emit self->errorRaised(tr("Could not move marker: %1").arg(error.message));
            }
        });
}

void SourceModel::cancelDrag(const QString& sourceId)
{
    if (sourceId.isEmpty() || sourceId != m_dragSourceId) {
        return;
    }
    m_dragSourceId.clear();

    TranslationSource* source = mutableSource(sourceId);
    if (source && source->position != m_dragStartPosition) {
        source->position = m_dragStartPosition;
        emit sourceChanged(sourceId);
    }
}

void SourceModel::toggleCategory(const QString& sourceId)
{
    if (!checkEditable(nullptr)) {
        return;
    }
    const TranslationSource* source = this->source(sourceId);
    if (!source || !m_backend) {
        return;
    }
    if (source->pendingCreate) {
        emit errorRaised(tr("Marker is still being created"));
        return;
    }
    if (m_categoryInFlight.contains(sourceId)) {
        return;
    }

    const Category target = source->category == Category::Inside ? Category::Outside : Category::Inside;
    m_categoryInFlight.insert(sourceId);

    QPointer<SourceModel> self(this);
    m_backend->updateSourceCategory(sourceId, TranslationSource::positionTypeFor(target),
        [self, sourceId, target](const BackendError& error) {
            if (!self) {
                return;
            }
            self->m_categoryInFlight.remove(sourceId);
            if (!error.isNull()) {
                qWarning() << "SourceModel: category update failed:" << error.message;
                emit self->errorRaised(tr("Could not change marker type: %1").arg(error.message));
                return;
            }
            TranslationSource* confirmed = self->mutableSource(sourceId);
            if (confirmed) {
                confirmed->category = target;
                emit self->sourceChanged(sourceId);
            }
        });
}

void SourceModel::remove(const QString& sourceId)
{
    if (!checkEditable(nullptr)) {
        return;
    }
    const TranslationSource* source = this->source(sourceId);
    if (!source) {
        return;
    }

    if (source->pendingCreate) {
        // The create answer will delete it remotely
        m_abandonedPlaceholders.insert(sourceId);
        m_placeholderText.remove(sourceId);
        removeLocal(sourceId);
        return;
    }

    // Edits of a deleted marker have nowhere to go
    if (m_queue) {
        for (const TranslationRecord& rec : source->records) {
            m_queue->discard(rec.id);
        }
    }
    m_textAfterSubmit.remove(sourceId);

    removeLocal(sourceId);

    if (!m_backend) {
        return;
    }
    QPointer<SourceModel> self(this);
    m_backend->deleteSource(sourceId, [self, sourceId](const BackendError& error) {
        if (error.isNull() || error.isNotFound()) {
            return;
        }
        qWarning() << "SourceModel: delete of" << sourceId << "failed:" << error.message;
        if (self) {
            emit self->errorRaised(tr("Could not delete marker: %1").arg(error.message));
        }
    });
}

void SourceModel::removeLocal(const QString& sourceId)
{
    const int index = indexOf(sourceId);
    if (index < 0) {
        return;
    }
    if (m_dragSourceId == sourceId) {
        m_dragSourceId.clear();
    }
    m_sources.removeAt(index);
    emit sourceRemoved(sourceId);

    if (m_activeSourceId == sourceId) {
        setActiveSource(QString());
    }
}

void SourceModel::writeFinished()
{
    m_outstandingWrites = qMax(0, m_outstandingWrites - 1);
    if (m_outstandingWrites == 0) {
        emit writesSettled();
    }
}

// ===== Text operations =====

bool SourceModel::editTranslation(const QString& sourceId, const QString& text)
{
    if (!checkEditable(nullptr)) {
        return false;
    }
    const TranslationSource* source = this->source(sourceId);
    if (!source) {
        return false;
    }

    if (sourceId == m_activeSourceId) {
        m_editorTranslation = text;
    }

    if (source->pendingCreate) {
        m_placeholderText.insert(sourceId, text);
        return true;
    }

    const TranslationRecord* mine = source->myRecord();
    if (!mine) {
        if (m_submitInFlight.contains(sourceId)) {
            m_textAfterSubmit.insert(sourceId, text);
            return true;
        }
        if (text.isEmpty()) {
            return true;
        }
        submitFirstTranslation(sourceId, text);
        return true;
    }

    if (m_queue) {
        m_queue->enqueueContent(mine->id, text, source->serverTranslationText);
    }
    return true;
}

void SourceModel::submitFirstTranslation(const QString& sourceId, const QString& text)
{
    if (!m_backend) {
        return;
    }
    m_submitInFlight.insert(sourceId);
    m_outstandingWrites++;

    QPointer<SourceModel> self(this);
    m_backend->submitTranslation(sourceId, m_targetLanguageId, text,
        [self, sourceId, text](const TranslationRecord& record, const BackendError& error) {
            if (!self) {
                return;
            }
            self->m_submitInFlight.remove(sourceId);
            const bool hasLater = self->m_textAfterSubmit.contains(sourceId);
            const QString later = self->m_textAfterSubmit.take(sourceId);

            if (!error.isNull()) {
                qWarning() << "SourceModel: submit translation failed:" << error.message;
                if (!error.isNotFound()) {
                    // Keep the user's text in the editor; the next keystroke retries
                    emit self->errorRaised(tr("Could not save translation: %1").arg(error.message));
                }
            } else {
                TranslationRecord mine = record;
                mine.isMine = true;
                self->applyRecordToSource(sourceId, mine);

                // Typing continued during the first write
                if (hasLater && later != text) {
                    self->editTranslation(sourceId, later);
                }
            }
            self->writeFinished();
        });
}

bool SourceModel::editProofread(const QString& sourceId, const QString& text, const QString& recordId)
{
    if (!checkEditable(nullptr)) {
        return false;
    }
    const TranslationSource* source = this->source(sourceId);
    if (!source) {
        return false;
    }

    const TranslationRecord* target = recordId.isEmpty() ? resolveProofTarget(*source)
                                                          : source->record(recordId);
    if (!target) {
        emit errorRaised(tr("Nothing to proofread yet"));
        return false;
    }

    if (sourceId == m_activeSourceId) {
        m_editorProof = text;
    }
    if (m_queue) {
        m_queue->enqueueProofread(target->id, text, target->proofreadContent);
    }
    return true;
}

bool SourceModel::selectRecord(const QString& sourceId, const QString& recordId, bool selected)
{
    if (!checkEditable(nullptr)) {
        return false;
    }
    TranslationSource* source = mutableSource(sourceId);
    if (!source) {
        return false;
    }
    TranslationRecord* rec = source->record(recordId);
    if (!rec) {
        return false;
    }

    // Selection is shown immediately; the queue carries it to the backend
    for (TranslationRecord& other : source->records) {
        other.selected = (other.id == recordId) ? selected : (selected ? false : other.selected);
    }
    source->refreshDerivedState();

    if (m_queue) {
        m_queue->enqueueSelected(recordId, selected);
    }

    emit sourceChanged(sourceId);
    if (sourceId == m_activeSourceId) {
        loadEditorBuffers();
        emit editorBuffersChanged(sourceId);
    }
    return true;
}

const TranslationRecord* SourceModel::resolveProofTarget(const TranslationSource& source) const
{
    return source.proofTarget();
}

void SourceModel::applyRecordToSource(const QString& sourceId, const TranslationRecord& record)
{
    TranslationSource* source = mutableSource(sourceId);
    if (!source || !record.isValid()) {
        return;
    }

    source->applyRecord(record);
    emit sourceChanged(sourceId);

    if (sourceId != m_activeSourceId) {
        return;
    }
    // Slots connected to sourceChanged may have reshaped m_sources
    source = mutableSource(sourceId);
    if (!source) {
        return;
    }

    // Refresh editor fields the user has no newer unsent text for
    bool changed = false;
    if (record.id == source->myTranslationId
        && !(m_queue && m_queue->hasPendingContent(record.id))
        && !m_textAfterSubmit.contains(sourceId)
        && m_editorTranslation != record.content) {
        m_editorTranslation = record.content;
        changed = true;
    }
    const TranslationRecord* target = resolveProofTarget(*source);
    if (target && !(m_queue && m_queue->hasPendingProofread(target->id))
        && m_editorProof != target->proofreadContent) {
        m_editorProof = target->proofreadContent;
        changed = true;
    }
    if (changed) {
        emit editorBuffersChanged(sourceId);
    }
}

void SourceModel::dropRecord(const QString& recordId)
{
    for (TranslationSource& source : m_sources) {
        for (int i = 0; i < source.records.size(); ++i) {
            if (source.records.at(i).id != recordId) {
                continue;
            }
            source.records.removeAt(i);
            source.refreshDerivedState();
            const QString sourceId = source.id;
            emit sourceChanged(sourceId);
            if (sourceId == m_activeSourceId) {
                loadEditorBuffers();
                emit editorBuffersChanged(sourceId);
            }
            return;
        }
    }
}
