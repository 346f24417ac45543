// ============================================================================
// InputDispatcher - Implementation
// ============================================================================

#include "InputDispatcher.h"
#include "ShortcutManager.h"
#include "SourceModel.h"
#include "ViewportTransform.h"

#include <QLineF>
#include <QtMath>
#include <QDebug>

InputDispatcher::InputDispatcher(ViewportTransform* viewport, SourceModel* model, QObject* parent)
    : QObject(parent)
    , m_viewport(viewport)
    , m_model(model)
{
}

InputDispatcher::~InputDispatcher() = default;

void InputDispatcher::detach()
{
    cancelGesture();
    m_viewport = nullptr;
    m_model = nullptr;
}

void InputDispatcher::setMode(Mode mode)
{
    if (m_mode == mode) {
        return;
    }
    m_mode = mode;
#ifdef TRANSDESK_DEBUG
    qDebug() << "InputDispatcher: mode" << mode;
#endif
    emit modeChanged(mode);
}

void InputDispatcher::setPlacementCategory(TranslationSource::Category category)
{
    if (m_placementCategory == category) {
        return;
    }
    m_placementCategory = category;
    emit placementCategoryChanged(category);
}

void InputDispatcher::togglePlacementCategory()
{
    setPlacementCategory(m_placementCategory == TranslationSource::Category::Inside
                         ? TranslationSource::Category::Outside
                         : TranslationSource::Category::Inside);
}

// ===== Pointer =====

bool InputDispatcher::handlePointer(const PointerEvent& pe)
{
    if (!isAttached()) {
        return false;
    }

    switch (pe.type) {
        case PointerEvent::Press:
            if (m_mode != Mode::Idle) {
                // A second button while a gesture runs is ignored
                return true;
            }
            if (pe.button != Qt::LeftButton && pe.button != Qt::RightButton) {
                return false;
            }
            handlePointerPress(pe);
            return true;
        case PointerEvent::Move:
            if (m_mode == Mode::Idle) {
                return false;
            }
            handlePointerMove(pe);
            return true;
        case PointerEvent::Release:
            if (m_mode == Mode::Idle || pe.button != m_pressButton) {
                return false;
            }
            handlePointerRelease(pe);
            return true;
    }
    return false;
}

void InputDispatcher::handlePointerPress(const PointerEvent& pe)
{
    m_pressButton = pe.button;
    m_pressPos = pe.viewportPos;
    m_lastPos = pe.viewportPos;
    m_dragSourceId.clear();
    m_placeOnRelease = false;

    const QString hit = m_model->sourceAt(pe.viewportPos, m_hitRadius);
    if (!hit.isEmpty()) {
        // Selecting never moves the marker; only a later move does
        m_model->setActiveSource(hit);
        if (pe.button == Qt::LeftButton && m_model->beginDrag(hit)) {
            const TranslationSource* source = m_model->source(hit);
            m_grabOffset = source ? m_viewport->normalizedToScreen(source->position) - pe.viewportPos
                                  : QPointF();
            m_dragSourceId = hit;
            setMode(Mode::DraggingMarker);
            return;
        }
        // Read-only or secondary press on a marker: may still become a pan
        setMode(Mode::Pending);
        return;
    }

    m_placeOnRelease = true;
    setMode(Mode::Pending);
}

void InputDispatcher::handlePointerMove(const PointerEvent& pe)
{
    const QPointF pos = pe.viewportPos;

    switch (m_mode) {
        case Mode::Pending:
            if (QLineF(m_pressPos, pos).length() < m_dragThreshold) {
                return;
            }
            m_placeOnRelease = false;
            setMode(Mode::Panning);
            // Include the distance covered before the threshold was crossed
            m_viewport->panBy(pos - m_pressPos);
            m_lastPos = pos;
            emit viewChanged();
            return;
        case Mode::Panning:
            m_viewport->panBy(pos - m_lastPos);
            m_lastPos = pos;
            emit viewChanged();
            return;
        case Mode::DraggingMarker:
            if (pos != m_lastPos) {
                m_model->drag(m_dragSourceId, pos + m_grabOffset);
                m_lastPos = pos;
            }
            return;
        case Mode::Idle:
            return;
    }
}

void InputDispatcher::handlePointerRelease(const PointerEvent& pe)
{
    const Mode finished = m_mode;
    const Qt::MouseButton button = m_pressButton;
    const bool place = m_placeOnRelease;
    const QString dragged = m_dragSourceId;

    m_pressButton = Qt::NoButton;
    m_placeOnRelease = false;
    m_dragSourceId.clear();
    setMode(Mode::Idle);

    if (finished == Mode::DraggingMarker) {
        m_model->endDrag(dragged);
        return;
    }

    if (finished == Mode::Pending && place) {
        // Secondary button places without stealing the editor focus
        const bool silent = (button == Qt::RightButton);
        QString error;
        if (!m_model->place(m_placementCategory, pe.viewportPos, silent, &error)) {
            qDebug() << "InputDispatcher: placement rejected:" << error;
        }
    }
}

bool InputDispatcher::cancelGesture()
{
    if (m_mode == Mode::Idle) {
        return false;
    }
    if (m_mode == Mode::DraggingMarker && m_model) {
        m_model->cancelDrag(m_dragSourceId);
    }
    m_pressButton = Qt::NoButton;
    m_placeOnRelease = false;
    m_dragSourceId.clear();
    setMode(Mode::Idle);
    return true;
}

// ===== Wheel =====

bool InputDispatcher::handleWheel(const QPointF& pos, const QPoint& angleDelta, const QPoint& pixelDelta,
                                  Qt::KeyboardModifiers modifiers)
{
    if (!isAttached()) {
        return false;
    }

    if (modifiers & Qt::ControlModifier) {
        qreal notches = 0;
        if (!angleDelta.isNull()) {
            // Mouse wheel: 120 units = 15 degrees = one step
            notches = angleDelta.y() / 120.0;
        } else if (!pixelDelta.isNull()) {
            notches = pixelDelta.y() / 50.0;
        }
        if (qFuzzyIsNull(notches)) {
            return true;
        }
        if (m_viewport->zoomAt(m_viewport->zoom() * qPow(DEFAULT_ZOOM_STEP, notches), pos)) {
            emit viewChanged();
        }
        return true;
    }

    QPointF delta;
    if (!pixelDelta.isNull()) {
        delta = QPointF(pixelDelta);
    } else if (!angleDelta.isNull()) {
        delta = QPointF(angleDelta.x(), angleDelta.y()) / 120.0 * WHEEL_SCROLL_STEP;
    }
    if (delta.isNull()) {
        return false;
    }

    if (modifiers & Qt::ShiftModifier) {
        // Vertical wheel drives horizontal pan
        delta = QPointF(delta.y() != 0 ? delta.y() : delta.x(), 0);
    }
    m_viewport->panBy(delta);
    emit viewChanged();
    return true;
}

// ===== Keyboard =====

bool InputDispatcher::handleKey(int key, Qt::KeyboardModifiers modifiers)
{
    if (!isAttached()) {
        return false;
    }

    // Marker cycling is fixed, not rebindable
    if (key == Qt::Key_Backtab || (key == Qt::Key_Tab && (modifiers & Qt::ShiftModifier))) {
        m_model->activatePrevious();
        return true;
    }
    if (key == Qt::Key_Tab && !(modifiers & (Qt::ControlModifier | Qt::AltModifier))) {
        m_model->activateNext();
        return true;
    }

    const QString action = ShortcutManager::instance()->actionForKey(key, modifiers);
    if (action.isEmpty()) {
        return false;
    }
    return triggerAction(action);
}

bool InputDispatcher::triggerAction(const QString& actionId)
{
    if (!isAttached()) {
        return false;
    }

    if (ShortcutManager::instance()->actionRequiresEdit(actionId) && !m_model->isEditEnabled()) {
#ifdef TRANSDESK_DEBUG
        qDebug() << "InputDispatcher: refused" << actionId << "while editing is disabled";
#endif
        return false;
    }

    // ----- View -----
    if (actionId == "view.zoom_in" || actionId == "view.zoom_in_alt") {
        if (m_viewport->zoomBy(m_zoomStep)) {
            emit viewChanged();
        }
        return true;
    }
    if (actionId == "view.zoom_out") {
        if (m_viewport->zoomBy(1.0 / m_zoomStep)) {
            emit viewChanged();
        }
        return true;
    }
    if (actionId == "view.zoom_reset") {
        if (m_viewport->zoomAt(1.0, m_viewport->canvasCenter())) {
            emit viewChanged();
        }
        return true;
    }
    if (actionId == "view.zoom_fit") {
        m_viewport->fitToCanvas();
        emit viewChanged();
        return true;
    }
    if (actionId.startsWith("view.pan_")) {
        // Moving the view up slides the image down
        QPointF delta;
        if (actionId == "view.pan_up") {
            delta = QPointF(0, m_panStep);
        } else if (actionId == "view.pan_down") {
            delta = QPointF(0, -m_panStep);
        } else if (actionId == "view.pan_left") {
            delta = QPointF(m_panStep, 0);
        } else if (actionId == "view.pan_right") {
            delta = QPointF(-m_panStep, 0);
        } else {
            return false;
        }
        m_viewport->panBy(delta);
        emit viewChanged();
        return true;
    }

    // ----- Navigation -----
    if (actionId == "navigation.next_page" || actionId == "navigation.next_page_alt") {
        cancelGesture();
        emit nextPageRequested();
        return true;
    }
    if (actionId == "navigation.prev_page" || actionId == "navigation.prev_page_alt") {
        cancelGesture();
        emit previousPageRequested();
        return true;
    }
    if (actionId == "navigation.escape") {
        if (!cancelGesture()) {
            m_model->setActiveSource(QString());
        }
        return true;
    }

    // ----- Markers -----
    if (actionId == "marker.toggle_placement") {
        togglePlacementCategory();
        return true;
    }
    if (actionId == "marker.toggle_category") {
        const QString active = m_model->activeSourceId();
        if (!active.isEmpty()) {
            m_model->toggleCategory(active);
        }
        return true;
    }
    if (actionId == "marker.delete") {
        const QString active = m_model->activeSourceId();
        if (!active.isEmpty()) {
            cancelGesture();
            m_model->remove(active);
        }
        return true;
    }

    // ----- Application -----
    if (actionId == "app.toggle_edit") {
        m_model->setEditEnabled(!m_model->isEditEnabled());
        return true;
    }

    qWarning() << "InputDispatcher: unhandled action" << actionId;
    return false;
}
