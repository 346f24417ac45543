#pragma once

// ============================================================================
// InputDispatcher - Pointer, wheel and keyboard routing for the workbench
// ============================================================================
// Part of the TransDesk workbench engine
//
// Widget-independent: the viewport widget converts Qt events into
// PointerEvent / wheel / key calls, so the whole gesture state machine can be
// driven from tests without a window.
//
//   Idle --press on canvas--> Pending --move >= threshold--> Panning
//                               |                              |
//                               +--release: place marker--+    +--release--+
//                                                         v                v
//   Idle --press on marker--> DraggingMarker --release--> Idle (commit position)
//
// The drag threshold is measured from the press position, not from the last
// move, so slow drifts still turn into a pan.
// ============================================================================

#include "TranslationSource.h"

#include <QObject>
#include <QPointF>
#include <QPoint>
#include <QString>

class ViewportTransform;
class SourceModel;

/**
 * @brief Unified pointer event (mouse now, touch/stylus later).
 */
struct PointerEvent {
    enum Type { Press, Move, Release };

    Type type = Move;
    QPointF viewportPos;                                ///< Position in canvas pixels
    Qt::MouseButton button = Qt::NoButton;              ///< Button that changed (Press/Release)
    Qt::MouseButtons buttons = Qt::NoButton;            ///< Buttons held
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

/**
 * @brief Turns raw input into viewport changes and marker operations.
 */
class InputDispatcher : public QObject {
    Q_OBJECT

public:
    enum class Mode {
        Idle,
        Pending,         ///< Pressed on empty canvas, threshold not reached yet
        Panning,
        DraggingMarker
    };
    Q_ENUM(Mode)

    static constexpr qreal DEFAULT_DRAG_THRESHOLD = 4.0;
    static constexpr qreal DEFAULT_HIT_RADIUS = 12.0;
    static constexpr qreal DEFAULT_PAN_STEP = 60.0;
    static constexpr qreal DEFAULT_ZOOM_STEP = 1.1;
    static constexpr qreal WHEEL_SCROLL_STEP = 40.0;   ///< Canvas pixels per wheel notch

    InputDispatcher(ViewportTransform* viewport, SourceModel* model, QObject* parent = nullptr);
    ~InputDispatcher() override;

    // ===== Configuration =====

    void setDragThreshold(qreal px) { m_dragThreshold = qMax<qreal>(0.0, px); }
    qreal dragThreshold() const { return m_dragThreshold; }

    void setHitRadius(qreal px) { m_hitRadius = qMax<qreal>(0.0, px); }
    qreal hitRadius() const { return m_hitRadius; }

    void setKeyboardPanStep(qreal px) { m_panStep = px; }
    void setKeyboardZoomFactor(qreal factor) { m_zoomStep = factor > 1.0 ? factor : DEFAULT_ZOOM_STEP; }

    /**
     * @brief Stop reacting to input (session shutdown). Cancels any gesture.
     */
    void detach();
    bool isAttached() const { return m_viewport && m_model; }

    // ===== State =====

    Mode mode() const { return m_mode; }

    /**
     * @brief Category used for the next placed marker.
     */
    TranslationSource::Category placementCategory() const { return m_placementCategory; }
    void setPlacementCategory(TranslationSource::Category category);
    void togglePlacementCategory();

    // ===== Input =====

    /**
     * @brief Feed one pointer event.
     * @return True if the event was consumed.
     */
    bool handlePointer(const PointerEvent& pe);

    /**
     * @brief Feed one wheel event.
     * @param angleDelta Wheel rotation (120 units per notch), null for touchpads.
     * @param pixelDelta High-resolution scroll in pixels, null for wheels.
     */
    bool handleWheel(const QPointF& pos, const QPoint& angleDelta, const QPoint& pixelDelta,
                     Qt::KeyboardModifiers modifiers);

    /**
     * @brief Feed one key press.
     * @return True if the key triggered something.
     */
    bool handleKey(int key, Qt::KeyboardModifiers modifiers);

    /**
     * @brief Run a ShortcutManager action by id.
     *
     * Actions that mutate markers are refused while editing is disabled.
     * @return True if the action was recognized and allowed.
     */
    bool triggerAction(const QString& actionId);

    /**
     * @brief Abort the current gesture. A dragged marker snaps back.
     * @return True if a gesture was in progress.
     */
    bool cancelGesture();

signals:
    void modeChanged(InputDispatcher::Mode mode);
    void placementCategoryChanged(TranslationSource::Category category);

    /**
     * @brief Zoom or pan changed; the view should repaint.
     */
    void viewChanged();

    void nextPageRequested();
    void previousPageRequested();

private:
    void handlePointerPress(const PointerEvent& pe);
    void handlePointerMove(const PointerEvent& pe);
    void handlePointerRelease(const PointerEvent& pe);
    void setMode(Mode mode);

    ViewportTransform* m_viewport = nullptr;
    SourceModel* m_model = nullptr;

    Mode m_mode = Mode::Idle;
    TranslationSource::Category m_placementCategory = TranslationSource::Category::Inside;

    // Current gesture
    Qt::MouseButton m_pressButton = Qt::NoButton;
    QPointF m_pressPos;
    QPointF m_lastPos;
    QPointF m_grabOffset;          ///< Marker center minus pointer at press
    QString m_dragSourceId;
    bool m_placeOnRelease = false;

    qreal m_dragThreshold = DEFAULT_DRAG_THRESHOLD;
    qreal m_hitRadius = DEFAULT_HIT_RADIUS;
    qreal m_panStep = DEFAULT_PAN_STEP;
    qreal m_zoomStep = DEFAULT_ZOOM_STEP;
};
