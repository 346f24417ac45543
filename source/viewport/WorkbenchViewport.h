// ============================================================================
// WorkbenchViewport - Canvas widget showing a page image and its markers
// ============================================================================
// Part of the TransDesk workbench engine
//
// WorkbenchViewport is a thin QWidget over WorkbenchEngine:
// - paints the current page image inside the ViewportTransform frame
// - paints one numbered marker per source, colored by category
// - converts Qt mouse/wheel/key events into InputDispatcher calls
// - shows a notice instead of the image when the page failed to load
//
// All gesture logic lives in InputDispatcher; this class only translates.
// ============================================================================

#pragma once

#include "../core/InputDispatcher.h"

#include <QWidget>
#include <QString>

class WorkbenchEngine;

class WorkbenchViewport : public QWidget {
    Q_OBJECT

public:
    explicit WorkbenchViewport(WorkbenchEngine* engine, QWidget* parent = nullptr);
    ~WorkbenchViewport() override;

    static constexpr int MARKER_RADIUS = 10;   ///< Marker disc radius in pixels

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

    /**
     * @brief Keep Tab for marker cycling instead of focus traversal.
     */
    bool focusNextPrevChild(bool next) override;

private:
    PointerEvent mouseToPointerEvent(QMouseEvent* event, PointerEvent::Type type) const;
    void paintMarkers(QPainter& painter);

    WorkbenchEngine* m_engine = nullptr;
    QString m_notice;                   ///< Shown when the page image failed
};
