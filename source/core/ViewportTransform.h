#pragma once

// ============================================================================
// ViewportTransform - Screen <-> normalized image coordinates
// ============================================================================
// Part of the TransDesk workbench engine
//
// The page image is drawn as a frame whose top-left corner sits at `pan`
// (canvas pixels) and whose size is imageSize * zoom. Marker positions are
// stored normalized to the unscaled image size, so they survive any zoom or
// pan change and any display resolution.
//
//   screen     = pan + normalized * imageSize * zoom
//   normalized = (screen - pan) / zoom / imageSize
// ============================================================================

#include <QPointF>
#include <QSizeF>
#include <QRectF>

/**
 * @brief Zoom/pan state and the coordinate mapping it implies.
 *
 * Pure math, no Qt object model: cheap to copy and easy to test.
 */
class ViewportTransform {
public:
    static constexpr qreal MIN_ZOOM = 0.1;   // 10%
    static constexpr qreal MAX_ZOOM = 8.0;   // 800%

    ViewportTransform() = default;

    // ===== State =====

    qreal zoom() const { return m_zoom; }
    QPointF pan() const { return m_pan; }

    /**
     * @brief Set the pan offset directly (frame origin in canvas pixels).
     */
    void setPan(const QPointF& pan) { m_pan = pan; }

    /**
     * @brief Move the frame by a screen-space delta.
     */
    void panBy(const QPointF& delta) { m_pan += delta; }

    QSizeF canvasSize() const { return m_canvasSize; }
    void setCanvasSize(const QSizeF& size) { m_canvasSize = size; }

    /**
     * @brief Unscaled size of the current page image in pixels.
     */
    QSizeF imageSize() const { return m_imageSize; }
    void setImageSize(const QSizeF& size) { m_imageSize = size; }

    bool hasImage() const { return m_imageSize.width() > 0 && m_imageSize.height() > 0; }

    /**
     * @brief The image frame in canvas coordinates.
     */
    QRectF frameRect() const;

    QPointF canvasCenter() const {
        return QPointF(m_canvasSize.width() / 2.0, m_canvasSize.height() / 2.0);
    }

    // ===== Mapping =====

    /**
     * @brief Map a canvas point to normalized image coordinates.
     * @param screen Point in canvas pixels.
     * @param inBounds Set to false if the unclamped point lies outside [0,1]
     *                 on either axis, or if no image size is known.
     * @return The normalized point clamped to [0,1].
     */
    QPointF screenToNormalized(const QPointF& screen, bool* inBounds = nullptr) const;

    /**
     * @brief Map a normalized image point to canvas pixels.
     */
    QPointF normalizedToScreen(const QPointF& normalized) const;

    // ===== Zoom =====

    static qreal clampZoom(qreal zoom);

    /**
     * @brief Zoom while keeping the image point under the anchor fixed on screen.
     * @param targetZoom Desired zoom, clamped to [MIN_ZOOM, MAX_ZOOM].
     * @param anchor Canvas point that must not move.
     * @return False if the clamped zoom equals the current zoom (nothing changed).
     */
    bool zoomAt(qreal targetZoom, const QPointF& anchor);

    /**
     * @brief Multiply zoom by a factor, anchored at the canvas center.
     */
    bool zoomBy(qreal factor) { return zoomAt(m_zoom * factor, canvasCenter()); }

    /**
     * @brief Zoom so the whole image fits the canvas with a 5% margin, centered.
     */
    void fitToCanvas();

    /**
     * @brief Center the frame in the canvas without changing zoom.
     */
    void centerImage();

    /**
     * @brief Reset to zoom 1.0, pan (0,0).
     */
    void reset();

private:
    qreal m_zoom = 1.0;
    QPointF m_pan;
    QSizeF m_canvasSize;
    QSizeF m_imageSize;
};
