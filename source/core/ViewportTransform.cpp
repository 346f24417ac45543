// ============================================================================
// ViewportTransform - Implementation
// ============================================================================

#include "ViewportTransform.h"

#include <QtGlobal>

QRectF ViewportTransform::frameRect() const
{
    return QRectF(m_pan, m_imageSize * m_zoom);
}

QPointF ViewportTransform::screenToNormalized(const QPointF& screen, bool* inBounds) const
{
    if (!hasImage()) {
        if (inBounds) {
            *inBounds = false;
        }
        return QPointF(0, 0);
    }

    const QPointF local = (screen - m_pan) / m_zoom;
    const qreal nx = local.x() / m_imageSize.width();
    const qreal ny = local.y() / m_imageSize.height();

    if (inBounds) {
        *inBounds = (nx >= 0.0 && nx <= 1.0 && ny >= 0.0 && ny <= 1.0);
    }

    return QPointF(qBound(0.0, nx, 1.0), qBound(0.0, ny, 1.0));
}

QPointF ViewportTransform::normalizedToScreen(const QPointF& normalized) const
{
    return m_pan + QPointF(normalized.x() * m_imageSize.width() * m_zoom,
                           normalized.y() * m_imageSize.height() * m_zoom);
}

qreal ViewportTransform::clampZoom(qreal zoom)
{
    return qBound(MIN_ZOOM, zoom, MAX_ZOOM);
}

bool ViewportTransform::zoomAt(qreal targetZoom, const QPointF& anchor)
{
    const qreal newZoom = clampZoom(targetZoom);
    if (qFuzzyCompare(newZoom, m_zoom)) {
        return false;
    }

    // Image-space point under the anchor at the old zoom:
    //   anchor = pan + base * zoom  =>  base = (anchor - pan) / zoom
    // Solve for the pan that keeps it there at the new zoom.
    const QPointF base = (anchor - m_pan) / m_zoom;
    m_zoom = newZoom;
    m_pan = anchor - base * m_zoom;
    return true;
}

void ViewportTransform::fitToCanvas()
{
    if (!hasImage() || m_canvasSize.isEmpty()) {
        reset();
        return;
    }

    const qreal marginFraction = 0.05;  // 5% margin on each side
    const qreal availWidth = m_canvasSize.width() * (1.0 - 2 * marginFraction);
    const qreal availHeight = m_canvasSize.height() * (1.0 - 2 * marginFraction);

    const qreal zoomX = availWidth / m_imageSize.width();
    const qreal zoomY = availHeight / m_imageSize.height();

    m_zoom = clampZoom(qMin(zoomX, zoomY));
    centerImage();
}

void ViewportTransform::centerImage()
{
    const QSizeF scaled = m_imageSize * m_zoom;
    m_pan = QPointF((m_canvasSize.width() - scaled.width()) / 2.0,
                    (m_canvasSize.height() - scaled.height()) / 2.0);
}

void ViewportTransform::reset()
{
    m_zoom = 1.0;
    m_pan = QPointF(0, 0);
}
