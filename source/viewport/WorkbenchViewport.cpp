// ============================================================================
// WorkbenchViewport - Implementation
// ============================================================================

#include "WorkbenchViewport.h"
#include "../compat/qt_compat.h"
#include "../core/SourceModel.h"
#include "../core/WorkbenchEngine.h"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>
#include <QWheelEvent>

WorkbenchViewport::WorkbenchViewport(WorkbenchEngine* engine, QWidget* parent)
    : QWidget(parent)
    , m_engine(engine)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(false);
    setAttribute(Qt::WA_OpaquePaintEvent);

    auto repaint = [this]() { update(); };

    connect(engine, &WorkbenchEngine::pageChanged, this, [this](int) {
        m_notice.clear();
        update();
    });
    connect(engine, &WorkbenchEngine::pageImageReady, this, repaint);
    connect(engine, &WorkbenchEngine::pageImageFailed, this, [this](int, const QString& notice) {
        m_notice = notice;
        update();
    });

    SourceModel* model = engine->sourceModel();
    connect(model, &SourceModel::sourcesReset, this, repaint);
    connect(model, &SourceModel::sourceAdded, this, repaint);
    connect(model, &SourceModel::sourceChanged, this, repaint);
    connect(model, &SourceModel::sourceRemoved, this, repaint);
    connect(model, &SourceModel::activeSourceChanged, this, repaint);

    connect(engine->inputDispatcher(), &InputDispatcher::viewChanged, this, repaint);
}

WorkbenchViewport::~WorkbenchViewport() = default;

// ===== Painting =====

void WorkbenchViewport::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), QColor(64, 64, 64));

    const ViewportTransform* viewport = m_engine->viewport();
    const QImage image = m_engine->currentImage();

    if (!image.isNull() && viewport->hasImage()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, viewport->zoom() < 2.0);
        painter.drawImage(viewport->frameRect(), image);
    } else {
        painter.setPen(QColor(200, 200, 200));
        const QString text = m_notice.isEmpty() ? tr("Loading page...") : m_notice;
        painter.drawText(rect(), Qt::AlignCenter | Qt::TextWordWrap, text);
    }

    if (viewport->hasImage()) {
        paintMarkers(painter);
    }
}

void WorkbenchViewport::paintMarkers(QPainter& painter)
{
    painter.setRenderHint(QPainter::Antialiasing, true);

    const ViewportTransform* viewport = m_engine->viewport();
    const SourceModel* model = m_engine->sourceModel();
    const QString active = model->activeSourceId();

    QFont font = painter.font();
    font.setBold(true);
    painter.setFont(font);

    const QVector<TranslationSource>& sources = model->sources();
    for (int i = 0; i < sources.size(); ++i) {
        const TranslationSource& source = sources.at(i);
        const QPointF center = viewport->normalizedToScreen(source.position);

        QColor fill = source.category == TranslationSource::Category::Inside
            ? QColor(220, 60, 60)
            : QColor(60, 120, 220);
        if (source.pendingCreate) {
            fill.setAlpha(128);
        }

        painter.setPen(QPen(QColor(source.id == active ? Qt::yellow : Qt::white),
                            source.id == active ? 3 : 1.5));
        painter.setBrush(fill);
        painter.drawEllipse(center, MARKER_RADIUS, MARKER_RADIUS);

        painter.setPen(Qt::white);
        const QRectF label(center.x() - MARKER_RADIUS, center.y() - MARKER_RADIUS,
                           MARKER_RADIUS * 2, MARKER_RADIUS * 2);
        painter.drawText(label, Qt::AlignCenter, QString::number(i + 1));
    }
}

void WorkbenchViewport::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    m_engine->setCanvasSize(QSizeF(event->size()));
    update();
}

// ===== Input =====

PointerEvent WorkbenchViewport::mouseToPointerEvent(QMouseEvent* event, PointerEvent::Type type) const
{
    PointerEvent pe;
    pe.type = type;
    pe.viewportPos = TD_MOUSE_POS(event);
    pe.button = event->button();
    pe.buttons = event->buttons();
    pe.modifiers = event->modifiers();
    return pe;
}

void WorkbenchViewport::mousePressEvent(QMouseEvent* event)
{
    setFocus(Qt::MouseFocusReason);
    if (m_engine->inputDispatcher()->handlePointer(mouseToPointerEvent(event, PointerEvent::Press))) {
        event->accept();
        return;
    }
    QWidget::mousePressEvent(event);
}

void WorkbenchViewport::mouseMoveEvent(QMouseEvent* event)
{
    if (m_engine->inputDispatcher()->handlePointer(mouseToPointerEvent(event, PointerEvent::Move))) {
        event->accept();
        return;
    }
    QWidget::mouseMoveEvent(event);
}

void WorkbenchViewport::mouseReleaseEvent(QMouseEvent* event)
{
    if (m_engine->inputDispatcher()->handlePointer(mouseToPointerEvent(event, PointerEvent::Release))) {
        event->accept();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

void WorkbenchViewport::wheelEvent(QWheelEvent* event)
{
    if (m_engine->inputDispatcher()->handleWheel(TD_WHEEL_POS(event), event->angleDelta(),
                                                 event->pixelDelta(), event->modifiers())) {
        event->accept();
        return;
    }
    event->ignore();
}

void WorkbenchViewport::keyPressEvent(QKeyEvent* event)
{
    if (m_engine->inputDispatcher()->handleKey(event->key(), event->modifiers())) {
        event->accept();
        return;
    }
    QWidget::keyPressEvent(event);
}

bool WorkbenchViewport::focusNextPrevChild(bool next)
{
    Q_UNUSED(next);
    return false;
}
