#ifndef VIEWPORTTRANSFORMTESTS_H
#define VIEWPORTTRANSFORMTESTS_H

#include <QObject>
#include <QTest>
#include "ViewportTransform.h"

/**
 * Unit tests for ViewportTransform.
 * Run with: transdesk --test-viewport
 */
class ViewportTransformTests : public QObject {
    Q_OBJECT

private:
    static bool fuzzyEqual(const QPointF& a, const QPointF& b, qreal eps = 1e-9) {
        return qAbs(a.x() - b.x()) < eps && qAbs(a.y() - b.y()) < eps;
    }

    static ViewportTransform makeTransform() {
        ViewportTransform t;
        t.setCanvasSize(QSizeF(1000, 800));
        t.setImageSize(QSizeF(800, 1200));
        return t;
    }

private slots:
    void testMappingAtIdentity() {
        ViewportTransform t = makeTransform();

        bool inBounds = false;
        QPointF n = t.screenToNormalized(QPointF(400, 600), &inBounds);
        QVERIFY(inBounds);
        QVERIFY(fuzzyEqual(n, QPointF(0.5, 0.5)));
        QVERIFY(fuzzyEqual(t.normalizedToScreen(QPointF(0.25, 0.75)), QPointF(200, 900)));
    }

    void testRoundTripUnderZoomAndPan() {
        ViewportTransform t = makeTransform();
        t.setPan(QPointF(37.5, -120));
        t.zoomAt(2.5, QPointF(300, 200));

        const QPointF points[] = { QPointF(0, 0), QPointF(1, 1), QPointF(0.3, 0.4), QPointF(0.99, 0.01) };
        for (const QPointF& n : points) {
            const QPointF back = t.screenToNormalized(t.normalizedToScreen(n));
            QVERIFY2(fuzzyEqual(back, n), qPrintable(QString("%1,%2").arg(n.x()).arg(n.y())));
        }
    }

    void testOutOfBoundsIsReportedAndClamped() {
        ViewportTransform t = makeTransform();

        bool inBounds = true;
        QPointF n = t.screenToNormalized(t.normalizedToScreen(QPointF(1.2, 0.5)), &inBounds);
        QVERIFY(!inBounds);
        QVERIFY(fuzzyEqual(n, QPointF(1.0, 0.5)));

        n = t.screenToNormalized(t.normalizedToScreen(QPointF(-0.1, 0.9)), &inBounds);
        QVERIFY(!inBounds);
        QVERIFY(fuzzyEqual(n, QPointF(0.0, 0.9)));
    }

    void testNoImageIsOutOfBounds() {
        ViewportTransform t;
        t.setCanvasSize(QSizeF(100, 100));
        bool inBounds = true;
        t.screenToNormalized(QPointF(10, 10), &inBounds);
        QVERIFY(!inBounds);
        QVERIFY(!t.hasImage());
    }

    void testZoomKeepsAnchorFixed() {
        ViewportTransform t = makeTransform();
        t.setPan(QPointF(15, 25));

        const QPointF anchor(333, 444);
        const QPointF before = t.screenToNormalized(anchor);
        QVERIFY(t.zoomAt(3.0, anchor));
        QCOMPARE(t.zoom(), 3.0);
        QVERIFY(fuzzyEqual(t.normalizedToScreen(before), anchor, 1e-6));

        QVERIFY(t.zoomAt(0.4, anchor));
        QVERIFY(fuzzyEqual(t.normalizedToScreen(before), anchor, 1e-6));
    }

    void testZoomIsClampedAndNoOpAtLimit() {
        ViewportTransform t = makeTransform();

        QVERIFY(t.zoomAt(100.0, QPointF(10, 10)));
        QCOMPARE(t.zoom(), ViewportTransform::MAX_ZOOM);

        const QPointF pan = t.pan();
        QVERIFY(!t.zoomAt(50.0, QPointF(500, 500)));
        QCOMPARE(t.pan(), pan);

        QVERIFY(t.zoomAt(0.0001, QPointF(10, 10)));
        QCOMPARE(t.zoom(), ViewportTransform::MIN_ZOOM);
        QVERIFY(!t.zoomBy(0.5));
    }

    void testZoomByUsesCanvasCenter() {
        ViewportTransform t = makeTransform();
        const QPointF center = t.canvasCenter();
        const QPointF under = t.screenToNormalized(center);

        QVERIFY(t.zoomBy(1.1));
        QVERIFY(qFuzzyCompare(t.zoom(), 1.1));
        QVERIFY(fuzzyEqual(t.normalizedToScreen(under), center, 1e-6));
    }

    void testFitToCanvas() {
        ViewportTransform t = makeTransform();
        t.fitToCanvas();

        // Height limits: 800 * 0.9 / 1200
        QVERIFY(qFuzzyCompare(t.zoom(), 0.6));
        const QRectF frame = t.frameRect();
        QVERIFY(qFuzzyCompare(frame.center().x(), 500.0));
        QVERIFY(qFuzzyCompare(frame.center().y(), 400.0));
        QVERIFY(frame.top() > 0);
    }

    void testPanByAndReset() {
        ViewportTransform t = makeTransform();
        t.panBy(QPointF(60, 0));
        t.panBy(QPointF(0, -60));
        QCOMPARE(t.pan(), QPointF(60, -60));

        t.zoomAt(2.0, QPointF(0, 0));
        t.reset();
        QCOMPARE(t.zoom(), 1.0);
        QCOMPARE(t.pan(), QPointF(0, 0));
    }
};

#endif // VIEWPORTTRANSFORMTESTS_H
