// ============================================================================
// qt_compat.h - Qt5 / Qt6 compatibility shims for TransDesk
// ============================================================================
// Include this header in .cpp files that use the Qt5/Qt6 APIs listed below.
// One-off differences are handled with inline #if QT_VERSION_CHECK guards
// directly in each source file.
// ============================================================================
#pragma once

#include <QtCore/qglobal.h>
#include <QKeySequence>

// ============================================================================
// Pointer event position (QPointF)
// ============================================================================
// Qt6 unified all events under QSinglePointEvent::position().
// Qt5: QMouseEvent::localPos().
// QWheelEvent::position() exists since Qt 5.14, so works in both.
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  define TD_MOUSE_POS(event)    (event)->position()
#else
#  define TD_MOUSE_POS(event)    (event)->localPos()
#endif
#define TD_WHEEL_POS(event)      (event)->position()

// ============================================================================
// Key chord -> QKeySequence
// ============================================================================
// Qt6: QKeySequence takes a QKeyCombination.
// Qt5: QKeySequence takes the key and modifiers OR-ed into an int.
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  define TD_KEY_CHORD(key, modifiers) \
     QKeySequence(QKeyCombination((modifiers), static_cast<Qt::Key>(key)))
#else
#  define TD_KEY_CHORD(key, modifiers) \
     QKeySequence(static_cast<int>(modifiers) | (key))
#endif

// ============================================================================
// Single-shot signal connections
// ============================================================================
// Qt6: Qt::SingleShotConnection auto-disconnects after the first emit.
// Qt5: No equivalent. Emulate with a shared connection handle that
//      disconnects itself from inside the lambda on first invocation.
//
// Usage (same syntax for both Qt versions):
//   TD_CONNECT_ONCE(sender, &Sender::signal, context, [=]() { ... });
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  define TD_CONNECT_ONCE(sender, signal, context, slot) \
     QObject::connect(sender, signal, context, slot, Qt::SingleShotConnection)
#else
#  include <QSharedPointer>
#  include <QMetaObject>
template<typename Sender, typename Signal, typename Context, typename Functor>
static inline void tdConnectOnce(Sender* sender, Signal signal, Context* context, Functor functor)
{
    auto conn = QSharedPointer<QMetaObject::Connection>::create();
    *conn = QObject::connect(sender, signal, context,
        [conn, functor]() mutable {
            QObject::disconnect(*conn);
            functor();
        });
}
#  define TD_CONNECT_ONCE(sender, signal, context, slot) \
     tdConnectOnce(sender, signal, context, slot)
#endif
