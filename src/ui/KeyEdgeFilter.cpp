#include "ui/KeyEdgeFilter.h"
#include "controllers/MediaController.h"
#include "core/Logging.h"
#include "input/KeyCommandDispatcher.h"

#include <QAbstractSpinBox>
#include <QApplication>
#include <QKeyEvent>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QTextEdit>

namespace HoldPlay::UI {

KeyEdgeFilter::KeyEdgeFilter(Controllers::MediaController& controller, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
{
}

void KeyEdgeFilter::addWindow(QWidget* window)
{
    if (window && !m_windows.contains(window)) {
        m_windows.append(window);
    }
}

bool KeyEdgeFilter::textInputHasFocus()
{
    const QWidget* focus = QApplication::focusWidget();
    if (!focus) {
        return false;
    }

    return qobject_cast<const QLineEdit*>(focus) ||
           qobject_cast<const QTextEdit*>(focus) ||
           qobject_cast<const QPlainTextEdit*>(focus) ||
           qobject_cast<const QAbstractSpinBox*>(focus);
}

bool KeyEdgeFilter::eventFilter(QObject* watched, QEvent* event)
{
    switch (event->type()) {
    case QEvent::KeyPress:
    case QEvent::KeyRelease:
        if (accepts(watched) && handleKeyEvent(static_cast<QKeyEvent*>(event))) {
            return true;
        }
        break;
    case QEvent::ApplicationStateChange: {
        const auto* stateEvent = static_cast<QApplicationStateChangeEvent*>(event);
        if (stateEvent->applicationState() != Qt::ApplicationActive) {
            // The release of a held key is lost once focus leaves.
            m_controller.keys().resetHoldState();
        }
        break;
    }
    default:
        break;
    }

    return QObject::eventFilter(watched, event);
}

bool KeyEdgeFilter::accepts(QObject* watched) const
{
    auto* widget = qobject_cast<QWidget*>(watched);
    if (!widget || QApplication::activeModalWidget()) {
        return false;
    }

    // A key event passes the application filter once per widget up the
    // parent chain; only its first receiver is handled.
    QWidget* receiver = QApplication::focusWidget();
    if (!receiver) {
        receiver = widget->window();
    }
    if (widget != receiver) {
        return false;
    }

    QWidget* window = widget->window();
    for (const QPointer<QWidget>& candidate : m_windows) {
        if (candidate && candidate == window) {
            return true;
        }
    }
    return false;
}

bool KeyEdgeFilter::handleKeyEvent(const QKeyEvent* event)
{
    if (event->modifiers() & (Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier)) {
        return false;
    }

    Core::KeyEdge edge;
    edge.key = event->key();
    edge.autoRepeat = event->isAutoRepeat();
    edge.textInputFocused = textInputHasFocus();

    if (event->type() == QEvent::KeyPress) {
        return m_controller.dispatch(Core::KeyDown{edge});
    }
    return m_controller.dispatch(Core::KeyUp{edge});
}

} // namespace HoldPlay::UI
