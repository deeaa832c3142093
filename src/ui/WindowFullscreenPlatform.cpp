#include "ui/WindowFullscreenPlatform.h"
#include "core/Logging.h"
#include <QEvent>
#include <QKeyEvent>
#include <stdexcept>

namespace HoldPlay::UI {

WindowFullscreenPlatform::WindowFullscreenPlatform(QWidget* target, QObject* parent)
    : IFullscreenPlatform(parent)
    , m_target(target)
{
    if (!m_target) {
        throw std::invalid_argument("Fullscreen target cannot be null");
    }

    m_embeddedFlags = m_target->windowFlags();
    m_target->installEventFilter(this);
}

WindowFullscreenPlatform::~WindowFullscreenPlatform()
{
    if (m_target) {
        m_target->removeEventFilter(this);
    }
}

bool WindowFullscreenPlatform::requestEnter()
{
    if (!m_target || !m_target->parentWidget() || !m_target->parentWidget()->isVisible()) {
        return false;
    }
    if (m_target->isFullScreen()) {
        return true;
    }

    if (!m_target->isWindow()) {
        m_embeddedFlags = m_target->windowFlags();
    }
    m_target->setWindowFlags(m_embeddedFlags | Qt::Window);
    m_target->showFullScreen();
    m_target->activateWindow();
    m_target->setFocus(Qt::OtherFocusReason);
    return true;
}

bool WindowFullscreenPlatform::requestExit()
{
    if (!m_target) {
        return false;
    }
    if (!m_target->isFullScreen()) {
        return true;
    }

    m_target->setWindowState(m_target->windowState() & ~Qt::WindowFullScreen);
    if (m_target->isWindow()) {
        restoreEmbedded();
    }
    return true;
}

void WindowFullscreenPlatform::restoreEmbedded()
{
    m_target->setWindowFlags(m_embeddedFlags & ~Qt::Window);
    m_target->show();
    if (QWidget* window = m_target->window()) {
        window->activateWindow();
    }
}

bool WindowFullscreenPlatform::isFullScreen() const
{
    return m_target && m_target->isFullScreen();
}

bool WindowFullscreenPlatform::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == m_target) {
        switch (event->type()) {
        case QEvent::WindowStateChange:
            if (!m_target->isFullScreen() && m_target->isWindow()) {
                qCDebug(lcFullscreen) << "Fullscreen left outside the player, re-embedding";
                restoreEmbedded();
            }
            notifyIfChanged();
            break;
        case QEvent::Show:
        case QEvent::Hide:
            notifyIfChanged();
            break;
        case QEvent::KeyPress: {
            auto* keyEvent = static_cast<QKeyEvent*>(event);
            if (keyEvent->key() == Qt::Key_Escape && m_target->isFullScreen()) {
                qCDebug(lcFullscreen) << "Escape pressed in fullscreen window";
                requestExit();
                return true;
            }
            break;
        }
        default:
            break;
        }
    }
    return IFullscreenPlatform::eventFilter(watched, event);
}

void WindowFullscreenPlatform::notifyIfChanged()
{
    const bool fullscreen = isFullScreen();
    if (fullscreen == m_lastReported) {
        return;
    }
    m_lastReported = fullscreen;
    emit fullscreenChanged(fullscreen);
}

} // namespace HoldPlay::UI
