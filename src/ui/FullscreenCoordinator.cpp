#include "ui/FullscreenCoordinator.h"
#include "core/Logging.h"
#include "core/PlaybackState.h"
#include "ui/IFullscreenPlatform.h"
#include <stdexcept>

namespace HoldPlay::UI {

FullscreenCoordinator::FullscreenCoordinator(Core::PlaybackState& state, IFullscreenPlatform* platform, QObject* parent)
    : QObject(parent)
    , m_state(state)
    , m_platform(platform)
{
    if (!m_platform) {
        throw std::invalid_argument("Fullscreen platform cannot be null");
    }
}

void FullscreenCoordinator::requestEnter()
{
    if (!m_state.hasSource()) {
        refuse(QStringLiteral("Fullscreen needs a loaded video"));
        return;
    }

    if (!m_platform) {
        refuse(QStringLiteral("Fullscreen platform is gone"));
        return;
    }

    if (m_state.isFullscreen()) {
        return;
    }

    if (!m_platform->requestEnter()) {
        refuse(QStringLiteral("Fullscreen request was blocked"));
    }
}

void FullscreenCoordinator::requestExit()
{
    if (!m_state.isFullscreen() || !m_platform) {
        return;
    }

    if (!m_platform->requestExit()) {
        refuse(QStringLiteral("Leaving fullscreen was blocked"));
    }
}

void FullscreenCoordinator::onPlatformFullscreenChanged(bool fullscreen)
{
    if (m_state.isFullscreen() == fullscreen) {
        return;
    }

    qCDebug(lcFullscreen) << "Platform reports fullscreen" << fullscreen;
    m_state.setFullscreen(fullscreen);
    emit overlayVisibilityChanged(fullscreen);
}

bool FullscreenCoordinator::isOverlayVisible() const noexcept
{
    return m_state.isFullscreen();
}

void FullscreenCoordinator::refuse(const QString& reason)
{
    qCWarning(lcFullscreen) << reason;
    emit requestRefused(Core::SessionError{Core::ErrorKind::FullscreenRequest, reason});
}

} // namespace HoldPlay::UI
