#ifndef HOLDPLAY_UI_FULLSCREENCOORDINATOR_H
#define HOLDPLAY_UI_FULLSCREENCOORDINATOR_H

#include <QObject>
#include <QPointer>
#include "core/Errors.h"

namespace HoldPlay::Core { class PlaybackState; }

namespace HoldPlay::UI {

class IFullscreenPlatform;

/**
 * @brief Reconciles fullscreen requests with platform notifications
 *
 * Requests are advisory. PlaybackState.fullscreen is written only from
 * onPlatformFullscreenChanged(), and the fullscreen overlay follows it.
 * Leaving fullscreen never touches playback here; pausing belongs to the
 * hold-key release.
 */
class FullscreenCoordinator : public QObject
{
    Q_OBJECT

public:
    FullscreenCoordinator(Core::PlaybackState& state, IFullscreenPlatform* platform, QObject* parent = nullptr);
    ~FullscreenCoordinator() override = default;

    FullscreenCoordinator(const FullscreenCoordinator&) = delete;
    FullscreenCoordinator& operator=(const FullscreenCoordinator&) = delete;
    FullscreenCoordinator(FullscreenCoordinator&&) = delete;
    FullscreenCoordinator& operator=(FullscreenCoordinator&&) = delete;

    void requestEnter();
    // Does nothing unless the platform has reported fullscreen.
    void requestExit();

    void onPlatformFullscreenChanged(bool fullscreen);

    [[nodiscard]] bool isOverlayVisible() const noexcept;

signals:
    void overlayVisibilityChanged(bool visible);
    void requestRefused(const HoldPlay::Core::SessionError& error);

private:
    void refuse(const QString& reason);

    Core::PlaybackState& m_state;
    QPointer<IFullscreenPlatform> m_platform;
};

} // namespace HoldPlay::UI

#endif // HOLDPLAY_UI_FULLSCREENCOORDINATOR_H
