#ifndef HOLDPLAY_CONTROLLERS_MEDIACONTROLLER_H
#define HOLDPLAY_CONTROLLERS_MEDIACONTROLLER_H

#include <QObject>
#include <QString>
#include <memory>
#include "core/Errors.h"
#include "core/PlaybackState.h"
#include "core/SessionEvent.h"
#include "input/KeyBindings.h"
#include "media/SourceHandle.h"

namespace HoldPlay {
namespace Media { class IMediaEngine; class MediaResourceManager; class PlaybackEngineAdapter; }
namespace UI { class IFullscreenPlatform; class FullscreenCoordinator; }
namespace Input { class KeyCommandDispatcher; }
}

namespace HoldPlay::Controllers {

/**
 * @brief Owner of one playback session and its event dispatch core
 *
 * Every engine notification, key edge and fullscreen notification becomes a
 * Core::SessionEvent and goes through dispatch(), which routes it to the
 * component that owns the affected state, in arrival order. Engine events for
 * a source other than the current one are dropped there.
 */
class MediaController : public QObject
{
    Q_OBJECT

public:
    MediaController(std::unique_ptr<Media::IMediaEngine> engine,
                    std::unique_ptr<UI::IFullscreenPlatform> fullscreenPlatform,
                    const Input::KeyBindings& bindings = Input::KeyBindings(),
                    QObject* parent = nullptr);
    ~MediaController() override;

    MediaController(const MediaController&) = delete;
    MediaController& operator=(const MediaController&) = delete;

    // Session access
    [[nodiscard]] const Core::PlaybackState& state() const noexcept { return m_state; }
    [[nodiscard]] Media::PlaybackEngineAdapter& playback() const noexcept { return *m_playback; }
    [[nodiscard]] Media::MediaResourceManager& resources() const noexcept { return *m_resources; }
    [[nodiscard]] UI::FullscreenCoordinator& fullscreen() const noexcept { return *m_fullscreen; }
    [[nodiscard]] Input::KeyCommandDispatcher& keys() const noexcept { return *m_keys; }
    [[nodiscard]] Media::IMediaEngine* mediaEngine() const;

    // Resource lifecycle
    bool openFile(const QString& filePath);
    void closeFile();
    [[nodiscard]] bool hasMedia() const noexcept { return m_state.hasSource(); }

    // Returns true when the event was consumed; for key edges this means the
    // platform default must be suppressed.
    bool dispatch(const Core::SessionEvent& event);

signals:
    void mediaOpened(const QString& filePath);
    void mediaLoadFailed(const QString& error);
    void mediaClosed();
    void errorOccurred(const HoldPlay::Core::SessionError& error);

private:
    void setupConnections();
    [[nodiscard]] bool isCurrent(Media::SourceId source) const noexcept;
    void failCurrentSource(const QString& reason);

    // Declared first: every component below holds a reference to it.
    Core::PlaybackState m_state;
    std::unique_ptr<UI::IFullscreenPlatform> m_fullscreenPlatform;
    std::unique_ptr<Media::PlaybackEngineAdapter> m_playback;
    std::unique_ptr<Media::MediaResourceManager> m_resources;
    std::unique_ptr<UI::FullscreenCoordinator> m_fullscreen;
    std::unique_ptr<Input::KeyCommandDispatcher> m_keys;
};

} // namespace HoldPlay::Controllers

#endif // HOLDPLAY_CONTROLLERS_MEDIACONTROLLER_H
