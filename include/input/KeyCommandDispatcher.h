#ifndef HOLDPLAY_INPUT_KEYCOMMANDDISPATCHER_H
#define HOLDPLAY_INPUT_KEYCOMMANDDISPATCHER_H

#include <QObject>
#include "core/SessionEvent.h"
#include "input/KeyBindings.h"

namespace HoldPlay {
namespace Media { class PlaybackEngineAdapter; }
namespace UI { class FullscreenCoordinator; }
}

namespace HoldPlay::Input {

/**
 * @brief Maps keyboard edges to playback and fullscreen actions
 *
 * handleKeyDown()/handleKeyUp() return true when the key is bound, telling the
 * caller to suppress the platform default (page scroll on Space, button
 * activation). Edges delivered while a text input has focus are ignored
 * entirely and return false.
 */
class KeyCommandDispatcher : public QObject
{
    Q_OBJECT

public:
    KeyCommandDispatcher(Media::PlaybackEngineAdapter& playback,
                         UI::FullscreenCoordinator& fullscreen,
                         const KeyBindings& bindings = KeyBindings(),
                         QObject* parent = nullptr);
    ~KeyCommandDispatcher() override = default;

    KeyCommandDispatcher(const KeyCommandDispatcher&) = delete;
    KeyCommandDispatcher& operator=(const KeyCommandDispatcher&) = delete;

    [[nodiscard]] const KeyBindings& bindings() const noexcept { return m_bindings; }
    void setBindings(const KeyBindings& bindings);

    bool handleKeyDown(const Core::KeyDown& edge);
    bool handleKeyUp(const Core::KeyUp& edge);

    [[nodiscard]] bool isHoldKeyDown() const noexcept { return m_holdKeyDown; }

    // Forgets a held key, e.g. when the window loses focus and the release
    // will never be delivered.
    void resetHoldState();

signals:
    void holdGestureStarted();
    void holdGestureEnded();

private:
    enum class Action {
        None,
        TogglePlay,
        SkipBackSmall,
        SkipForwardSmall,
        SkipBackLarge,
        SkipForwardLarge,
        Hold
    };

    [[nodiscard]] Action actionFor(int key) const noexcept;
    void beginHold();
    void endHold();

    Media::PlaybackEngineAdapter& m_playback;
    UI::FullscreenCoordinator& m_fullscreen;
    KeyBindings m_bindings;
    bool m_holdKeyDown{false};
};

} // namespace HoldPlay::Input

#endif // HOLDPLAY_INPUT_KEYCOMMANDDISPATCHER_H
