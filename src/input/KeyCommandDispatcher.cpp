#include "input/KeyCommandDispatcher.h"
#include "core/Logging.h"
#include "media/PlaybackEngineAdapter.h"
#include "ui/FullscreenCoordinator.h"

namespace HoldPlay::Input {

KeyCommandDispatcher::KeyCommandDispatcher(Media::PlaybackEngineAdapter& playback,
                                           UI::FullscreenCoordinator& fullscreen,
                                           const KeyBindings& bindings,
                                           QObject* parent)
    : QObject(parent)
    , m_playback(playback)
    , m_fullscreen(fullscreen)
    , m_bindings(bindings)
{
}

void KeyCommandDispatcher::setBindings(const KeyBindings& bindings)
{
    m_bindings = bindings;
    m_holdKeyDown = false;
}

bool KeyCommandDispatcher::handleKeyDown(const Core::KeyDown& edge)
{
    if (edge.textInputFocused) {
        return false;
    }

    switch (actionFor(edge.key)) {
    case Action::None:
        return false;
    case Action::TogglePlay:
        if (!edge.autoRepeat) {
            m_playback.togglePlayPause();
        }
        return true;
    case Action::SkipBackSmall:
        m_playback.skip(-m_bindings.smallSkipSeconds);
        return true;
    case Action::SkipForwardSmall:
        m_playback.skip(m_bindings.smallSkipSeconds);
        return true;
    case Action::SkipBackLarge:
        m_playback.skip(-m_bindings.largeSkipSeconds);
        return true;
    case Action::SkipForwardLarge:
        m_playback.skip(m_bindings.largeSkipSeconds);
        return true;
    case Action::Hold:
        if (!edge.autoRepeat && !m_holdKeyDown) {
            beginHold();
        }
        return true;
    }
    return false;
}

bool KeyCommandDispatcher::handleKeyUp(const Core::KeyUp& edge)
{
    if (edge.textInputFocused) {
        return false;
    }

    const Action action = actionFor(edge.key);
    if (action == Action::None) {
        return false;
    }

    // Auto-repeat arrives as release/press pairs; only the real release ends the gesture.
    if (action == Action::Hold && !edge.autoRepeat) {
        endHold();
    }
    return true;
}

void KeyCommandDispatcher::resetHoldState()
{
    if (m_holdKeyDown) {
        qCDebug(lcInput) << "Hold key state reset without a release";
    }
    m_holdKeyDown = false;
}

KeyCommandDispatcher::Action KeyCommandDispatcher::actionFor(int key) const noexcept
{
    if (key == m_bindings.hold) {
        return Action::Hold;
    }
    if (key == m_bindings.togglePlay) {
        return Action::TogglePlay;
    }
    if (key == m_bindings.skipBackSmall) {
        return Action::SkipBackSmall;
    }
    if (key == m_bindings.skipForwardSmall) {
        return Action::SkipForwardSmall;
    }
    if (key == m_bindings.skipBackLarge) {
        return Action::SkipBackLarge;
    }
    if (key == m_bindings.skipForwardLarge) {
        return Action::SkipForwardLarge;
    }
    return Action::None;
}

void KeyCommandDispatcher::beginHold()
{
    m_holdKeyDown = true;
    qCDebug(lcInput) << "Hold gesture started";

    // Fullscreen is requested first but not awaited, so a refused request
    // still lets playback start.
    m_fullscreen.requestEnter();
    m_playback.play();

    emit holdGestureStarted();
}

void KeyCommandDispatcher::endHold()
{
    m_holdKeyDown = false;
    qCDebug(lcInput) << "Hold gesture ended";

    m_fullscreen.requestExit();
    m_playback.pause();

    emit holdGestureEnded();
}

} // namespace HoldPlay::Input
