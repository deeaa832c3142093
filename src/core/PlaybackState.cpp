#include "core/PlaybackState.h"

namespace HoldPlay::Core {

PlaybackState::PlaybackState(QObject* parent)
    : QObject(parent)
{
}

PlaybackSnapshot PlaybackState::snapshot() const
{
    PlaybackSnapshot snapshot;
    snapshot.source = m_source;
    snapshot.playing = m_playing;
    snapshot.rate = m_rate;
    snapshot.currentTime = m_currentTime;
    snapshot.duration = m_duration;
    snapshot.fullscreen = m_fullscreen;
    return snapshot;
}

void PlaybackState::installSource(const Media::SourceHandle& source)
{
    m_source = source;
    m_playing = false;
    m_currentTime = Seconds();
    m_duration = Seconds();

    emit sourceChanged(m_source);
    emit changed();
}

void PlaybackState::setPlaying(bool playing)
{
    if (m_playing == playing) {
        return;
    }
    m_playing = playing;
    emit changed();
}

void PlaybackState::setRate(PlaybackRate rate)
{
    if (m_rate == rate) {
        return;
    }
    m_rate = rate;
    emit changed();
}

void PlaybackState::setCurrentTime(Seconds time)
{
    if (m_currentTime == time) {
        return;
    }
    m_currentTime = time;
    emit changed();
}

void PlaybackState::setDuration(Seconds duration)
{
    if (m_duration == duration) {
        return;
    }
    m_duration = duration;
    // A shorter duration than the last reported time must not break currentTime <= duration.
    m_currentTime = m_currentTime.clampedTo(m_duration);
    emit changed();
}

void PlaybackState::setFullscreen(bool fullscreen)
{
    if (m_fullscreen == fullscreen) {
        return;
    }
    m_fullscreen = fullscreen;
    emit fullscreenChanged(m_fullscreen);
    emit changed();
}

} // namespace HoldPlay::Core
