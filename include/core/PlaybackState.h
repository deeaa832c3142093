#ifndef HOLDPLAY_CORE_PLAYBACKSTATE_H
#define HOLDPLAY_CORE_PLAYBACKSTATE_H

#include <QObject>
#include "core/PlaybackRate.h"
#include "core/Seconds.h"
#include "media/SourceHandle.h"

namespace HoldPlay {
namespace Media { class MediaResourceManager; class PlaybackEngineAdapter; }
namespace UI { class FullscreenCoordinator; }
}

namespace HoldPlay::Core {

/**
 * @brief Value copy of the session state handed to readers
 */
struct PlaybackSnapshot
{
    Media::SourceHandle source;
    bool playing{false};
    PlaybackRate rate{PlaybackRate::Normal};
    Seconds currentTime;
    Seconds duration;
    bool fullscreen{false};

    [[nodiscard]] bool hasSource() const noexcept { return !source.isNull(); }
};

/**
 * @brief Authoritative state of one playback session
 *
 * Each field has exactly one writer, enforced through friendship:
 *  - source:                          MediaResourceManager
 *  - playing, rate, currentTime, duration: PlaybackEngineAdapter
 *  - fullscreen:                      FullscreenCoordinator
 * Everyone else reads through the getters or snapshot().
 */
class PlaybackState : public QObject
{
    Q_OBJECT

public:
    explicit PlaybackState(QObject* parent = nullptr);
    ~PlaybackState() override = default;

    PlaybackState(const PlaybackState&) = delete;
    PlaybackState& operator=(const PlaybackState&) = delete;

    [[nodiscard]] const Media::SourceHandle& source() const noexcept { return m_source; }
    [[nodiscard]] bool hasSource() const noexcept { return !m_source.isNull(); }
    [[nodiscard]] bool isPlaying() const noexcept { return m_playing; }
    [[nodiscard]] PlaybackRate rate() const noexcept { return m_rate; }
    [[nodiscard]] Seconds currentTime() const noexcept { return m_currentTime; }
    [[nodiscard]] Seconds duration() const noexcept { return m_duration; }
    [[nodiscard]] bool isFullscreen() const noexcept { return m_fullscreen; }

    [[nodiscard]] PlaybackSnapshot snapshot() const;

signals:
    void changed();
    void sourceChanged(const HoldPlay::Media::SourceHandle& source);
    void fullscreenChanged(bool fullscreen);

private:
    friend class Media::MediaResourceManager;
    friend class Media::PlaybackEngineAdapter;
    friend class UI::FullscreenCoordinator;

    // Installs the new source and resets playing/currentTime/duration in one step.
    void installSource(const Media::SourceHandle& source);

    void setPlaying(bool playing);
    void setRate(PlaybackRate rate);
    void setCurrentTime(Seconds time);
    void setDuration(Seconds duration);
    void setFullscreen(bool fullscreen);

    Media::SourceHandle m_source;
    bool m_playing{false};
    PlaybackRate m_rate{PlaybackRate::Normal};
    Seconds m_currentTime;
    Seconds m_duration;
    bool m_fullscreen{false};
};

} // namespace HoldPlay::Core

#endif // HOLDPLAY_CORE_PLAYBACKSTATE_H
