#ifndef HOLDPLAY_MEDIA_PLAYBACKENGINEADAPTER_H
#define HOLDPLAY_MEDIA_PLAYBACKENGINEADAPTER_H

#include <QObject>
#include <memory>
#include <utility>
#include "core/Errors.h"
#include "core/PlaybackRate.h"
#include "core/Seconds.h"
#include "media/IMediaEngine.h"
#include "media/RequestLedger.h"
#include "media/SourceHandle.h"

namespace HoldPlay::Core { class PlaybackState; }

namespace HoldPlay::Media {

/**
 * @brief Facade over the native engine and writer of the playback fields
 *
 * Commands are fire-and-forget. PlaybackState.playing, currentTime and
 * duration change only in the on*() handlers, which MediaController calls
 * when the engine reports back. Seeks are clamped here to [0, duration]
 * ([0, inf) while the duration is unknown) before they reach the engine.
 */
class PlaybackEngineAdapter : public QObject {
    Q_OBJECT

public:
    explicit PlaybackEngineAdapter(Core::PlaybackState& state, QObject* parent = nullptr);
    ~PlaybackEngineAdapter() override;

    // Engine management
    void setMediaEngine(std::unique_ptr<IMediaEngine> engine);
    [[nodiscard]] IMediaEngine* mediaEngine() const;
    [[nodiscard]] bool hasEngine() const noexcept;

    // Source binding
    bool attachSource(const SourceHandle& source);
    void detachSource();

    // Transport requests
    void play();
    void pause();
    void togglePlayPause();
    void seekTo(Core::Seconds target);
    void skip(double deltaSeconds);
    void setRate(Core::PlaybackRate rate);

    // Engine reports, already filtered to the current source
    void onTimeUpdate(Core::Seconds time);
    void onDurationKnown(Core::Seconds duration);
    void onEnded();
    void onEngineState(bool playing);
    void onRequestFailed(RequestId request, const QString& reason);

signals:
    void errorOccurred(const HoldPlay::Core::SessionError& error);

private:
    template<typename Func>
    auto safeEngineCall(Func&& func) const -> decltype(func(std::declval<IMediaEngine&>()));

    template<typename Func>
    bool safeEngineCallVoid(Func&& func) const;

    void reportRequestError(const QString& reason);

    Core::PlaybackState& m_state;
    std::unique_ptr<IMediaEngine> m_engine;
    RequestLedger m_requests;
    Core::Seconds m_pendingSeekTarget;
};

} // namespace HoldPlay::Media

#endif // HOLDPLAY_MEDIA_PLAYBACKENGINEADAPTER_H
