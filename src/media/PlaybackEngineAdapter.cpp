#include "media/PlaybackEngineAdapter.h"
#include "core/Logging.h"
#include "core/PlaybackState.h"
#include <utility>

namespace HoldPlay::Media {

PlaybackEngineAdapter::PlaybackEngineAdapter(Core::PlaybackState& state, QObject* parent)
    : QObject(parent)
    , m_state(state)
{
}

PlaybackEngineAdapter::~PlaybackEngineAdapter() = default;

void PlaybackEngineAdapter::setMediaEngine(std::unique_ptr<IMediaEngine> engine)
{
    if (m_engine) {
        m_engine->disconnect(this);
        m_engine->stop();
    }

    m_engine = std::move(engine);
    m_requests.clear();
}

IMediaEngine* PlaybackEngineAdapter::mediaEngine() const
{
    return m_engine.get();
}

bool PlaybackEngineAdapter::hasEngine() const noexcept
{
    return m_engine != nullptr;
}

bool PlaybackEngineAdapter::attachSource(const SourceHandle& source)
{
    m_requests.clear();

    const qreal factor = Core::rateFactor(m_state.rate());
    return safeEngineCall([&](IMediaEngine& engine) -> bool {
        if (!engine.loadMedia(source.id(), source.url())) {
            return false;
        }
        // A fresh source starts at the engine's default rate; keep the user's choice.
        engine.setPlaybackRate(factor);
        return true;
    });
}

void PlaybackEngineAdapter::detachSource()
{
    m_requests.clear();
    safeEngineCallVoid([](IMediaEngine& engine) {
        engine.unloadMedia();
    });
}

void PlaybackEngineAdapter::play()
{
    if (!m_state.hasSource()) {
        qCDebug(lcMedia) << "play() ignored: no media loaded";
        return;
    }

    const RequestId request = m_requests.issue(RequestKind::Transport);
    if (!safeEngineCallVoid([request](IMediaEngine& engine) {
        engine.play(request);
    })) {
        m_requests.settle(request);
        m_state.setPlaying(false);
        reportRequestError(QStringLiteral("Playback could not be started"));
    }
}

void PlaybackEngineAdapter::pause()
{
    if (!m_state.hasSource()) {
        return;
    }

    const RequestId request = m_requests.issue(RequestKind::Transport);
    if (!safeEngineCallVoid([request](IMediaEngine& engine) {
        engine.pause(request);
    })) {
        m_requests.settle(request);
        reportRequestError(QStringLiteral("Playback could not be paused"));
    }
}

void PlaybackEngineAdapter::togglePlayPause()
{
    if (m_state.isPlaying()) {
        pause();
    } else {
        play();
    }
}

void PlaybackEngineAdapter::seekTo(Core::Seconds target)
{
    if (!m_state.hasSource()) {
        return;
    }

    const Core::Seconds clamped = target.clampedTo(m_state.duration());
    const RequestId request = m_requests.issue(RequestKind::Seek);
    if (!safeEngineCallVoid([&](IMediaEngine& engine) {
        engine.setPosition(clamped.toMilliseconds(), request);
    })) {
        m_requests.settle(request);
        reportRequestError(QStringLiteral("Seek to %1 s failed").arg(clamped.value()));
        return;
    }
    m_pendingSeekTarget = clamped;
}

void PlaybackEngineAdapter::skip(double deltaSeconds)
{
    if (!m_state.hasSource()) {
        return;
    }

    // An unconfirmed seek is where the engine is headed; otherwise ask the engine.
    if (m_requests.hasPending(RequestKind::Seek)) {
        seekTo(m_pendingSeekTarget.offsetBy(deltaSeconds));
        return;
    }

    const qint64 position = safeEngineCall([](const IMediaEngine& engine) -> qint64 {
        return engine.position();
    });
    seekTo(Core::Seconds::fromMilliseconds(position).offsetBy(deltaSeconds));
}

void PlaybackEngineAdapter::setRate(Core::PlaybackRate rate)
{
    const qreal factor = Core::rateFactor(rate);
    if (safeEngineCallVoid([factor](IMediaEngine& engine) {
        engine.setPlaybackRate(factor);
    })) {
        m_state.setRate(rate);
    }
}

void PlaybackEngineAdapter::onTimeUpdate(Core::Seconds time)
{
    m_requests.settle(RequestKind::Seek);
    m_state.setCurrentTime(time.clampedTo(m_state.duration()));
}

void PlaybackEngineAdapter::onDurationKnown(Core::Seconds duration)
{
    m_state.setDuration(duration);
}

void PlaybackEngineAdapter::onEnded()
{
    m_requests.settle(RequestKind::Transport);
    m_state.setPlaying(false);
}

void PlaybackEngineAdapter::onEngineState(bool playing)
{
    m_requests.settle(RequestKind::Transport);
    m_state.setPlaying(playing);
}

void PlaybackEngineAdapter::onRequestFailed(RequestId request, const QString& reason)
{
    if (m_requests.isPending(RequestKind::Transport, request)) {
        m_requests.settle(request);
        m_state.setPlaying(false);
        reportRequestError(reason);
        return;
    }

    if (m_requests.isPending(RequestKind::Seek, request)) {
        m_requests.settle(request);
        reportRequestError(reason);
        return;
    }

    // Superseded request: its outcome no longer matters, but the playing flag
    // must still agree with what the engine is actually doing.
    qCDebug(lcMedia) << "Ignoring failure of superseded request" << request << reason;
    const bool enginePlaying = safeEngineCall([](const IMediaEngine& engine) -> bool {
        return engine.state() == EngineState::Playing;
    });
    m_state.setPlaying(enginePlaying);
}

void PlaybackEngineAdapter::reportRequestError(const QString& reason)
{
    qCWarning(lcMedia) << "Playback request failed:" << reason;
    emit errorOccurred(Core::SessionError{Core::ErrorKind::PlaybackRequest, reason});
}

// Template implementations
template<typename Func>
auto PlaybackEngineAdapter::safeEngineCall(Func&& func) const -> decltype(func(std::declval<IMediaEngine&>()))
{
    using ReturnType = decltype(func(std::declval<IMediaEngine&>()));

    if (!m_engine) {
        return ReturnType{};
    }

    try {
        return func(*m_engine);
    } catch (const std::exception& e) {
        qCWarning(lcMedia) << "Engine operation failed:" << e.what();
        return ReturnType{};
    }
}

template<typename Func>
bool PlaybackEngineAdapter::safeEngineCallVoid(Func&& func) const
{
    if (!m_engine) {
        return false;
    }

    try {
        func(*m_engine);
        return true;
    } catch (const std::exception& e) {
        qCWarning(lcMedia) << "Engine operation failed:" << e.what();
        return false;
    }
}

} // namespace HoldPlay::Media
