#include "controllers/MediaController.h"
#include "core/Logging.h"
#include "input/KeyCommandDispatcher.h"
#include "media/IMediaEngine.h"
#include "media/MediaResourceManager.h"
#include "media/PlaybackEngineAdapter.h"
#include "ui/FullscreenCoordinator.h"
#include "ui/IFullscreenPlatform.h"
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace HoldPlay::Controllers {

MediaController::MediaController(std::unique_ptr<Media::IMediaEngine> engine,
                                 std::unique_ptr<UI::IFullscreenPlatform> fullscreenPlatform,
                                 const Input::KeyBindings& bindings,
                                 QObject* parent)
    : QObject(parent)
    , m_fullscreenPlatform(std::move(fullscreenPlatform))
    , m_playback(std::make_unique<Media::PlaybackEngineAdapter>(m_state))
    , m_resources(std::make_unique<Media::MediaResourceManager>(m_state))
{
    if (!engine) {
        throw std::invalid_argument("Media engine cannot be null");
    }

    m_playback->setMediaEngine(std::move(engine));
    m_fullscreen = std::make_unique<UI::FullscreenCoordinator>(m_state, m_fullscreenPlatform.get());
    m_keys = std::make_unique<Input::KeyCommandDispatcher>(*m_playback, *m_fullscreen, bindings);

    setupConnections();
}

MediaController::~MediaController()
{
    // Session end: stop the engine before the handles it reads from go away.
    m_playback->detachSource();
    m_resources->releaseAll();

    // Members go away in reverse order; nothing may dispatch into them meanwhile.
    if (Media::IMediaEngine* engine = mediaEngine()) {
        engine->disconnect(this);
    }
    m_fullscreenPlatform->disconnect(this);
}

Media::IMediaEngine* MediaController::mediaEngine() const
{
    return m_playback->mediaEngine();
}

bool MediaController::openFile(const QString& filePath)
{
    Media::SourceHandle handle;
    try {
        handle = m_resources->openFile(filePath);
    } catch (const Core::ResourceError& e) {
        failCurrentSource(e.message());
        return false;
    }

    // From here on, notifications of the previous source are stale.
    m_playback->detachSource();
    m_resources->replace(handle);

    if (!m_playback->attachSource(handle)) {
        const QString engineError = mediaEngine() ? mediaEngine()->errorString() : QString();
        failCurrentSource(engineError.isEmpty() ? QStringLiteral("Failed to load media") : engineError);
        return false;
    }

    qCInfo(lcSession) << "Opened" << filePath << "as source" << handle.id();
    emit mediaOpened(filePath);
    return true;
}

void MediaController::closeFile()
{
    m_fullscreen->requestExit();

    const bool hadMedia = m_state.hasSource();
    m_playback->detachSource();
    m_resources->replace(Media::SourceHandle());

    if (hadMedia) {
        qCInfo(lcSession) << "Closed media";
        emit mediaClosed();
    }
}

bool MediaController::dispatch(const Core::SessionEvent& event)
{
    return std::visit([this](const auto& e) -> bool {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, Core::KeyDown>) {
            return m_keys->handleKeyDown(e);
        } else if constexpr (std::is_same_v<T, Core::KeyUp>) {
            return m_keys->handleKeyUp(e);
        } else if constexpr (std::is_same_v<T, Core::FullscreenChange>) {
            m_fullscreen->onPlatformFullscreenChanged(e.fullscreen);
            return true;
        } else {
            // Remaining alternatives are engine notifications.
            if (!isCurrent(e.source)) {
                qCDebug(lcSession) << "Dropping event for stale source" << e.source;
                return false;
            }

            if constexpr (std::is_same_v<T, Core::TimeUpdate>) {
                m_playback->onTimeUpdate(e.time);
            } else if constexpr (std::is_same_v<T, Core::DurationKnown>) {
                m_playback->onDurationKnown(e.duration);
            } else if constexpr (std::is_same_v<T, Core::Ended>) {
                m_playback->onEnded();
            } else if constexpr (std::is_same_v<T, Core::EngineStateReport>) {
                m_playback->onEngineState(e.playing);
            } else if constexpr (std::is_same_v<T, Core::RequestFailed>) {
                m_playback->onRequestFailed(e.request, e.reason);
            } else if constexpr (std::is_same_v<T, Core::ResourceFailure>) {
                failCurrentSource(e.reason);
            }
            return true;
        }
    }, event);
}

void MediaController::setupConnections()
{
    Media::IMediaEngine* engine = m_playback->mediaEngine();

    connect(engine, &Media::IMediaEngine::positionChanged,
            this, [this](Media::SourceId source, qint64 position) {
                dispatch(Core::TimeUpdate{source, Core::Seconds::fromMilliseconds(position)});
            });
    connect(engine, &Media::IMediaEngine::durationChanged,
            this, [this](Media::SourceId source, qint64 duration) {
                dispatch(Core::DurationKnown{source, Core::Seconds::fromMilliseconds(duration)});
            });
    connect(engine, &Media::IMediaEngine::endOfMedia,
            this, [this](Media::SourceId source) {
                dispatch(Core::Ended{source});
            });
    connect(engine, &Media::IMediaEngine::stateChanged,
            this, [this](Media::SourceId source, Media::EngineState state) {
                dispatch(Core::EngineStateReport{source, state == Media::EngineState::Playing});
            });
    connect(engine, &Media::IMediaEngine::requestFailed,
            this, [this](Media::SourceId source, Media::RequestId request, const QString& reason) {
                dispatch(Core::RequestFailed{source, request, reason});
            });
    connect(engine, &Media::IMediaEngine::mediaError,
            this, [this](Media::SourceId source, const QString& reason) {
                dispatch(Core::ResourceFailure{source, reason});
            });

    connect(m_fullscreenPlatform.get(), &UI::IFullscreenPlatform::fullscreenChanged,
            this, [this](bool fullscreen) {
                dispatch(Core::FullscreenChange{fullscreen});
            });

    connect(m_playback.get(), &Media::PlaybackEngineAdapter::errorOccurred,
            this, &MediaController::errorOccurred);
    connect(m_fullscreen.get(), &UI::FullscreenCoordinator::requestRefused,
            this, &MediaController::errorOccurred);
}

bool MediaController::isCurrent(Media::SourceId source) const noexcept
{
    return source != Media::NullSourceId && source == m_state.source().id();
}

void MediaController::failCurrentSource(const QString& reason)
{
    qCWarning(lcSession) << "Media load failed:" << reason;
    closeFile();
    emit mediaLoadFailed(reason);
    emit errorOccurred(Core::SessionError{Core::ErrorKind::Resource, reason});
}

} // namespace HoldPlay::Controllers
