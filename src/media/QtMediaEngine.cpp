#include "media/QtMediaEngine.h"
#include "core/Logging.h"
#include <QAudioDevice>
#include <QMediaDevices>
#include <utility>

namespace HoldPlay::Media {

QtMediaEngine::QtMediaEngine(QObject* parent)
    : IMediaEngine(parent)
    , m_player(std::make_unique<QMediaPlayer>(this))
    , m_audioOutput(std::make_unique<QAudioOutput>(this))
{
    initializeAudioOutput();
    m_player->setAudioOutput(m_audioOutput.get());

    connect(m_player.get(), &QMediaPlayer::playbackStateChanged,
            this, &QtMediaEngine::onPlayerStateChanged);
    connect(m_player.get(), &QMediaPlayer::mediaStatusChanged,
            this, &QtMediaEngine::onPlayerMediaStatusChanged);
    connect(m_player.get(), &QMediaPlayer::errorOccurred,
            this, &QtMediaEngine::onPlayerErrorOccurred);
    connect(m_player.get(), &QMediaPlayer::positionChanged,
            this, &QtMediaEngine::onPlayerPositionChanged);
    connect(m_player.get(), &QMediaPlayer::durationChanged,
            this, &QtMediaEngine::onPlayerDurationChanged);

    qCDebug(lcMedia) << "QtMediaEngine initialized";
}

QtMediaEngine::~QtMediaEngine() = default;

bool QtMediaEngine::loadMedia(SourceId source, const QUrl& url)
{
    if (!url.isValid() || !url.isLocalFile()) {
        m_lastError = QStringLiteral("Only local files can be played: %1").arg(url.toString());
        qCWarning(lcMedia) << m_lastError;
        return false;
    }

    m_lastError.clear();

    if (m_player->playbackState() != QMediaPlayer::StoppedState) {
        m_player->stop();
    }

    m_inflightRequest = NoRequest;
    m_source = source;
    m_player->setSource(url);

    qCDebug(lcMedia) << "Loaded source" << source << url.toLocalFile();
    return true;
}

void QtMediaEngine::unloadMedia()
{
    m_player->stop();
    // Clear the id first so notifications caused by dropping the source are not
    // attributed to the handle being released.
    m_source = NullSourceId;
    m_inflightRequest = NoRequest;
    m_player->setSource(QUrl());
}

SourceId QtMediaEngine::currentSource() const
{
    return m_source;
}

void QtMediaEngine::play(RequestId request)
{
    if (m_player->source().isEmpty()) {
        m_lastError = QStringLiteral("No media loaded");
        emit requestFailed(m_source, request, m_lastError);
        return;
    }

    m_inflightRequest = request;

    // Playing from the end restarts from the beginning.
    const qint64 currentPos = m_player->position();
    const qint64 total = m_player->duration();
    if (total > 0 && currentPos >= total) {
        m_player->setPosition(0);
    }

    m_player->play();
}

void QtMediaEngine::pause(RequestId request)
{
    m_inflightRequest = request;
    m_player->pause();
}

void QtMediaEngine::stop()
{
    m_inflightRequest = NoRequest;
    m_player->stop();
}

qint64 QtMediaEngine::position() const
{
    return m_player->position();
}

qint64 QtMediaEngine::duration() const
{
    return m_player->duration();
}

void QtMediaEngine::setPosition(qint64 position, RequestId request)
{
    if (m_player->source().isEmpty()) {
        emit requestFailed(m_source, request, QStringLiteral("No media loaded"));
        return;
    }
    m_player->setPosition(position);
}

qreal QtMediaEngine::playbackRate() const
{
    return m_player->playbackRate();
}

void QtMediaEngine::setPlaybackRate(qreal rate)
{
    m_player->setPlaybackRate(rate);
}

EngineState QtMediaEngine::state() const
{
    return convertState(m_player->playbackState());
}

QString QtMediaEngine::errorString() const
{
    return m_lastError;
}

void QtMediaEngine::setVideoOutput(QObject* output)
{
    m_player->setVideoOutput(output);
}

// Private slots
void QtMediaEngine::onPlayerStateChanged(QMediaPlayer::PlaybackState state)
{
    if (state != QMediaPlayer::StoppedState) {
        m_inflightRequest = NoRequest;
    }
    emit stateChanged(m_source, convertState(state));
}

void QtMediaEngine::onPlayerMediaStatusChanged(QMediaPlayer::MediaStatus status)
{
    switch (status) {
    case QMediaPlayer::EndOfMedia:
        emit endOfMedia(m_source);
        break;
    case QMediaPlayer::InvalidMedia:
        m_lastError = QStringLiteral("Invalid media format");
        emit mediaError(m_source, m_lastError);
        break;
    default:
        break;
    }
}

void QtMediaEngine::onPlayerErrorOccurred(QMediaPlayer::Error error, const QString& errorString)
{
    if (error == QMediaPlayer::NoError) {
        return;
    }

    m_lastError = errorString.isEmpty() ? QStringLiteral("Unknown media error") : errorString;
    qCWarning(lcMedia) << "Player error" << error << m_lastError;

    switch (error) {
    case QMediaPlayer::ResourceError:
    case QMediaPlayer::FormatError:
    case QMediaPlayer::AccessDeniedError:
        emit mediaError(m_source, m_lastError);
        break;
    default: {
        const RequestId request = std::exchange(m_inflightRequest, NoRequest);
        if (request != NoRequest) {
            emit requestFailed(m_source, request, m_lastError);
        } else {
            emit mediaError(m_source, m_lastError);
        }
        break;
    }
    }
}

void QtMediaEngine::onPlayerPositionChanged(qint64 position)
{
    emit positionChanged(m_source, position);
}

void QtMediaEngine::onPlayerDurationChanged(qint64 duration)
{
    emit durationChanged(m_source, duration);
}

// Private methods
EngineState QtMediaEngine::convertState(QMediaPlayer::PlaybackState qtState)
{
    switch (qtState) {
    case QMediaPlayer::StoppedState:
        return EngineState::Stopped;
    case QMediaPlayer::PlayingState:
        return EngineState::Playing;
    case QMediaPlayer::PausedState:
        return EngineState::Paused;
    }
    return EngineState::Stopped;
}

void QtMediaEngine::initializeAudioOutput()
{
    const QAudioDevice defaultDevice = QMediaDevices::defaultAudioOutput();

    if (defaultDevice.isNull()) {
        qCWarning(lcMedia) << "No default audio output device found";
        return;
    }

    m_audioOutput->setDevice(defaultDevice);
    m_audioOutput->setMuted(false);

    qCDebug(lcMedia) << "Audio output initialized with device:" << defaultDevice.description();
}

} // namespace HoldPlay::Media
