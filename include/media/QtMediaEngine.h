#ifndef HOLDPLAY_MEDIA_QTMEDIAENGINE_H
#define HOLDPLAY_MEDIA_QTMEDIAENGINE_H

#include "IMediaEngine.h"
#include <QMediaPlayer>
#include <QAudioOutput>
#include <memory>

namespace HoldPlay::Media
{

    /**
     * @brief Qt Multimedia implementation of IMediaEngine
     */
    class QtMediaEngine : public IMediaEngine
    {
        Q_OBJECT

    public:
        explicit QtMediaEngine(QObject* parent = nullptr);
        ~QtMediaEngine() override;

        // IMediaEngine implementation
        bool loadMedia(SourceId source, const QUrl& url) override;
        void unloadMedia() override;
        [[nodiscard]] SourceId currentSource() const override;

        void play(RequestId request) override;
        void pause(RequestId request) override;
        void stop() override;

        [[nodiscard]] qint64 position() const override;
        [[nodiscard]] qint64 duration() const override;
        void setPosition(qint64 position, RequestId request) override;

        [[nodiscard]] qreal playbackRate() const override;
        void setPlaybackRate(qreal rate) override;

        [[nodiscard]] EngineState state() const override;
        [[nodiscard]] QString errorString() const override;

        // Video output, typically a QVideoWidget. Not owned.
        void setVideoOutput(QObject* output);

    private slots:
        void onPlayerStateChanged(QMediaPlayer::PlaybackState state);
        void onPlayerMediaStatusChanged(QMediaPlayer::MediaStatus status);
        void onPlayerErrorOccurred(QMediaPlayer::Error error, const QString& errorString);
        void onPlayerPositionChanged(qint64 position);
        void onPlayerDurationChanged(qint64 duration);

    private:
        [[nodiscard]] static EngineState convertState(QMediaPlayer::PlaybackState qtState);
        void initializeAudioOutput();

        std::unique_ptr<QMediaPlayer> m_player;
        std::unique_ptr<QAudioOutput> m_audioOutput;
        SourceId m_source{NullSourceId};
        RequestId m_inflightRequest{NoRequest}; // last transport/seek request not yet confirmed
        QString m_lastError;
    };

} // namespace HoldPlay::Media

#endif // HOLDPLAY_MEDIA_QTMEDIAENGINE_H
