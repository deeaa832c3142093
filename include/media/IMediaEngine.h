#ifndef HOLDPLAY_MEDIA_IMEDIAENGINE_H
#define HOLDPLAY_MEDIA_IMEDIAENGINE_H

#include <QObject>
#include <QString>
#include <QUrl>
#include "media/SourceHandle.h"

namespace HoldPlay::Media {

enum class EngineState {
    Stopped,
    Playing,
    Paused
};

/**
 * @brief Native playback capability
 *
 * Every command returns immediately. Its effect is reported later through the
 * signals, each tagged with the source that was loaded when it was produced.
 * Transport and seek commands carry a request id; a late failure of that
 * request comes back through requestFailed() with the same id.
 */
class IMediaEngine : public QObject {
    Q_OBJECT

public:
    explicit IMediaEngine(QObject* parent = nullptr) : QObject(parent) {}
    ~IMediaEngine() override = default;

    // Source management
    virtual bool loadMedia(SourceId source, const QUrl& url) = 0;
    virtual void unloadMedia() = 0;
    [[nodiscard]] virtual SourceId currentSource() const = 0;

    // Transport
    virtual void play(RequestId request) = 0;
    virtual void pause(RequestId request) = 0;
    virtual void stop() = 0;

    // Position and duration, in milliseconds
    [[nodiscard]] virtual qint64 position() const = 0;
    [[nodiscard]] virtual qint64 duration() const = 0;
    virtual void setPosition(qint64 position, RequestId request) = 0;

    // Playback rate
    [[nodiscard]] virtual qreal playbackRate() const = 0;
    virtual void setPlaybackRate(qreal rate) = 0;

    [[nodiscard]] virtual EngineState state() const = 0;
    [[nodiscard]] virtual QString errorString() const = 0;

signals:
    void stateChanged(HoldPlay::Media::SourceId source, HoldPlay::Media::EngineState state);
    void positionChanged(HoldPlay::Media::SourceId source, qint64 position);
    void durationChanged(HoldPlay::Media::SourceId source, qint64 duration);
    void endOfMedia(HoldPlay::Media::SourceId source);
    void requestFailed(HoldPlay::Media::SourceId source, HoldPlay::Media::RequestId request, const QString& reason);
    void mediaError(HoldPlay::Media::SourceId source, const QString& reason);
};

} // namespace HoldPlay::Media

Q_DECLARE_METATYPE(HoldPlay::Media::EngineState)

#endif // HOLDPLAY_MEDIA_IMEDIAENGINE_H
