#include "ui/ControlSurfacePresenter.h"
#include "controllers/MediaController.h"
#include "media/PlaybackEngineAdapter.h"
#include <QtMath>
#include <algorithm>

namespace HoldPlay::UI {

namespace {
constexpr qint64 UnknownDurationRangeMs = 100000;
}

ControlSurfacePresenter::ControlSurfacePresenter(Controllers::MediaController& controller, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
{
    connect(&m_controller.state(), &Core::PlaybackState::changed,
            this, &ControlSurfacePresenter::onStateChanged);
}

TransportView ControlSurfacePresenter::present(const Core::PlaybackSnapshot& snapshot)
{
    TransportView view;
    view.showLoadPrompt = !snapshot.hasSource();
    view.playing = snapshot.playing;
    view.currentTimeText = formatTime(snapshot.currentTime);
    view.durationText = formatTime(snapshot.duration);
    view.progress = snapshot.currentTime.value() / std::max(snapshot.duration.value(), 1.0);
    view.seekPositionMs = snapshot.currentTime.toMilliseconds();
    view.seekMaximumMs = snapshot.duration.isZero() ? UnknownDurationRangeMs
                                                    : snapshot.duration.toMilliseconds();
    view.activeRate = snapshot.rate;
    view.overlayVisible = snapshot.fullscreen;
    return view;
}

QString ControlSurfacePresenter::formatTime(Core::Seconds time)
{
    const auto totalSeconds = static_cast<qint64>(qFloor(time.value()));
    const qint64 minutes = totalSeconds / 60;
    const qint64 seconds = totalSeconds % 60;

    return QString("%1:%2")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'));
}

TransportView ControlSurfacePresenter::currentView() const
{
    return present(m_controller.state().snapshot());
}

void ControlSurfacePresenter::togglePlay()
{
    m_controller.playback().togglePlayPause();
}

void ControlSurfacePresenter::seek(Core::Seconds target)
{
    m_controller.playback().seekTo(target);
}

void ControlSurfacePresenter::skip(double deltaSeconds)
{
    m_controller.playback().skip(deltaSeconds);
}

void ControlSurfacePresenter::setRate(Core::PlaybackRate rate)
{
    m_controller.playback().setRate(rate);
}

bool ControlSurfacePresenter::openFile(const QString& filePath)
{
    return m_controller.openFile(filePath);
}

void ControlSurfacePresenter::closeFile()
{
    m_controller.closeFile();
}

void ControlSurfacePresenter::onStateChanged()
{
    emit viewChanged(currentView());
}

} // namespace HoldPlay::UI
