#ifndef HOLDPLAY_UI_CONTROLSURFACEPRESENTER_H
#define HOLDPLAY_UI_CONTROLSURFACEPRESENTER_H

#include <QObject>
#include <QString>
#include "core/PlaybackRate.h"
#include "core/PlaybackState.h"
#include "core/Seconds.h"

namespace HoldPlay::Controllers { class MediaController; }

namespace HoldPlay::UI {

// Everything the transport bar and the fullscreen overlay need to draw.
struct TransportView
{
    bool showLoadPrompt{true};
    bool playing{false};            // selects the pause icon when true
    QString currentTimeText{QStringLiteral("0:00")};
    QString durationText{QStringLiteral("0:00")};
    double progress{0.0};           // currentTime / max(duration, 1)
    qint64 seekPositionMs{0};
    qint64 seekMaximumMs{100000};   // duration, or 100 s while unknown
    Core::PlaybackRate activeRate{Core::PlaybackRate::Normal};
    bool overlayVisible{false};
};

/**
 * @brief Read-only view of the session plus routing of user intents
 *
 * The presenter never writes PlaybackState. Intents go to the playback
 * adapter or the media controller, and the resulting state change comes back
 * through viewChanged().
 */
class ControlSurfacePresenter : public QObject
{
    Q_OBJECT

public:
    explicit ControlSurfacePresenter(Controllers::MediaController& controller, QObject* parent = nullptr);
    ~ControlSurfacePresenter() override = default;

    [[nodiscard]] static TransportView present(const Core::PlaybackSnapshot& snapshot);
    [[nodiscard]] static QString formatTime(Core::Seconds time);

    [[nodiscard]] TransportView currentView() const;

    // User intents
    void togglePlay();
    void seek(Core::Seconds target);
    void skip(double deltaSeconds);
    void setRate(Core::PlaybackRate rate);
    bool openFile(const QString& filePath);
    void closeFile();

signals:
    void viewChanged(const HoldPlay::UI::TransportView& view);

private slots:
    void onStateChanged();

private:
    Controllers::MediaController& m_controller;
};

} // namespace HoldPlay::UI

Q_DECLARE_METATYPE(HoldPlay::UI::TransportView)

#endif // HOLDPLAY_UI_CONTROLSURFACEPRESENTER_H
