#ifndef HOLDPLAY_UI_MAINWINDOW_H
#define HOLDPLAY_UI_MAINWINDOW_H

#include <QMainWindow>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QPushButton>
#include <QButtonGroup>
#include <QStackedWidget>
#include <QLabel>
#include <QVideoWidget>
#include <memory>

#include "core/Errors.h"
#include "core/PlaybackRate.h"
#include "input/KeyBindings.h"
#include "ui/ControlSurfacePresenter.h"

namespace HoldPlay {
namespace Core { class Application; }
namespace Controllers { class MediaController; }
namespace UI { class SeekSlider; class KeyEdgeFilter; }
}

namespace HoldPlay::UI {

/**
 * @brief Player window: load prompt, video surface and transport bar
 *
 * Keyboard edges are captured application-wide and handed to the session
 * dispatch core, so the bindings work regardless of which child has focus.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    MainWindow(const MainWindow&) = delete;
    MainWindow& operator=(const MainWindow&) = delete;
    MainWindow(MainWindow&&) = delete;
    MainWindow& operator=(MainWindow&&) = delete;

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void openFile();
    void closeFile();
    void onViewChanged(const HoldPlay::UI::TransportView& view);
    void onMediaLoadFailed(const QString& error);
    void onErrorOccurred(const HoldPlay::Core::SessionError& error);

private:
    void setupUI();
    void setupLoadPrompt();
    void setupPlayerPage();
    void setupVideoContainer();
    void setupTransportBar();
    void setupMediaController();
    void connectSignals();

    QPushButton* addSkipButton(QHBoxLayout *layout, const QString& text, double seconds);

    Core::Application* m_app;
    Input::KeyBindings m_bindings;
    Core::PlaybackRate m_defaultRate{Core::PlaybackRate::Normal};

    // Session (owns the engine and fullscreen platform)
    std::unique_ptr<Controllers::MediaController> m_mediaController;
    std::unique_ptr<ControlSurfacePresenter> m_presenter;
    std::unique_ptr<KeyEdgeFilter> m_keyFilter;

    // Pages
    QStackedWidget* m_pages{nullptr};
    QWidget* m_loadPromptPage{nullptr};
    QWidget* m_playerPage{nullptr};

    // Video surface and its fullscreen overlay
    QWidget* m_videoContainer{nullptr};
    QVideoWidget* m_videoWidget{nullptr};
    QWidget* m_overlay{nullptr};
    QLabel* m_overlayCurrentTimeLabel{nullptr};
    QLabel* m_overlayTotalTimeLabel{nullptr};
    SeekSlider* m_overlaySlider{nullptr};

    // Inline transport bar
    QWidget* m_controlsWidget{nullptr};
    QLabel* m_currentTimeLabel{nullptr};
    QLabel* m_totalTimeLabel{nullptr};
    SeekSlider* m_positionSlider{nullptr};
    QPushButton* m_playPauseButton{nullptr};
    QPushButton* m_closeFileButton{nullptr};
    QButtonGroup* m_rateButtons{nullptr};
};

} // namespace HoldPlay::UI

#endif // HOLDPLAY_UI_MAINWINDOW_H
