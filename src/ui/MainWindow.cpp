#include "ui/MainWindow.h"
#include "ui/KeyEdgeFilter.h"
#include "ui/SeekSlider.h"
#include "ui/WindowFullscreenPlatform.h"
#include "controllers/MediaController.h"
#include "core/Application.h"
#include "core/ConfigManager.h"
#include "core/Logging.h"
#include "input/KeyCommandDispatcher.h"
#include "media/PlaybackEngineAdapter.h"
#include "media/QtMediaEngine.h"

#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QFileInfo>
#include <QFileDialog>
#include <QGridLayout>
#include <QKeySequence>
#include <QMessageBox>
#include <QStandardPaths>
#include <QStatusBar>
#include <stdexcept>

namespace HoldPlay::UI {

namespace {
const QString VideoFileFilter = QStringLiteral("Video Files (*.mp4 *.m4v *.webm *.mkv *.mov);;All Files (*)");

QString skipLabel(double seconds)
{
    return (seconds < 0 ? QStringLiteral("-") : QStringLiteral("+")) + QString::number(qAbs(seconds));
}
}

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_app(Core::Application::instance())
{
    if (!m_app) {
        throw std::runtime_error("Application instance not available");
    }

    if (auto* config = m_app->configManager()) {
        m_bindings = config->keyBindings();
        m_defaultRate = config->defaultRate();
    }

    setWindowTitle("HoldPlay");
    setMinimumSize(640, 420);
    resize(960, 640);

    setupUI();
    setupMediaController();
    connectSignals();

    onViewChanged(m_presenter->currentView());
    statusBar()->showMessage(tr("Open a video file to start"));

    qApp->installEventFilter(m_keyFilter.get());
}

MainWindow::~MainWindow()
{
    qApp->removeEventFilter(m_keyFilter.get());

    // Both watch the controller's state.
    m_keyFilter.reset();
    m_presenter.reset();
    m_mediaController.reset();
}

void MainWindow::setupUI()
{
    m_pages = new QStackedWidget(this);
    setCentralWidget(m_pages);

    setupLoadPrompt();
    setupPlayerPage();

    m_pages->addWidget(m_loadPromptPage);
    m_pages->addWidget(m_playerPage);
}

void MainWindow::setupLoadPrompt()
{
    m_loadPromptPage = new QWidget(this);
    auto* layout = new QVBoxLayout(m_loadPromptPage);
    layout->addStretch();

    auto* title = new QLabel(tr("No video loaded"), m_loadPromptPage);
    title->setAlignment(Qt::AlignCenter);
    title->setObjectName("loadPromptTitle");

    auto* hint = new QLabel(tr("Hold %1 to watch in fullscreen, release to pause")
                               .arg(QKeySequence(m_bindings.hold).toString(QKeySequence::NativeText)),
                           m_loadPromptPage);
    hint->setAlignment(Qt::AlignCenter);

    auto* browseButton = new QPushButton(tr("Browse..."), m_loadPromptPage);
    browseButton->setFixedWidth(160);
    browseButton->setFocusPolicy(Qt::NoFocus);
    connect(browseButton, &QPushButton::clicked, this, &MainWindow::openFile);

    layout->addWidget(title);
    layout->addWidget(hint);
    layout->addSpacing(12);
    layout->addWidget(browseButton, 0, Qt::AlignHCenter);
    layout->addStretch();
}

void MainWindow::setupPlayerPage()
{
    m_playerPage = new QWidget(this);
    auto* layout = new QVBoxLayout(m_playerPage);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    setupVideoContainer();
    setupTransportBar();

    layout->addWidget(m_videoContainer, 100);
    layout->addWidget(m_controlsWidget);
}

void MainWindow::setupVideoContainer()
{
    m_videoContainer = new QWidget(m_playerPage);
    m_videoContainer->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    m_videoContainer->setStyleSheet("background-color: black;");

    auto* grid = new QGridLayout(m_videoContainer);
    grid->setContentsMargins(0, 0, 0, 0);

    m_videoWidget = new QVideoWidget(m_videoContainer);
    m_videoWidget->setMinimumSize(480, 270);
    m_videoWidget->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    m_videoWidget->setFocusPolicy(Qt::StrongFocus);

    // Overlay shares the video cell and is shown only in fullscreen.
    m_overlay = new QWidget(m_videoContainer);
    m_overlay->setObjectName("fullScreenOverlay");
    m_overlay->setAttribute(Qt::WA_StyledBackground);
    m_overlay->setStyleSheet("#fullScreenOverlay { background-color: rgba(0, 0, 0, 160); }"
                             "QLabel { color: white; }");

    auto* overlayLayout = new QHBoxLayout(m_overlay);
    overlayLayout->setContentsMargins(16, 8, 16, 8);

    m_overlayCurrentTimeLabel = new QLabel("0:00", m_overlay);
    m_overlaySlider = new SeekSlider(m_overlay);
    m_overlayTotalTimeLabel = new QLabel("0:00", m_overlay);

    overlayLayout->addWidget(m_overlayCurrentTimeLabel);
    overlayLayout->addWidget(m_overlaySlider, 1);
    overlayLayout->addWidget(m_overlayTotalTimeLabel);
    m_overlay->setVisible(false);

    grid->addWidget(m_videoWidget, 0, 0);
    grid->addWidget(m_overlay, 0, 0, Qt::AlignBottom);
}

void MainWindow::setupTransportBar()
{
    m_controlsWidget = new QWidget(m_playerPage);
    m_controlsWidget->setObjectName("controlsWidget");

    auto* controlsLayout = new QVBoxLayout(m_controlsWidget);
    controlsLayout->setContentsMargins(10, 8, 10, 8);
    controlsLayout->setSpacing(5);

    auto* progressLayout = new QHBoxLayout();
    m_currentTimeLabel = new QLabel("0:00", m_controlsWidget);
    m_currentTimeLabel->setObjectName("timeLabel");
    m_currentTimeLabel->setMinimumWidth(50);
    m_currentTimeLabel->setAlignment(Qt::AlignCenter);

    m_positionSlider = new SeekSlider(m_controlsWidget);

    m_totalTimeLabel = new QLabel("0:00", m_controlsWidget);
    m_totalTimeLabel->setObjectName("timeLabel");
    m_totalTimeLabel->setMinimumWidth(50);
    m_totalTimeLabel->setAlignment(Qt::AlignCenter);

    progressLayout->addWidget(m_currentTimeLabel);
    progressLayout->addWidget(m_positionSlider, 1);
    progressLayout->addWidget(m_totalTimeLabel);

    auto* buttonsLayout = new QHBoxLayout();

    m_closeFileButton = new QPushButton(tr("Open Another"), m_controlsWidget);
    m_closeFileButton->setFocusPolicy(Qt::NoFocus);
    buttonsLayout->addWidget(m_closeFileButton);
    buttonsLayout->addStretch();

    addSkipButton(buttonsLayout, skipLabel(-m_bindings.largeSkipSeconds), -m_bindings.largeSkipSeconds);
    addSkipButton(buttonsLayout, skipLabel(-m_bindings.smallSkipSeconds), -m_bindings.smallSkipSeconds);

    m_playPauseButton = new QPushButton("▶", m_controlsWidget);
    m_playPauseButton->setObjectName("playPauseButton");
    m_playPauseButton->setFixedSize(48, 48);
    m_playPauseButton->setFocusPolicy(Qt::NoFocus);
    buttonsLayout->addWidget(m_playPauseButton);

    addSkipButton(buttonsLayout, skipLabel(m_bindings.smallSkipSeconds), m_bindings.smallSkipSeconds);
    addSkipButton(buttonsLayout, skipLabel(m_bindings.largeSkipSeconds), m_bindings.largeSkipSeconds);
    buttonsLayout->addStretch();

    m_rateButtons = new QButtonGroup(this);
    m_rateButtons->setExclusive(true);
    for (const Core::PlaybackRate rate : Core::allPlaybackRates()) {
        auto* button = new QPushButton(Core::rateLabel(rate), m_controlsWidget);
        button->setCheckable(true);
        button->setFocusPolicy(Qt::NoFocus);
        m_rateButtons->addButton(button, static_cast<int>(rate));
        buttonsLayout->addWidget(button);
    }

    controlsLayout->addLayout(progressLayout);
    controlsLayout->addLayout(buttonsLayout);
}

QPushButton* MainWindow::addSkipButton(QHBoxLayout *layout, const QString& text, double seconds)
{
    auto* button = new QPushButton(text, m_controlsWidget);
    button->setObjectName("mediaButton");
    button->setFixedSize(44, 40);
    button->setFocusPolicy(Qt::NoFocus);
    connect(button, &QPushButton::clicked, this, [this, seconds]() {
        m_presenter->skip(seconds);
    });
    layout->addWidget(button);
    return button;
}

void MainWindow::setupMediaController()
{
    auto engine = std::make_unique<Media::QtMediaEngine>();
    engine->setVideoOutput(m_videoWidget);

    auto platform = std::make_unique<WindowFullscreenPlatform>(m_videoContainer);

    m_mediaController = std::make_unique<Controllers::MediaController>(
        std::move(engine), std::move(platform), m_bindings);
    m_presenter = std::make_unique<ControlSurfacePresenter>(*m_mediaController);

    m_keyFilter = std::make_unique<KeyEdgeFilter>(*m_mediaController);
    m_keyFilter->addWindow(this);
    m_keyFilter->addWindow(m_videoContainer);

    m_mediaController->playback().setRate(m_defaultRate);
}

void MainWindow::connectSignals()
{
    connect(m_presenter.get(), &ControlSurfacePresenter::viewChanged,
            this, &MainWindow::onViewChanged);

    connect(m_playPauseButton, &QPushButton::clicked, this, [this]() {
        m_presenter->togglePlay();
    });
    connect(m_closeFileButton, &QPushButton::clicked, this, &MainWindow::closeFile);

    connect(m_rateButtons, &QButtonGroup::idClicked, this, [this](int id) {
        m_presenter->setRate(static_cast<Core::PlaybackRate>(id));
    });

    const auto seekTo = [this](qint64 positionMs) {
        m_presenter->seek(Core::Seconds::fromMilliseconds(positionMs));
    };
    connect(m_positionSlider, &SeekSlider::seekRequested, this, seekTo);
    connect(m_overlaySlider, &SeekSlider::seekRequested, this, seekTo);

    connect(m_mediaController.get(), &Controllers::MediaController::mediaOpened,
            this, [this](const QString& filePath) {
                statusBar()->showMessage(tr("Loaded: %1").arg(QFileInfo(filePath).fileName()));
            });
    connect(m_mediaController.get(), &Controllers::MediaController::mediaLoadFailed,
            this, &MainWindow::onMediaLoadFailed);
    connect(m_mediaController.get(), &Controllers::MediaController::errorOccurred,
            this, &MainWindow::onErrorOccurred);

    connect(&m_mediaController->keys(), &Input::KeyCommandDispatcher::holdGestureStarted,
            this, [this]() { statusBar()->clearMessage(); });
}

void MainWindow::openFile()
{
    const QString filePath = QFileDialog::getOpenFileName(
        this,
        tr("Open Video"),
        QStandardPaths::writableLocation(QStandardPaths::MoviesLocation),
        VideoFileFilter);

    if (filePath.isEmpty()) {
        return;
    }

    if (!m_presenter->openFile(filePath)) {
        qCWarning(lcSession) << "Could not open" << filePath;
    }
}

void MainWindow::closeFile()
{
    m_presenter->closeFile();
    statusBar()->showMessage(tr("Open a video file to start"));
}

void MainWindow::onViewChanged(const TransportView& view)
{
    m_pages->setCurrentWidget(view.showLoadPrompt ? m_loadPromptPage : m_playerPage);

    m_playPauseButton->setText(view.playing ? "⏸" : "▶");
    m_playPauseButton->setToolTip(view.playing ? tr("Pause") : tr("Play"));

    m_currentTimeLabel->setText(view.currentTimeText);
    m_totalTimeLabel->setText(view.durationText);
    m_positionSlider->showPosition(view.seekPositionMs, view.seekMaximumMs);

    m_overlayCurrentTimeLabel->setText(view.currentTimeText);
    m_overlayTotalTimeLabel->setText(view.durationText);
    m_overlaySlider->showPosition(view.seekPositionMs, view.seekMaximumMs);
    m_overlay->setVisible(view.overlayVisible);
    if (view.overlayVisible) {
        m_overlay->raise();
    }

    if (auto* button = m_rateButtons->button(static_cast<int>(view.activeRate))) {
        button->setChecked(true);
    }
}

void MainWindow::onMediaLoadFailed(const QString& error)
{
    QMessageBox::warning(this, tr("Cannot Open Video"), error);
}

void MainWindow::onErrorOccurred(const Core::SessionError& error)
{
    statusBar()->showMessage(error.message, 5000);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (m_mediaController) {
        m_mediaController->closeFile();
    }
    event->accept();
}

} // namespace HoldPlay::UI
