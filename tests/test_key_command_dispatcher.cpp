#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <memory>
#include "controllers/MediaController.h"
#include "input/KeyCommandDispatcher.h"
#include "utils/FakeFullscreenPlatform.h"
#include "utils/FakeMediaEngine.h"
#include "utils/TestUtils.h"

using namespace HoldPlay;
using namespace HoldPlay::Test;

namespace {

Core::KeyDown keyDown(int key, bool autoRepeat = false, bool textInputFocused = false)
{
    Core::KeyDown edge;
    edge.key = key;
    edge.autoRepeat = autoRepeat;
    edge.textInputFocused = textInputFocused;
    return edge;
}

Core::KeyUp keyUp(int key, bool autoRepeat = false, bool textInputFocused = false)
{
    Core::KeyUp edge;
    edge.key = key;
    edge.autoRepeat = autoRepeat;
    edge.textInputFocused = textInputFocused;
    return edge;
}

int countCalls(const QStringList& calls, const QString& prefix)
{
    int count = 0;
    for (const QString& call : calls) {
        if (call.startsWith(prefix)) {
            ++count;
        }
    }
    return count;
}

} // namespace

class TestKeyCommandDispatcher : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Bindings
    void testSpaceTogglesPlayback();
    void testSkipKeys();
    void testUnboundKeyIsNotHandled();
    void testCustomBindings();

    // Guards
    void testTextInputFocusIgnoresEverything();
    void testAutoRepeatSpaceDoesNotToggle();
    void testAutoRepeatSkipStillSkips();

    // Hold gesture
    void testHoldDownThenUpEndsPaused();
    void testFullscreenRequestedBeforePlay();
    void testHoldRepeatDoesNotReRequest();
    void testAutoRepeatReleaseIsIgnored();
    void testRefusedFullscreenStillPlays();
    void testReleaseWithoutPressPauses();
    void testResetHoldState();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<Controllers::MediaController> m_controller;
    FakeMediaEngine* m_engine{nullptr};
    FakeFullscreenPlatform* m_platform{nullptr};
};

void TestKeyCommandDispatcher::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());

    auto engine = std::make_unique<FakeMediaEngine>();
    auto platform = std::make_unique<FakeFullscreenPlatform>();
    m_engine = engine.get();
    m_platform = platform.get();
    m_controller = std::make_unique<Controllers::MediaController>(std::move(engine), std::move(platform));

    QVERIFY(m_controller->openFile(TestUtils::createMediaFile(*m_dir, "clip.mp4")));
    m_engine->emitDuration(120000);
    m_engine->clearCalls();
}

void TestKeyCommandDispatcher::cleanup()
{
    m_controller.reset();
    m_dir.reset();
    m_engine = nullptr;
    m_platform = nullptr;
}

void TestKeyCommandDispatcher::testSpaceTogglesPlayback()
{
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Space)));
    QVERIFY(m_controller->state().isPlaying());
    QVERIFY(m_controller->dispatch(keyUp(Qt::Key_Space)));

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Space)));
    QVERIFY(!m_controller->state().isPlaying());

    // Space never touches fullscreen.
    QCOMPARE(m_platform->enterRequests(), 0);
}

void TestKeyCommandDispatcher::testSkipKeys()
{
    m_engine->emitPosition(50000);

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_X)));
    QCOMPARE(m_engine->lastSeekTarget(), qint64(49000));

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_C)));
    QCOMPARE(m_engine->lastSeekTarget(), qint64(50000));

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_S)));
    QCOMPARE(m_engine->lastSeekTarget(), qint64(40000));

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_D)));
    QCOMPARE(m_engine->lastSeekTarget(), qint64(50000));

    QCOMPARE(m_controller->state().currentTime().value(), 50.0);
}

void TestKeyCommandDispatcher::testUnboundKeyIsNotHandled()
{
    QVERIFY(!m_controller->dispatch(keyDown(Qt::Key_Q)));
    QVERIFY(!m_controller->dispatch(keyUp(Qt::Key_Q)));
    QVERIFY(m_engine->calls().isEmpty());
}

void TestKeyCommandDispatcher::testCustomBindings()
{
    Input::KeyBindings bindings;
    bindings.hold = Qt::Key_H;
    bindings.skipForwardLarge = Qt::Key_L;
    bindings.largeSkipSeconds = 30.0;
    m_controller->keys().setBindings(bindings);

    QVERIFY(!m_controller->dispatch(keyDown(Qt::Key_Z)));
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_L)));
    QCOMPARE(m_engine->lastSeekTarget(), qint64(30000));

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_H)));
    QVERIFY(m_controller->state().isFullscreen());
}

void TestKeyCommandDispatcher::testTextInputFocusIgnoresEverything()
{
    const Core::PlaybackSnapshot before = m_controller->state().snapshot();

    QVERIFY(!m_controller->dispatch(keyDown(Qt::Key_Z, false, true)));
    QVERIFY(!m_controller->dispatch(keyDown(Qt::Key_Space, false, true)));
    QVERIFY(!m_controller->dispatch(keyDown(Qt::Key_D, false, true)));
    QVERIFY(!m_controller->dispatch(keyUp(Qt::Key_Z, false, true)));

    const Core::PlaybackSnapshot after = m_controller->state().snapshot();
    QCOMPARE(after.playing, before.playing);
    QCOMPARE(after.fullscreen, before.fullscreen);
    QCOMPARE(after.currentTime.value(), before.currentTime.value());
    QCOMPARE(m_platform->enterRequests(), 0);
    QVERIFY(m_engine->calls().isEmpty());
    QVERIFY(!m_controller->keys().isHoldKeyDown());
}

void TestKeyCommandDispatcher::testAutoRepeatSpaceDoesNotToggle()
{
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Space)));
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Space, true)));
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Space, true)));

    QVERIFY(m_controller->state().isPlaying());
    QCOMPARE(countCalls(m_engine->calls(), "play:"), 1);
    QCOMPARE(countCalls(m_engine->calls(), "pause:"), 0);
}

void TestKeyCommandDispatcher::testAutoRepeatSkipStillSkips()
{
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_C)));
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_C, true)));
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_C, true)));

    QCOMPARE(m_engine->lastSeekTarget(), qint64(3000));
}

void TestKeyCommandDispatcher::testHoldDownThenUpEndsPaused()
{
    QSignalSpy startedSpy(&m_controller->keys(), &Input::KeyCommandDispatcher::holdGestureStarted);
    QSignalSpy endedSpy(&m_controller->keys(), &Input::KeyCommandDispatcher::holdGestureEnded);

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z)));
    QVERIFY(m_controller->state().isPlaying());
    QVERIFY(m_controller->state().isFullscreen());
    QVERIFY(m_controller->keys().isHoldKeyDown());

    QVERIFY(m_controller->dispatch(keyUp(Qt::Key_Z)));
    QVERIFY(!m_controller->state().isPlaying());
    QVERIFY(!m_controller->state().isFullscreen());
    QVERIFY(!m_controller->keys().isHoldKeyDown());

    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(endedSpy.count(), 1);
}

void TestKeyCommandDispatcher::testFullscreenRequestedBeforePlay()
{
    QStringList order;
    QObject context;
    connect(m_platform, &UI::IFullscreenPlatform::fullscreenChanged, &context, [&order](bool fullscreen) {
        if (fullscreen) {
            order << "fullscreen";
        }
    });
    connect(m_engine, &Media::IMediaEngine::stateChanged, &context,
            [&order](Media::SourceId, Media::EngineState state) {
                if (state == Media::EngineState::Playing) {
                    order << "playing";
                }
            });

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z)));

    QCOMPARE(order, QStringList({"fullscreen", "playing"}));
}

void TestKeyCommandDispatcher::testHoldRepeatDoesNotReRequest()
{
    m_platform->setDeferred(true);

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z)));
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z, true)));
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z, true)));

    QCOMPARE(m_platform->enterRequests(), 1);
    QCOMPARE(countCalls(m_engine->calls(), "play:"), 1);
}

void TestKeyCommandDispatcher::testAutoRepeatReleaseIsIgnored()
{
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z)));

    QVERIFY(m_controller->dispatch(keyUp(Qt::Key_Z, true)));
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z, true)));

    QVERIFY(m_controller->state().isPlaying());
    QVERIFY(m_controller->state().isFullscreen());
    QCOMPARE(m_platform->exitRequests(), 0);
}

void TestKeyCommandDispatcher::testRefusedFullscreenStillPlays()
{
    m_platform->setRefuse(true);
    QSignalSpy errorSpy(m_controller.get(), &Controllers::MediaController::errorOccurred);

    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z)));

    QVERIFY(m_controller->state().isPlaying());
    QVERIFY(!m_controller->state().isFullscreen());
    QCOMPARE(errorSpy.count(), 1);
    QCOMPARE(errorSpy.at(0).at(0).value<Core::SessionError>().kind, Core::ErrorKind::FullscreenRequest);
}

void TestKeyCommandDispatcher::testReleaseWithoutPressPauses()
{
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Space)));
    QVERIFY(m_controller->state().isPlaying());

    QVERIFY(m_controller->dispatch(keyUp(Qt::Key_Z)));

    QVERIFY(!m_controller->state().isPlaying());
    QCOMPARE(m_platform->exitRequests(), 0);
}

void TestKeyCommandDispatcher::testResetHoldState()
{
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z)));
    QVERIFY(m_controller->keys().isHoldKeyDown());

    m_controller->keys().resetHoldState();
    QVERIFY(!m_controller->keys().isHoldKeyDown());

    // A fresh press is a new gesture.
    QVERIFY(m_controller->dispatch(keyDown(Qt::Key_Z)));
    QVERIFY(m_controller->keys().isHoldKeyDown());
}

QTEST_GUILESS_MAIN(TestKeyCommandDispatcher)
#include "test_key_command_dispatcher.moc"
