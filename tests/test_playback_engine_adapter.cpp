#include <QtTest/QtTest>
#include <QRegularExpression>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <memory>
#include "core/PlaybackState.h"
#include "media/MediaResourceManager.h"
#include "media/PlaybackEngineAdapter.h"
#include "utils/FakeMediaEngine.h"
#include "utils/TestUtils.h"

using namespace HoldPlay;
using namespace HoldPlay::Test;

// Engine notifications are delivered straight to the adapter's handlers here;
// routing through the dispatch core is covered by the controller tests.
class TestPlaybackEngineAdapter : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Seeking
    void testSkipForwardFromStart();
    void testSkipForwardClampsToDuration();
    void testSkipBackwardClampsToZero();
    void testSkipsStackOnUnconfirmedSeek();
    void testConfirmedSeekReturnsBaseToEngine();
    void testSeekWithUnknownDurationIsUnbounded();
    void testSeekDoesNotWriteCurrentTime();
    void testTimeUpdateClampedToDuration();

    // Transport
    void testPlayWaitsForEngineReport();
    void testLatestRequestFailureRollsBack();
    void testSupersededFailureResyncsWithEngine();
    void testThrowingEngineRollsBack();
    void testEndedStopsPlaying();
    void testCommandsWithoutSourceAreIgnored();

    // Rate
    void testSetRate();
    void testRateReappliedOnAttach();

private:
    void loadSource();

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<Core::PlaybackState> m_state;
    std::unique_ptr<Media::MediaResourceManager> m_resources;
    std::unique_ptr<Media::PlaybackEngineAdapter> m_adapter;
    FakeMediaEngine* m_engine{nullptr};
};

void TestPlaybackEngineAdapter::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());

    m_state = std::make_unique<Core::PlaybackState>();
    m_resources = std::make_unique<Media::MediaResourceManager>(*m_state);
    m_adapter = std::make_unique<Media::PlaybackEngineAdapter>(*m_state);

    auto engine = std::make_unique<FakeMediaEngine>();
    engine->setDeferred(true);
    m_engine = engine.get();
    m_adapter->setMediaEngine(std::move(engine));
}

void TestPlaybackEngineAdapter::cleanup()
{
    m_adapter.reset();
    m_resources.reset();
    m_state.reset();
    m_dir.reset();
    m_engine = nullptr;
}

void TestPlaybackEngineAdapter::loadSource()
{
    const Media::SourceHandle handle =
        m_resources->openFile(TestUtils::createMediaFile(*m_dir, "clip.mp4"));
    m_resources->replace(handle);
    QVERIFY(m_adapter->attachSource(handle));
}

void TestPlaybackEngineAdapter::testSkipForwardFromStart()
{
    loadSource();
    m_adapter->onDurationKnown(Core::Seconds(120.0));

    m_adapter->skip(10.0);

    QCOMPARE(m_engine->lastSeekTarget(), qint64(10000));
}

void TestPlaybackEngineAdapter::testSkipForwardClampsToDuration()
{
    loadSource();
    m_adapter->onDurationKnown(Core::Seconds(120.0));
    m_engine->emitPosition(115000);

    m_adapter->skip(10.0);

    QCOMPARE(m_engine->lastSeekTarget(), qint64(120000));
}

void TestPlaybackEngineAdapter::testSkipBackwardClampsToZero()
{
    loadSource();
    m_adapter->onDurationKnown(Core::Seconds(120.0));
    m_engine->emitPosition(4000);

    m_adapter->skip(-10.0);

    QCOMPARE(m_engine->lastSeekTarget(), qint64(0));
}

void TestPlaybackEngineAdapter::testSkipsStackOnUnconfirmedSeek()
{
    loadSource();
    m_adapter->onDurationKnown(Core::Seconds(120.0));

    m_adapter->skip(10.0);
    m_adapter->skip(10.0);
    QCOMPARE(m_engine->lastSeekTarget(), qint64(20000));

    m_adapter->skip(-5.0);
    QCOMPARE(m_engine->lastSeekTarget(), qint64(15000));
}

void TestPlaybackEngineAdapter::testConfirmedSeekReturnsBaseToEngine()
{
    loadSource();
    m_adapter->onDurationKnown(Core::Seconds(120.0));

    m_adapter->skip(10.0);
    m_engine->emitPosition(40000);
    m_adapter->onTimeUpdate(Core::Seconds(40.0));

    m_adapter->skip(10.0);
    QCOMPARE(m_engine->lastSeekTarget(), qint64(50000));
}

void TestPlaybackEngineAdapter::testSeekWithUnknownDurationIsUnbounded()
{
    loadSource();

    m_adapter->seekTo(Core::Seconds(500.0));

    QCOMPARE(m_engine->lastSeekTarget(), qint64(500000));
}

void TestPlaybackEngineAdapter::testSeekDoesNotWriteCurrentTime()
{
    loadSource();
    m_adapter->onDurationKnown(Core::Seconds(120.0));

    m_adapter->seekTo(Core::Seconds(30.0));
    QCOMPARE(m_state->currentTime().value(), 0.0);

    m_adapter->onTimeUpdate(Core::Seconds(30.0));
    QCOMPARE(m_state->currentTime().value(), 30.0);
}

void TestPlaybackEngineAdapter::testTimeUpdateClampedToDuration()
{
    loadSource();
    m_adapter->onDurationKnown(Core::Seconds(120.0));

    m_adapter->onTimeUpdate(Core::Seconds(130.0));

    QCOMPARE(m_state->currentTime().value(), 120.0);
}

void TestPlaybackEngineAdapter::testPlayWaitsForEngineReport()
{
    loadSource();

    m_adapter->play();
    QVERIFY(m_engine->calls().contains(QString("play:%1").arg(m_engine->lastRequest())));
    QVERIFY(!m_state->isPlaying());

    m_adapter->onEngineState(true);
    QVERIFY(m_state->isPlaying());
}

void TestPlaybackEngineAdapter::testLatestRequestFailureRollsBack()
{
    loadSource();
    QSignalSpy errorSpy(m_adapter.get(), &Media::PlaybackEngineAdapter::errorOccurred);

    m_adapter->play();
    m_adapter->onRequestFailed(m_engine->lastRequest(), "Autoplay blocked");

    QVERIFY(!m_state->isPlaying());
    QCOMPARE(errorSpy.count(), 1);
    const auto error = errorSpy.at(0).at(0).value<Core::SessionError>();
    QCOMPARE(error.kind, Core::ErrorKind::PlaybackRequest);
    QCOMPARE(error.message, QString("Autoplay blocked"));
}

void TestPlaybackEngineAdapter::testSupersededFailureResyncsWithEngine()
{
    loadSource();
    QSignalSpy errorSpy(m_adapter.get(), &Media::PlaybackEngineAdapter::errorOccurred);

    m_adapter->play();
    const Media::RequestId playRequest = m_engine->lastRequest();
    m_adapter->onEngineState(true);
    m_adapter->pause();

    // The engine is still playing when the stale failure arrives.
    m_engine->emitState(Media::EngineState::Playing);
    m_adapter->onRequestFailed(playRequest, "late failure");

    QCOMPARE(errorSpy.count(), 0);
    QVERIFY(m_state->isPlaying());
}

void TestPlaybackEngineAdapter::testThrowingEngineRollsBack()
{
    loadSource();
    QSignalSpy errorSpy(m_adapter.get(), &Media::PlaybackEngineAdapter::errorOccurred);
    m_engine->setThrowOnPlay(true);

    m_adapter->play();

    QVERIFY(!m_state->isPlaying());
    QCOMPARE(errorSpy.count(), 1);
}

void TestPlaybackEngineAdapter::testEndedStopsPlaying()
{
    loadSource();
    m_adapter->play();
    m_adapter->onEngineState(true);

    m_adapter->onEnded();

    QVERIFY(!m_state->isPlaying());
}

void TestPlaybackEngineAdapter::testCommandsWithoutSourceAreIgnored()
{
    m_adapter->play();
    m_adapter->pause();
    m_adapter->skip(10.0);
    m_adapter->seekTo(Core::Seconds(5.0));

    for (const QString& call : m_engine->calls()) {
        QVERIFY2(!call.startsWith("play") && !call.startsWith("pause") && !call.startsWith("seek"),
                 qPrintable(call));
    }
    QVERIFY(!m_state->isPlaying());
}

void TestPlaybackEngineAdapter::testSetRate()
{
    loadSource();

    m_adapter->setRate(Core::PlaybackRate::ThreeQuarters);

    QCOMPARE(m_state->rate(), Core::PlaybackRate::ThreeQuarters);
    QCOMPARE(m_engine->playbackRate(), 0.75);
}

void TestPlaybackEngineAdapter::testRateReappliedOnAttach()
{
    m_adapter->setRate(Core::PlaybackRate::Half);
    m_engine->clearCalls();

    loadSource();

    const QStringList& calls = m_engine->calls();
    const qsizetype loadIndex = calls.indexOf(QRegularExpression("^load:\\d+$"));
    QVERIFY(loadIndex >= 0);
    QCOMPARE(calls.indexOf(QString("rate:0.5")), qsizetype(loadIndex + 1));
    QCOMPARE(m_state->rate(), Core::PlaybackRate::Half);
}

QTEST_GUILESS_MAIN(TestPlaybackEngineAdapter)
#include "test_playback_engine_adapter.moc"
