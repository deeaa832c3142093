#include <QtTest/QtTest>
#include <QApplication>
#include <QSignalSpy>
#include <QVBoxLayout>
#include <QWidget>
#include <memory>
#include <stdexcept>
#include "ui/WindowFullscreenPlatform.h"

using namespace HoldPlay;

class TestWindowFullscreenPlatform : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testNullTargetThrows();
    void testEnterRequiresVisibleParent();
    void testEnterDetachesTarget();
    void testExitReembedsTarget();
    void testWindowManagerExitReembedsTarget();
    void testReenterAfterWindowManagerExit();
    void testEscapeLeavesFullscreen();

private:
    void simulateWindowManagerExit();

    std::unique_ptr<QWidget> m_window;
    QWidget* m_container{nullptr};
    std::unique_ptr<UI::WindowFullscreenPlatform> m_platform;
};

void TestWindowFullscreenPlatform::init()
{
    m_window = std::make_unique<QWidget>();
    auto* layout = new QVBoxLayout(m_window.get());
    m_container = new QWidget(m_window.get());
    layout->addWidget(m_container);
    m_platform = std::make_unique<UI::WindowFullscreenPlatform>(m_container);
    m_window->show();
}

void TestWindowFullscreenPlatform::cleanup()
{
    m_platform.reset();
    m_window.reset();
    m_container = nullptr;
}

void TestWindowFullscreenPlatform::simulateWindowManagerExit()
{
    m_container->setWindowState(m_container->windowState() & ~Qt::WindowFullScreen);
}

void TestWindowFullscreenPlatform::testNullTargetThrows()
{
    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, UI::WindowFullscreenPlatform(nullptr));
}

void TestWindowFullscreenPlatform::testEnterRequiresVisibleParent()
{
    m_window->hide();

    QVERIFY(!m_platform->requestEnter());
    QVERIFY(!m_container->isWindow());
}

void TestWindowFullscreenPlatform::testEnterDetachesTarget()
{
    QSignalSpy spy(m_platform.get(), &UI::IFullscreenPlatform::fullscreenChanged);

    QVERIFY(m_platform->requestEnter());

    QVERIFY(m_container->isWindow());
    QVERIFY(m_platform->isFullScreen());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.last().at(0).toBool(), true);
}

void TestWindowFullscreenPlatform::testExitReembedsTarget()
{
    QVERIFY(m_platform->requestEnter());
    QSignalSpy spy(m_platform.get(), &UI::IFullscreenPlatform::fullscreenChanged);

    QVERIFY(m_platform->requestExit());

    QVERIFY(!m_platform->isFullScreen());
    QVERIFY(!m_container->isWindow());
    QCOMPARE(m_container->parentWidget(), m_window.get());
    QVERIFY(m_container->isVisible());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.last().at(0).toBool(), false);
}

void TestWindowFullscreenPlatform::testWindowManagerExitReembedsTarget()
{
    QVERIFY(m_platform->requestEnter());
    QSignalSpy spy(m_platform.get(), &UI::IFullscreenPlatform::fullscreenChanged);

    simulateWindowManagerExit();

    QVERIFY(!m_platform->isFullScreen());
    QVERIFY(!m_container->isWindow());
    QCOMPARE(m_container->parentWidget(), m_window.get());
    QVERIFY(m_container->isVisible());
    QVERIFY(!spy.isEmpty());
    QCOMPARE(spy.last().at(0).toBool(), false);
}

void TestWindowFullscreenPlatform::testReenterAfterWindowManagerExit()
{
    QVERIFY(m_platform->requestEnter());
    simulateWindowManagerExit();
    QVERIFY(!m_container->isWindow());

    QVERIFY(m_platform->requestEnter());
    QVERIFY(m_platform->isFullScreen());

    QVERIFY(m_platform->requestExit());
    QVERIFY(!m_container->isWindow());
    QVERIFY(!m_container->windowFlags().testFlag(Qt::Window));
}

void TestWindowFullscreenPlatform::testEscapeLeavesFullscreen()
{
    QVERIFY(m_platform->requestEnter());

    QTest::keyClick(m_container, Qt::Key_Escape);

    QVERIFY(!m_platform->isFullScreen());
    QVERIFY(!m_container->isWindow());
}

QTEST_MAIN(TestWindowFullscreenPlatform)
#include "test_window_fullscreen_platform.moc"
