#include <QtTest>
#include <QtConcurrent>
#include <QImage>
#include <QColor>

#include "nativeapi/NativeApiActor.h"
#include "raster/PixelConversion.h"
#include "raster/RasterBudget.h"
#include "../mocks/MockNativeApiBackend.h"

#include <memory>

using namespace DeskProbe;

/**
 * @brief Tests for NativeApiActor against MockNativeApiBackend.
 *
 * Covers:
 * - Lazy, single start of the worker thread
 * - Thread affinity of every backend call
 * - Round trips for each command
 * - Error propagation, backend exceptions and init failure
 * - Shutdown, timeout and destruction
 */
class tst_NativeApiActor : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Startup
    void testWorkerNotStartedUntilFirstRequest();
    void testConcurrentFirstRequestsStartOneWorker();

    // Thread affinity
    void testBackendRunsOnWorkerThread();

    // Round trips
    void testEnumerateWindows();
    void testWindowTitle();
    void testWindowRect();
    void testIsWindowFocused();
    void testCaptureWindowImage();
    void testRequestsServedInOrder();

    // Errors
    void testStaleHandle();
    void testMinimizedWindow();
    void testWindowMinimizedDuringCopy();
    void testEnumerateFailure();
    void testBackendExceptionBecomesError();
    void testInitializeFailureAnswersEveryRequest();
    void testBackendCreationThrows();
    void testCaptureRespectsRasterBudget();

    // Lifecycle
    void testShutdown();
    void testShutdownBeforeFirstRequest();
    void testTimeout();
    void testDestructorReleasesBackend();

private:
    std::unique_ptr<NativeApiActor> makeActor(int timeoutMs = 0);

    std::shared_ptr<MockNativeApiState> m_state;
};

namespace {

const WindowHandle kEditor(0x1001);
const WindowHandle kTerminal(0x2002);
const WindowHandle kUntitled(0x3003);
const WindowHandle kMissing(0xDEAD);

} // namespace

void tst_NativeApiActor::init()
{
    m_state = std::make_shared<MockNativeApiState>();
    m_state->addWindow(kEditor, QStringLiteral("Editor"), WindowRect{10, 20, 110, 70});
    m_state->addWindow(kUntitled, QString(), WindowRect{0, 0, 5, 5});
    m_state->addWindow(kTerminal, QStringLiteral("Terminal é"), WindowRect{-5, 0, 35, 12});
    m_state->setFocusedWindow(kTerminal);
}

void tst_NativeApiActor::cleanup()
{
    m_state.reset();
}

std::unique_ptr<NativeApiActor> tst_NativeApiActor::makeActor(int timeoutMs)
{
    return std::make_unique<NativeApiActor>(QStringLiteral("Mock"),
                                            MockNativeApiBackend::factory(m_state), timeoutMs);
}

// ============================================================================
// Startup
// ============================================================================

void tst_NativeApiActor::testWorkerNotStartedUntilFirstRequest()
{
    auto actor = makeActor();

    QVERIFY(!actor->isWorkerStarted());
    QCOMPARE(m_state->factoryCallCount(), 0);

    QVERIFY(actor->enumerateWindows().isSuccess());

    QVERIFY(actor->isWorkerStarted());
    QCOMPARE(m_state->factoryCallCount(), 1);
    QCOMPARE(m_state->initializeCallCount(), 1);

    QVERIFY(actor->windowTitle(kEditor).isSuccess());
    QCOMPARE(m_state->factoryCallCount(), 1);
    QCOMPARE(m_state->initializeCallCount(), 1);
}

void tst_NativeApiActor::testConcurrentFirstRequestsStartOneWorker()
{
    auto actor = makeActor();
    NativeApiActor *api = actor.get();

    QList<int> callers;
    for (int i = 0; i < 16; ++i) {
        callers.append(i);
    }

    QList<bool> succeeded = QtConcurrent::blockingMapped<QList<bool>>(callers, [api](int) {
        return api->enumerateWindows().isSuccess();
    });

    QCOMPARE(succeeded.size(), 16);
    QVERIFY(!succeeded.contains(false));
    QCOMPARE(m_state->factoryCallCount(), 1);
    QCOMPARE(m_state->initializeCallCount(), 1);
}

// ============================================================================
// Thread affinity
// ============================================================================

void tst_NativeApiActor::testBackendRunsOnWorkerThread()
{
    auto actor = makeActor();
    NativeApiActor *api = actor.get();

    QFuture<void> fromPool = QtConcurrent::run([api]() {
        api->windowTitle(kEditor);
        api->isWindowFocused(kEditor);
    });
    actor->enumerateWindows();
    actor->windowRect(kEditor);
    fromPool.waitForFinished();

    const QList<Qt::HANDLE> threads = m_state->callThreads();
    QCOMPARE(threads.size(), 5);  // initialize + four commands
    for (Qt::HANDLE thread : threads) {
        QCOMPARE(thread, threads.first());
    }
    QVERIFY(threads.first() != QThread::currentThreadId());
}

// ============================================================================
// Round trips
// ============================================================================

void tst_NativeApiActor::testEnumerateWindows()
{
    auto actor = makeActor();

    Result<std::vector<WindowHandle>> windows = actor->enumerateWindows();

    QVERIFY(windows.isSuccess());
    // Untitled windows are not listed.
    const std::vector<WindowHandle> expected{kEditor, kTerminal};
    QVERIFY(windows.value() == expected);
}

void tst_NativeApiActor::testWindowTitle()
{
    auto actor = makeActor();

    QCOMPARE(actor->windowTitle(kTerminal).value(), QStringLiteral("Terminal é"));

    Result<QString> untitled = actor->windowTitle(kUntitled);
    QVERIFY(untitled.isSuccess());
    QVERIFY(untitled.value().isEmpty());
}

void tst_NativeApiActor::testWindowRect()
{
    auto actor = makeActor();

    Result<WindowRect> rect = actor->windowRect(kEditor);

    QVERIFY(rect.isSuccess());
    QCOMPARE(rect.value(), (WindowRect{10, 20, 110, 70}));
    QCOMPARE(rect.value().toQRect(), QRect(10, 20, 100, 50));
}

void tst_NativeApiActor::testIsWindowFocused()
{
    auto actor = makeActor();

    QCOMPARE(actor->isWindowFocused(kTerminal).value(), true);
    QCOMPARE(actor->isWindowFocused(kEditor).value(), false);

    m_state->setFocusedWindow(kEditor);
    QCOMPARE(actor->isWindowFocused(kEditor).value(), true);
}

void tst_NativeApiActor::testCaptureWindowImage()
{
    QImage content(3, 2, QImage::Format_RGBA8888);
    content.fill(QColor(0, 0, 255, 255));
    content.setPixelColor(1, 1, QColor(255, 0, 0, 255));
    m_state->addWindow(kEditor, QStringLiteral("Editor"), WindowRect{0, 0, 3, 2}, content);
    auto actor = makeActor();

    Result<Raster> raster = actor->captureWindowImage(kEditor);

    QVERIFY(raster.isSuccess());
    QCOMPARE(raster.value().width(), 3u);
    QCOMPARE(raster.value().height(), 2u);
    QCOMPARE(raster.value().pixel(1, 1), PixelConversion::packRgba(255, 0, 0, 255));
    QCOMPARE(raster.value().pixel(0, 0), PixelConversion::packRgba(0, 0, 255, 255));
}

void tst_NativeApiActor::testRequestsServedInOrder()
{
    auto actor = makeActor();

    actor->windowRect(kEditor);
    actor->enumerateWindows();
    actor->isWindowFocused(kEditor);
    actor->captureWindowImage(kEditor);
    actor->windowTitle(kEditor);

    const QStringList expected{
        QStringLiteral("initialize"),
        QStringLiteral("windowRect"),
        QStringLiteral("enumerateWindows"),
        QStringLiteral("isWindowFocused"),
        QStringLiteral("captureWindowImage"),
        QStringLiteral("windowTitle"),
    };
    QCOMPARE(m_state->calls(), expected);
}

// ============================================================================
// Errors
// ============================================================================

void tst_NativeApiActor::testStaleHandle()
{
    auto actor = makeActor();

    Result<WindowRect> rect = actor->windowRect(kMissing);
    QVERIFY(!rect.isSuccess());
    QCOMPARE(rect.error().code, ErrorCode::StaleHandle);
    QCOMPARE(rect.error().nativeCode, qint64(1400));
    QVERIFY(rect.error().isStaleHandle());

    Result<Raster> capture = actor->captureWindowImage(kMissing);
    QVERIFY(!capture.isSuccess());
    QCOMPARE(capture.error().code, ErrorCode::StaleHandle);
}

void tst_NativeApiActor::testMinimizedWindow()
{
    auto actor = makeActor();
    QVERIFY(actor->captureWindowImage(kEditor).isSuccess());

    m_state->setMinimized(kEditor, true);
    Result<Raster> capture = actor->captureWindowImage(kEditor);

    QVERIFY(!capture.isSuccess());
    QCOMPARE(capture.error().code, ErrorCode::WindowMinimized);
    QCOMPARE(capture.error().step, NativeStep::CheckMinimized);
    QVERIFY(capture.error().isStaleHandle());
}

void tst_NativeApiActor::testWindowMinimizedDuringCopy()
{
    auto budget = RasterBudget::create(4);
    m_state->setRasterBudget(budget);
    m_state->setMinimizeDuringCopy(kEditor, true);
    auto actor = makeActor();

    Result<Raster> capture = actor->captureWindowImage(kEditor);

    QVERIFY(!capture.isSuccess());
    QCOMPARE(capture.error().code, ErrorCode::WindowMinimized);
    QCOMPARE(budget->liveCount(), 0);

    // Still minimized on the next attempt, caught before the copy.
    QCOMPARE(actor->captureWindowImage(kEditor).error().code, ErrorCode::WindowMinimized);
}

void tst_NativeApiActor::testEnumerateFailure()
{
    m_state->setEnumerateError(Error::nativeCall(NativeStep::EnumerateWindows, 5, QStringLiteral("denied")));
    auto actor = makeActor();

    Result<std::vector<WindowHandle>> windows = actor->enumerateWindows();

    QVERIFY(!windows.isSuccess());
    QCOMPARE(windows.error().code, ErrorCode::NativeCallFailed);
    QCOMPARE(windows.error().step, NativeStep::EnumerateWindows);
    QCOMPARE(windows.error().nativeCode, qint64(5));
}

void tst_NativeApiActor::testBackendExceptionBecomesError()
{
    m_state->setThrowOnCapture(true);
    auto actor = makeActor();

    Result<Raster> capture = actor->captureWindowImage(kEditor);
    QVERIFY(!capture.isSuccess());
    QCOMPARE(capture.error().code, ErrorCode::NativeCallFailed);
    QVERIFY(capture.error().message.contains(QStringLiteral("mock capture exploded")));

    // The worker survives and keeps serving.
    m_state->setThrowOnCapture(false);
    QVERIFY(actor->captureWindowImage(kEditor).isSuccess());
}

void tst_NativeApiActor::testInitializeFailureAnswersEveryRequest()
{
    m_state->setInitializeError(Error::nativeCall(NativeStep::Connect, 111, QStringLiteral("no display")));
    auto actor = makeActor();

    Result<std::vector<WindowHandle>> windows = actor->enumerateWindows();
    QVERIFY(!windows.isSuccess());
    QCOMPARE(windows.error().step, NativeStep::Connect);
    QCOMPARE(windows.error().nativeCode, qint64(111));

    QCOMPARE(actor->windowTitle(kEditor).error().step, NativeStep::Connect);
    QCOMPARE(actor->captureWindowImage(kEditor).error().step, NativeStep::Connect);
    QCOMPARE(m_state->initializeCallCount(), 1);
    QCOMPARE(m_state->calls(), QStringList{QStringLiteral("initialize")});

    QVERIFY(actor->shutdown().isSuccess());
}

void tst_NativeApiActor::testBackendCreationThrows()
{
    m_state->setThrowOnCreate(true);
    auto actor = makeActor();

    Result<std::vector<WindowHandle>> windows = actor->enumerateWindows();
    QVERIFY(!windows.isSuccess());
    QCOMPARE(windows.error().code, ErrorCode::NativeCallFailed);
    QCOMPARE(windows.error().step, NativeStep::Connect);
    QVERIFY(windows.error().message.contains(QStringLiteral("mock backend construction failed")));

    QCOMPARE(actor->captureWindowImage(kEditor).error().step, NativeStep::Connect);
    QCOMPARE(m_state->factoryCallCount(), 1);
    QCOMPARE(m_state->liveBackendCount(), 0);

    QVERIFY(actor->shutdown().isSuccess());
}

void tst_NativeApiActor::testCaptureRespectsRasterBudget()
{
    auto budget = RasterBudget::create(1);
    m_state->setRasterBudget(budget);
    auto actor = makeActor();

    Result<Raster> first = actor->captureWindowImage(kEditor);
    QVERIFY(first.isSuccess());
    QCOMPARE(budget->liveCount(), 1);

    Result<Raster> second = actor->captureWindowImage(kTerminal);
    QVERIFY(!second.isSuccess());
    QCOMPARE(second.error().code, ErrorCode::ResourceExhausted);

    first = Result<Raster>();
    QVERIFY(actor->captureWindowImage(kTerminal).isSuccess());
}

// ============================================================================
// Lifecycle
// ============================================================================

void tst_NativeApiActor::testShutdown()
{
    auto actor = makeActor();
    QVERIFY(actor->enumerateWindows().isSuccess());
    QCOMPARE(m_state->liveBackendCount(), 1);

    Result<Acknowledgement> acknowledged = actor->shutdown();

    QVERIFY(acknowledged.isSuccess());
    QCOMPARE(m_state->liveBackendCount(), 0);

    Result<std::vector<WindowHandle>> afterwards = actor->enumerateWindows();
    QVERIFY(!afterwards.isSuccess());
    QCOMPARE(afterwards.error().code, ErrorCode::ChannelClosed);

    // No second worker is spawned.
    QCOMPARE(m_state->factoryCallCount(), 1);
}

void tst_NativeApiActor::testShutdownBeforeFirstRequest()
{
    auto actor = makeActor();

    QVERIFY(actor->shutdown().isSuccess());
    QVERIFY(!actor->isWorkerStarted());

    QCOMPARE(actor->windowTitle(kEditor).error().code, ErrorCode::ChannelClosed);
    QVERIFY(!actor->isWorkerStarted());
    QCOMPARE(m_state->factoryCallCount(), 0);
}

void tst_NativeApiActor::testTimeout()
{
    m_state->setCallDelayMs(400);
    auto actor = makeActor(100);
    QCOMPARE(actor->requestTimeoutMs(), 100);

    QElapsedTimer timer;
    timer.start();
    Result<std::vector<WindowHandle>> windows = actor->enumerateWindows();

    QVERIFY(!windows.isSuccess());
    QCOMPARE(windows.error().code, ErrorCode::Timeout);
    QVERIFY(timer.elapsed() < 400);

    // Let the worker finish (and discard) the abandoned requests.
    m_state->setCallDelayMs(0);
    QTest::qWait(1000);

    Result<std::vector<WindowHandle>> retry = actor->enumerateWindows();
    QVERIFY(retry.isSuccess());
    QCOMPARE(retry.value().size(), size_t(2));
}

void tst_NativeApiActor::testDestructorReleasesBackend()
{
    {
        auto actor = makeActor();
        QVERIFY(actor->enumerateWindows().isSuccess());
        QCOMPARE(m_state->liveBackendCount(), 1);
    }

    QCOMPARE(m_state->liveBackendCount(), 0);
}

QTEST_GUILESS_MAIN(tst_NativeApiActor)
#include "tst_NativeApiActor.moc"
