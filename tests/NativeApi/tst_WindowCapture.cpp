#include <QtTest>

#include "nativeapi/WindowCapture.h"
#include "raster/PixelConversion.h"
#include "raster/RasterBudget.h"

#include <optional>

using namespace DeskProbe;

namespace {

// Scripted steps recording the order they were called in.
class ScriptedSteps : public IWindowCaptureSteps
{
public:
    Result<WindowRect> queryRect() override
    {
        log.append(QStringLiteral("rect"));
        if (rectError) {
            return Result<WindowRect>::failure(*rectError);
        }
        return Result<WindowRect>::success(rect);
    }

    Result<Acknowledgement> checkCapturable() override
    {
        log.append(QStringLiteral("check"));
        if (minimized) {
            return Result<Acknowledgement>::failure(Error::windowMinimized());
        }
        return Result<Acknowledgement>::success(Acknowledgement{});
    }

    Result<NativePixels> copyPixels(const WindowRect &copyRect) override
    {
        log.append(QStringLiteral("copy"));
        if (copyError) {
            return Result<NativePixels>::failure(*copyError);
        }
        NativePixels pixels;
        pixels.width = quint32(copyRect.width());
        pixels.height = quint32(copyRect.height());
        pixels.hasAlpha = hasAlpha;
        for (int i = 0; i < copyRect.width() * copyRect.height(); ++i) {
            // B, G, R, A
            pixels.bgra.insert(pixels.bgra.end(), {0x30, 0x20, 0x10, 0x00});
        }
        if (minimizeAfterCopy) {
            minimized = true;
        }
        return Result<NativePixels>::success(std::move(pixels));
    }

    WindowRect rect{10, 10, 13, 12};
    bool minimized = false;
    bool minimizeAfterCopy = false;
    bool hasAlpha = false;
    std::optional<Error> rectError;
    std::optional<Error> copyError;
    QStringList log;
};

} // namespace

/**
 * @brief Tests for the shared rect -> check -> copy -> check -> convert sequence.
 */
class tst_WindowCapture : public QObject
{
    Q_OBJECT

private slots:
    void testStepOrder();
    void testConvertsBgraToRgba();
    void testKeepsAlphaWhenPresent();
    void testMinimizedBeforeCopySkipsCopy();
    void testMinimizedDuringCopyDiscardsPixels();
    void testEmptyRectSkipsCopy();
    void testRectErrorPropagates();
    void testCopyErrorPropagates();

    // ZPixmap layout
    void testZPixmapLayout_Accepted();
    void testZPixmapLayout_MsbFirstRejected();
    void testZPixmapLayout_WrongDepthOrSize();
};

void tst_WindowCapture::testStepOrder()
{
    ScriptedSteps steps;

    Result<Raster> raster = WindowCapture::run(steps, nullptr);

    QVERIFY(raster.isSuccess());
    const QStringList expected{QStringLiteral("rect"), QStringLiteral("check"),
                               QStringLiteral("copy"), QStringLiteral("check")};
    QCOMPARE(steps.log, expected);
}

void tst_WindowCapture::testConvertsBgraToRgba()
{
    ScriptedSteps steps;

    Result<Raster> raster = WindowCapture::run(steps, nullptr);

    QVERIFY(raster.isSuccess());
    QCOMPARE(raster.value().width(), 3u);
    QCOMPARE(raster.value().height(), 2u);
    // Undefined fourth byte is forced opaque.
    QCOMPARE(raster.value().pixel(2, 1), PixelConversion::packRgba(0x10, 0x20, 0x30, 0xFF));
}

void tst_WindowCapture::testKeepsAlphaWhenPresent()
{
    ScriptedSteps steps;
    steps.hasAlpha = true;

    Result<Raster> raster = WindowCapture::run(steps, nullptr);

    QVERIFY(raster.isSuccess());
    QCOMPARE(raster.value().pixel(0, 0), PixelConversion::packRgba(0x10, 0x20, 0x30, 0x00));
}

void tst_WindowCapture::testMinimizedBeforeCopySkipsCopy()
{
    ScriptedSteps steps;
    steps.minimized = true;

    Result<Raster> raster = WindowCapture::run(steps, nullptr);

    QVERIFY(!raster.isSuccess());
    QCOMPARE(raster.error().code, ErrorCode::WindowMinimized);
    QVERIFY(!steps.log.contains(QStringLiteral("copy")));
}

void tst_WindowCapture::testMinimizedDuringCopyDiscardsPixels()
{
    auto budget = RasterBudget::create(2);
    ScriptedSteps steps;
    steps.minimizeAfterCopy = true;

    Result<Raster> raster = WindowCapture::run(steps, budget);

    QVERIFY(!raster.isSuccess());
    QCOMPARE(raster.error().code, ErrorCode::WindowMinimized);
    QCOMPARE(steps.log.count(QStringLiteral("copy")), 1);
    QCOMPARE(steps.log.last(), QStringLiteral("check"));
    QCOMPARE(budget->liveCount(), 0);
}

void tst_WindowCapture::testEmptyRectSkipsCopy()
{
    ScriptedSteps steps;
    steps.rect = WindowRect{5, 5, 5, 40};

    Result<Raster> raster = WindowCapture::run(steps, nullptr);

    QVERIFY(!raster.isSuccess());
    QCOMPARE(raster.error().code, ErrorCode::NativeCallFailed);
    QCOMPARE(raster.error().step, NativeStep::GetWindowRect);
    QVERIFY(!steps.log.contains(QStringLiteral("copy")));
}

void tst_WindowCapture::testRectErrorPropagates()
{
    ScriptedSteps steps;
    steps.rectError = Error::staleHandle(NativeStep::GetWindowRect, QStringLiteral("gone"), 1400);

    Result<Raster> raster = WindowCapture::run(steps, nullptr);

    QVERIFY(!raster.isSuccess());
    QCOMPARE(raster.error().code, ErrorCode::StaleHandle);
    QCOMPARE(steps.log, QStringList{QStringLiteral("rect")});
}

void tst_WindowCapture::testCopyErrorPropagates()
{
    ScriptedSteps steps;
    steps.copyError = Error::nativeCall(NativeStep::CopyBits, 6, QStringLiteral("BitBlt failed"));

    Result<Raster> raster = WindowCapture::run(steps, nullptr);

    QVERIFY(!raster.isSuccess());
    QCOMPARE(raster.error().step, NativeStep::CopyBits);
    QCOMPARE(raster.error().nativeCode, qint64(6));
    QCOMPARE(steps.log.last(), QStringLiteral("copy"));
}

// ============================================================================
// ZPixmap layout
// ============================================================================

void tst_WindowCapture::testZPixmapLayout_Accepted()
{
    Result<bool> depth24 = WindowCapture::checkZPixmapLayout(true, 24, 4 * 3 * 2, 3, 2);
    QVERIFY(depth24.isSuccess());
    QCOMPARE(depth24.value(), false);

    Result<bool> depth32 = WindowCapture::checkZPixmapLayout(true, 32, 4 * 3 * 2, 3, 2);
    QVERIFY(depth32.isSuccess());
    QCOMPARE(depth32.value(), true);
}

void tst_WindowCapture::testZPixmapLayout_MsbFirstRejected()
{
    Result<bool> layout = WindowCapture::checkZPixmapLayout(false, 24, 4 * 3 * 2, 3, 2);

    QVERIFY(!layout.isSuccess());
    QCOMPARE(layout.error().code, ErrorCode::NativeCallFailed);
    QCOMPARE(layout.error().step, NativeStep::UnsupportedPixelFormat);
}

void tst_WindowCapture::testZPixmapLayout_WrongDepthOrSize()
{
    QCOMPARE(WindowCapture::checkZPixmapLayout(true, 16, 4 * 3 * 2, 3, 2).error().step,
             NativeStep::UnsupportedPixelFormat);
    // 24-bit packed (3 bytes per pixel)
    QCOMPARE(WindowCapture::checkZPixmapLayout(true, 24, 3 * 3 * 2, 3, 2).error().step,
             NativeStep::UnsupportedPixelFormat);
}

QTEST_GUILESS_MAIN(tst_WindowCapture)
#include "tst_WindowCapture.moc"
