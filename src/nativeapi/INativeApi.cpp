#include "nativeapi/INativeApi.h"
#include "nativeapi/NativeApiActor.h"
#include "nativeapi/UnsupportedNativeApi.h"
#include "raster/RasterBudget.h"
#include "settings/AutomationSettingsManager.h"

#ifdef Q_OS_WIN
#include "nativeapi/Win32NativeApiBackend.h"
#endif

#ifdef DESKPROBE_HAS_XCB
#include "nativeapi/X11NativeApiBackend.h"
#endif

#include <QDebug>

namespace DeskProbe {

std::unique_ptr<INativeApi> INativeApi::createForPlatform(std::shared_ptr<RasterBudget> budget,
                                                          int requestTimeoutMs)
{
#ifdef Q_OS_WIN
    qDebug() << "INativeApi: Using Win32 backend";
    return std::make_unique<NativeApiActor>(
        QStringLiteral("Win32"),
        [budget]() { return std::make_unique<Win32NativeApiBackend>(budget); },
        requestTimeoutMs);
#elif defined(DESKPROBE_HAS_XCB)
    qDebug() << "INativeApi: Using X11 backend";
    return std::make_unique<NativeApiActor>(
        QStringLiteral("X11"),
        [budget]() { return std::make_unique<X11NativeApiBackend>(budget); },
        requestTimeoutMs);
#else
    Q_UNUSED(budget);
    Q_UNUSED(requestTimeoutMs);
    qDebug() << "INativeApi: No native backend for this platform";
    return std::make_unique<UnsupportedNativeApi>();
#endif
}

std::unique_ptr<INativeApi> INativeApi::createFromSettings()
{
    const AutomationSettingsManager &settings = AutomationSettingsManager::instance();
    return createForPlatform(settings.makeRasterBudget(), settings.loadRequestTimeoutMs());
}

bool INativeApi::isNativeBackendAvailable()
{
#if defined(Q_OS_WIN) || defined(DESKPROBE_HAS_XCB)
    return true;
#else
    return false;
#endif
}

} // namespace DeskProbe
