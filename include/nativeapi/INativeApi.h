#ifndef DESKPROBE_INATIVEAPI_H
#define DESKPROBE_INATIVEAPI_H

#include "core/Result.h"
#include "raster/Raster.h"
#include "window/WindowHandle.h"

#include <QString>

#include <memory>
#include <vector>

namespace DeskProbe {

class RasterBudget;

/**
 * @brief Blocking window/display API usable from any thread.
 *
 * Every call is marshalled to the one thread that owns the native backend
 * and blocks the caller until that thread replies.
 */
class INativeApi
{
public:
    virtual ~INativeApi() = default;

    virtual QString backendName() const = 0;

    virtual Result<std::vector<WindowHandle>> enumerateWindows() = 0;
    virtual Result<QString> windowTitle(WindowHandle handle) = 0;
    virtual Result<WindowRect> windowRect(WindowHandle handle) = 0;
    virtual Result<bool> isWindowFocused(WindowHandle handle) = 0;
    virtual Result<Raster> captureWindowImage(WindowHandle handle) = 0;

    /**
     * @brief Stop the native API thread.
     *
     * Returns once the backend has been released. Later calls fail with
     * ErrorCode::ChannelClosed.
     */
    virtual Result<Acknowledgement> shutdown() = 0;

    /**
     * @brief Factory method to create the implementation for this platform.
     *
     * Windows: Win32 (User32 + GDI). Linux: X11 via xcb. Anything else gets
     * an implementation that answers every call with PlatformUnsupported.
     *
     * @param budget Cap shared by every captured raster; nullptr for none.
     * @param requestTimeoutMs Caller-side reply wait, 0 waits forever.
     */
    static std::unique_ptr<INativeApi> createForPlatform(std::shared_ptr<RasterBudget> budget,
                                                         int requestTimeoutMs = 0);

    /**
     * @brief createForPlatform() with the raster cap and reply timeout stored
     * in AutomationSettingsManager.
     *
     * The caller owns the result and hands it to whoever needs window access;
     * its worker thread starts on the first request.
     */
    static std::unique_ptr<INativeApi> createFromSettings();

    // True when this build has a real backend for the running platform.
    static bool isNativeBackendAvailable();
};

} // namespace DeskProbe

#endif // DESKPROBE_INATIVEAPI_H
