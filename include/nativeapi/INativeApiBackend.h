#ifndef DESKPROBE_INATIVEAPIBACKEND_H
#define DESKPROBE_INATIVEAPIBACKEND_H

#include "core/Result.h"
#include "raster/Raster.h"
#include "window/WindowHandle.h"

#include <QString>

#include <functional>
#include <memory>
#include <vector>

namespace DeskProbe {

/**
 * @brief Platform window/display API, called only from the native API thread.
 *
 * Implementations:
 * - Win32NativeApiBackend: User32 enumeration + GDI BitBlt capture
 * - X11NativeApiBackend: xcb QueryTree enumeration + GetImage capture
 *
 * A backend is constructed, initialized, used and destroyed on one thread,
 * so it may hold thread-affine native state (display connection, DCs).
 */
class INativeApiBackend
{
public:
    virtual ~INativeApiBackend() = default;

    virtual QString backendName() const = 0;

    /**
     * @brief Open native connections. Called once, before any command.
     *
     * On failure every command except Shutdown is answered with the
     * returned error.
     */
    virtual Result<Acknowledgement> initialize() = 0;

    // Visible top-level windows with a non-empty title, in OS order.
    virtual Result<std::vector<WindowHandle>> enumerateWindows() = 0;

    // Empty string (not an error) when the window has no title.
    virtual Result<QString> windowTitle(WindowHandle handle) = 0;

    virtual Result<WindowRect> windowRect(WindowHandle handle) = 0;

    virtual Result<bool> isWindowFocused(WindowHandle handle) = 0;

    /**
     * @brief Copy the window's current pixels into a raster.
     *
     * Fails when the window is minimized or gone, or when any native
     * resource fails to allocate; never returns a partially filled raster.
     */
    virtual Result<Raster> captureWindowImage(WindowHandle handle) = 0;
};

// Invoked on the native API thread to build its backend.
using NativeApiBackendFactory = std::function<std::unique_ptr<INativeApiBackend>()>;

} // namespace DeskProbe

#endif // DESKPROBE_INATIVEAPIBACKEND_H
