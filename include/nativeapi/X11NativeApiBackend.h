#ifndef DESKPROBE_X11NATIVEAPIBACKEND_H
#define DESKPROBE_X11NATIVEAPIBACKEND_H

#include "nativeapi/INativeApiBackend.h"

#include <memory>

namespace DeskProbe {

class RasterBudget;

/**
 * @brief X11 backend built on xcb.
 *
 * Holds one connection to the X server for the lifetime of the native API
 * thread. Only top-level children of the root window are enumerated.
 */
class X11NativeApiBackend : public INativeApiBackend
{
public:
    explicit X11NativeApiBackend(std::shared_ptr<RasterBudget> budget);
    ~X11NativeApiBackend() override;

    X11NativeApiBackend(const X11NativeApiBackend &) = delete;
    X11NativeApiBackend &operator=(const X11NativeApiBackend &) = delete;

    QString backendName() const override;
    Result<Acknowledgement> initialize() override;

    Result<std::vector<WindowHandle>> enumerateWindows() override;
    Result<QString> windowTitle(WindowHandle handle) override;
    Result<WindowRect> windowRect(WindowHandle handle) override;
    Result<bool> isWindowFocused(WindowHandle handle) override;
    Result<Raster> captureWindowImage(WindowHandle handle) override;

private:
    class Private;
    Private *d;
};

} // namespace DeskProbe

#endif // DESKPROBE_X11NATIVEAPIBACKEND_H
