#ifndef DESKPROBE_WIN32NATIVEAPIBACKEND_H
#define DESKPROBE_WIN32NATIVEAPIBACKEND_H

#include "nativeapi/INativeApiBackend.h"

#include <memory>

namespace DeskProbe {

class RasterBudget;

/**
 * @brief User32/GDI backend.
 *
 * Enumerates with EnumWindows, captures with GetWindowDC + BitBlt into a
 * compatible bitmap and reads the bits back with GetDIBits. Every DC and
 * bitmap is owned by an RAII guard so error paths release them too.
 */
class Win32NativeApiBackend : public INativeApiBackend
{
public:
    explicit Win32NativeApiBackend(std::shared_ptr<RasterBudget> budget);
    ~Win32NativeApiBackend() override;

    QString backendName() const override;
    Result<Acknowledgement> initialize() override;

    Result<std::vector<WindowHandle>> enumerateWindows() override;
    Result<QString> windowTitle(WindowHandle handle) override;
    Result<WindowRect> windowRect(WindowHandle handle) override;
    Result<bool> isWindowFocused(WindowHandle handle) override;
    Result<Raster> captureWindowImage(WindowHandle handle) override;

private:
    std::shared_ptr<RasterBudget> m_budget;
};

} // namespace DeskProbe

#endif // DESKPROBE_WIN32NATIVEAPIBACKEND_H
