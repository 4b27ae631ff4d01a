#ifndef DESKPROBE_UNSUPPORTEDNATIVEAPI_H
#define DESKPROBE_UNSUPPORTEDNATIVEAPI_H

#include "nativeapi/INativeApi.h"

namespace DeskProbe {

/**
 * @brief INativeApi for platforms without a backend.
 *
 * Answers every call with ErrorCode::PlatformUnsupported. No thread is started.
 */
class UnsupportedNativeApi : public INativeApi
{
public:
    QString backendName() const override;

    Result<std::vector<WindowHandle>> enumerateWindows() override;
    Result<QString> windowTitle(WindowHandle handle) override;
    Result<WindowRect> windowRect(WindowHandle handle) override;
    Result<bool> isWindowFocused(WindowHandle handle) override;
    Result<Raster> captureWindowImage(WindowHandle handle) override;
    Result<Acknowledgement> shutdown() override;
};

} // namespace DeskProbe

#endif // DESKPROBE_UNSUPPORTEDNATIVEAPI_H
