#include "nativeapi/UnsupportedNativeApi.h"

namespace DeskProbe {

QString UnsupportedNativeApi::backendName() const
{
    return QStringLiteral("Unsupported");
}

Result<std::vector<WindowHandle>> UnsupportedNativeApi::enumerateWindows()
{
    return Result<std::vector<WindowHandle>>::failure(Error::platformUnsupported());
}

Result<QString> UnsupportedNativeApi::windowTitle(WindowHandle)
{
    return Result<QString>::failure(Error::platformUnsupported());
}

Result<WindowRect> UnsupportedNativeApi::windowRect(WindowHandle)
{
    return Result<WindowRect>::failure(Error::platformUnsupported());
}

Result<bool> UnsupportedNativeApi::isWindowFocused(WindowHandle)
{
    return Result<bool>::failure(Error::platformUnsupported());
}

Result<Raster> UnsupportedNativeApi::captureWindowImage(WindowHandle)
{
    return Result<Raster>::failure(Error::platformUnsupported());
}

Result<Acknowledgement> UnsupportedNativeApi::shutdown()
{
    return Result<Acknowledgement>::failure(Error::platformUnsupported());
}

} // namespace DeskProbe
