#include "window/WindowRegistry.h"
#include "nativeapi/INativeApi.h"

namespace DeskProbe {

WindowRegistry::WindowRegistry(INativeApi &api)
    : m_api(api)
{
}

Result<std::vector<WindowHandle>> WindowRegistry::enumerateWindows()
{
    return m_api.enumerateWindows();
}

Result<QString> WindowRegistry::windowTitle(WindowHandle handle)
{
    return m_api.windowTitle(handle);
}

Result<WindowRect> WindowRegistry::windowRect(WindowHandle handle)
{
    return m_api.windowRect(handle);
}

Result<int> WindowRegistry::windowX(WindowHandle handle)
{
    return windowRect(handle).map([](const WindowRect &rect) { return rect.left; });
}

Result<int> WindowRegistry::windowY(WindowHandle handle)
{
    return windowRect(handle).map([](const WindowRect &rect) { return rect.top; });
}

Result<quint32> WindowRegistry::windowWidth(WindowHandle handle)
{
    return windowRect(handle).map([](const WindowRect &rect) { return quint32(qMax(0, rect.width())); });
}

Result<quint32> WindowRegistry::windowHeight(WindowHandle handle)
{
    return windowRect(handle).map([](const WindowRect &rect) { return quint32(qMax(0, rect.height())); });
}

Result<bool> WindowRegistry::isWindowFocused(WindowHandle handle)
{
    return m_api.isWindowFocused(handle);
}

Result<Raster> WindowRegistry::captureWindow(WindowHandle handle)
{
    return m_api.captureWindowImage(handle);
}

} // namespace DeskProbe
