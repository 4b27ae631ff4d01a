#ifndef DESKPROBE_WINDOWREGISTRY_H
#define DESKPROBE_WINDOWREGISTRY_H

#include "core/Result.h"
#include "raster/Raster.h"
#include "window/WindowHandle.h"

#include <QString>

#include <vector>

namespace DeskProbe {

class INativeApi;

/**
 * @brief Window lookups keyed by WindowHandle.
 *
 * Keeps no per-window state. Every query goes to the native API, so a
 * closed window is reported by the query that touches it.
 */
class WindowRegistry
{
public:
    explicit WindowRegistry(INativeApi &api);

    Result<std::vector<WindowHandle>> enumerateWindows();

    Result<QString> windowTitle(WindowHandle handle);
    Result<WindowRect> windowRect(WindowHandle handle);

    // Geometry shortcuts over windowRect(); sizes never go negative.
    Result<int> windowX(WindowHandle handle);
    Result<int> windowY(WindowHandle handle);
    Result<quint32> windowWidth(WindowHandle handle);
    Result<quint32> windowHeight(WindowHandle handle);

    Result<bool> isWindowFocused(WindowHandle handle);
    Result<Raster> captureWindow(WindowHandle handle);

private:
    INativeApi &m_api;
};

} // namespace DeskProbe

#endif // DESKPROBE_WINDOWREGISTRY_H
