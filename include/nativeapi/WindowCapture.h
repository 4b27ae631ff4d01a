#ifndef DESKPROBE_WINDOWCAPTURE_H
#define DESKPROBE_WINDOWCAPTURE_H

#include "core/Result.h"
#include "raster/Raster.h"
#include "window/WindowHandle.h"

#include <memory>
#include <vector>

namespace DeskProbe {

class RasterBudget;

// Pixels as a native copy produced them: B, G, R, A/X byte order, rows
// tightly packed.
struct NativePixels
{
    quint32 width = 0;
    quint32 height = 0;
    std::vector<uchar> bgra;
    bool hasAlpha = false;  // false: the fourth byte is undefined
};

/**
 * @brief Native steps of capturing one window.
 *
 * A backend implements the steps for one window handle; WindowCapture::run()
 * sequences them so every backend validates, copies and converts the same way.
 */
class IWindowCaptureSteps
{
public:
    virtual ~IWindowCaptureSteps() = default;

    virtual Result<WindowRect> queryRect() = 0;

    // Fails with WindowMinimized or StaleHandle when the window cannot be read.
    virtual Result<Acknowledgement> checkCapturable() = 0;

    virtual Result<NativePixels> copyPixels(const WindowRect &rect) = 0;
};

namespace WindowCapture {

/**
 * @brief rect -> capturable check -> pixel copy -> second check -> RGBA raster.
 *
 * The second check catches a window minimized or destroyed during the copy;
 * the copied pixels are then discarded and no raster is built.
 */
Result<Raster> run(IWindowCaptureSteps &steps, const std::shared_ptr<RasterBudget> &budget);

/**
 * @brief Validates an X11 ZPixmap GetImage reply before it is read as BGRA.
 *
 * Accepts depth 24 or 32 with exactly 4 bytes per pixel from an LSB-first
 * server. Returns whether the fourth byte carries alpha (depth 32), or
 * UnsupportedPixelFormat.
 */
Result<bool> checkZPixmapLayout(bool lsbFirst, int depth, std::size_t byteCount,
                                quint32 width, quint32 height);

} // namespace WindowCapture
} // namespace DeskProbe

#endif // DESKPROBE_WINDOWCAPTURE_H
