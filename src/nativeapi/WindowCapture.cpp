#include "nativeapi/WindowCapture.h"
#include "raster/PixelConversion.h"

namespace DeskProbe {
namespace WindowCapture {

Result<Raster> run(IWindowCaptureSteps &steps, const std::shared_ptr<RasterBudget> &budget)
{
    Result<WindowRect> rect = steps.queryRect();
    if (!rect.isSuccess()) {
        return Result<Raster>::failure(rect.error());
    }

    Result<Acknowledgement> capturable = steps.checkCapturable();
    if (!capturable.isSuccess()) {
        return Result<Raster>::failure(capturable.error());
    }

    const int width = rect.value().width();
    const int height = rect.value().height();
    if (width <= 0 || height <= 0) {
        return Result<Raster>::failure(Error::nativeCall(
            NativeStep::GetWindowRect, 0,
            QStringLiteral("Window has an empty rectangle (%1 x %2)").arg(width).arg(height)));
    }

    Result<NativePixels> copied = steps.copyPixels(rect.value());
    if (!copied.isSuccess()) {
        return Result<Raster>::failure(copied.error());
    }

    capturable = steps.checkCapturable();
    if (!capturable.isSuccess()) {
        return Result<Raster>::failure(capturable.error());
    }

    NativePixels pixels = copied.takeValue();
    PixelConversion::swapRedBlue(pixels.bgra.data(), pixels.bgra.size());
    if (!pixels.hasAlpha) {
        PixelConversion::forceOpaque(pixels.bgra.data(), pixels.bgra.size());
    }

    return Raster::fromRgba(pixels.width, pixels.height, pixels.bgra.data(), pixels.bgra.size(),
                            budget);
}

Result<bool> checkZPixmapLayout(bool lsbFirst, int depth, std::size_t byteCount,
                                quint32 width, quint32 height)
{
    if (!lsbFirst) {
        return Result<bool>::failure(Error::nativeCall(
            NativeStep::UnsupportedPixelFormat, depth,
            QStringLiteral("Unsupported image layout: server byte order is MSB first")));
    }

    const std::size_t expected = std::size_t(width) * std::size_t(height) * 4;
    if ((depth != 24 && depth != 32) || byteCount != expected) {
        return Result<bool>::failure(Error::nativeCall(
            NativeStep::UnsupportedPixelFormat, depth,
            QStringLiteral("Unsupported image layout: depth %1, %2 bytes for %3 x %4")
                .arg(depth)
                .arg(qulonglong(byteCount))
                .arg(width)
                .arg(height)));
    }
    return Result<bool>::success(depth == 32);
}

} // namespace WindowCapture
} // namespace DeskProbe
