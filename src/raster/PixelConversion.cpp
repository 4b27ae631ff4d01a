#include "raster/PixelConversion.h"

#include <utility>

namespace DeskProbe {
namespace PixelConversion {

void swapRedBlue(uchar *data, std::size_t byteCount)
{
    if (!data) {
        return;
    }
    const std::size_t whole = byteCount - (byteCount % 4);
    for (std::size_t i = 0; i < whole; i += 4) {
        std::swap(data[i], data[i + 2]);
    }
}

void forceOpaque(uchar *data, std::size_t byteCount)
{
    if (!data) {
        return;
    }
    const std::size_t whole = byteCount - (byteCount % 4);
    for (std::size_t i = 3; i < whole; i += 4) {
        data[i] = 0xFF;
    }
}

} // namespace PixelConversion
} // namespace DeskProbe
