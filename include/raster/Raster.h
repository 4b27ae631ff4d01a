#ifndef DESKPROBE_RASTER_H
#define DESKPROBE_RASTER_H

#include "core/Result.h"
#include "raster/PixelConversion.h"

#include <QImage>

#include <cstddef>
#include <memory>

namespace DeskProbe {

class RasterBudget;
class RasterLease;

/**
 * @brief Immutable width x height grid of RGBA pixels.
 *
 * Row-major, origin top-left. Pixel data lives in a Format_RGBA8888 QImage;
 * copies share the buffer (Qt implicit sharing) and are never written to,
 * so one Raster may be analysed from several threads at once.
 *
 * Each distinct buffer holds one lease from a RasterBudget. Copies share the
 * lease; the slot is released when the last copy is destroyed.
 */
class Raster
{
public:
    // Null raster, 0 x 0.
    Raster() = default;

    /**
     * @brief Copy RGBA-ordered bytes into a new raster.
     * @param rgba     width * height * 4 bytes, rows tightly packed
     * @param budget   live-raster cap to charge; nullptr means uncapped
     */
    static Result<Raster> fromRgba(quint32 width, quint32 height,
                                   const uchar *rgba, std::size_t byteCount,
                                   const std::shared_ptr<RasterBudget> &budget);

    // Converts any QImage format to RGBA8888.
    static Result<Raster> fromImage(const QImage &image,
                                    const std::shared_ptr<RasterBudget> &budget);

    bool isNull() const { return m_image.isNull(); }
    quint32 width() const { return quint32(m_image.width()); }
    quint32 height() const { return quint32(m_image.height()); }

    bool contains(quint32 x, quint32 y) const { return x < width() && y < height(); }

    // Packed 0xRRGGBBAA; coordinates must satisfy contains().
    quint32 pixel(quint32 x, quint32 y) const
    {
        return PixelConversion::loadRgba(m_image.constScanLine(int(y)) + std::size_t(x) * 4);
    }

    // Read-only view of the pixel store.
    const QImage &image() const { return m_image; }

private:
    Raster(QImage image, std::shared_ptr<const RasterLease> lease);

    QImage m_image;
    std::shared_ptr<const RasterLease> m_lease;
};

} // namespace DeskProbe

#endif // DESKPROBE_RASTER_H
