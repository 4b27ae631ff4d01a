#include "raster/Raster.h"
#include "raster/RasterBudget.h"

#include <QDebug>

#include <cstring>
#include <limits>

namespace DeskProbe {

Raster::Raster(QImage image, std::shared_ptr<const RasterLease> lease)
    : m_image(std::move(image))
    , m_lease(std::move(lease))
{
}

Result<Raster> Raster::fromRgba(quint32 width, quint32 height,
                                const uchar *rgba, std::size_t byteCount,
                                const std::shared_ptr<RasterBudget> &budget)
{
    if (width == 0 || height == 0 || !rgba) {
        return Result<Raster>::failure(
            Error::malformedInput(QStringLiteral("Raster must have a non-empty pixel buffer")));
    }
    if (width > quint32(std::numeric_limits<int>::max() / 4)
        || height > quint32(std::numeric_limits<int>::max())) {
        return Result<Raster>::failure(
            Error::malformedInput(QStringLiteral("Raster dimensions %1x%2 are too large")
                                      .arg(width).arg(height)));
    }

    const std::size_t rowBytes = std::size_t(width) * 4;
    if (byteCount != rowBytes * height) {
        return Result<Raster>::failure(Error::malformedInput(
            QStringLiteral("Expected %1 bytes for a %2x%3 raster, got %4")
                .arg(rowBytes * height).arg(width).arg(height).arg(byteCount)));
    }

    std::shared_ptr<const RasterLease> lease;
    if (budget) {
        auto acquired = budget->acquire();
        if (!acquired.isSuccess()) {
            return Result<Raster>::failure(acquired.error());
        }
        lease = acquired.takeValue();
    }

    QImage image(int(width), int(height), QImage::Format_RGBA8888);
    if (image.isNull()) {
        qWarning() << "Raster: Failed to allocate" << width << "x" << height << "buffer";
        return Result<Raster>::failure(Error::resourceExhausted(
            QStringLiteral("Could not allocate a %1x%2 raster").arg(width).arg(height)));
    }

    for (quint32 y = 0; y < height; ++y) {
        std::memcpy(image.scanLine(int(y)), rgba + std::size_t(y) * rowBytes, rowBytes);
    }

    return Result<Raster>::success(Raster(std::move(image), std::move(lease)));
}

Result<Raster> Raster::fromImage(const QImage &image, const std::shared_ptr<RasterBudget> &budget)
{
    if (image.isNull()) {
        return Result<Raster>::failure(
            Error::malformedInput(QStringLiteral("Cannot build a raster from a null image")));
    }

    const QImage rgba = image.convertToFormat(QImage::Format_RGBA8888);
    // RGBA8888 rows are 4-byte aligned, so the stride is exactly width * 4.
    return fromRgba(quint32(rgba.width()), quint32(rgba.height()), rgba.constBits(),
                    std::size_t(rgba.sizeInBytes()), budget);
}

} // namespace DeskProbe
