#include "utils/MatConverter.h"
#include "raster/PixelConversion.h"
#include "raster/Raster.h"

namespace MatConverter {

cv::Mat toMatView(const DeskProbe::Raster& raster)
{
    if (raster.isNull()) {
        return {};
    }
    const QImage& image = raster.image();
    return cv::Mat(image.height(), image.width(), CV_8UC4,
                   const_cast<uchar*>(image.constBits()),
                   static_cast<size_t>(image.bytesPerLine()));
}

cv::Scalar toScalar(quint32 rgba)
{
    using namespace DeskProbe::PixelConversion;
    return cv::Scalar(red(rgba), green(rgba), blue(rgba), alpha(rgba));
}

} // namespace MatConverter
