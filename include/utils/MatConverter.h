#ifndef DESKPROBE_MATCONVERTER_H
#define DESKPROBE_MATCONVERTER_H

#include <QtGlobal>

#include <opencv2/core.hpp>

namespace DeskProbe {
class Raster;
}

// Raster -> cv::Mat bridging.
//
// Channel order: Raster memory is R-G-B-A per pixel, so the resulting
// CV_8UC4 Mat holds channels (R, G, B, A), not OpenCV's default BGRA.
// Scalars passed to OpenCV must be built in the same order.

namespace MatConverter {

// Wraps the raster buffer as a CV_8UC4 Mat (no pixel copy). The Mat must be
// treated as read-only and must not outlive the raster. Null raster -> empty Mat.
cv::Mat toMatView(const DeskProbe::Raster& raster);

// cv::Scalar in the channel order used by toMatView().
cv::Scalar toScalar(quint32 rgba);

} // namespace MatConverter

#endif // DESKPROBE_MATCONVERTER_H
