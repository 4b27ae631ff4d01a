#include "matching/MatchTypes.h"

#include <algorithm>

namespace DeskProbe {

std::optional<FeatureBounds> FeatureBounds::of(const Feature &feature)
{
    if (feature.pixels.empty()) {
        return std::nullopt;
    }

    FeatureBounds bounds;
    bounds.minX = bounds.maxX = feature.pixels.front().x;
    bounds.minY = bounds.maxY = feature.pixels.front().y;
    for (const Pixel &pixel : feature.pixels) {
        bounds.minX = std::min(bounds.minX, pixel.x);
        bounds.minY = std::min(bounds.minY, pixel.y);
        bounds.maxX = std::max(bounds.maxX, pixel.x);
        bounds.maxY = std::max(bounds.maxY, pixel.y);
    }
    return bounds;
}

} // namespace DeskProbe
