#include "matching/ImageMatcher.h"
#include "matching/ColorDistance.h"
#include "raster/Raster.h"
#include "utils/MatConverter.h"

#include <QHash>

#include <opencv2/core.hpp>

#include <algorithm>
#include <tuple>

namespace DeskProbe {
namespace ImageMatcher {

namespace {

struct Region {
    quint32 minX = 0;
    quint32 minY = 0;
    quint32 maxX = 0;
    quint32 maxY = 0;
};

// Feature pixel relative to the feature's bounding-box origin.
struct Offset {
    quint32 dx = 0;
    quint32 dy = 0;
    quint32 rgba = 0;
};

std::vector<Offset> relativeOffsets(const Feature& feature, const FeatureBounds& bounds)
{
    std::vector<Offset> offsets;
    offsets.reserve(feature.pixels.size());
    for (const Pixel& pixel : feature.pixels) {
        offsets.push_back({pixel.x - bounds.minX, pixel.y - bounds.minY, pixel.rgba});
    }
    return offsets;
}

Result<Region> normalizeRegion(const Raster& raster, quint32 startX, quint32 startY,
                               quint32 endX, quint32 endY)
{
    Region region;
    region.minX = std::min(startX, endX);
    region.maxX = std::max(startX, endX);
    region.minY = std::min(startY, endY);
    region.maxY = std::max(startY, endY);

    if (!raster.contains(region.minX, region.minY)) {
        return Result<Region>::failure(
            Error::outOfBounds(QStringLiteral("Start point is outside image boundaries.")));
    }
    if (!raster.contains(region.maxX, region.maxY)) {
        return Result<Region>::failure(
            Error::outOfBounds(QStringLiteral("End point is outside image boundaries.")));
    }
    return Result<Region>::success(region);
}

} // namespace

Result<quint32> pixelRgba(const Raster& raster, quint32 x, quint32 y)
{
    if (!raster.contains(x, y)) {
        return Result<quint32>::failure(Error::outOfBounds(
            QStringLiteral("Pixel (%1, %2) is outside a %3x%4 image")
                .arg(x).arg(y).arg(raster.width()).arg(raster.height())));
    }
    return Result<quint32>::success(raster.pixel(x, y));
}

std::vector<Pixel> findColor(const Raster& raster, quint32 rgba)
{
    std::vector<Pixel> positions;

    const cv::Mat view = MatConverter::toMatView(raster);
    if (view.empty()) {
        return positions;
    }

    const cv::Scalar target = MatConverter::toScalar(rgba);
    cv::Mat mask;
    cv::inRange(view, target, target, mask);
    if (cv::countNonZero(mask) == 0) {
        return positions;
    }

    // findNonZero scans row by row, which gives row-major order.
    std::vector<cv::Point> points;
    cv::findNonZero(mask, points);

    positions.reserve(points.size());
    for (const cv::Point& point : points) {
        positions.push_back({quint32(point.x), quint32(point.y), rgba});
    }
    return positions;
}

std::vector<Feature> extractFeatures(const Raster& raster, quint32 rgba, int clusterRadius)
{
    std::vector<Pixel> pixels = findColor(raster, rgba);
    std::sort(pixels.begin(), pixels.end(), [](const Pixel& a, const Pixel& b) {
        return std::tie(a.x, a.y) < std::tie(b.x, b.y);
    });

    const qint64 radius = std::max(0, clusterRadius);
    const qint64 maxDistSq = radius * radius;

    std::vector<Feature> groups;
    for (const Pixel& pixel : pixels) {
        auto isNear = [&pixel, maxDistSq](const Pixel& member) {
            const qint64 dx = qint64(member.x) - qint64(pixel.x);
            const qint64 dy = qint64(member.y) - qint64(pixel.y);
            return dx * dx + dy * dy <= maxDistSq;
        };

        auto group = std::find_if(groups.begin(), groups.end(), [&isNear](const Feature& candidate) {
            return std::any_of(candidate.pixels.begin(), candidate.pixels.end(), isNear);
        });

        if (group != groups.end()) {
            group->pixels.push_back(pixel);
        } else {
            groups.push_back(Feature{{pixel}});
        }
    }
    return groups;
}

std::vector<Pixel> findFeature(const Raster& raster, const Feature& feature,
                               double colorTolerancePercent, double maxMismatchPercent)
{
    std::vector<Pixel> found;

    const std::optional<FeatureBounds> bounds = FeatureBounds::of(feature);
    if (!bounds) {
        return found;
    }

    if (bounds->width() > raster.width() || bounds->height() > raster.height()) {
        return found;
    }
    const quint32 featureWidth = quint32(bounds->width());
    const quint32 featureHeight = quint32(bounds->height());

    const double threshold = ColorDistance::toleranceThreshold(colorTolerancePercent);
    const quint32 maxMismatches = ColorDistance::mismatchBudget(feature.pixels.size(), maxMismatchPercent);
    const std::vector<Offset> offsets = relativeOffsets(feature, *bounds);

    for (quint32 startY = 0; startY <= raster.height() - featureHeight; ++startY) {
        for (quint32 startX = 0; startX <= raster.width() - featureWidth; ++startX) {
            quint32 mismatches = 0;

            for (const Offset& offset : offsets) {
                const quint32 x = startX + offset.dx;
                const quint32 y = startY + offset.dy;

                const bool matched = raster.contains(x, y)
                    && ColorDistance::withinTolerance(offset.rgba, raster.pixel(x, y), threshold);
                if (!matched && ++mismatches > maxMismatches) {
                    break;
                }
            }

            if (mismatches <= maxMismatches) {
                found.push_back({startX, startY, raster.pixel(startX, startY)});
            }
        }
    }
    return found;
}

Result<double> checkFeature(const Raster& raster, quint32 x, quint32 y,
                            const Feature& feature, double colorTolerancePercent)
{
    const std::optional<FeatureBounds> bounds = FeatureBounds::of(feature);
    if (!bounds) {
        return Result<double>::failure(
            Error::malformedInput(QStringLiteral("This feature has no pixels")));
    }

    if (quint64(x) + bounds->width() > raster.width()
        || quint64(y) + bounds->height() > raster.height()) {
        return Result<double>::failure(Error::outOfBounds(
            QStringLiteral("Feature, when placed at the given top_left point, "
                           "extends beyond image boundaries.")));
    }

    const double threshold = ColorDistance::toleranceThreshold(colorTolerancePercent);

    std::size_t matching = 0;
    for (const Offset& offset : relativeOffsets(feature, *bounds)) {
        if (ColorDistance::withinTolerance(offset.rgba, raster.pixel(x + offset.dx, y + offset.dy),
                                           threshold)) {
            ++matching;
        }
    }

    return Result<double>::success(double(matching) / double(feature.pixels.size()));
}

Result<Feature> getFeature(const Raster& raster, quint32 startX, quint32 startY,
                           quint32 endX, quint32 endY)
{
    const Result<Region> region = normalizeRegion(raster, startX, startY, endX, endY);
    if (!region.isSuccess()) {
        return Result<Feature>::failure(region.error());
    }
    const Region& r = region.value();

    Feature feature;
    feature.pixels.reserve(std::size_t(r.maxX - r.minX + 1) * (r.maxY - r.minY + 1));
    for (quint32 y = r.minY; y <= r.maxY; ++y) {
        for (quint32 x = r.minX; x <= r.maxX; ++x) {
            feature.pixels.push_back({x - r.minX, y - r.minY, raster.pixel(x, y)});
        }
    }
    return Result<Feature>::success(std::move(feature));
}

Result<std::vector<ColourFrequency>> colourFrequencies(const Raster& raster,
                                                       quint32 startX, quint32 startY,
                                                       quint32 endX, quint32 endY)
{
    using Frequencies = std::vector<ColourFrequency>;

    const Result<Region> region = normalizeRegion(raster, startX, startY, endX, endY);
    if (!region.isSuccess()) {
        return Result<Frequencies>::failure(region.error());
    }
    const Region& r = region.value();

    Frequencies frequencies;
    QHash<quint32, std::size_t> indexByColour;
    for (quint32 y = r.minY; y <= r.maxY; ++y) {
        for (quint32 x = r.minX; x <= r.maxX; ++x) {
            const quint32 rgba = raster.pixel(x, y);
            auto it = indexByColour.constFind(rgba);
            if (it == indexByColour.constEnd()) {
                indexByColour.insert(rgba, frequencies.size());
                frequencies.push_back({rgba, 1});
            } else {
                ++frequencies[it.value()].count;
            }
        }
    }
    return Result<Frequencies>::success(std::move(frequencies));
}

} // namespace ImageMatcher
} // namespace DeskProbe
