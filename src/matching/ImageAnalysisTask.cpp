#include "matching/ImageAnalysisTask.h"
#include "settings/AutomationSettingsManager.h"

#include <QtConcurrent>

namespace DeskProbe {
namespace ImageAnalysisTask {

QFuture<std::vector<Pixel>> findColor(const Raster& raster, quint32 rgba)
{
    return QtConcurrent::run([raster, rgba]() {
        return ImageMatcher::findColor(raster, rgba);
    });
}

QFuture<std::vector<Feature>> extractFeatures(const Raster& raster, quint32 rgba, int clusterRadius)
{
    return QtConcurrent::run([raster, rgba, clusterRadius]() {
        return ImageMatcher::extractFeatures(raster, rgba, clusterRadius);
    });
}

QFuture<std::vector<Feature>> extractFeatures(const Raster& raster, quint32 rgba)
{
    return extractFeatures(raster, rgba, AutomationSettingsManager::instance().loadClusterRadius());
}

QFuture<std::vector<Pixel>> findFeature(const Raster& raster, const Feature& feature,
                                        double colorTolerancePercent, double maxMismatchPercent)
{
    return QtConcurrent::run([raster, feature, colorTolerancePercent, maxMismatchPercent]() {
        return ImageMatcher::findFeature(raster, feature, colorTolerancePercent, maxMismatchPercent);
    });
}

QFuture<Result<double>> checkFeature(const Raster& raster, quint32 x, quint32 y,
                                     const Feature& feature, double colorTolerancePercent)
{
    return QtConcurrent::run([raster, x, y, feature, colorTolerancePercent]() {
        return ImageMatcher::checkFeature(raster, x, y, feature, colorTolerancePercent);
    });
}

QFuture<Result<Feature>> getFeature(const Raster& raster, quint32 startX, quint32 startY,
                                    quint32 endX, quint32 endY)
{
    return QtConcurrent::run([raster, startX, startY, endX, endY]() {
        return ImageMatcher::getFeature(raster, startX, startY, endX, endY);
    });
}

QFuture<Result<std::vector<ColourFrequency>>> colourFrequencies(const Raster& raster,
                                                                quint32 startX, quint32 startY,
                                                                quint32 endX, quint32 endY)
{
    return QtConcurrent::run([raster, startX, startY, endX, endY]() {
        return ImageMatcher::colourFrequencies(raster, startX, startY, endX, endY);
    });
}

} // namespace ImageAnalysisTask
} // namespace DeskProbe
