#ifndef DESKPROBE_IMAGEANALYSISTASK_H
#define DESKPROBE_IMAGEANALYSISTASK_H

#include "core/Result.h"
#include "matching/MatchTypes.h"
#include "matching/ImageMatcher.h"
#include "raster/Raster.h"

#include <QFuture>
#include <QFutureWatcher>
#include <QObject>

#include <vector>

/**
 * @brief Background variants of the ImageMatcher operations.
 *
 * Each call copies the Raster handle (sharing its immutable buffer) into a
 * task on QThreadPool::globalInstance() and returns immediately. A started
 * task always runs to completion; cancelling the QFuture does not interrupt it.
 */
namespace DeskProbe {
namespace ImageAnalysisTask {

QFuture<std::vector<Pixel>> findColor(const Raster& raster, quint32 rgba);

QFuture<std::vector<Feature>> extractFeatures(const Raster& raster, quint32 rgba, int clusterRadius);

// Clusters with AutomationSettingsManager::loadClusterRadius(), read on the
// calling thread.
QFuture<std::vector<Feature>> extractFeatures(const Raster& raster, quint32 rgba);

QFuture<std::vector<Pixel>> findFeature(const Raster& raster, const Feature& feature,
                                        double colorTolerancePercent, double maxMismatchPercent);

QFuture<Result<double>> checkFeature(const Raster& raster, quint32 x, quint32 y,
                                     const Feature& feature, double colorTolerancePercent);

QFuture<Result<Feature>> getFeature(const Raster& raster, quint32 startX, quint32 startY,
                                    quint32 endX, quint32 endY);

QFuture<Result<std::vector<ColourFrequency>>> colourFrequencies(const Raster& raster,
                                                                quint32 startX, quint32 startY,
                                                                quint32 endX, quint32 endY);

/**
 * @brief Invoke callback with the task result on context's thread.
 *
 * The watcher is parented to context, so nothing is delivered once context
 * has been destroyed.
 */
template <typename T, typename Callback>
void whenFinished(const QFuture<T>& future, QObject* context, Callback callback)
{
    auto* watcher = new QFutureWatcher<T>(context);
    QObject::connect(watcher, &QFutureWatcher<T>::finished, context, [watcher, callback]() {
        callback(watcher->result());
        watcher->deleteLater();
    });
    watcher->setFuture(future);
}

} // namespace ImageAnalysisTask
} // namespace DeskProbe

#endif // DESKPROBE_IMAGEANALYSISTASK_H
