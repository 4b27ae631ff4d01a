#ifndef DESKPROBE_IMAGEMATCHER_H
#define DESKPROBE_IMAGEMATCHER_H

#include "core/Result.h"
#include "matching/MatchTypes.h"

#include <vector>

namespace DeskProbe {

class Raster;

/**
 * @brief Pixel and pattern analysis over a Raster.
 *
 * Pure functions: no I/O, no shared state. Safe to call concurrently on the
 * same or different rasters.
 *
 * Colour matching uses the Euclidean RGBA distance (ColorDistance). A
 * tolerance fraction p in [0, 1] becomes the threshold p * 510; two colours
 * match when their distance is <= threshold.
 */
namespace ImageMatcher {

inline constexpr int kDefaultClusterRadius = 5;

// Colour at (x, y), or OutOfBounds.
Result<quint32> pixelRgba(const Raster& raster, quint32 x, quint32 y);

// Every pixel whose colour equals rgba exactly, in row-major order.
std::vector<Pixel> findColor(const Raster& raster, quint32 rgba);

/**
 * @brief Groups the exact matches of rgba into features.
 *
 * Matches are sorted by (x, y) and grouped in one pass: each pixel joins
 * the first existing group holding any member within clusterRadius (squared
 * distance compare), otherwise it starts a new group.
 *
 * This is an order-dependent approximation of connected components, not
 * union-find: two pixels of one blob can land in different groups when the
 * blob is reached from two sides before the bridge between them.
 *
 * Feature pixels keep absolute raster coordinates.
 */
std::vector<Feature> extractFeatures(const Raster& raster, quint32 rgba,
                                     int clusterRadius = kDefaultClusterRadius);

/**
 * @brief Sliding-window fuzzy search for a feature.
 *
 * The feature's bounding box is placed at every top-left position that keeps
 * it inside the raster. A placement is reported when at most
 * round(pixelCount * maxMismatchPercent) feature pixels differ by more than
 * the colour tolerance. Each hit carries the raster colour at its top-left.
 *
 * Empty feature, or one larger than the raster: empty result, no error.
 */
std::vector<Pixel> findFeature(const Raster& raster, const Feature& feature,
                               double colorTolerancePercent, double maxMismatchPercent);

/**
 * @brief Fraction (0.0 - 1.0) of feature pixels matching when the feature's
 * bounding box is anchored at (x, y).
 *
 * MalformedInput for an empty feature; OutOfBounds if the placement does
 * not fit inside the raster.
 */
Result<double> checkFeature(const Raster& raster, quint32 x, quint32 y,
                            const Feature& feature, double colorTolerancePercent);

/**
 * @brief Extracts the rectangle spanned by two corners (either order,
 * inclusive) as a feature with coordinates relative to its top-left.
 *
 * OutOfBounds if either corner lies outside the raster.
 */
Result<Feature> getFeature(const Raster& raster, quint32 startX, quint32 startY,
                           quint32 endX, quint32 endY);

/**
 * @brief Exact-colour histogram of the rectangle spanned by two corners.
 *
 * Entries appear in the order their colour is first met scanning the
 * rectangle row by row. OutOfBounds if the rectangle leaves the raster.
 */
Result<std::vector<ColourFrequency>> colourFrequencies(const Raster& raster,
                                                       quint32 startX, quint32 startY,
                                                       quint32 endX, quint32 endY);

} // namespace ImageMatcher
} // namespace DeskProbe

#endif // DESKPROBE_IMAGEMATCHER_H
