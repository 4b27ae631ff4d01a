#ifndef DESKPROBE_COLORDISTANCE_H
#define DESKPROBE_COLORDISTANCE_H

#include <QtGlobal>
#include <cstddef>

namespace DeskProbe {
namespace ColorDistance {

// sqrt(255^2 * 4)
inline constexpr double kMaxWithAlpha = 510.0;
// sqrt(255^2 * 3), rounded
inline constexpr double kMaxWithoutAlpha = 441.67;

// Euclidean distance over per-channel differences of two packed colours.
double distance(quint32 lhs, quint32 rhs, bool useAlpha = true);

// Absolute threshold for a tolerance fraction in [0, 1]. Always scaled by
// kMaxWithAlpha, the metric used by both anchored and sliding search.
double toleranceThreshold(double tolerancePercent);

// Largest mismatch count still accepted: round(count * percent), halves
// rounded away from zero. The percentage is clamped to [0, 1].
quint32 mismatchBudget(std::size_t pixelCount, double maxMismatchPercent);

inline bool withinTolerance(quint32 lhs, quint32 rhs, double threshold)
{
    return distance(lhs, rhs, true) <= threshold;
}

} // namespace ColorDistance
} // namespace DeskProbe

#endif // DESKPROBE_COLORDISTANCE_H
