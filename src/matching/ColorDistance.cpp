#include "matching/ColorDistance.h"
#include "raster/PixelConversion.h"

#include <cmath>

namespace DeskProbe {
namespace ColorDistance {

namespace {
double clampPercent(double percent)
{
    if (!(percent > 0.0)) {  // also catches NaN
        return 0.0;
    }
    return percent > 1.0 ? 1.0 : percent;
}
} // namespace

double distance(quint32 lhs, quint32 rhs, bool useAlpha)
{
    using namespace PixelConversion;
    const double dr = double(red(lhs)) - double(red(rhs));
    const double dg = double(green(lhs)) - double(green(rhs));
    const double db = double(blue(lhs)) - double(blue(rhs));
    double sum = dr * dr + dg * dg + db * db;
    if (useAlpha) {
        const double da = double(alpha(lhs)) - double(alpha(rhs));
        sum += da * da;
    }
    return std::sqrt(sum);
}

double toleranceThreshold(double tolerancePercent)
{
    return kMaxWithAlpha * clampPercent(tolerancePercent);
}

quint32 mismatchBudget(std::size_t pixelCount, double maxMismatchPercent)
{
    // std::round rounds halfway cases away from zero.
    return quint32(std::round(double(pixelCount) * clampPercent(maxMismatchPercent)));
}

} // namespace ColorDistance
} // namespace DeskProbe
