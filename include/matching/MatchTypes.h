#ifndef DESKPROBE_MATCHTYPES_H
#define DESKPROBE_MATCHTYPES_H

#include <QtGlobal>

#include <optional>
#include <vector>

namespace DeskProbe {

// A sampled point. Coordinates are absolute unless stated otherwise.
struct Pixel
{
    quint32 x = 0;
    quint32 y = 0;
    quint32 rgba = 0;  // 0xRRGGBBAA

    bool operator==(const Pixel &other) const
    {
        return x == other.x && y == other.y && rgba == other.rgba;
    }
    bool operator!=(const Pixel &other) const { return !(*this == other); }
};

// Sparse pixel pattern. Extraction produces coordinates relative to the
// pattern's top-left bounding corner; callers may supply any coordinates.
struct Feature
{
    std::vector<Pixel> pixels;

    bool operator==(const Feature &other) const { return pixels == other.pixels; }
};

struct ColourFrequency
{
    quint32 rgba = 0;
    quint32 count = 0;

    bool operator==(const ColourFrequency &other) const
    {
        return rgba == other.rgba && count == other.count;
    }
};

// Inclusive bounding box of a feature's pixel coordinates.
struct FeatureBounds
{
    quint32 minX = 0;
    quint32 minY = 0;
    quint32 maxX = 0;
    quint32 maxY = 0;

    // 64-bit: a box spanning the whole quint32 range is 2^32 wide.
    quint64 width() const { return quint64(maxX) - minX + 1; }
    quint64 height() const { return quint64(maxY) - minY + 1; }

    // std::nullopt for an empty feature.
    static std::optional<FeatureBounds> of(const Feature &feature);
};

} // namespace DeskProbe

#endif // DESKPROBE_MATCHTYPES_H
