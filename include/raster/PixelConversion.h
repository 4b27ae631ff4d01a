#ifndef DESKPROBE_PIXELCONVERSION_H
#define DESKPROBE_PIXELCONVERSION_H

#include <QtGlobal>
#include <cstddef>

// Packed colour helpers and native byte-order fixups.
//
// A packed colour is 0xRRGGBBAA: red in the most significant byte, alpha in
// the least. Raster memory stores the same four channels in R, G, B, A byte
// order (QImage::Format_RGBA8888).

namespace DeskProbe {
namespace PixelConversion {

constexpr quint32 packRgba(quint8 r, quint8 g, quint8 b, quint8 a)
{
    return (quint32(r) << 24) | (quint32(g) << 16) | (quint32(b) << 8) | quint32(a);
}

constexpr quint8 red(quint32 rgba) { return quint8((rgba >> 24) & 0xFF); }
constexpr quint8 green(quint32 rgba) { return quint8((rgba >> 16) & 0xFF); }
constexpr quint8 blue(quint32 rgba) { return quint8((rgba >> 8) & 0xFF); }
constexpr quint8 alpha(quint32 rgba) { return quint8(rgba & 0xFF); }

// Reads one pixel from RGBA-ordered memory.
inline quint32 loadRgba(const uchar *p)
{
    return packRgba(p[0], p[1], p[2], p[3]);
}

// Swaps bytes 0 and 2 of every complete 4-byte pixel (BGRA <-> RGBA).
// A trailing partial pixel is left untouched.
void swapRedBlue(uchar *data, std::size_t byteCount);

// Sets the alpha byte of every complete 4-byte pixel to 0xFF. Used for
// native surfaces that carry no alpha channel and leave the byte undefined.
void forceOpaque(uchar *data, std::size_t byteCount);

} // namespace PixelConversion
} // namespace DeskProbe

#endif // DESKPROBE_PIXELCONVERSION_H
