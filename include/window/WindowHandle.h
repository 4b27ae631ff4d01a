#ifndef DESKPROBE_WINDOWHANDLE_H
#define DESKPROBE_WINDOWHANDLE_H

#include <QHash>
#include <QRect>
#include <QtGlobal>

namespace DeskProbe {

/**
 * @brief Opaque identifier of an OS window (HWND value or X11 window id).
 *
 * Carries no liveness guarantee: the window may close or move between
 * calls, which surfaces as an error from the call that needs it.
 */
class WindowHandle
{
public:
    constexpr WindowHandle() = default;
    constexpr explicit WindowHandle(quint64 value) : m_value(value) {}

    constexpr quint64 value() const { return m_value; }
    constexpr bool isNull() const { return m_value == 0; }

    constexpr bool operator==(const WindowHandle &other) const { return m_value == other.m_value; }
    constexpr bool operator!=(const WindowHandle &other) const { return m_value != other.m_value; }

private:
    quint64 m_value = 0;
};

inline size_t qHash(const WindowHandle &handle, size_t seed = 0)
{
    return ::qHash(handle.value(), seed);
}

// Window bounds in screen coordinates; right and bottom are exclusive.
struct WindowRect
{
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    QRect toQRect() const { return QRect(left, top, width(), height()); }

    bool operator==(const WindowRect &other) const
    {
        return left == other.left && top == other.top
            && right == other.right && bottom == other.bottom;
    }
};

} // namespace DeskProbe

#endif // DESKPROBE_WINDOWHANDLE_H
