#ifndef DESKPROBE_ERROR_H
#define DESKPROBE_ERROR_H

#include <QString>
#include <QtGlobal>

namespace DeskProbe {

/**
 * @brief Category of a recoverable failure.
 *
 * Every category is returned to the caller as a value; none of them
 * terminates the process.
 */
enum class ErrorCode {
    PlatformUnsupported,   ///< No native backend exists for this platform
    NativeCallFailed,      ///< An OS call reported failure (see nativeCode)
    StaleHandle,           ///< The window no longer exists
    WindowMinimized,       ///< The window is minimized / unmapped
    OutOfBounds,           ///< Coordinates or a placement fall outside a raster
    MalformedInput,        ///< Empty feature or otherwise unusable argument
    ResourceExhausted,     ///< Too many live rasters, or a buffer failed to allocate
    ChannelClosed,         ///< The native API worker has stopped accepting requests
    Timeout                ///< The caller stopped waiting for a reply
};

/**
 * @brief Native step that produced an error, for diagnosis.
 */
enum class NativeStep {
    None,
    Connect,
    InternAtom,
    EnumerateWindows,
    GetWindowAttributes,
    GetWindowTitle,
    GetWindowRect,
    TranslateCoordinates,
    GetInputFocus,
    CheckMinimized,
    CheckHandle,
    GetWindowDc,
    CreateCompatibleDc,
    CreateCompatibleBitmap,
    CopyBits,
    ReadBits,
    GetImage,
    UnsupportedPixelFormat
};

struct Error
{
    ErrorCode code = ErrorCode::NativeCallFailed;
    NativeStep step = NativeStep::None;
    qint64 nativeCode = 0;  // Raw OS error (GetLastError / X11 error code), 0 if none
    QString message;

    // Both stale-handle flavours (destroyed or minimized) share one category.
    bool isStaleHandle() const
    {
        return code == ErrorCode::StaleHandle || code == ErrorCode::WindowMinimized;
    }

    QString toString() const;

    static Error platformUnsupported();
    static Error nativeCall(NativeStep step, qint64 nativeCode, const QString &message);
    static Error staleHandle(NativeStep step, const QString &message, qint64 nativeCode = 0);
    static Error windowMinimized(NativeStep step = NativeStep::CheckMinimized);
    static Error outOfBounds(const QString &message);
    static Error malformedInput(const QString &message);
    static Error resourceExhausted(const QString &message);
    static Error channelClosed(const QString &message);
    static Error timeout(int waitedMs);
};

QString errorCodeName(ErrorCode code);
QString nativeStepName(NativeStep step);

} // namespace DeskProbe

#endif // DESKPROBE_ERROR_H
