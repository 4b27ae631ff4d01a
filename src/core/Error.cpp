#include "core/Error.h"

namespace DeskProbe {

QString Error::toString() const
{
    QString text = errorCodeName(code);
    if (step != NativeStep::None) {
        text += QStringLiteral(" [%1]").arg(nativeStepName(step));
    }
    if (nativeCode != 0) {
        text += QStringLiteral(" (os error %1)").arg(nativeCode);
    }
    if (!message.isEmpty()) {
        text += QStringLiteral(": ") + message;
    }
    return text;
}

Error Error::platformUnsupported()
{
    return {ErrorCode::PlatformUnsupported, NativeStep::None, 0,
            QStringLiteral("Window and capture APIs are not supported on this platform")};
}

Error Error::nativeCall(NativeStep step, qint64 nativeCode, const QString &message)
{
    return {ErrorCode::NativeCallFailed, step, nativeCode, message};
}

Error Error::staleHandle(NativeStep step, const QString &message, qint64 nativeCode)
{
    return {ErrorCode::StaleHandle, step, nativeCode, message};
}

Error Error::windowMinimized(NativeStep step)
{
    return {ErrorCode::WindowMinimized, step, 0, QStringLiteral("Window is minimized")};
}

Error Error::outOfBounds(const QString &message)
{
    return {ErrorCode::OutOfBounds, NativeStep::None, 0, message};
}

Error Error::malformedInput(const QString &message)
{
    return {ErrorCode::MalformedInput, NativeStep::None, 0, message};
}

Error Error::resourceExhausted(const QString &message)
{
    return {ErrorCode::ResourceExhausted, NativeStep::None, 0, message};
}

Error Error::channelClosed(const QString &message)
{
    return {ErrorCode::ChannelClosed, NativeStep::None, 0, message};
}

Error Error::timeout(int waitedMs)
{
    return {ErrorCode::Timeout, NativeStep::None, 0,
            QStringLiteral("No reply from the native API thread within %1 ms").arg(waitedMs)};
}

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::PlatformUnsupported:
        return QStringLiteral("PlatformUnsupported");
    case ErrorCode::NativeCallFailed:
        return QStringLiteral("NativeCallFailed");
    case ErrorCode::StaleHandle:
        return QStringLiteral("StaleHandle");
    case ErrorCode::WindowMinimized:
        return QStringLiteral("WindowMinimized");
    case ErrorCode::OutOfBounds:
        return QStringLiteral("OutOfBounds");
    case ErrorCode::MalformedInput:
        return QStringLiteral("MalformedInput");
    case ErrorCode::ResourceExhausted:
        return QStringLiteral("ResourceExhausted");
    case ErrorCode::ChannelClosed:
        return QStringLiteral("ChannelClosed");
    case ErrorCode::Timeout:
        return QStringLiteral("Timeout");
    }
    return QStringLiteral("Unknown");
}

QString nativeStepName(NativeStep step)
{
    switch (step) {
    case NativeStep::None:
        return QStringLiteral("None");
    case NativeStep::Connect:
        return QStringLiteral("Connect");
    case NativeStep::InternAtom:
        return QStringLiteral("InternAtom");
    case NativeStep::EnumerateWindows:
        return QStringLiteral("EnumerateWindows");
    case NativeStep::GetWindowAttributes:
        return QStringLiteral("GetWindowAttributes");
    case NativeStep::GetWindowTitle:
        return QStringLiteral("GetWindowTitle");
    case NativeStep::GetWindowRect:
        return QStringLiteral("GetWindowRect");
    case NativeStep::TranslateCoordinates:
        return QStringLiteral("TranslateCoordinates");
    case NativeStep::GetInputFocus:
        return QStringLiteral("GetInputFocus");
    case NativeStep::CheckMinimized:
        return QStringLiteral("CheckMinimized");
    case NativeStep::CheckHandle:
        return QStringLiteral("CheckHandle");
    case NativeStep::GetWindowDc:
        return QStringLiteral("GetWindowDc");
    case NativeStep::CreateCompatibleDc:
        return QStringLiteral("CreateCompatibleDc");
    case NativeStep::CreateCompatibleBitmap:
        return QStringLiteral("CreateCompatibleBitmap");
    case NativeStep::CopyBits:
        return QStringLiteral("CopyBits");
    case NativeStep::ReadBits:
        return QStringLiteral("ReadBits");
    case NativeStep::GetImage:
        return QStringLiteral("GetImage");
    case NativeStep::UnsupportedPixelFormat:
        return QStringLiteral("UnsupportedPixelFormat");
    }
    return QStringLiteral("Unknown");
}

} // namespace DeskProbe
