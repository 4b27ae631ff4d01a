#ifndef DESKPROBE_NATIVEAPICOMMANDS_H
#define DESKPROBE_NATIVEAPICOMMANDS_H

#include "core/Result.h"
#include "raster/Raster.h"
#include "window/WindowHandle.h"

#include <QString>

#include <future>
#include <type_traits>
#include <variant>
#include <vector>

namespace DeskProbe {

// One struct per command. Response names the payload type of the reply,
// so a request can only ever be answered with the type its caller expects.
namespace NativeApiCommand {

struct EnumerateWindows {
    using Response = std::vector<WindowHandle>;
};

struct GetWindowTitle {
    using Response = QString;
    WindowHandle handle;
};

struct GetWindowRect {
    using Response = WindowRect;
    WindowHandle handle;
};

struct IsWindowFocused {
    using Response = bool;
    WindowHandle handle;
};

struct CaptureWindowImage {
    using Response = Raster;
    WindowHandle handle;
};

struct Shutdown {
    using Response = Acknowledgement;
};

} // namespace NativeApiCommand

// A command plus its private reply channel.
template <typename Command>
struct NativeApiRequest
{
    using Response = typename Command::Response;

    Command command;
    std::promise<Result<Response>> reply;
};

using AnyNativeApiRequest = std::variant<
    NativeApiRequest<NativeApiCommand::EnumerateWindows>,
    NativeApiRequest<NativeApiCommand::GetWindowTitle>,
    NativeApiRequest<NativeApiCommand::GetWindowRect>,
    NativeApiRequest<NativeApiCommand::IsWindowFocused>,
    NativeApiRequest<NativeApiCommand::CaptureWindowImage>,
    NativeApiRequest<NativeApiCommand::Shutdown>>;

// Answers any pending request with error, whatever its command.
inline void failRequest(AnyNativeApiRequest &request, const Error &error)
{
    std::visit([&error](auto &pending) {
        using Response = typename std::decay_t<decltype(pending)>::Response;
        pending.reply.set_value(Result<Response>::failure(error));
    }, request);
}

} // namespace DeskProbe

#endif // DESKPROBE_NATIVEAPICOMMANDS_H
