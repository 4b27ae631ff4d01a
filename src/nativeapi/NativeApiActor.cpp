#include "nativeapi/NativeApiActor.h"
#include "nativeapi/NativeApiChannel.h"
#include "nativeapi/NativeApiThread.h"

#include <QDebug>

#include <chrono>
#include <future>

namespace DeskProbe {

NativeApiActor::NativeApiActor(const QString &backendName, NativeApiBackendFactory factory,
                               int requestTimeoutMs)
    : m_backendName(backendName)
    , m_factory(std::move(factory))
    , m_requestTimeoutMs(qMax(0, requestTimeoutMs))
    , m_channel(std::make_shared<NativeApiChannel>())
{
}

NativeApiActor::~NativeApiActor()
{
    for (auto &abandoned : m_channel->close()) {
        failRequest(abandoned, Error::channelClosed(QStringLiteral("Native API actor destroyed")));
    }
    // Joins the worker.
    m_thread.reset();
}

void NativeApiActor::ensureStarted()
{
    std::call_once(m_startOnce, [this]() {
        m_thread = std::make_unique<NativeApiThread>(m_backendName, m_factory, m_channel);
        m_thread->start();
        m_workerStarted = true;
        qDebug() << "NativeApiActor: Started worker for" << m_backendName;
    });
}

template <typename Command>
Result<typename Command::Response> NativeApiActor::call(Command command)
{
    using Response = typename Command::Response;

    ensureStarted();

    NativeApiRequest<Command> request{std::move(command), {}};
    std::future<Result<Response>> reply = request.reply.get_future();

    AnyNativeApiRequest envelope(std::move(request));
    if (!m_channel->send(envelope)) {
        return Result<Response>::failure(
            Error::channelClosed(QStringLiteral("Native API thread is not running")));
    }

    try {
        if (m_requestTimeoutMs > 0
            && reply.wait_for(std::chrono::milliseconds(m_requestTimeoutMs)) != std::future_status::ready) {
            qWarning() << "NativeApiActor: No reply within" << m_requestTimeoutMs << "ms";
            return Result<Response>::failure(Error::timeout(m_requestTimeoutMs));
        }
        return reply.get();
    } catch (const std::future_error &e) {
        qWarning() << "NativeApiActor: Reply lost:" << e.what();
        return Result<Response>::failure(
            Error::channelClosed(QStringLiteral("Native API thread dropped the request")));
    }
}

Result<std::vector<WindowHandle>> NativeApiActor::enumerateWindows()
{
    return call(NativeApiCommand::EnumerateWindows{});
}

Result<QString> NativeApiActor::windowTitle(WindowHandle handle)
{
    return call(NativeApiCommand::GetWindowTitle{handle});
}

Result<WindowRect> NativeApiActor::windowRect(WindowHandle handle)
{
    return call(NativeApiCommand::GetWindowRect{handle});
}

Result<bool> NativeApiActor::isWindowFocused(WindowHandle handle)
{
    return call(NativeApiCommand::IsWindowFocused{handle});
}

Result<Raster> NativeApiActor::captureWindowImage(WindowHandle handle)
{
    return call(NativeApiCommand::CaptureWindowImage{handle});
}

Result<Acknowledgement> NativeApiActor::shutdown()
{
    // Shutting down an actor that never ran must not spawn its thread.
    bool neverStarted = false;
    std::call_once(m_startOnce, [&neverStarted]() { neverStarted = true; });
    if (neverStarted) {
        m_channel->close();
        qDebug() << "NativeApiActor: Shut down" << m_backendName << "before first request";
        return Result<Acknowledgement>::success(Acknowledgement{});
    }

    Result<Acknowledgement> acknowledged = call(NativeApiCommand::Shutdown{});
    if (acknowledged.isSuccess() && m_thread) {
        m_thread->wait();
    }
    return acknowledged;
}

} // namespace DeskProbe
