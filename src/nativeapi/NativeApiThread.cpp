#include "nativeapi/NativeApiThread.h"
#include "nativeapi/NativeApiChannel.h"

#include <QDebug>

#include <exception>
#include <optional>
#include <type_traits>

namespace DeskProbe {

namespace {

Result<std::vector<WindowHandle>> dispatch(INativeApiBackend &backend,
                                           const NativeApiCommand::EnumerateWindows &)
{
    return backend.enumerateWindows();
}

Result<QString> dispatch(INativeApiBackend &backend, const NativeApiCommand::GetWindowTitle &command)
{
    return backend.windowTitle(command.handle);
}

Result<WindowRect> dispatch(INativeApiBackend &backend, const NativeApiCommand::GetWindowRect &command)
{
    return backend.windowRect(command.handle);
}

Result<bool> dispatch(INativeApiBackend &backend, const NativeApiCommand::IsWindowFocused &command)
{
    return backend.isWindowFocused(command.handle);
}

Result<Raster> dispatch(INativeApiBackend &backend, const NativeApiCommand::CaptureWindowImage &command)
{
    return backend.captureWindowImage(command.handle);
}

// Backend code may throw (std::bad_alloc, a Qt container growing past its
// limit); that must reach the caller as an error, not kill the worker.
template <typename Command>
Result<typename Command::Response> dispatchGuarded(INativeApiBackend &backend, const Command &command)
{
    using Response = typename Command::Response;
    try {
        return dispatch(backend, command);
    } catch (const std::exception &e) {
        qWarning() << "NativeApiThread: Backend threw:" << e.what();
        return Result<Response>::failure(
            Error::nativeCall(NativeStep::None, 0, QString::fromLocal8Bit(e.what())));
    }
}

// A factory or initialize() that throws is an initialization failure.
Result<Acknowledgement> createBackend(const NativeApiBackendFactory &factory,
                                      std::unique_ptr<INativeApiBackend> &backend)
{
    try {
        backend = factory ? factory() : nullptr;
        if (!backend) {
            return Result<Acknowledgement>::failure(
                Error::nativeCall(NativeStep::Connect, 0, QStringLiteral("No native API backend")));
        }
        return backend->initialize();
    } catch (const std::exception &e) {
        qWarning() << "NativeApiThread: Backend creation threw:" << e.what();
        backend.reset();
        return Result<Acknowledgement>::failure(
            Error::nativeCall(NativeStep::Connect, 0, QString::fromLocal8Bit(e.what())));
    }
}

} // namespace

NativeApiThread::NativeApiThread(const QString &backendName,
                                 NativeApiBackendFactory factory,
                                 std::shared_ptr<NativeApiChannel> channel,
                                 QObject *parent)
    : QThread(parent)
    , m_backendName(backendName)
    , m_factory(std::move(factory))
    , m_channel(std::move(channel))
{
    setObjectName(QStringLiteral("NativeApi-%1").arg(backendName));
}

NativeApiThread::~NativeApiThread()
{
    m_channel->close();
    if (!wait(5000)) {
        qWarning() << "NativeApiThread: Worker still inside a native call, waiting";
        wait();
    }
}

void NativeApiThread::run()
{
    qDebug() << "NativeApiThread: Started" << m_backendName << "on thread" << QThread::currentThreadId();

    std::unique_ptr<INativeApiBackend> backend;
    Result<Acknowledgement> ready = createBackend(m_factory, backend);
    if (!ready.isSuccess()) {
        qWarning() << "NativeApiThread: Backend initialization failed:" << ready.error().toString();
    }

    std::optional<std::promise<Result<Acknowledgement>>> shutdownReply;
    qint64 servedCount = 0;

    while (!shutdownReply) {
        std::optional<AnyNativeApiRequest> request = m_channel->receive();
        if (!request) {
            break;
        }

        std::visit([&](auto &pending) {
            using Command = std::decay_t<decltype(pending.command)>;
            using Response = typename Command::Response;

            if constexpr (std::is_same_v<Command, NativeApiCommand::Shutdown>) {
                shutdownReply.emplace(std::move(pending.reply));
            } else if (!ready.isSuccess()) {
                pending.reply.set_value(Result<Response>::failure(ready.error()));
            } else {
                Result<Response> result = dispatchGuarded(*backend, pending.command);
                pending.reply.set_value(std::move(result));
            }
        }, *request);

        ++servedCount;
    }

    // Anything queued behind Shutdown will never be served.
    for (auto &abandoned : m_channel->close()) {
        failRequest(abandoned, Error::channelClosed(QStringLiteral("Native API thread stopped")));
    }

    backend.reset();

    // Acknowledge only once the backend is gone, so teardown is complete
    // when shutdown() returns.
    if (shutdownReply) {
        shutdownReply->set_value(Result<Acknowledgement>::success(Acknowledgement{}));
    }

    qDebug() << "NativeApiThread: Stopped" << m_backendName << "after" << servedCount << "requests";
}

} // namespace DeskProbe
