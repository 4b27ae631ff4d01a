#ifndef DESKPROBE_NATIVEAPIACTOR_H
#define DESKPROBE_NATIVEAPIACTOR_H

#include "nativeapi/INativeApi.h"
#include "nativeapi/INativeApiBackend.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace DeskProbe {

class NativeApiChannel;
class NativeApiThread;

/**
 * @brief INativeApi that owns one worker thread and one backend.
 *
 * The worker is started by the first request, exactly once even when many
 * threads make their first request together. Requests are served in the
 * order they reach the channel; each one carries its own reply promise.
 */
class NativeApiActor : public INativeApi
{
public:
    NativeApiActor(const QString &backendName, NativeApiBackendFactory factory,
                   int requestTimeoutMs = 0);
    ~NativeApiActor() override;

    NativeApiActor(const NativeApiActor &) = delete;
    NativeApiActor &operator=(const NativeApiActor &) = delete;

    QString backendName() const override { return m_backendName; }

    Result<std::vector<WindowHandle>> enumerateWindows() override;
    Result<QString> windowTitle(WindowHandle handle) override;
    Result<WindowRect> windowRect(WindowHandle handle) override;
    Result<bool> isWindowFocused(WindowHandle handle) override;
    Result<Raster> captureWindowImage(WindowHandle handle) override;
    Result<Acknowledgement> shutdown() override;

    bool isWorkerStarted() const { return m_workerStarted.load(); }
    int requestTimeoutMs() const { return m_requestTimeoutMs; }

private:
    void ensureStarted();

    template <typename Command>
    Result<typename Command::Response> call(Command command);

    const QString m_backendName;
    NativeApiBackendFactory m_factory;
    const int m_requestTimeoutMs;

    std::shared_ptr<NativeApiChannel> m_channel;
    std::unique_ptr<NativeApiThread> m_thread;
    std::once_flag m_startOnce;
    std::atomic<bool> m_workerStarted{false};
};

} // namespace DeskProbe

#endif // DESKPROBE_NATIVEAPIACTOR_H
