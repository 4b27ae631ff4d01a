#ifndef DESKPROBE_NATIVEAPITHREAD_H
#define DESKPROBE_NATIVEAPITHREAD_H

#include "nativeapi/INativeApiBackend.h"

#include <QThread>
#include <QString>

#include <memory>

namespace DeskProbe {

class NativeApiChannel;

/**
 * @brief The single thread that owns a native API backend.
 *
 * Runs receive -> dispatch -> reply until a Shutdown request arrives or the
 * channel is closed. The backend is created, initialized and destroyed on
 * this thread.
 */
class NativeApiThread : public QThread
{
    Q_OBJECT

public:
    NativeApiThread(const QString &backendName,
                    NativeApiBackendFactory factory,
                    std::shared_ptr<NativeApiChannel> channel,
                    QObject *parent = nullptr);
    ~NativeApiThread() override;

protected:
    void run() override;

private:
    QString m_backendName;
    NativeApiBackendFactory m_factory;
    std::shared_ptr<NativeApiChannel> m_channel;
};

} // namespace DeskProbe

#endif // DESKPROBE_NATIVEAPITHREAD_H
