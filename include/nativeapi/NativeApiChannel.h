#ifndef DESKPROBE_NATIVEAPICHANNEL_H
#define DESKPROBE_NATIVEAPICHANNEL_H

#include "nativeapi/NativeApiCommands.h"

#include <QMutex>
#include <QWaitCondition>

#include <deque>
#include <optional>
#include <vector>

namespace DeskProbe {

/**
 * @brief Unbounded FIFO of requests from caller threads to the native API thread.
 *
 * Any number of senders, one receiver. Once closed, send() refuses new
 * requests and receive() returns std::nullopt.
 */
class NativeApiChannel
{
public:
    NativeApiChannel() = default;
    NativeApiChannel(const NativeApiChannel &) = delete;
    NativeApiChannel &operator=(const NativeApiChannel &) = delete;

    // Returns false (and leaves request untouched) if the channel is closed.
    bool send(AnyNativeApiRequest &request);

    // Blocks until a request arrives or the channel is closed.
    std::optional<AnyNativeApiRequest> receive();

    // Closes the channel and hands back requests nobody will serve.
    std::vector<AnyNativeApiRequest> close();

private:
    QMutex m_mutex;
    QWaitCondition m_condition;
    std::deque<AnyNativeApiRequest> m_queue;
    bool m_closed = false;
};

} // namespace DeskProbe

#endif // DESKPROBE_NATIVEAPICHANNEL_H
