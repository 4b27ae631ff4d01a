#include "nativeapi/NativeApiChannel.h"

namespace DeskProbe {

bool NativeApiChannel::send(AnyNativeApiRequest &request)
{
    QMutexLocker locker(&m_mutex);
    if (m_closed) {
        return false;
    }
    m_queue.push_back(std::move(request));
    m_condition.wakeOne();
    return true;
}

std::optional<AnyNativeApiRequest> NativeApiChannel::receive()
{
    QMutexLocker locker(&m_mutex);
    while (m_queue.empty() && !m_closed) {
        m_condition.wait(&m_mutex);
    }
    if (m_closed) {
        return std::nullopt;
    }

    AnyNativeApiRequest request = std::move(m_queue.front());
    m_queue.pop_front();
    return request;
}

std::vector<AnyNativeApiRequest> NativeApiChannel::close()
{
    QMutexLocker locker(&m_mutex);
    m_closed = true;

    std::vector<AnyNativeApiRequest> abandoned;
    abandoned.reserve(m_queue.size());
    for (auto &request : m_queue) {
        abandoned.push_back(std::move(request));
    }
    m_queue.clear();

    m_condition.wakeAll();
    return abandoned;
}

} // namespace DeskProbe
