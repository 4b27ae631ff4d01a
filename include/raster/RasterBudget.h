#ifndef DESKPROBE_RASTERBUDGET_H
#define DESKPROBE_RASTERBUDGET_H

#include "core/Result.h"

#include <atomic>
#include <memory>

namespace DeskProbe {

class RasterBudget;

/**
 * @brief Proof that one raster slot is in use.
 *
 * Returned by RasterBudget::acquire(). The slot is given back when the last
 * shared owner of the lease goes away.
 */
class RasterLease
{
public:
    ~RasterLease();

    RasterLease(const RasterLease &) = delete;
    RasterLease &operator=(const RasterLease &) = delete;

private:
    friend class RasterBudget;
    explicit RasterLease(std::shared_ptr<RasterBudget> budget);

    std::shared_ptr<RasterBudget> m_budget;
};

/**
 * @brief Caps the number of decoded rasters alive at the same time.
 *
 * Acquiring past the cap fails with ErrorCode::ResourceExhausted instead of
 * aborting. Thread-safe; leases may be released from any thread.
 */
class RasterBudget : public std::enable_shared_from_this<RasterBudget>
{
public:
    static constexpr int kDefaultCapacity = 20;

    static std::shared_ptr<RasterBudget> create(int capacity = kDefaultCapacity);

    Result<std::shared_ptr<const RasterLease>> acquire();

    int capacity() const { return m_capacity; }
    int liveCount() const { return m_live.load(); }

private:
    friend class RasterLease;
    explicit RasterBudget(int capacity);
    void release();

    const int m_capacity;
    std::atomic<int> m_live{0};
};

} // namespace DeskProbe

#endif // DESKPROBE_RASTERBUDGET_H
