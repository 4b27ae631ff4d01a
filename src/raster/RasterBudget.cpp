#include "raster/RasterBudget.h"

#include <QDebug>

#include <algorithm>

namespace DeskProbe {

RasterLease::RasterLease(std::shared_ptr<RasterBudget> budget)
    : m_budget(std::move(budget))
{
}

RasterLease::~RasterLease()
{
    if (m_budget) {
        m_budget->release();
    }
}

std::shared_ptr<RasterBudget> RasterBudget::create(int capacity)
{
    return std::shared_ptr<RasterBudget>(new RasterBudget(capacity));
}

RasterBudget::RasterBudget(int capacity)
    : m_capacity(std::max(1, capacity))
{
}

Result<std::shared_ptr<const RasterLease>> RasterBudget::acquire()
{
    int live = m_live.load();
    do {
        if (live >= m_capacity) {
            qWarning() << "RasterBudget: Refusing raster, live count at cap" << m_capacity;
            return Result<std::shared_ptr<const RasterLease>>::failure(
                Error::resourceExhausted(
                    QStringLiteral("Too many live rasters (limit %1)").arg(m_capacity)));
        }
    } while (!m_live.compare_exchange_weak(live, live + 1));

    std::shared_ptr<const RasterLease> lease(new RasterLease(shared_from_this()));
    return Result<std::shared_ptr<const RasterLease>>::success(std::move(lease));
}

void RasterBudget::release()
{
    m_live.fetch_sub(1);
}

} // namespace DeskProbe
