#include <QtTest>
#include <QtConcurrent>

#include "raster/RasterBudget.h"

#include <atomic>
#include <vector>

using namespace DeskProbe;

class tst_RasterBudget : public QObject
{
    Q_OBJECT

private slots:
    void testCreate_DefaultCapacity();
    void testCreate_CapacityAtLeastOne();
    void testAcquire_UpToCapacity();
    void testAcquire_ReleasedOnLastOwner();
    void testAcquire_LeaseOutlivesCallerHandle();
    void testAcquire_ConcurrentNeverExceedsCapacity();
};

void tst_RasterBudget::testCreate_DefaultCapacity()
{
    auto budget = RasterBudget::create();
    QCOMPARE(budget->capacity(), RasterBudget::kDefaultCapacity);
    QCOMPARE(budget->capacity(), 20);
    QCOMPARE(budget->liveCount(), 0);
}

void tst_RasterBudget::testCreate_CapacityAtLeastOne()
{
    QCOMPARE(RasterBudget::create(0)->capacity(), 1);
    QCOMPARE(RasterBudget::create(-5)->capacity(), 1);
}

void tst_RasterBudget::testAcquire_UpToCapacity()
{
    auto budget = RasterBudget::create(3);
    std::vector<std::shared_ptr<const RasterLease>> leases;

    for (int i = 0; i < 3; ++i) {
        auto lease = budget->acquire();
        QVERIFY(lease.isSuccess());
        leases.push_back(lease.takeValue());
    }
    QCOMPARE(budget->liveCount(), 3);

    auto refused = budget->acquire();
    QVERIFY(!refused.isSuccess());
    QCOMPARE(refused.error().code, ErrorCode::ResourceExhausted);
    QVERIFY(refused.error().message.contains(QStringLiteral("limit 3")));
    QCOMPARE(budget->liveCount(), 3);
}

void tst_RasterBudget::testAcquire_ReleasedOnLastOwner()
{
    auto budget = RasterBudget::create(1);

    std::shared_ptr<const RasterLease> lease = budget->acquire().takeValue();
    std::shared_ptr<const RasterLease> shared = lease;

    lease.reset();
    QCOMPARE(budget->liveCount(), 1);
    QVERIFY(!budget->acquire().isSuccess());

    shared.reset();
    QCOMPARE(budget->liveCount(), 0);
    QVERIFY(budget->acquire().isSuccess());
}

void tst_RasterBudget::testAcquire_LeaseOutlivesCallerHandle()
{
    std::weak_ptr<RasterBudget> weak;
    std::shared_ptr<const RasterLease> lease;
    {
        auto budget = RasterBudget::create(1);
        weak = budget;
        lease = budget->acquire().takeValue();
    }

    // The lease keeps its budget alive so release has somewhere to go.
    QVERIFY(!weak.expired());
    lease.reset();
    QVERIFY(weak.expired());
}

void tst_RasterBudget::testAcquire_ConcurrentNeverExceedsCapacity()
{
    auto budget = RasterBudget::create(8);
    std::atomic<int> granted{0};
    std::atomic<int> peak{0};

    QList<int> workers;
    for (int i = 0; i < 32; ++i) {
        workers.append(i);
    }

    QtConcurrent::blockingMap(workers, [&](int) {
        for (int round = 0; round < 200; ++round) {
            auto lease = budget->acquire();
            if (!lease.isSuccess()) {
                continue;
            }
            ++granted;
            int live = budget->liveCount();
            int seen = peak.load();
            while (live > seen && !peak.compare_exchange_weak(seen, live)) {
            }
        }
    });

    QVERIFY(granted.load() > 0);
    QVERIFY(peak.load() <= 8);
    QCOMPARE(budget->liveCount(), 0);
}

QTEST_GUILESS_MAIN(tst_RasterBudget)
#include "tst_RasterBudget.moc"
