#include <QtTest>
#include <QSignalSpy>
#include <QThread>
#include <atomic>
#include <limits>
#include "../src/progress_reporter.h"

class TestProgressReporter : public QObject {
    Q_OBJECT
private slots:
    void testForwardsOnPercentChange();
    void testCoalescesRepeatedValues();
    void testForwardsRepeatAfterInterval();
    void testClampsAndDropsRegressions();
    void testFractionFloors();
    void testBeginStartsNewSequence();
    void testConcurrentProducers();
};

void TestProgressReporter::testForwardsOnPercentChange()
{
    ProgressReporter r;
    QSignalSpy spy(&r, &ProgressReporter::progressChanged);
    r.begin("a");
    QVERIFY(r.report(1, "a"));
    QVERIFY(r.report(2, "a"));
    QVERIFY(r.report(3, "a"));
    QCOMPARE(spy.count(), 3);
    QCOMPARE(spy.at(2).at(0).toString(), QString("a"));
    QCOMPARE(spy.at(2).at(1).toInt(), 3);
}

void TestProgressReporter::testCoalescesRepeatedValues()
{
    ProgressReporter r;
    r.setMinIntervalMs(10000);
    QSignalSpy spy(&r, &ProgressReporter::progressChanged);
    r.begin("a");
    // Raw per-byte style callbacks: many values, few distinct percentages
    for (int i = 0; i < 1000; ++i) {
        r.reportFraction(i / 1000.0 * 0.05, "a");
    }
    QCOMPARE(spy.count(), 5);   // 0..4
    QCOMPARE(r.forwardedCount(), 5);
}

void TestProgressReporter::testForwardsRepeatAfterInterval()
{
    ProgressReporter r;
    r.setMinIntervalMs(20);
    QSignalSpy spy(&r, &ProgressReporter::progressChanged);
    r.begin("a");
    QVERIFY(r.report(40, "a"));
    QVERIFY(!r.report(40, "a"));
    QThread::msleep(40);
    QVERIFY(r.report(40, "a"));
    QCOMPARE(spy.count(), 2);
}

void TestProgressReporter::testClampsAndDropsRegressions()
{
    ProgressReporter r;
    QSignalSpy spy(&r, &ProgressReporter::progressChanged);
    r.begin("up");
    r.report(-5, "up");
    r.report(50, "up");
    r.report(30, "up");
    r.report(250, "up");
    QList<int> seen;
    for (const auto& args : spy) seen << args.at(1).toInt();
    QCOMPARE(seen, QList<int>({0, 50, 100}));
    QCOMPARE(r.lastPercent("up"), 100);
}

void TestProgressReporter::testFractionFloors()
{
    ProgressReporter r;
    r.begin("f");
    r.reportFraction(0.999, "f");
    QCOMPARE(r.lastPercent("f"), 99);
    QVERIFY(!r.reportFraction(std::numeric_limits<double>::quiet_NaN(), "f"));
    r.reportFraction(1.0, "f");
    QCOMPARE(r.lastPercent("f"), 100);
}

void TestProgressReporter::testBeginStartsNewSequence()
{
    ProgressReporter r;
    r.begin("u");
    r.report(80, "u");
    r.begin("u");
    QCOMPARE(r.lastPercent("u"), -1);
    QVERIFY(r.report(10, "u"));
    r.finish("u");
    QCOMPARE(r.lastPercent("u"), -1);
}

void TestProgressReporter::testConcurrentProducers()
{
    ProgressReporter r;
    r.setMinIntervalMs(1000);
    int received = 0;
    bool overlapped = false;
    std::atomic_int inside{0};
    connect(&r, &ProgressReporter::progressChanged, &r, [&](const QString&, int) {
        if (++inside > 1) overlapped = true;
        ++received;
        --inside;
    }, Qt::DirectConnection);

    QList<QThread*> threads;
    for (int t = 0; t < 4; ++t) {
        const QString ctx = QString("archive:%1").arg(t);
        threads << QThread::create([&r, ctx]() {
            r.begin(ctx);
            for (int p = 0; p <= 100; ++p) r.report(p, ctx);
        });
    }
    for (QThread* t : threads) t->start();
    for (QThread* t : threads) { t->wait(); delete t; }

    QVERIFY(!overlapped);
    QCOMPARE(received, 4 * 101);
    QCOMPARE(r.forwardedCount(), 4 * 101);
}

QTEST_APPLESS_MAIN(TestProgressReporter)
#include "test_progress_reporter.moc"
