#include <QtTest>
#include <cmath>

#include "utils/progressgate.h"
#include "utils/ratewindow.h"

class TestRateWindow : public QObject
{
    Q_OBJECT

private slots:
    // ========== Constructor and basic state ==========

    void testConstructor()
    {
        RateWindow window(8);
        QCOMPARE(window.count(), static_cast<size_t>(0));
        QCOMPARE(window.windowSize(), static_cast<size_t>(8));
        QCOMPARE(window.bytesPerSecond(), 0.0);
        QCOMPARE(window.latestBytes(), qint64(0));
    }

    void testMinimumWindowSize()
    {
        RateWindow window(1);
        QCOMPARE(window.windowSize(), static_cast<size_t>(2));
    }

    // ========== Rate calculation ==========

    void testSingleSampleHasNoRate()
    {
        RateWindow window;
        window.addSample(1000, 4096);
        QCOMPARE(window.bytesPerSecond(), 0.0);
        QCOMPARE(window.latestBytes(), qint64(4096));
    }

    void testSteadyRate()
    {
        RateWindow window(8);
        window.addSample(0, 0);
        window.addSample(1000, 512 * 1024);
        QCOMPARE(window.bytesPerSecond(), 524288.0);

        window.addSample(2000, 1024 * 1024);
        QCOMPARE(window.bytesPerSecond(), 524288.0);
    }

    void testNoElapsedTime()
    {
        RateWindow window;
        window.addSample(500, 0);
        window.addSample(500, 1000);
        QCOMPARE(window.bytesPerSecond(), 0.0);
    }

    // ========== Window behavior ==========

    void testOldSamplesDropOut()
    {
        RateWindow window(3);
        window.addSample(0, 0);
        window.addSample(1000, 100);    // slow start
        window.addSample(2000, 10100);
        window.addSample(3000, 20100);  // evicts the first sample

        QCOMPARE(window.count(), static_cast<size_t>(3));
        // (20100 - 100) bytes over 2 s
        QCOMPARE(window.bytesPerSecond(), 10000.0);
    }

    void testOutOfOrderSampleIgnored()
    {
        RateWindow window;
        window.addSample(1000, 100);
        window.addSample(2000, 200);
        window.addSample(1500, 900);

        QCOMPARE(window.count(), static_cast<size_t>(2));
        QCOMPARE(window.latestBytes(), qint64(200));
    }

    void testRestartResetsWindow()
    {
        RateWindow window;
        window.addSample(0, 0);
        window.addSample(1000, 5000);
        window.addSample(2000, 10);  // transfer restarted after a retry

        QCOMPARE(window.count(), static_cast<size_t>(1));
        QCOMPARE(window.bytesPerSecond(), 0.0);
    }

    void testClear()
    {
        RateWindow window;
        window.addSample(0, 0);
        window.addSample(1000, 1000);
        window.clear();
        QCOMPARE(window.count(), static_cast<size_t>(0));
        QCOMPARE(window.bytesPerSecond(), 0.0);
    }

    // ========== Progress gate ==========

    void testGateFirstReportPasses()
    {
        ProgressGate gate(250, 64 * 1024);
        QVERIFY(gate.shouldReport(0, 10, 1000000));
    }

    void testGateDropsFrequentSmallReports()
    {
        ProgressGate gate(250, 64 * 1024);
        QVERIFY(gate.shouldReport(0, 1000, 1000000));
        QVERIFY(!gate.shouldReport(50, 2000, 1000000));
        QVERIFY(!gate.shouldReport(100, 3000, 1000000));
        QVERIFY(gate.shouldReport(260, 4000, 1000000));
    }

    void testGatePassesLargeDelta()
    {
        ProgressGate gate(250, 1000);
        QVERIFY(gate.shouldReport(0, 0, 0));
        QVERIFY(gate.shouldReport(10, 1500, 0));
    }

    void testGatePassesCompletion()
    {
        ProgressGate gate(250, 64 * 1024);
        QVERIFY(gate.shouldReport(0, 100, 200));
        QVERIFY(gate.shouldReport(5, 200, 200));
    }

    void testGateDropsRepeatedByteCount()
    {
        ProgressGate gate(10, 1);
        QVERIFY(gate.shouldReport(0, 100, 100));
        QVERIFY(!gate.shouldReport(1000, 100, 100));

        gate.reset();
        QVERIFY(gate.shouldReport(1000, 100, 100));
    }
};

QTEST_MAIN(TestRateWindow)
#include "test_ratewindow.moc"
