#include <QtTest>
#include "../Fakes.hpp"
#include "sync/ScrollSynchronizer.hpp"

using namespace cal;

class TestScrollSynchronizer : public QObject {
    Q_OBJECT

private slots:
    void testProportionalOffset() {
        ScrollSynchronizer sync(true);
        auto id = test::track("A", "B", "/1.mp3");
        sync.trackChanged(id);
        sync.setLineCount(101);

        sync.tick(test::playing(id, 100.0, 200.0));
        QCOMPARE(sync.offset(), usize(50));

        sync.tick(test::playing(id, 0.0, 200.0));
        QCOMPARE(sync.offset(), usize(0));

        sync.tick(test::playing(id, 500.0, 200.0));
        QCOMPARE(sync.offset(), usize(100));
    }

    void testUnknownDurationStaysAtTop() {
        ScrollSynchronizer sync(true);
        sync.setLineCount(10);
        sync.tick(test::playing(test::track("A", "B", "/1"), 30.0, 0.0));
        QCOMPARE(sync.offset(), usize(0));
    }

    void testEmptyDocument() {
        ScrollSynchronizer sync(true);
        sync.setLineCount(0);
        sync.tick(test::playing(test::track("A", "B", "/1"), 100.0, 200.0));
        QCOMPARE(sync.offset(), usize(0));
        sync.manualScroll(5);
        QCOMPARE(sync.offset(), usize(0));
    }

    void testManualPersistsAcrossTicks() {
        ScrollSynchronizer sync(true);
        auto id = test::track("A", "B", "/1.mp3");
        sync.trackChanged(id);
        sync.setLineCount(20);

        sync.manualScroll(3);
        QVERIFY(sync.mode() == ScrollMode::Manual);
        QCOMPARE(sync.offset(), usize(3));

        sync.tick(test::playing(id, 190.0, 200.0));
        QCOMPARE(sync.offset(), usize(3));

        sync.trackChanged(test::track("C", "D", "/2.mp3"));
        QVERIFY(sync.mode() == ScrollMode::Auto);
        QCOMPARE(sync.offset(), usize(0));
    }

    void testManualClamps() {
        ScrollSynchronizer sync(false);
        sync.setLineCount(5);
        sync.manualScroll(-3);
        QCOMPARE(sync.offset(), usize(0));
        sync.manualScroll(100);
        QCOMPARE(sync.offset(), usize(4));
    }

    void testAutoScrollDisabledNeverMoves() {
        ScrollSynchronizer sync(false);
        QVERIFY(sync.mode() == ScrollMode::Manual);
        auto id = test::track("A", "B", "/1.mp3");
        sync.trackChanged(id);
        QVERIFY(sync.mode() == ScrollMode::Manual);
        sync.setLineCount(50);
        sync.tick(test::playing(id, 100.0, 200.0));
        QCOMPARE(sync.offset(), usize(0));
    }

    void testShorterDocumentReclamps() {
        ScrollSynchronizer sync(false);
        sync.setLineCount(30);
        sync.manualScroll(25);
        sync.setLineCount(10);
        QCOMPARE(sync.offset(), usize(9));
        sync.setLineCount(0);
        QCOMPARE(sync.offset(), usize(0));
    }

    void testOffsetInvariant() {
        ScrollSynchronizer sync(true);
        auto id = test::track("A", "B", "/1.mp3");
        for (usize n : {usize(1), usize(2), usize(7), usize(64)}) {
            sync.trackChanged(id);
            sync.setLineCount(n);
            for (f64 pos = 0.0; pos <= 240.0; pos += 7.5) {
                sync.tick(test::playing(id, pos, 200.0));
                QVERIFY(sync.offset() <= n - 1);
            }
        }
    }
};

int runTestScrollSynchronizer(int argc, char** argv) {
    TestScrollSynchronizer tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ScrollSynchronizer.moc"
