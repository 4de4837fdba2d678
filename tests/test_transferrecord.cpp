#include <QtTest>
#include <QRegularExpression>

#include "models/transferrecord.h"

class TestTransferRecord : public QObject
{
    Q_OBJECT

private:
    static TransferRecord makeRecord(qint64 total, qint64 transferred)
    {
        TransferRecord record;
        record.fileName = "a.txt";
        record.localPath = "/home/me/a.txt";
        record.remotePath = "/srv/a.txt";
        record.totalBytes = total;
        record.transferredBytes = transferred;
        return record;
    }

private slots:
    void testDefaults()
    {
        TransferRecord record;
        QVERIFY(!record.id.isNull());
        QCOMPARE(record.status, TransferStatus::Pending);
        QCOMPARE(record.resumeOffset, qint64(0));
        QVERIFY(!record.canResume);
        QVERIFY(!record.startedAt.isValid());
        QVERIFY(!record.progressPercent().has_value());
        QVERIFY(!record.cancellation);

        TransferRecord other;
        QVERIFY(record.id != other.id);
    }

    void testProgressPercent()
    {
        QCOMPARE(*makeRecord(200, 50).progressPercent(), 25.0);
        QCOMPARE(*makeRecord(100, 100).progressPercent(), 100.0);
        QCOMPARE(*makeRecord(100, 0).progressPercent(), 0.0);
    }

    void testProgressPercentClamped()
    {
        QCOMPARE(*makeRecord(100, 150).progressPercent(), 100.0);
        QCOMPARE(*makeRecord(100, -10).progressPercent(), 0.0);
    }

    void testProgressPercentUndefinedWithoutTotal()
    {
        QVERIFY(!makeRecord(0, 0).progressPercent().has_value());
        QVERIFY(!makeRecord(0, 500).progressPercent().has_value());
    }

    void testStatusDisplay()
    {
        TransferRecord record = makeRecord(100, 45);
        QCOMPARE(record.statusDisplay(), QString("Queued"));

        record.status = TransferStatus::InProgress;
        QCOMPARE(record.statusDisplay(), QString("45%"));

        record.status = TransferStatus::Completed;
        QCOMPARE(record.statusDisplay(), QString("Done"));

        record.status = TransferStatus::Failed;
        QCOMPARE(record.statusDisplay(), QString("Failed"));

        record.status = TransferStatus::Cancelled;
        QCOMPARE(record.statusDisplay(), QString("Cancelled"));
    }

    void testStatusDisplayInProgressWithoutTotal()
    {
        TransferRecord record = makeRecord(0, 0);
        record.status = TransferStatus::InProgress;
        QCOMPARE(record.statusDisplay(), QString("0%"));
    }

    void testDirectionDisplay()
    {
        TransferRecord record;
        record.direction = TransferDirection::Upload;
        QCOMPARE(record.directionDisplay(), QStringLiteral("↑"));
        record.direction = TransferDirection::Download;
        QCOMPARE(record.directionDisplay(), QStringLiteral("↓"));
    }

    void testFormatSpeed()
    {
        QCOMPARE(formatSpeed(512.0), QString("512.0 B/s"));
        QCOMPARE(formatSpeed(1536.0), QString("1.5 KB/s"));
        QCOMPARE(formatSpeed(3.0 * 1024 * 1024), QString("3.0 MB/s"));
        QCOMPARE(formatSpeed(2.0 * 1024 * 1024 * 1024), QString("2.0 GB/s"));
    }

    void testSpeedDisplay()
    {
        const QDateTime start = QDateTime::currentDateTime();
        TransferRecord record = makeRecord(10000, 4096);
        record.status = TransferStatus::InProgress;
        record.startedAt = start;

        QCOMPARE(record.speedDisplay(start.addMSecs(2000)), QString("2.0 KB/s"));
    }

    void testSpeedDisplayEmptyEarlyOrIdle()
    {
        const QDateTime start = QDateTime::currentDateTime();
        TransferRecord record = makeRecord(10000, 4096);
        record.startedAt = start;

        // Not running
        QVERIFY(record.speedDisplay(start.addMSecs(2000)).isEmpty());

        // Running, but under half a second
        record.status = TransferStatus::InProgress;
        QVERIFY(record.speedDisplay(start.addMSecs(400)).isEmpty());

        // Never started
        record.startedAt = QDateTime();
        QVERIFY(record.speedDisplay(start.addMSecs(2000)).isEmpty());
    }

    void testButtonFlags()
    {
        TransferRecord record = makeRecord(100, 0);
        QVERIFY(!record.showCancelButton());
        QVERIFY(!record.showRetryButton());
        QVERIFY(!record.showResumeButton());

        record.status = TransferStatus::InProgress;
        QVERIFY(record.showCancelButton());
        QVERIFY(!record.showRetryButton());

        record.status = TransferStatus::Failed;
        QVERIFY(!record.showCancelButton());
        QVERIFY(record.showRetryButton());
        QVERIFY(!record.showResumeButton());

        record.canResume = true;
        QVERIFY(record.showResumeButton());

        record.status = TransferStatus::Cancelled;
        QVERIFY(record.showRetryButton());
        QVERIFY(record.showResumeButton());

        record.status = TransferStatus::Completed;
        QVERIFY(!record.showRetryButton());
        QVERIFY(!record.showResumeButton());
    }

    void testActiveAndSettled()
    {
        TransferRecord record;
        QVERIFY(record.isActive());
        record.status = TransferStatus::InProgress;
        QVERIFY(record.isActive());
        QVERIFY(!record.isSettled());

        for (TransferStatus status : {TransferStatus::Completed, TransferStatus::Failed,
                                      TransferStatus::Cancelled}) {
            record.status = status;
            QVERIFY(!record.isActive());
            QVERIFY(record.isSettled());
        }
    }

    void testValidTransitions_data()
    {
        QTest::addColumn<int>("from");
        QTest::addColumn<int>("to");
        QTest::addColumn<bool>("valid");

        auto row = [](const char *name, TransferStatus from, TransferStatus to, bool valid) {
            QTest::newRow(name) << static_cast<int>(from) << static_cast<int>(to) << valid;
        };

        row("pending->inprogress", TransferStatus::Pending, TransferStatus::InProgress, true);
        row("pending->cancelled", TransferStatus::Pending, TransferStatus::Cancelled, true);
        row("pending->completed", TransferStatus::Pending, TransferStatus::Completed, false);
        row("pending->failed", TransferStatus::Pending, TransferStatus::Failed, false);
        row("inprogress->completed", TransferStatus::InProgress, TransferStatus::Completed, true);
        row("inprogress->failed", TransferStatus::InProgress, TransferStatus::Failed, true);
        row("inprogress->cancelled", TransferStatus::InProgress, TransferStatus::Cancelled, true);
        row("inprogress->pending", TransferStatus::InProgress, TransferStatus::Pending, false);
        row("failed->pending", TransferStatus::Failed, TransferStatus::Pending, true);
        row("failed->completed", TransferStatus::Failed, TransferStatus::Completed, false);
        row("cancelled->pending", TransferStatus::Cancelled, TransferStatus::Pending, true);
        row("cancelled->inprogress", TransferStatus::Cancelled, TransferStatus::InProgress, false);
        row("completed->pending", TransferStatus::Completed, TransferStatus::Pending, false);
        row("completed->failed", TransferStatus::Completed, TransferStatus::Failed, false);
    }

    void testValidTransitions()
    {
        QFETCH(int, from);
        QFETCH(int, to);
        QFETCH(bool, valid);

        QCOMPARE(isValidTransition(static_cast<TransferStatus>(from), static_cast<TransferStatus>(to)), valid);
    }

    void testTransitionToRejectedKeepsStatus()
    {
        TransferRecord record;
        record.status = TransferStatus::Completed;

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("rejected transition"));
        QVERIFY(!record.transitionTo(TransferStatus::Pending));
        QCOMPARE(record.status, TransferStatus::Completed);
    }

    void testTransitionToAccepted()
    {
        TransferRecord record;
        QVERIFY(record.transitionTo(TransferStatus::InProgress));
        QCOMPARE(record.status, TransferStatus::InProgress);
        QVERIFY(record.transitionTo(TransferStatus::Failed));
        QVERIFY(record.transitionTo(TransferStatus::Pending));
        QCOMPARE(record.status, TransferStatus::Pending);
    }

    void testInitializeResumeProgress()
    {
        TransferRecord record = makeRecord(100, 0);
        record.resumeOffset = 40;
        record.initializeResumeProgress();
        QCOMPARE(record.resumeOffset, qint64(40));
        QCOMPARE(record.transferredBytes, qint64(40));
        QCOMPARE(*record.progressPercent(), 40.0);
    }

    void testInitializeResumeProgressClampsOffset()
    {
        TransferRecord tooLarge = makeRecord(100, 0);
        tooLarge.resumeOffset = 150;
        tooLarge.initializeResumeProgress();
        QCOMPARE(tooLarge.resumeOffset, qint64(100));
        QCOMPARE(tooLarge.transferredBytes, qint64(100));

        TransferRecord negative = makeRecord(100, 0);
        negative.resumeOffset = -5;
        negative.initializeResumeProgress();
        QCOMPARE(negative.resumeOffset, qint64(0));
        QCOMPARE(negative.transferredBytes, qint64(0));

        TransferRecord unknownSize = makeRecord(0, 0);
        unknownSize.resumeOffset = 10;
        unknownSize.initializeResumeProgress();
        QCOMPARE(unknownSize.resumeOffset, qint64(0));
    }

    void testUpdateProgressClamps()
    {
        TransferRecord record = makeRecord(100, 0);
        record.resumeOffset = 40;
        record.initializeResumeProgress();

        record.updateProgress(10);
        QCOMPARE(record.transferredBytes, qint64(40));

        record.updateProgress(70);
        QCOMPARE(record.transferredBytes, qint64(70));

        record.updateProgress(250);
        QCOMPARE(record.transferredBytes, qint64(100));
    }

    void testUpdateProgressWithoutTotal()
    {
        TransferRecord record = makeRecord(0, 0);
        record.updateProgress(300);
        QCOMPARE(record.transferredBytes, qint64(300));
        QVERIFY(!record.progressPercent().has_value());
    }
};

QTEST_MAIN(TestTransferRecord)
#include "test_transferrecord.moc"
