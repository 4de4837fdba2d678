#include <QtTest>
#include <QFile>
#include <QTemporaryDir>

#include "mocks/mocksftpsession.h"
#include "services/resumestatetracker.h"

class TestResumeStateTracker : public QObject
{
    Q_OBJECT

private:
    MockSftpSession *mockSession = nullptr;
    QTemporaryDir tempDir;

    void writeLocalFile(const QString &path, qint64 size)
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(QByteArray(size, 'x'));
    }

    TransferRecord uploadRecord(qint64 total) const
    {
        TransferRecord record;
        record.direction = TransferDirection::Upload;
        record.fileName = "a.bin";
        record.localPath = tempDir.filePath("a.bin");
        record.remotePath = "/srv/a.bin";
        record.totalBytes = total;
        return record;
    }

    TransferRecord downloadRecord(qint64 total) const
    {
        TransferRecord record;
        record.direction = TransferDirection::Download;
        record.fileName = "b.bin";
        record.localPath = tempDir.filePath("b.bin");
        record.remotePath = "/srv/b.bin";
        record.totalBytes = total;
        return record;
    }

private slots:
    void init()
    {
        mockSession = new MockSftpSession(this);
        mockSession->mockSetConnected(true);
        QFile::remove(tempDir.filePath("b.bin"));
    }

    void cleanup()
    {
        delete mockSession;
        mockSession = nullptr;
    }

    void testPureEvaluation()
    {
        ResumeState partial = ResumeStateTracker::evaluate(40, 100);
        QVERIFY(partial.canResume);
        QCOMPARE(partial.resumeOffset, qint64(40));

        for (const auto &sizes : {qMakePair(qint64(0), qint64(100)),
                                  qMakePair(qint64(100), qint64(100)),
                                  qMakePair(qint64(150), qint64(100)),
                                  qMakePair(qint64(40), qint64(0))}) {
            const ResumeState state = ResumeStateTracker::evaluate(sizes.first, sizes.second);
            QVERIFY(!state.canResume);
            QCOMPARE(state.resumeOffset, qint64(0));
        }
    }

    void testUploadProbesSession()
    {
        ResumeStateTracker tracker(mockSession);
        mockSession->mockSetRemoteFile("/srv/a.bin", 30);

        TransferRecord record = uploadRecord(100);
        QCOMPARE(tracker.probeDestinationSize(record), qint64(30));

        tracker.apply(record);
        QVERIFY(record.canResume);
        QCOMPARE(record.resumeOffset, qint64(30));
        QCOMPARE(record.transferredBytes, qint64(30));
        QCOMPARE(mockSession->mockGetFileInfoRequests().last(), QString("/srv/a.bin"));
    }

    void testUploadProbeErrorCountsAsAbsent()
    {
        ResumeStateTracker tracker(mockSession);
        mockSession->mockSetRemoteFile("/srv/a.bin", 30);
        mockSession->mockSetProbeError("/srv/a.bin", "Permission denied");

        TransferRecord record = uploadRecord(100);
        record.canResume = true;
        record.resumeOffset = 30;

        tracker.apply(record);
        QVERIFY(!record.canResume);
        QCOMPARE(record.resumeOffset, qint64(0));
    }

    void testUploadDirectoryCountsAsEmpty()
    {
        ResumeStateTracker tracker(mockSession);
        mockSession->mockSetRemoteDirectory("/srv/a.bin");
        QCOMPARE(tracker.probeDestinationSize(uploadRecord(100)), qint64(0));
    }

    void testUploadWithoutSession()
    {
        ResumeStateTracker tracker;
        const ResumeState state = tracker.evaluate(uploadRecord(100));
        QVERIFY(!state.canResume);
    }

    void testDownloadProbesLocalFile()
    {
        ResumeStateTracker tracker(mockSession);
        writeLocalFile(tempDir.filePath("b.bin"), 25);

        TransferRecord record = downloadRecord(100);
        tracker.apply(record);
        QVERIFY(record.canResume);
        QCOMPARE(record.resumeOffset, qint64(25));

        // Downloads never touch the session
        QVERIFY(mockSession->mockGetFileInfoRequests().isEmpty());
    }

    void testDownloadCompleteDestinationIsNotResumable()
    {
        ResumeStateTracker tracker(mockSession);
        writeLocalFile(tempDir.filePath("b.bin"), 100);

        TransferRecord record = downloadRecord(100);
        tracker.apply(record);
        QVERIFY(!record.canResume);
        QCOMPARE(record.resumeOffset, qint64(0));
    }

    void testMissingDestinationIsNotResumable()
    {
        ResumeStateTracker tracker(mockSession);
        TransferRecord record = downloadRecord(100);
        tracker.apply(record);
        QVERIFY(!record.canResume);
        QCOMPARE(record.transferredBytes, qint64(0));
    }

    void testUnknownTotalIsNotResumable()
    {
        ResumeStateTracker tracker(mockSession);
        writeLocalFile(tempDir.filePath("b.bin"), 25);

        const ResumeState state = tracker.evaluate(downloadRecord(0));
        QVERIFY(!state.canResume);
    }
};

QTEST_MAIN(TestResumeStateTracker)
#include "test_resumestatetracker.moc"
