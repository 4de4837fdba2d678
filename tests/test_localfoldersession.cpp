#include <QtTest>
#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "models/transferqueue.h"
#include "services/localfoldersession.h"
#include "utils/cancellationtoken.h"

class TestLocalFolderSession : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir = nullptr;
    LocalFolderSession *session = nullptr;

    QString rootDir() const { return tempDir->filePath("root"); }
    QString localDir() const { return tempDir->filePath("local"); }

    static QByteArray pattern(qint64 size)
    {
        QByteArray data;
        data.reserve(size);
        for (qint64 i = 0; i < size; ++i) {
            data.append(static_cast<char>('a' + (i % 26)));
        }
        return data;
    }

    static void writeFile(const QString &path, const QByteArray &content)
    {
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(content);
    }

    static QByteArray readFile(const QString &path)
    {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            return QByteArray();
        }
        return file.readAll();
    }

    // Waits for the job and returns its result
    static RemoteTransferJob::Result waitFor(RemoteTransferJob *job)
    {
        if (!job->isFinished()) {
            QSignalSpy finishedSpy(job, &RemoteTransferJob::finished);
            finishedSpy.wait(5000);
        }
        return job->result();
    }

private slots:
    void init()
    {
        tempDir = new QTemporaryDir();
        QDir().mkpath(tempDir->filePath("root"));
        QDir().mkpath(tempDir->filePath("local"));
        session = new LocalFolderSession(rootDir(), this);
    }

    void cleanup()
    {
        delete session;
        delete tempDir;
        session = nullptr;
        tempDir = nullptr;
    }

    void testConnectedWhileRootExists()
    {
        QVERIFY(session->isConnected());

        LocalFolderSession missing(tempDir->filePath("nowhere"));
        QVERIFY(!missing.isConnected());
    }

    void testLocalPathFor()
    {
        QCOMPARE(session->localPathFor("/a/b.txt"), QDir::cleanPath(rootDir() + "/a/b.txt"));
        QCOMPARE(session->localPathFor("/"), QDir::cleanPath(rootDir()));
        QVERIFY(session->localPathFor("/../outside.txt").isEmpty());
        QVERIFY(session->localPathFor("/a/../../outside.txt").isEmpty());
    }

    void testFilesystemRootServesAbsolutePaths()
    {
        LocalFolderSession rootSession("/");
        QVERIFY(rootSession.isConnected());

        const QString existing = rootDir() + "/present.txt";
        writeFile(existing, pattern(7));

        QCOMPARE(rootSession.localPathFor("/"), QString("/"));
        QCOMPARE(rootSession.localPathFor(existing), QDir::cleanPath(existing));

        const auto info = rootSession.fileInfo(existing);
        QVERIFY(info.has_value());
        QCOMPARE(info->size, qint64(7));
    }

    void testFileInfo()
    {
        writeFile(rootDir() + "/docs/a.txt", pattern(123));

        const auto file = session->fileInfo("/docs/a.txt");
        QVERIFY(file.has_value());
        QCOMPARE(file->path, QString("/docs/a.txt"));
        QCOMPARE(file->size, qint64(123));
        QVERIFY(!file->isDirectory);

        const auto directory = session->fileInfo("/docs");
        QVERIFY(directory.has_value());
        QVERIFY(directory->isDirectory);
        QCOMPARE(directory->size, qint64(0));
    }

    void testFileInfoAbsentIsNotAnError()
    {
        QString error;
        QVERIFY(!session->fileInfo("/missing.txt", &error).has_value());
        QVERIFY(error.isEmpty());
    }

    void testFileInfoOutsideRootIsAnError()
    {
        QString error;
        QVERIFY(!session->fileInfo("/../escape.txt", &error).has_value());
        QVERIFY(error.contains("outside"));
    }

    void testUploadCopiesFile()
    {
        const QByteArray content = pattern(1000);
        writeFile(localDir() + "/a.txt", content);
        session->setChunkSize(256);

        CancellationSource source;
        RemoteTransferJob *job = session->upload(localDir() + "/a.txt", "/up/a.txt", 0, source.token());
        QSignalSpy progressSpy(job, &RemoteTransferJob::progress);

        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Succeeded);
        QCOMPARE(readFile(rootDir() + "/up/a.txt"), content);

        // 256 + 256 + 256 + 232, absolute positions
        QCOMPARE(progressSpy.count(), 4);
        QCOMPARE(progressSpy.first().at(0).toLongLong(), qint64(256));
        QCOMPARE(progressSpy.last().at(0).toLongLong(), qint64(1000));
        QCOMPARE(progressSpy.last().at(1).toLongLong(), qint64(1000));
        delete job;
    }

    void testDownloadCopiesFile()
    {
        const QByteArray content = pattern(300);
        writeFile(rootDir() + "/srv/b.bin", content);

        CancellationSource source;
        RemoteTransferJob *job = session->download("/srv/b.bin", localDir() + "/nested/b.bin", 0, source.token());

        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Succeeded);
        QCOMPARE(readFile(localDir() + "/nested/b.bin"), content);
        delete job;
    }

    void testOverwriteTruncatesDestination()
    {
        writeFile(rootDir() + "/srv/c.txt", pattern(10));
        writeFile(localDir() + "/c.txt", QByteArray(500, 'z'));

        CancellationSource source;
        RemoteTransferJob *job = session->download("/srv/c.txt", localDir() + "/c.txt", 0, source.token());

        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Succeeded);
        QCOMPARE(readFile(localDir() + "/c.txt"), pattern(10));
        delete job;
    }

    void testResumeAppendsFromOffset()
    {
        const QByteArray content = pattern(1000);
        writeFile(localDir() + "/big.bin", content);
        writeFile(rootDir() + "/big.bin", content.left(400));

        CancellationSource source;
        RemoteTransferJob *job = session->upload(localDir() + "/big.bin", "/big.bin", 400, source.token());
        QSignalSpy progressSpy(job, &RemoteTransferJob::progress);

        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Succeeded);
        QCOMPARE(readFile(rootDir() + "/big.bin"), content);
        QCOMPARE(progressSpy.last().at(0).toLongLong(), qint64(1000));
        delete job;
    }

    void testResumeOffsetBeyondDestinationIsReduced()
    {
        const QByteArray content = pattern(200);
        writeFile(rootDir() + "/srv/d.bin", content);
        writeFile(localDir() + "/d.bin", content.left(50));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("destination shorter than resume offset"));
        CancellationSource source;
        RemoteTransferJob *job = session->download("/srv/d.bin", localDir() + "/d.bin", 150, source.token());

        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Succeeded);
        QCOMPARE(readFile(localDir() + "/d.bin"), content);
        delete job;
    }

    void testCancellationStopsBetweenChunks()
    {
        writeFile(localDir() + "/e.bin", pattern(4096));
        session->setChunkSize(1024);

        CancellationSource source;
        RemoteTransferJob *job = session->upload(localDir() + "/e.bin", "/e.bin", 0, source.token());
        connect(job, &RemoteTransferJob::progress, this, [&source](qint64 bytes, qint64) {
            if (bytes >= 1024) {
                source.cancel();
            }
        });

        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Cancelled);
        QCOMPARE(QFileInfo(rootDir() + "/e.bin").size(), qint64(1024));
        delete job;
    }

    void testCancelledBeforeStartCopiesNothing()
    {
        writeFile(localDir() + "/f.bin", pattern(100));

        CancellationSource source;
        source.cancel();
        RemoteTransferJob *job = session->upload(localDir() + "/f.bin", "/f.bin", 0, source.token());

        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Cancelled);
        QCOMPARE(QFileInfo(rootDir() + "/f.bin").size(), qint64(0));
        delete job;
    }

    void testMissingSourceFailsAsynchronously()
    {
        CancellationSource source;
        RemoteTransferJob *job = session->download("/nothing.bin", localDir() + "/nothing.bin", 0, source.token());

        QVERIFY(!job->isFinished());
        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Failed);
        QVERIFY(job->errorString().contains("Cannot open"));
        delete job;
    }

    void testUploadOutsideRootFails()
    {
        writeFile(localDir() + "/g.txt", pattern(5));

        CancellationSource source;
        RemoteTransferJob *job = session->upload(localDir() + "/g.txt", "/../g.txt", 0, source.token());

        QCOMPARE(waitFor(job), RemoteTransferJob::Result::Failed);
        QVERIFY(job->errorString().contains("outside"));
        delete job;
    }

    void testDeletingJobStopsCopy()
    {
        writeFile(localDir() + "/h.bin", pattern(4096));
        session->setChunkSize(1024);

        CancellationSource source;
        RemoteTransferJob *job = session->upload(localDir() + "/h.bin", "/h.bin", 0, source.token());
        delete job;

        // Give any stray chunk a chance to run
        QTest::qWait(50);
        QVERIFY(QFileInfo(rootDir() + "/h.bin").size() < 4096);
    }

    void testQueueDrivesSessionEndToEnd()
    {
        const QByteArray content = pattern(5000);
        writeFile(localDir() + "/q.bin", content);
        session->setChunkSize(1000);

        TransferQueue queue(session);
        TransferSettings settings;
        settings.autoRemoveCompleted = false;
        queue.setSettings(settings);

        TransferRecord record;
        record.direction = TransferDirection::Upload;
        record.fileName = "q.bin";
        record.localPath = localDir() + "/q.bin";
        record.remotePath = "/incoming/q.bin";
        record.totalBytes = content.size();
        const QUuid id = queue.enqueue(record);

        QSignalSpy drainedSpy(&queue, &TransferQueue::queueDrained);
        QTRY_COMPARE(drainedSpy.count(), 1);

        const auto settled = queue.record(id);
        QVERIFY(settled.has_value());
        QCOMPARE(settled->status, TransferStatus::Completed);
        QCOMPARE(settled->transferredBytes, qint64(5000));
        QCOMPARE(readFile(rootDir() + "/incoming/q.bin"), content);
    }
};

QTEST_MAIN(TestLocalFolderSession)
#include "test_localfoldersession.moc"
