/**
 * @file remotetransferjob.h
 * @brief Handle for one in-flight upload or download.
 */

#ifndef REMOTETRANSFERJOB_H
#define REMOTETRANSFERJOB_H

#include <QObject>
#include <QString>

/**
 * @brief Reports progress and the outcome of a single session transfer.
 *
 * Sessions create a job per upload/download, much like a QNetworkReply.
 * The consumer connects to progress() and finished() and reads result()
 * once finished() has fired. Jobs finish exactly once.
 *
 * @par Example usage:
 * @code
 * RemoteTransferJob *job = session->upload(local, remote, 0, source.token());
 * connect(job, &RemoteTransferJob::progress, this, &MyWidget::onProgress);
 * connect(job, &RemoteTransferJob::finished, this, [job]() {
 *     if (job->result() == RemoteTransferJob::Result::Failed)
 *         qWarning() << job->errorString();
 *     job->deleteLater();
 * });
 * @endcode
 */
class RemoteTransferJob : public QObject
{
    Q_OBJECT

public:
    enum class Result {
        Running,    ///< Not finished yet
        Succeeded,  ///< All bytes transferred
        Failed,     ///< Transfer failed, see errorString()
        Cancelled   ///< Stopped because the cancellation token fired
    };
    Q_ENUM(Result)

    explicit RemoteTransferJob(QObject *parent = nullptr);
    ~RemoteTransferJob() override = default;

    [[nodiscard]] Result result() const { return result_; }
    [[nodiscard]] bool isFinished() const { return result_ != Result::Running; }
    [[nodiscard]] QString errorString() const { return errorString_; }

    /// @name Session side
    /// @{

    /**
     * @brief Publishes progress.
     * @param bytesTransferred Absolute position, resume offset included.
     * @param totalBytes Size of the source (0 if unknown).
     */
    void reportProgress(qint64 bytesTransferred, qint64 totalBytes);

    void finishSucceeded();
    void finishFailed(const QString &message);
    void finishCancelled();
    /// @}

signals:
    void progress(qint64 bytesTransferred, qint64 totalBytes);
    void finished();

private:
    void finish(Result result, const QString &message);

    Result result_ = Result::Running;
    QString errorString_;
};

#endif // REMOTETRANSFERJOB_H
