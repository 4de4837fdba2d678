/**
 * @file transferexecutor.h
 * @brief Drives one transfer record through the session to a terminal state.
 */

#ifndef TRANSFEREXECUTOR_H
#define TRANSFEREXECUTOR_H

#include <QObject>
#include <QPointer>
#include <QUuid>
#include <memory>

#include "isftpsession.h"
#include "models/transferrecord.h"
#include "resumestatetracker.h"

/**
 * @brief Executes a single transfer at a time.
 *
 * execute() moves the record to InProgress, starts the session job and
 * returns. Progress and the final outcome arrive through the job's
 * signals; the executor writes them into the record and emits settled()
 * once the record reached Completed, Failed or Cancelled. Session errors
 * never escape: they end up in TransferRecord::errorMessage.
 */
class TransferExecutor : public QObject
{
    Q_OBJECT

public:
    explicit TransferExecutor(ISftpSession *session, QObject *parent = nullptr);
    ~TransferExecutor() override;

    void setSession(ISftpSession *session);

    /**
     * @brief Starts @p record. The executor must be idle and the record Pending.
     * @return False if the transfer could not be started at all.
     */
    bool execute(const std::shared_ptr<TransferRecord> &record);

    [[nodiscard]] bool isBusy() const { return record_ != nullptr; }

    /**
     * @brief True while the body of transfer @p id is still running.
     */
    [[nodiscard]] bool isExecuting(const QUuid &id) const { return record_ && record_->id == id; }

    [[nodiscard]] const ResumeStateTracker &resumeStateTracker() const { return tracker_; }

signals:
    void started(const QUuid &id);
    void recordChanged(const QUuid &id);
    void settled(const QUuid &id);

    /// Emitted after an upload completed, so remote views can refresh
    void remoteRefreshRequested();
    /// Emitted after a download completed, so local views can refresh
    void localRefreshRequested();

private slots:
    void onJobProgress(qint64 bytesTransferred, qint64 totalBytes);
    void onJobFinished();
    void onJobDestroyed();

private:
    void settle(RemoteTransferJob::Result result, const QString &errorMessage);
    void releaseJob();

    QPointer<ISftpSession> session_;
    ResumeStateTracker tracker_;
    std::shared_ptr<TransferRecord> record_;
    QPointer<RemoteTransferJob> job_;
};

#endif // TRANSFEREXECUTOR_H
