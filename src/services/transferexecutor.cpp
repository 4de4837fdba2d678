#include "transferexecutor.h"
#include "utils/logging.h"

#include <QDebug>

TransferExecutor::TransferExecutor(ISftpSession *session, QObject *parent)
    : QObject(parent)
    , session_(session)
    , tracker_(session)
{
}

TransferExecutor::~TransferExecutor()
{
    // Stop listening before members go away; the job may outlive us
    // because it is owned by the session.
    if (job_) {
        disconnect(job_, nullptr, this, nullptr);
    }
    if (record_ && record_->cancellation) {
        record_->cancellation->cancel();
    }
}

void TransferExecutor::setSession(ISftpSession *session)
{
    session_ = session;
    tracker_.setSession(session);
}

bool TransferExecutor::execute(const std::shared_ptr<TransferRecord> &record)
{
    if (!record) {
        return false;
    }
    if (record_) {
        qWarning() << "TransferExecutor: already executing" << record_->fileName
                   << "- refusing" << record->fileName;
        return false;
    }
    if (!record->transitionTo(TransferStatus::InProgress)) {
        return false;
    }

    record_ = record;
    record_->cancellation = std::make_shared<CancellationSource>();
    record_->startedAt = QDateTime::currentDateTime();
    record_->completedAt = QDateTime();
    record_->errorMessage.clear();
    record_->initializeResumeProgress();

    const QUuid id = record_->id;
    emit recordChanged(id);
    emit started(id);

    LOG_VERBOSE() << "TransferExecutor: starting" << transferDirectionToString(record_->direction)
                  << "local:" << record_->localPath
                  << "remote:" << record_->remotePath
                  << "offset:" << record_->resumeOffset;

    RemoteTransferJob *job = nullptr;
    if (session_ && session_->isConnected()) {
        const CancellationToken token = record_->cancellation->token();
        if (record_->direction == TransferDirection::Upload) {
            job = session_->upload(record_->localPath, record_->remotePath, record_->resumeOffset, token);
        } else {
            job = session_->download(record_->remotePath, record_->localPath, record_->resumeOffset, token);
        }
    }

    if (!job) {
        settle(RemoteTransferJob::Result::Failed, tr("Session unavailable"));
        return true;
    }

    job_ = job;
    connect(job, &RemoteTransferJob::progress, this, &TransferExecutor::onJobProgress);
    connect(job, &RemoteTransferJob::finished, this, &TransferExecutor::onJobFinished);
    connect(job, &QObject::destroyed, this, &TransferExecutor::onJobDestroyed);

    if (job->isFinished()) {
        // The finished() signal was emitted before we could connect
        QMetaObject::invokeMethod(this, &TransferExecutor::onJobFinished, Qt::QueuedConnection);
    }
    return true;
}

void TransferExecutor::onJobProgress(qint64 bytesTransferred, qint64 totalBytes)
{
    if (!record_ || record_->status != TransferStatus::InProgress) {
        return;
    }

    if (record_->totalBytes <= 0 && totalBytes > 0) {
        record_->totalBytes = totalBytes;
    }
    record_->updateProgress(bytesTransferred);
    emit recordChanged(record_->id);
}

void TransferExecutor::onJobFinished()
{
    if (!record_ || !job_ || !job_->isFinished()) {
        return;
    }
    settle(job_->result(), job_->errorString());
}

void TransferExecutor::onJobDestroyed()
{
    // Only reached when the session deleted a job that never finished
    if (record_) {
        job_ = nullptr;
        settle(RemoteTransferJob::Result::Failed, tr("Transfer aborted by session"));
    }
}

void TransferExecutor::releaseJob()
{
    if (job_) {
        disconnect(job_, nullptr, this, nullptr);
        job_->deleteLater();
        job_ = nullptr;
    }
}

void TransferExecutor::settle(RemoteTransferJob::Result result, const QString &errorMessage)
{
    std::shared_ptr<TransferRecord> record = std::move(record_);
    record_.reset();
    releaseJob();

    if (!record) {
        return;
    }

    switch (result) {
    case RemoteTransferJob::Result::Succeeded:
        if (record->status == TransferStatus::Cancelled) {
            // Cancel command won the race; keep the user's decision
            tracker_.apply(*record);
            break;
        }
        record->transitionTo(TransferStatus::Completed);
        record->transferredBytes = record->totalBytes;
        record->canResume = false;
        qDebug() << "TransferExecutor:" << transferDirectionToString(record->direction)
                 << "completed:" << record->localPath << "<->" << record->remotePath;
        break;

    case RemoteTransferJob::Result::Cancelled:
        if (record->status != TransferStatus::Cancelled) {
            record->transitionTo(TransferStatus::Cancelled);
        }
        qDebug() << "TransferExecutor: transfer cancelled:" << record->fileName;
        tracker_.apply(*record);
        break;

    case RemoteTransferJob::Result::Failed:
    case RemoteTransferJob::Result::Running:
        if (record->status != TransferStatus::Cancelled) {
            record->transitionTo(TransferStatus::Failed);
            record->errorMessage = errorMessage.isEmpty() ? tr("Transfer failed") : errorMessage;
        }
        qWarning() << "TransferExecutor: transfer failed:" << record->fileName << "-" << errorMessage;
        tracker_.apply(*record);
        break;
    }

    record->completedAt = QDateTime::currentDateTime();

    if (record->cancellation) {
        record->cancellation->dispose();
        record->cancellation.reset();
    }

    const QUuid id = record->id;
    const bool completed = record->status == TransferStatus::Completed;
    const TransferDirection direction = record->direction;

    emit recordChanged(id);
    emit settled(id);

    if (completed) {
        if (direction == TransferDirection::Upload) {
            emit remoteRefreshRequested();
        } else {
            emit localRefreshRequested();
        }
    }
}
