#include "remotetransferjob.h"

#include <QDebug>

RemoteTransferJob::RemoteTransferJob(QObject *parent)
    : QObject(parent)
{
}

void RemoteTransferJob::reportProgress(qint64 bytesTransferred, qint64 totalBytes)
{
    if (isFinished()) {
        return;
    }
    emit progress(bytesTransferred, totalBytes);
}

void RemoteTransferJob::finishSucceeded()
{
    finish(Result::Succeeded, QString());
}

void RemoteTransferJob::finishFailed(const QString &message)
{
    finish(Result::Failed, message);
}

void RemoteTransferJob::finishCancelled()
{
    finish(Result::Cancelled, QString());
}

void RemoteTransferJob::finish(Result result, const QString &message)
{
    if (isFinished()) {
        qWarning() << "RemoteTransferJob: ignoring second completion" << result
                   << "after" << result_;
        return;
    }

    result_ = result;
    errorString_ = message;
    emit finished();
}
