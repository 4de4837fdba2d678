#include "localfoldersession.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QPointer>
#include <QTimer>

struct LocalFolderSession::CopyState {
    QPointer<RemoteTransferJob> job;
    QFile source;
    QFile destination;
    qint64 position = 0;
    qint64 total = 0;
    CancellationToken token;
};

LocalFolderSession::LocalFolderSession(const QString &rootPath, QObject *parent)
    : ISftpSession(parent)
    , rootPath_(QDir::cleanPath(QFileInfo(rootPath).absoluteFilePath()))
{
}

LocalFolderSession::~LocalFolderSession() = default;

void LocalFolderSession::setChunkSize(qint64 bytes)
{
    chunkSize_ = bytes > 0 ? bytes : DefaultChunkSize;
}

bool LocalFolderSession::isConnected() const
{
    return QFileInfo(rootPath_).isDir();
}

QString LocalFolderSession::localPathFor(const QString &remotePath) const
{
    const QString mapped = QDir::cleanPath(rootPath_ + QLatin1Char('/') + remotePath);
    // cleanPath keeps the trailing '/' only for a filesystem root such as "/"
    const QString prefix = rootPath_.endsWith(QLatin1Char('/')) ? rootPath_ : rootPath_ + QLatin1Char('/');
    if (mapped != rootPath_ && !mapped.startsWith(prefix)) {
        return QString();
    }
    return mapped;
}

std::optional<RemoteFileInfo> LocalFolderSession::fileInfo(const QString &remotePath,
                                                           QString *errorString)
{
    const QString mapped = localPathFor(remotePath);
    if (mapped.isEmpty()) {
        if (errorString) {
            *errorString = tr("Path outside session root: %1").arg(remotePath);
        }
        return std::nullopt;
    }

    const QFileInfo info(mapped);
    if (!info.exists()) {
        return std::nullopt;
    }
    if (!info.isReadable()) {
        if (errorString) {
            *errorString = tr("Permission denied: %1").arg(remotePath);
        }
        return std::nullopt;
    }

    RemoteFileInfo result;
    result.path = remotePath;
    result.isDirectory = info.isDir();
    result.size = info.isDir() ? 0 : info.size();
    result.modified = info.lastModified();
    return result;
}

RemoteTransferJob *LocalFolderSession::upload(const QString &localPath,
                                              const QString &remotePath,
                                              qint64 resumeOffset,
                                              const CancellationToken &token)
{
    const QString destination = localPathFor(remotePath);
    if (destination.isEmpty()) {
        return failedJob(tr("Path outside session root: %1").arg(remotePath));
    }
    return startCopy(localPath, destination, resumeOffset, token);
}

RemoteTransferJob *LocalFolderSession::download(const QString &remotePath,
                                                const QString &localPath,
                                                qint64 resumeOffset,
                                                const CancellationToken &token)
{
    const QString source = localPathFor(remotePath);
    if (source.isEmpty()) {
        return failedJob(tr("Path outside session root: %1").arg(remotePath));
    }
    return startCopy(source, localPath, resumeOffset, token);
}

RemoteTransferJob *LocalFolderSession::failedJob(const QString &message)
{
    auto *job = new RemoteTransferJob(this);
    // Jobs must finish asynchronously
    QTimer::singleShot(0, job, [job, message]() { job->finishFailed(message); });
    return job;
}

RemoteTransferJob *LocalFolderSession::startCopy(const QString &sourcePath,
                                                 const QString &destinationPath,
                                                 qint64 resumeOffset,
                                                 const CancellationToken &token)
{
    auto state = std::make_shared<CopyState>();
    state->token = token;
    state->source.setFileName(sourcePath);
    state->destination.setFileName(destinationPath);

    if (!state->source.open(QIODevice::ReadOnly)) {
        return failedJob(tr("Cannot open %1: %2").arg(sourcePath, state->source.errorString()));
    }
    state->total = state->source.size();

    if (!QDir().mkpath(QFileInfo(destinationPath).absolutePath())) {
        return failedJob(tr("Cannot create directory for %1").arg(destinationPath));
    }

    // Never resume past what the destination actually holds
    qint64 offset = qBound<qint64>(0, resumeOffset, state->total);
    if (offset > 0) {
        const qint64 existing = QFileInfo(destinationPath).size();
        if (existing < offset) {
            qWarning() << "LocalFolderSession: destination shorter than resume offset,"
                       << existing << "<" << offset;
            offset = existing;
        }
    }

    const QIODevice::OpenMode mode = offset > 0
        ? QIODevice::ReadWrite
        : QIODevice::WriteOnly | QIODevice::Truncate;
    if (!state->destination.open(mode)) {
        return failedJob(tr("Cannot open %1: %2").arg(destinationPath, state->destination.errorString()));
    }

    if (offset > 0) {
        if (!state->destination.resize(offset) || !state->destination.seek(offset)
            || !state->source.seek(offset)) {
            return failedJob(tr("Cannot resume %1 at byte %2").arg(destinationPath).arg(offset));
        }
    }
    state->position = offset;

    LOG_VERBOSE() << "LocalFolderSession: copy" << sourcePath << "->" << destinationPath
                  << "from" << offset << "of" << state->total;

    auto *job = new RemoteTransferJob(this);
    state->job = job;
    scheduleNextChunk(state);
    return job;
}

void LocalFolderSession::scheduleNextChunk(const std::shared_ptr<CopyState> &state)
{
    // The job is the timer context: deleting it stops the copy
    QTimer::singleShot(0, state->job.data(), [this, state]() { copyNextChunk(state); });
}

void LocalFolderSession::copyNextChunk(const std::shared_ptr<CopyState> &state)
{
    RemoteTransferJob *job = state->job;
    if (!job) {
        return;
    }

    if (state->token.isCancellationRequested()) {
        state->destination.close();
        state->source.close();
        job->finishCancelled();
        return;
    }

    if (state->position < state->total) {
        const QByteArray chunk = state->source.read(qMin(chunkSize_, state->total - state->position));
        if (chunk.isEmpty()) {
            const QString error = state->source.errorString();
            state->destination.close();
            job->finishFailed(tr("Read error: %1").arg(error));
            return;
        }

        const qint64 written = state->destination.write(chunk);
        if (written != chunk.size()) {
            const QString error = state->destination.errorString();
            state->destination.close();
            job->finishFailed(tr("Write error: %1").arg(error));
            return;
        }
        state->position += written;
    }

    job->reportProgress(state->position, state->total);

    if (state->position < state->total) {
        scheduleNextChunk(state);
        return;
    }

    if (!state->destination.flush()) {
        job->finishFailed(tr("Write error: %1").arg(state->destination.errorString()));
        return;
    }
    state->destination.close();
    state->source.close();
    job->finishSucceeded();
}
