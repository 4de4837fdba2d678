#include "batchcoordinator.h"
#include "isftpsession.h"
#include "models/transferqueue.h"
#include "utils/logging.h"
#include "utils/remotepath.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

BatchCoordinator::BatchCoordinator(ISftpSession *session,
                                   TransferQueue *queue,
                                   QObject *parent)
    : QObject(parent)
    , session_(session)
    , queue_(queue)
{
}

BatchCoordinator::~BatchCoordinator() = default;

BatchResult BatchCoordinator::uploadFiles(const QStringList &localPaths,
                                          const QString &remoteDestDir,
                                          const ConflictResolver &resolver,
                                          std::optional<ConflictAction> applyToAll)
{
    QList<Candidate> candidates;
    candidates.reserve(localPaths.size());
    for (const QString &localPath : localPaths) {
        const QString fileName = QFileInfo(localPath).fileName();
        candidates.append({localPath, RemotePath::join(remoteDestDir, fileName)});
    }

    return processBatch(candidates, TransferDirection::Upload, resolver, applyToAll);
}

BatchResult BatchCoordinator::downloadFiles(const QStringList &remotePaths,
                                            const QString &localDestDir,
                                            const ConflictResolver &resolver,
                                            std::optional<ConflictAction> applyToAll)
{
    const QDir destination(localDestDir);

    QList<Candidate> candidates;
    candidates.reserve(remotePaths.size());
    for (const QString &remotePath : remotePaths) {
        const QString fileName = RemotePath::fileName(remotePath);
        candidates.append({destination.filePath(fileName), remotePath});
    }

    return processBatch(candidates, TransferDirection::Download, resolver, applyToAll);
}

void BatchCoordinator::setApplyToAllResolution(ConflictAction action)
{
    if (activeBatches_.isEmpty()) {
        LOG_VERBOSE() << "BatchCoordinator: no batch running, ignoring apply-to-all"
                      << conflictActionToString(action);
        return;
    }
    activeBatches_.last()->applyToAll = action;
}

BatchResult BatchCoordinator::processBatch(const QList<Candidate> &candidates,
                                           TransferDirection direction,
                                           const ConflictResolver &resolver,
                                           std::optional<ConflictAction> applyToAll)
{
    BatchResult result;
    result.direction = direction;
    result.requested = candidates.size();

    if (!queue_ || !session_ || !session_->isConnected()) {
        qWarning() << "BatchCoordinator: no connected session, dropping"
                   << candidates.size() << "file(s)";
        result.aborted = true;
        result.unclassified = result.requested;
        emit statusMessage(tr("Not connected"), 3000);
        emit batchFinished(result);
        return result;
    }

    emit batchStarted(direction, result.requested);

    BatchContext context;
    context.applyToAll = applyToAll;
    activeBatches_.append(&context);

    for (int i = 0; i < candidates.size(); ++i) {
        const Classification classification = classify(candidates[i], direction, resolver, context, result);

        switch (classification) {
        case Classification::Enqueued:
            break;
        case Classification::Skipped:
            result.skipped++;
            break;
        case Classification::Inaccessible:
            result.inaccessible++;
            break;
        case Classification::Abort:
            // Already-enqueued transfers keep running
            result.aborted = true;
            result.unclassified = candidates.size() - i;
            break;
        }

        if (result.aborted) {
            LOG_VERBOSE() << "BatchCoordinator: batch aborted with"
                          << result.unclassified << "file(s) unclassified";
            break;
        }
    }

    activeBatches_.removeOne(&context);

    if (result.enqueued > 0) {
        const QString message = direction == TransferDirection::Upload
            ? tr("Queued %1 of %2 upload(s)").arg(result.enqueued).arg(result.requested)
            : tr("Queued %1 of %2 download(s)").arg(result.enqueued).arg(result.requested);
        emit statusMessage(message, 3000);
    }

    emit batchFinished(result);
    return result;
}

BatchCoordinator::Classification BatchCoordinator::classify(const Candidate &candidate,
                                                            TransferDirection direction,
                                                            const ConflictResolver &resolver,
                                                            BatchContext &context,
                                                            BatchResult &result)
{
    bool exists = false;
    qint64 existingSize = 0;
    qint64 totalSize = 0;

    if (direction == TransferDirection::Upload) {
        const QFileInfo source(candidate.localPath);
        if (!source.exists() || !source.isFile() || !source.isReadable()) {
            qWarning() << "BatchCoordinator: source file not accessible:" << candidate.localPath;
            return Classification::Inaccessible;
        }
        totalSize = source.size();

        // A failed probe means "absent"; the transfer itself will report real errors
        QString error;
        const auto remote = session_->fileInfo(candidate.remotePath, &error);
        if (remote) {
            exists = true;
            existingSize = remote->isDirectory ? 0 : remote->size;
        } else if (!error.isEmpty()) {
            LOG_VERBOSE() << "BatchCoordinator: probe failed for" << candidate.remotePath << "-" << error;
        }
    } else {
        const auto size = remoteSourceSize(candidate.remotePath);
        if (!size) {
            qWarning() << "BatchCoordinator: remote source not accessible:" << candidate.remotePath;
            return Classification::Inaccessible;
        }
        totalSize = *size;

        const QFileInfo destination(candidate.localPath);
        exists = destination.exists();
        existingSize = (exists && destination.isFile()) ? destination.size() : 0;
    }

    if (!exists) {
        enqueueRecord(candidate.localPath, candidate.remotePath, direction, totalSize, 0, result);
        return Classification::Enqueued;
    }

    ConflictAction requested = ConflictAction::Overwrite;
    if (context.applyToAll) {
        requested = *context.applyToAll;
    } else if (resolver) {
        ConflictRequest request;
        request.direction = direction;
        request.localPath = candidate.localPath;
        request.remotePath = candidate.remotePath;
        request.existingSize = existingSize;
        request.totalSize = totalSize;
        request.canResume = ConflictResolutionPolicy::canResume(existingSize, totalSize);

        const std::optional<ConflictDecision> decision = resolver(request);
        if (!decision) {
            return Classification::Abort;
        }
        requested = decision->action;
        if (decision->applyToAll) {
            context.applyToAll = decision->action;
        }
    }

    const ConflictAction action = ConflictResolutionPolicy::effectiveAction(requested, existingSize, totalSize);
    LOG_VERBOSE() << "BatchCoordinator: conflict on"
                  << (direction == TransferDirection::Upload ? candidate.remotePath : candidate.localPath)
                  << "requested:" << conflictActionToString(requested)
                  << "applied:" << conflictActionToString(action);

    switch (action) {
    case ConflictAction::Skip:
        return Classification::Skipped;

    case ConflictAction::Resume:
        enqueueRecord(candidate.localPath, candidate.remotePath, direction, totalSize, existingSize, result);
        return Classification::Enqueued;

    case ConflictAction::KeepBoth:
        if (direction == TransferDirection::Upload) {
            enqueueRecord(candidate.localPath, uniqueRemotePath(candidate.remotePath),
                          direction, totalSize, 0, result);
        } else {
            enqueueRecord(ConflictResolutionPolicy::uniqueLocalPath(candidate.localPath),
                          candidate.remotePath, direction, totalSize, 0, result);
        }
        return Classification::Enqueued;

    case ConflictAction::Overwrite:
        break;
    }

    enqueueRecord(candidate.localPath, candidate.remotePath, direction, totalSize, 0, result);
    return Classification::Enqueued;
}

void BatchCoordinator::enqueueRecord(const QString &localPath,
                                     const QString &remotePath,
                                     TransferDirection direction,
                                     qint64 totalBytes,
                                     qint64 resumeOffset,
                                     BatchResult &result)
{
    TransferRecord record;
    record.fileName = direction == TransferDirection::Upload
        ? QFileInfo(localPath).fileName()
        : RemotePath::fileName(remotePath);
    record.localPath = localPath;
    record.remotePath = remotePath;
    record.direction = direction;
    record.totalBytes = totalBytes;
    record.resumeOffset = resumeOffset;
    record.initializeResumeProgress();

    result.recordIds.append(queue_->enqueue(record));
    result.enqueued++;
}

std::optional<qint64> BatchCoordinator::remoteSourceSize(const QString &remotePath)
{
    if (sizeLookup_) {
        return sizeLookup_(remotePath);
    }

    QString error;
    const auto info = session_->fileInfo(remotePath, &error);
    if (!info || info->isDirectory) {
        if (!error.isEmpty()) {
            LOG_VERBOSE() << "BatchCoordinator: size probe failed for" << remotePath << "-" << error;
        }
        return std::nullopt;
    }
    return info->size;
}

QString BatchCoordinator::uniqueRemotePath(const QString &remotePath)
{
    if (uniqueRemotePathProvider_) {
        return uniqueRemotePathProvider_(remotePath);
    }

    return ConflictResolutionPolicy::uniquePath(
        remotePath,
        [this](const QString &candidate) {
            return session_ && session_->fileInfo(candidate).has_value();
        },
        QLatin1Char('/'));
}
