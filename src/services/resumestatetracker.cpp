#include "resumestatetracker.h"
#include "utils/logging.h"

#include <QFileInfo>

ResumeStateTracker::ResumeStateTracker(ISftpSession *session)
    : session_(session)
{
}

qint64 ResumeStateTracker::probeDestinationSize(const TransferRecord &record) const
{
    if (record.direction == TransferDirection::Upload) {
        if (!session_) {
            return 0;
        }
        QString error;
        const auto info = session_->fileInfo(record.remotePath, &error);
        if (!info) {
            if (!error.isEmpty()) {
                LOG_VERBOSE() << "ResumeStateTracker: remote probe failed for"
                              << record.remotePath << "-" << error;
            }
            return 0;
        }
        return info->isDirectory ? 0 : info->size;
    }

    const QFileInfo localInfo(record.localPath);
    if (!localInfo.exists() || !localInfo.isFile()) {
        return 0;
    }
    return localInfo.size();
}

ResumeState ResumeStateTracker::evaluate(qint64 existingSize, qint64 totalBytes)
{
    ResumeState state;
    if (totalBytes > 0 && existingSize > 0 && existingSize < totalBytes) {
        state.canResume = true;
        state.resumeOffset = existingSize;
    }
    return state;
}

ResumeState ResumeStateTracker::evaluate(const TransferRecord &record) const
{
    if (record.totalBytes <= 0) {
        return ResumeState();
    }
    return evaluate(probeDestinationSize(record), record.totalBytes);
}

void ResumeStateTracker::apply(TransferRecord &record) const
{
    const ResumeState state = evaluate(record);
    record.canResume = state.canResume;
    record.resumeOffset = state.resumeOffset;
    if (state.canResume) {
        record.transferredBytes = state.resumeOffset;
    }
}
