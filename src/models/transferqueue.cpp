#include "transferqueue.h"
#include "services/isftpsession.h"
#include "services/transferexecutor.h"
#include "utils/logging.h"

#include <QDebug>
#include <QThread>
#include <QTimer>

TransferQueue::TransferQueue(ISftpSession *session, QObject *parent)
    : QAbstractListModel(parent)
    , executor_(new TransferExecutor(session, this))
{
    connect(executor_, &TransferExecutor::started,
            this, &TransferQueue::onExecutorStarted);
    connect(executor_, &TransferExecutor::recordChanged,
            this, &TransferQueue::onExecutorRecordChanged);
    connect(executor_, &TransferExecutor::settled,
            this, &TransferQueue::onExecutorSettled);
    connect(executor_, &TransferExecutor::remoteRefreshRequested,
            this, &TransferQueue::remoteRefreshRequested);
    connect(executor_, &TransferExecutor::localRefreshRequested,
            this, &TransferQueue::localRefreshRequested);
}

TransferQueue::~TransferQueue()
{
    // Disconnect from the executor BEFORE this object is destroyed.
    // The executor is a child and is deleted in QObject::~QObject(),
    // after records_ is already gone.
    disconnect(executor_, nullptr, this, nullptr);
}

void TransferQueue::setSession(ISftpSession *session)
{
    executor_->setSession(session);
}

bool TransferQueue::isOwnerThread() const
{
    return QThread::currentThread() == thread();
}

void TransferQueue::scheduleEvent(std::function<void()> event)
{
    eventQueue_.enqueue(std::move(event));

    // Schedule event processing if not already scheduled
    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &TransferQueue::processEventQueue);
    }
}

void TransferQueue::processEventQueue()
{
    eventProcessingScheduled_ = false;

    // Re-entrancy guard: if we're already processing, let the outer call finish
    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &TransferQueue::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void TransferQueue::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

QUuid TransferQueue::enqueue(TransferRecord record)
{
    const QUuid id = record.id;

    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, record]() { enqueue(record); },
                                  Qt::QueuedConnection);
        return id;
    }

    if (indexOf(id) >= 0) {
        qWarning() << "TransferQueue: ignoring duplicate record id" << id;
        return id;
    }

    record.status = TransferStatus::Pending;
    record.cancellation.reset();
    record.initializeResumeProgress();

    LOG_VERBOSE() << "TransferQueue: enqueue" << transferDirectionToString(record.direction)
                  << record.fileName << "offset:" << record.resumeOffset
                  << "total:" << record.totalBytes;

    const int row = records_.size();
    beginInsertRows(QModelIndex(), row, row);
    records_.append(std::make_shared<TransferRecord>(std::move(record)));
    endInsertRows();

    notifyCountsChanged();
    scheduleDrain();
    return id;
}

void TransferQueue::scheduleDrain()
{
    if (draining_) {
        // The active pass picks up new Pending records on its next iteration
        return;
    }
    draining_ = true;
    scheduleEvent([this]() { drainNext(); });
}

void TransferQueue::drainNext()
{
    if (executor_->isBusy()) {
        // The settle handler continues the pass
        return;
    }

    for (const auto &record : records_) {
        if (record->status != TransferStatus::Pending) {
            continue;
        }
        if (executor_->execute(record)) {
            return;
        }
        qWarning() << "TransferQueue: could not start" << record->fileName;
        break;
    }

    LOG_VERBOSE() << "TransferQueue: drain pass finished";
    draining_ = false;
    emit queueDrained();
}

void TransferQueue::onExecutorStarted(const QUuid &id)
{
    const int row = indexOf(id);
    if (row < 0) {
        return;
    }
    emit transferStarted(records_[row]->fileName, records_[row]->direction);
    notifyCountsChanged();
}

void TransferQueue::onExecutorRecordChanged(const QUuid &id)
{
    const int row = indexOf(id);
    if (row >= 0) {
        notifyRowChanged(row);
    }
}

void TransferQueue::onExecutorSettled(const QUuid &id)
{
    const int row = indexOf(id);
    if (row >= 0) {
        const TransferRecord &record = *records_[row];
        switch (record.status) {
        case TransferStatus::Completed:
            emit transferCompleted(record.fileName);
            if (settings_.autoRemoveCompleted) {
                scheduleAutoRemoval(id);
            }
            break;
        case TransferStatus::Failed:
            emit transferFailed(record.fileName, record.errorMessage);
            break;
        case TransferStatus::Cancelled:
            emit transferCancelled(record.fileName);
            break;
        case TransferStatus::Pending:
        case TransferStatus::InProgress:
            qWarning() << "TransferQueue: settled record in state"
                       << transferStatusToString(record.status);
            break;
        }
        notifyCountsChanged();
    }

    // Keep the pass going; a failed transfer never stops the queue
    scheduleEvent([this]() { drainNext(); });
}

bool TransferQueue::cancelRecord(TransferRecord &record)
{
    switch (record.status) {
    case TransferStatus::InProgress:
        // The source may already be disposed if the job settled concurrently
        if (record.cancellation) {
            record.cancellation->cancel();
        }
        return record.transitionTo(TransferStatus::Cancelled);

    case TransferStatus::Pending:
        if (!record.transitionTo(TransferStatus::Cancelled)) {
            return false;
        }
        record.completedAt = QDateTime::currentDateTime();
        emit transferCancelled(record.fileName);
        return true;

    case TransferStatus::Completed:
    case TransferStatus::Failed:
    case TransferStatus::Cancelled:
        break;
    }
    return false;
}

void TransferQueue::cancel(const QUuid &id)
{
    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, id]() { cancel(id); }, Qt::QueuedConnection);
        return;
    }

    const int row = indexOf(id);
    if (row < 0) {
        return;
    }
    if (cancelRecord(*records_[row])) {
        notifyRowChanged(row);
        notifyCountsChanged();
    }
}

void TransferQueue::cancelAll()
{
    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this]() { cancelAll(); }, Qt::QueuedConnection);
        return;
    }

    bool changed = false;
    for (int row = 0; row < records_.size(); ++row) {
        if (cancelRecord(*records_[row])) {
            notifyRowChanged(row);
            changed = true;
        }
    }

    if (changed) {
        notifyCountsChanged();
    }
    emit transfersCancelled();
}

bool TransferQueue::retry(const QUuid &id)
{
    if (!isOwnerThread()) {
        bool accepted = false;
        QMetaObject::invokeMethod(this, [this, id, &accepted]() { accepted = retry(id); },
                                  Qt::BlockingQueuedConnection);
        return accepted;
    }

    const int row = indexOf(id);
    if (row < 0 || executor_->isExecuting(id)) {
        return false;
    }

    TransferRecord &record = *records_[row];
    if (!record.showRetryButton()) {
        return false;
    }

    record.errorMessage.clear();
    record.resumeOffset = 0;
    record.canResume = false;
    record.transferredBytes = 0;
    record.startedAt = QDateTime();
    record.completedAt = QDateTime();
    record.transitionTo(TransferStatus::Pending);

    LOG_VERBOSE() << "TransferQueue: retry" << record.fileName;

    notifyRowChanged(row);
    notifyCountsChanged();
    scheduleDrain();
    return true;
}

bool TransferQueue::resume(const QUuid &id)
{
    if (!isOwnerThread()) {
        bool accepted = false;
        QMetaObject::invokeMethod(this, [this, id, &accepted]() { accepted = resume(id); },
                                  Qt::BlockingQueuedConnection);
        return accepted;
    }

    const int row = indexOf(id);
    if (row < 0 || executor_->isExecuting(id)) {
        return false;
    }

    TransferRecord &record = *records_[row];
    if (!record.showRetryButton()) {
        return false;
    }

    executor_->resumeStateTracker().apply(record);
    if (!record.canResume) {
        LOG_VERBOSE() << "TransferQueue: cannot resume" << record.fileName;
        notifyRowChanged(row);
        return false;
    }

    record.errorMessage.clear();
    record.startedAt = QDateTime();
    record.completedAt = QDateTime();
    record.transitionTo(TransferStatus::Pending);
    record.initializeResumeProgress();

    LOG_VERBOSE() << "TransferQueue: resume" << record.fileName << "at" << record.resumeOffset;

    notifyRowChanged(row);
    notifyCountsChanged();
    scheduleDrain();
    return true;
}

bool TransferQueue::remove(const QUuid &id)
{
    if (!isOwnerThread()) {
        bool removed = false;
        QMetaObject::invokeMethod(this, [this, id, &removed]() { removed = remove(id); },
                                  Qt::BlockingQueuedConnection);
        return removed;
    }

    const int row = indexOf(id);
    if (row < 0 || records_[row]->status == TransferStatus::InProgress || executor_->isExecuting(id)) {
        return false;
    }

    removeRecordAt(row);
    notifyCountsChanged();
    return true;
}

void TransferQueue::clearCompleted()
{
    if (!isOwnerThread()) {
        QMetaObject::invokeMethod(this, [this]() { clearCompleted(); }, Qt::QueuedConnection);
        return;
    }

    // A cancelled record stays until its transfer body has settled, as in remove()
    bool removedAny = false;
    for (int row = records_.size() - 1; row >= 0; --row) {
        if (records_[row]->isSettled() && !executor_->isExecuting(records_[row]->id)) {
            removeRecordAt(row);
            removedAny = true;
        }
    }

    if (removedAny) {
        notifyCountsChanged();
    }
}

void TransferQueue::scheduleAutoRemoval(const QUuid &id)
{
    QTimer::singleShot(settings_.autoRemoveDelayMs, this, [this, id]() {
        removeIfStillCompleted(id);
    });
}

void TransferQueue::removeIfStillCompleted(const QUuid &id)
{
    const int row = indexOf(id);
    if (row < 0 || records_[row]->status != TransferStatus::Completed) {
        return;
    }

    LOG_VERBOSE() << "TransferQueue: auto-removing" << records_[row]->fileName;
    removeRecordAt(row);
    notifyCountsChanged();
}

void TransferQueue::removeRecordAt(int row)
{
    beginRemoveRows(QModelIndex(), row, row);
    records_.removeAt(row);
    endRemoveRows();
}

void TransferQueue::notifyRowChanged(int row)
{
    const QModelIndex changed = index(row);
    emit dataChanged(changed, changed);
    emit recordChanged(records_[row]->id);
}

void TransferQueue::notifyCountsChanged()
{
    const int count = activeCount();
    if (count != lastActiveCount_) {
        lastActiveCount_ = count;
        emit activeCountChanged(count);
    }
    emit queueChanged();
}

int TransferQueue::activeCount() const
{
    int count = 0;
    for (const auto &record : records_) {
        if (record->isActive()) {
            count++;
        }
    }
    return count;
}

int TransferQueue::pendingCount() const
{
    int count = 0;
    for (const auto &record : records_) {
        if (record->status == TransferStatus::Pending) {
            count++;
        }
    }
    return count;
}

std::optional<TransferRecord> TransferQueue::record(const QUuid &id) const
{
    const int row = indexOf(id);
    if (row < 0) {
        return std::nullopt;
    }
    TransferRecord snapshot = *records_[row];
    snapshot.cancellation.reset();
    return snapshot;
}

QList<QUuid> TransferQueue::recordIds() const
{
    QList<QUuid> ids;
    ids.reserve(records_.size());
    for (const auto &record : records_) {
        ids.append(record->id);
    }
    return ids;
}

int TransferQueue::indexOf(const QUuid &id) const
{
    for (int i = 0; i < records_.size(); ++i) {
        if (records_[i]->id == id) {
            return i;
        }
    }
    return -1;
}

int TransferQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return records_.size();
}

QVariant TransferQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= records_.size()) {
        return QVariant();
    }

    const TransferRecord &record = *records_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return record.fileName;
    case IdRole:
        return record.id;
    case LocalPathRole:
        return record.localPath;
    case RemotePathRole:
        return record.remotePath;
    case DirectionRole:
        return static_cast<int>(record.direction);
    case StatusRole:
        return static_cast<int>(record.status);
    case ProgressRole: {
        const auto percent = record.progressPercent();
        return percent ? QVariant(*percent) : QVariant();
    }
    case TransferredBytesRole:
        return record.transferredBytes;
    case TotalBytesRole:
        return record.totalBytes;
    case ResumeOffsetRole:
        return record.resumeOffset;
    case CanResumeRole:
        return record.canResume;
    case ErrorMessageRole:
        return record.errorMessage;
    case StartedAtRole:
        return record.startedAt;
    case CompletedAtRole:
        return record.completedAt;
    case StatusDisplayRole:
        return record.statusDisplay();
    case SpeedDisplayRole:
        return record.speedDisplay();
    case DirectionDisplayRole:
        return record.directionDisplay();
    case ShowCancelRole:
        return record.showCancelButton();
    case ShowRetryRole:
        return record.showRetryButton();
    case ShowResumeRole:
        return record.showResumeButton();
    }

    return QVariant();
}

QHash<int, QByteArray> TransferQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[IdRole] = "id";
    roles[FileNameRole] = "fileName";
    roles[LocalPathRole] = "localPath";
    roles[RemotePathRole] = "remotePath";
    roles[DirectionRole] = "direction";
    roles[StatusRole] = "status";
    roles[ProgressRole] = "progress";
    roles[TransferredBytesRole] = "transferredBytes";
    roles[TotalBytesRole] = "totalBytes";
    roles[ResumeOffsetRole] = "resumeOffset";
    roles[CanResumeRole] = "canResume";
    roles[ErrorMessageRole] = "errorMessage";
    roles[StartedAtRole] = "startedAt";
    roles[CompletedAtRole] = "completedAt";
    roles[StatusDisplayRole] = "statusDisplay";
    roles[SpeedDisplayRole] = "speedDisplay";
    roles[DirectionDisplayRole] = "directionDisplay";
    roles[ShowCancelRole] = "showCancel";
    roles[ShowRetryRole] = "showRetry";
    roles[ShowResumeRole] = "showResume";
    return roles;
}
