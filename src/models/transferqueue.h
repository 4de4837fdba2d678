#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QAbstractListModel>
#include <QList>
#include <QQueue>
#include <QString>
#include <QUuid>
#include <functional>
#include <memory>
#include <optional>

#include "models/transferrecord.h"
#include "services/transfersettings.h"

class ISftpSession;
class TransferExecutor;

/**
 * @brief Ordered set of transfer records drained by a single worker.
 *
 * Records run strictly in enqueue order, one at a time. Enqueueing or
 * re-arming a record starts a drain pass unless one is already running;
 * the running pass picks up new Pending records on its next iteration.
 * A failing transfer never stops the pass.
 *
 * The queue and its records belong to the thread the queue lives in.
 * Commands issued from other threads are re-posted to that thread.
 *
 * @par Example usage:
 * @code
 * TransferQueue *queue = new TransferQueue(session, this);
 * connect(queue, &TransferQueue::remoteRefreshRequested,
 *         remoteBrowser, &RemoteBrowser::refresh);
 *
 * TransferRecord record;
 * record.localPath = "/home/me/a.txt";
 * record.remotePath = "/srv/a.txt";
 * record.totalBytes = 1024;
 * queue->enqueue(record);
 * @endcode
 */
class TransferQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        FileNameRole,
        LocalPathRole,
        RemotePathRole,
        DirectionRole,
        StatusRole,
        ProgressRole,
        TransferredBytesRole,
        TotalBytesRole,
        ResumeOffsetRole,
        CanResumeRole,
        ErrorMessageRole,
        StartedAtRole,
        CompletedAtRole,
        StatusDisplayRole,
        SpeedDisplayRole,
        DirectionDisplayRole,
        ShowCancelRole,
        ShowRetryRole,
        ShowResumeRole
    };

    explicit TransferQueue(ISftpSession *session = nullptr, QObject *parent = nullptr);
    ~TransferQueue() override;

    void setSession(ISftpSession *session);

    void setSettings(const TransferSettings &settings) { settings_ = settings; }
    [[nodiscard]] TransferSettings settings() const { return settings_; }

    /// @name Commands
    /// @{

    /**
     * @brief Appends a record and starts draining.
     * @param record A Pending record; its resume offset is clamped to its size.
     * @return The record id.
     */
    QUuid enqueue(TransferRecord record);

    /**
     * @brief Cancels one Pending or InProgress record. No-op for settled records.
     */
    void cancel(const QUuid &id);

    /**
     * @brief Cancels every Pending and InProgress record.
     */
    void cancelAll();

    /**
     * @brief Restarts a Failed or Cancelled record from byte 0.
     * @return False if the record is unknown, not re-armable or still running.
     */
    bool retry(const QUuid &id);

    /**
     * @brief Re-arms a Failed or Cancelled record at its resume offset.
     * @return False if the destination no longer allows resuming.
     */
    bool resume(const QUuid &id);

    /**
     * @brief Removes a record that is not InProgress.
     */
    bool remove(const QUuid &id);

    /**
     * @brief Drops all Completed, Failed and Cancelled records.
     *
     * A cancelled record whose job has not finished yet is kept, like remove().
     */
    void clearCompleted();
    /// @}

    /// @name State
    /// @{
    [[nodiscard]] int activeCount() const;
    [[nodiscard]] bool hasActiveTransfer() const { return activeCount() > 0; }
    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] bool isDraining() const { return draining_; }

    /// @brief Snapshot of a record, nullopt if it is not in the queue.
    [[nodiscard]] std::optional<TransferRecord> record(const QUuid &id) const;
    [[nodiscard]] QList<QUuid> recordIds() const;
    [[nodiscard]] int indexOf(const QUuid &id) const;
    /// @}

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    // For testing: immediately process all pending events
    void flushEventQueue();

signals:
    /// Per-record change notification (status, bytes, timestamps)
    void recordChanged(const QUuid &id);
    void queueChanged();
    void activeCountChanged(int count);

    void transferStarted(const QString &fileName, TransferDirection direction);
    void transferCompleted(const QString &fileName);
    void transferFailed(const QString &fileName, const QString &error);
    void transferCancelled(const QString &fileName);
    void transfersCancelled();

    /// Emitted when a drain pass finds no more Pending records
    void queueDrained();

    void remoteRefreshRequested();
    void localRefreshRequested();

private:
    void scheduleDrain();
    void drainNext();
    void scheduleEvent(std::function<void()> event);
    void processEventQueue();

    void onExecutorStarted(const QUuid &id);
    void onExecutorRecordChanged(const QUuid &id);
    void onExecutorSettled(const QUuid &id);

    void scheduleAutoRemoval(const QUuid &id);
    void removeIfStillCompleted(const QUuid &id);
    void removeRecordAt(int row);

    bool cancelRecord(TransferRecord &record);
    void notifyRowChanged(int row);
    void notifyCountsChanged();

    [[nodiscard]] bool isOwnerThread() const;

    QList<std::shared_ptr<TransferRecord>> records_;
    TransferExecutor *executor_ = nullptr;
    TransferSettings settings_;

    // Drain gate: at most one pass is active
    bool draining_ = false;
    int lastActiveCount_ = 0;

    // Event queue for deferred processing (prevents re-entrancy)
    QQueue<std::function<void()>> eventQueue_;
    bool processingEvents_ = false;  // Re-entrancy guard
    bool eventProcessingScheduled_ = false;  // Prevents multiple timer posts
};

#endif // TRANSFERQUEUE_H
