/**
 * @file batchcoordinator.h
 * @brief Turns a user's file selection into queued transfers.
 *
 * The coordinator classifies each selected file against its destination,
 * asks the UI how to resolve conflicts and feeds accepted transfers into
 * the TransferQueue.
 */

#ifndef BATCHCOORDINATOR_H
#define BATCHCOORDINATOR_H

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <functional>
#include <optional>

#include "conflictresolutionpolicy.h"
#include "models/transferrecord.h"

class ISftpSession;
class TransferQueue;

/**
 * @brief Outcome of one uploadFiles()/downloadFiles() call.
 *
 * enqueued == requested - skipped - inaccessible - unclassified always holds.
 */
struct BatchResult {
    TransferDirection direction = TransferDirection::Upload;
    int requested = 0;     ///< Number of source paths passed in
    int enqueued = 0;      ///< Records handed to the queue
    int skipped = 0;       ///< Conflicts resolved as Skip (including degraded Resume)
    int inaccessible = 0;  ///< Sources that could not be read or sized
    int unclassified = 0;  ///< Sources never looked at because the batch was aborted
    bool aborted = false;  ///< The resolver stopped the batch, or no session was available
    QList<QUuid> recordIds;
};

Q_DECLARE_METATYPE(BatchResult)

/**
 * @brief Entry point for batch uploads and downloads.
 *
 * Conflicts are resolved strictly one at a time, in selection order,
 * because the resolver usually shows a modal prompt. Each accepted file
 * is enqueued immediately, so transfers may start while later files are
 * still being classified. The calls return once every file has been
 * classified or the batch was aborted, not when the transfers finish.
 *
 * @par Example usage:
 * @code
 * BatchCoordinator *coordinator = new BatchCoordinator(session, queue, this);
 * coordinator->setUniqueRemotePathProvider([browser](const QString &path) {
 *     return browser->suggestUniqueName(path);
 * });
 *
 * coordinator->uploadFiles(selectedFiles, "/home/user/dest",
 *     [this](const ConflictRequest &request) -> std::optional<ConflictDecision> {
 *         return showConflictDialog(request);  // nullopt when the user hits Cancel
 *     });
 * @endcode
 */
class BatchCoordinator : public QObject
{
    Q_OBJECT

public:
    /// Size of a remote source; nullopt when it cannot be read
    using RemoteFileSizeLookup = std::function<std::optional<qint64>(const QString &remotePath)>;

    /// Non-colliding alternative for an existing remote path
    using UniqueRemotePathProvider = std::function<QString(const QString &remotePath)>;

    /**
     * @brief Constructs a coordinator.
     * @param session Session used for remote metadata probes (not owned).
     * @param queue Queue receiving accepted transfers (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit BatchCoordinator(ISftpSession *session,
                              TransferQueue *queue,
                              QObject *parent = nullptr);
    ~BatchCoordinator() override;

    /**
     * @brief Queues uploads of local files into a remote directory.
     * @param localPaths Files to upload; directories count as inaccessible.
     * @param remoteDestDir Destination directory on the server.
     * @param resolver Called for each existing destination. An empty
     *        resolver overwrites.
     * @param applyToAll Resolution used for every conflict of this batch
     *        without calling @p resolver.
     */
    BatchResult uploadFiles(const QStringList &localPaths,
                            const QString &remoteDestDir,
                            const ConflictResolver &resolver,
                            std::optional<ConflictAction> applyToAll = std::nullopt);

    /**
     * @brief Queues downloads of remote files into a local directory.
     * @param remotePaths Files to download.
     * @param localDestDir Destination directory on this machine.
     * @param resolver Called for each existing destination. An empty
     *        resolver overwrites.
     * @param applyToAll Resolution used for every conflict of this batch
     *        without calling @p resolver.
     */
    BatchResult downloadFiles(const QStringList &remotePaths,
                              const QString &localDestDir,
                              const ConflictResolver &resolver,
                              std::optional<ConflictAction> applyToAll = std::nullopt);

    /**
     * @brief Applies @p action to every remaining conflict of the running batch.
     *
     * Meant to be called from inside the resolver. Has no effect when no
     * batch is running. An override never outlives its batch; pass
     * applyToAll to uploadFiles()/downloadFiles() to preset one.
     */
    void setApplyToAllResolution(ConflictAction action);

    void setRemoteFileSizeLookup(RemoteFileSizeLookup lookup) { sizeLookup_ = std::move(lookup); }
    void setUniqueRemotePathProvider(UniqueRemotePathProvider provider) { uniqueRemotePathProvider_ = std::move(provider); }

    [[nodiscard]] bool isBatchRunning() const { return !activeBatches_.isEmpty(); }

signals:
    void batchStarted(TransferDirection direction, int fileCount);
    void batchFinished(const BatchResult &result);

    // Status messages (for user feedback)
    void statusMessage(const QString &message, int timeout);

private:
    struct Candidate {
        QString localPath;
        QString remotePath;
    };

    // Per-call state; lives on the stack of processBatch()
    struct BatchContext {
        std::optional<ConflictAction> applyToAll;
    };

    enum class Classification { Enqueued, Skipped, Inaccessible, Abort };

    BatchResult processBatch(const QList<Candidate> &candidates,
                             TransferDirection direction,
                             const ConflictResolver &resolver,
                             std::optional<ConflictAction> applyToAll);
    Classification classify(const Candidate &candidate,
                            TransferDirection direction,
                            const ConflictResolver &resolver,
                            BatchContext &context,
                            BatchResult &result);
    void enqueueRecord(const QString &localPath,
                       const QString &remotePath,
                       TransferDirection direction,
                       qint64 totalBytes,
                       qint64 resumeOffset,
                       BatchResult &result);

    [[nodiscard]] std::optional<qint64> remoteSourceSize(const QString &remotePath);
    [[nodiscard]] QString uniqueRemotePath(const QString &remotePath);

    QPointer<ISftpSession> session_;
    QPointer<TransferQueue> queue_;
    RemoteFileSizeLookup sizeLookup_;
    UniqueRemotePathProvider uniqueRemotePathProvider_;

    // Innermost batch last; a resolver running a nested event loop may start another batch
    QList<BatchContext *> activeBatches_;
};

#endif // BATCHCOORDINATOR_H
