/**
 * @file localfoldersession.h
 * @brief Session backed by a directory on the local filesystem.
 */

#ifndef LOCALFOLDERSESSION_H
#define LOCALFOLDERSESSION_H

#include <QString>
#include <memory>

#include "isftpsession.h"

/**
 * @brief ISftpSession that treats a local directory as the remote root.
 *
 * Remote paths are absolute ("/dir/file") and resolve below rootPath().
 * Paths that escape the root are rejected. Copies run in chunks on the
 * event loop, honour the resume offset and check the cancellation token
 * between chunks, so the transfer engine behaves exactly as it would
 * against a real server.
 */
class LocalFolderSession : public ISftpSession
{
    Q_OBJECT

public:
    static constexpr qint64 DefaultChunkSize = 64 * 1024;

    explicit LocalFolderSession(const QString &rootPath, QObject *parent = nullptr);
    ~LocalFolderSession() override;

    [[nodiscard]] QString rootPath() const { return rootPath_; }

    void setChunkSize(qint64 bytes);
    [[nodiscard]] qint64 chunkSize() const { return chunkSize_; }

    /**
     * @brief Maps a remote path to its location below the root.
     * @return Empty string if the path escapes the root.
     */
    [[nodiscard]] QString localPathFor(const QString &remotePath) const;

    // ISftpSession
    [[nodiscard]] bool isConnected() const override;
    [[nodiscard]] std::optional<RemoteFileInfo> fileInfo(const QString &remotePath,
                                                         QString *errorString = nullptr) override;
    [[nodiscard]] RemoteTransferJob *upload(const QString &localPath,
                                            const QString &remotePath,
                                            qint64 resumeOffset,
                                            const CancellationToken &token) override;
    [[nodiscard]] RemoteTransferJob *download(const QString &remotePath,
                                              const QString &localPath,
                                              qint64 resumeOffset,
                                              const CancellationToken &token) override;

private:
    struct CopyState;

    RemoteTransferJob *startCopy(const QString &sourcePath,
                                 const QString &destinationPath,
                                 qint64 resumeOffset,
                                 const CancellationToken &token);
    RemoteTransferJob *failedJob(const QString &message);
    void scheduleNextChunk(const std::shared_ptr<CopyState> &state);
    void copyNextChunk(const std::shared_ptr<CopyState> &state);

    QString rootPath_;
    qint64 chunkSize_ = DefaultChunkSize;
};

#endif // LOCALFOLDERSESSION_H
