/**
 * @file isftpsession.h
 * @brief Interface for the remote file-transfer session.
 *
 * This interface allows dependency injection of sessions, enabling
 * runtime swapping between production and mock implementations for testing.
 */

#ifndef ISFTPSESSION_H
#define ISFTPSESSION_H

#include <QObject>
#include <QString>
#include <optional>

#include "remotefileinfo.h"
#include "remotetransferjob.h"
#include "utils/cancellationtoken.h"

/**
 * @brief Abstract interface for a connected file-transfer session.
 *
 * The transfer engine only needs metadata probing and byte moving.
 * Connection setup, authentication and directory browsing belong to the
 * concrete session.
 *
 * @par Example usage:
 * @code
 * // Production code
 * ISftpSession *session = new LocalFolderSession("/srv/data", this);
 *
 * // Test code
 * ISftpSession *session = new MockSftpSession(this);
 *
 * TransferQueue queue(session);
 * @endcode
 */
class ISftpSession : public QObject
{
    Q_OBJECT

public:
    explicit ISftpSession(QObject *parent = nullptr) : QObject(parent) {}
    ~ISftpSession() override = default;

    /**
     * @brief Checks if the session can move bytes.
     */
    [[nodiscard]] virtual bool isConnected() const = 0;

    /**
     * @brief Probes a remote path.
     * @param remotePath Absolute remote path.
     * @param errorString Receives a description when the probe itself failed.
     * @return Metadata, or nullopt if the path does not exist or could not be probed.
     */
    [[nodiscard]] virtual std::optional<RemoteFileInfo> fileInfo(const QString &remotePath,
                                                                 QString *errorString = nullptr) = 0;

    /// @name Transfers
    /// Both calls return a job owned by the session, or nullptr if the
    /// session cannot start the transfer. Jobs must finish asynchronously.
    /// @{

    /**
     * @brief Uploads a local file.
     * @param localPath Source on the local filesystem.
     * @param remotePath Destination on the server.
     * @param resumeOffset Byte position to continue from (0 = start over).
     * @param token Observed between chunks; the job finishes Cancelled when it fires.
     */
    [[nodiscard]] virtual RemoteTransferJob *upload(const QString &localPath,
                                                    const QString &remotePath,
                                                    qint64 resumeOffset,
                                                    const CancellationToken &token) = 0;

    /**
     * @brief Downloads a remote file.
     * @param remotePath Source on the server.
     * @param localPath Destination on the local filesystem.
     * @param resumeOffset Byte position to continue from (0 = start over).
     * @param token Observed between chunks; the job finishes Cancelled when it fires.
     */
    [[nodiscard]] virtual RemoteTransferJob *download(const QString &remotePath,
                                                      const QString &localPath,
                                                      qint64 resumeOffset,
                                                      const CancellationToken &token) = 0;
    /// @}
};

#endif // ISFTPSESSION_H
