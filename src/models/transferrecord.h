/**
 * @file transferrecord.h
 * @brief A single tracked upload or download.
 */

#ifndef TRANSFERRECORD_H
#define TRANSFERRECORD_H

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QUuid>
#include <memory>
#include <optional>

#include "utils/cancellationtoken.h"

enum class TransferDirection { Upload, Download };

/**
 * @brief Lifecycle of a transfer.
 *
 * Pending -> InProgress -> {Completed | Failed | Cancelled}. Failed and
 * Cancelled can be re-armed to Pending by retry/resume; Completed is final.
 */
enum class TransferStatus { Pending, InProgress, Completed, Failed, Cancelled };

/// @brief Convert TransferStatus to string for debugging
[[nodiscard]] inline const char* transferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending: return "Pending";
        case TransferStatus::InProgress: return "InProgress";
        case TransferStatus::Completed: return "Completed";
        case TransferStatus::Failed: return "Failed";
        case TransferStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Convert TransferDirection to string for debugging
[[nodiscard]] inline const char* transferDirectionToString(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "Upload" : "Download";
}

/**
 * @brief Returns true if a record may move from @p from to @p to.
 */
[[nodiscard]] bool isValidTransition(TransferStatus from, TransferStatus to);

/**
 * @brief Formats a byte rate, e.g. "1.5 MB/s" (1024 based).
 */
[[nodiscard]] QString formatSpeed(double bytesPerSecond);

struct TransferRecord {
    QUuid id = QUuid::createUuid();

    QString fileName;
    QString localPath;
    QString remotePath;
    TransferDirection direction = TransferDirection::Upload;

    qint64 totalBytes = 0;
    qint64 transferredBytes = 0;
    qint64 resumeOffset = 0;
    bool canResume = false;

    TransferStatus status = TransferStatus::Pending;
    QString errorMessage;
    QDateTime startedAt;
    QDateTime completedAt;

    // Present only while the transfer body runs
    std::shared_ptr<CancellationSource> cancellation;

    /**
     * @brief Percentage complete, clamped to [0, 100].
     * @return nullopt when the total size is unknown (zero).
     */
    [[nodiscard]] std::optional<double> progressPercent() const;

    [[nodiscard]] bool isActive() const {
        return status == TransferStatus::Pending || status == TransferStatus::InProgress;
    }
    [[nodiscard]] bool isSettled() const {
        return status == TransferStatus::Completed || status == TransferStatus::Failed ||
               status == TransferStatus::Cancelled;
    }

    [[nodiscard]] bool showCancelButton() const { return status == TransferStatus::InProgress; }
    [[nodiscard]] bool showRetryButton() const {
        return status == TransferStatus::Failed || status == TransferStatus::Cancelled;
    }
    [[nodiscard]] bool showResumeButton() const { return showRetryButton() && canResume; }

    [[nodiscard]] QString statusDisplay() const;
    [[nodiscard]] QString directionDisplay() const;

    /**
     * @brief Average speed since the transfer started.
     * @param now Reference time (injected for testing).
     * @return Empty unless InProgress for at least half a second.
     */
    [[nodiscard]] QString speedDisplay(const QDateTime &now = QDateTime::currentDateTime()) const;

    /**
     * @brief Moves to @p to if isValidTransition() allows it.
     * @return False (and a logged warning) for a rejected transition.
     */
    bool transitionTo(TransferStatus to);

    /**
     * @brief Clamps resumeOffset into [0, totalBytes] and pre-seeds progress from it.
     *
     * Keeps a resumed transfer from visually restarting at zero.
     */
    void initializeResumeProgress();

    /**
     * @brief Records a progress report from the session.
     * @param bytes Absolute byte position (resume offset included).
     */
    void updateProgress(qint64 bytes);
};

Q_DECLARE_METATYPE(TransferDirection)
Q_DECLARE_METATYPE(TransferStatus)

#endif // TRANSFERRECORD_H
