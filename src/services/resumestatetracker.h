/**
 * @file resumestatetracker.h
 * @brief Decides whether an interrupted transfer can continue where it stopped.
 */

#ifndef RESUMESTATETRACKER_H
#define RESUMESTATETRACKER_H

#include <QPointer>

#include "isftpsession.h"
#include "models/transferrecord.h"

/**
 * @brief Eligibility of a record for resuming.
 */
struct ResumeState {
    bool canResume = false;
    qint64 resumeOffset = 0;
};

/**
 * @brief Probes the destination of a transfer to compute its resume offset.
 *
 * Uploads are probed on the session, downloads on the local filesystem.
 * Any probe error counts as an empty destination.
 */
class ResumeStateTracker
{
public:
    explicit ResumeStateTracker(ISftpSession *session = nullptr);

    void setSession(ISftpSession *session) { session_ = session; }

    /**
     * @brief Current size of the transfer destination, 0 if absent or unreadable.
     */
    [[nodiscard]] qint64 probeDestinationSize(const TransferRecord &record) const;

    /**
     * @brief Pure rule: resumable iff 0 < existingSize < totalBytes.
     */
    [[nodiscard]] static ResumeState evaluate(qint64 existingSize, qint64 totalBytes);

    /**
     * @brief Probes the destination and evaluates the record.
     */
    [[nodiscard]] ResumeState evaluate(const TransferRecord &record) const;

    /**
     * @brief Recomputes canResume/resumeOffset on @p record.
     *
     * When resumable, transferredBytes is moved to the offset so progress
     * reflects what is already on the destination.
     */
    void apply(TransferRecord &record) const;

private:
    QPointer<ISftpSession> session_;
};

#endif // RESUMESTATETRACKER_H
