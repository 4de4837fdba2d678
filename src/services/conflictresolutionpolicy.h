/**
 * @file conflictresolutionpolicy.h
 * @brief Decisions for destinations that already exist.
 */

#ifndef CONFLICTRESOLUTIONPOLICY_H
#define CONFLICTRESOLUTIONPOLICY_H

#include <QString>
#include <functional>
#include <optional>

#include "models/transferrecord.h"

enum class ConflictAction { Overwrite, Skip, Resume, KeepBoth };

/// @brief Convert ConflictAction to string for debugging
[[nodiscard]] inline const char* conflictActionToString(ConflictAction action) {
    switch (action) {
        case ConflictAction::Overwrite: return "Overwrite";
        case ConflictAction::Skip: return "Skip";
        case ConflictAction::Resume: return "Resume";
        case ConflictAction::KeepBoth: return "KeepBoth";
    }
    return "Unknown";
}

/**
 * @brief Answer to one conflict prompt.
 *
 * When applyToAll is set the action is reused for every remaining
 * conflict of the same batch without asking again.
 */
struct ConflictDecision {
    ConflictAction action = ConflictAction::Overwrite;
    bool applyToAll = false;
};

/**
 * @brief Everything a prompt needs to describe one conflict.
 */
struct ConflictRequest {
    TransferDirection direction = TransferDirection::Upload;
    QString localPath;
    QString remotePath;
    qint64 existingSize = 0;  ///< Size of the destination that already exists
    qint64 totalSize = 0;     ///< Size of the source (0 if unknown)
    bool canResume = false;
};

/**
 * @brief Asks the user how to handle a conflict.
 *
 * Returning nullopt aborts the remaining classification of the batch.
 * Called once per conflict, strictly in sequence.
 */
using ConflictResolver = std::function<std::optional<ConflictDecision>(const ConflictRequest &request)>;

/**
 * @brief Pure decision rules shared by batch classification and resume.
 */
class ConflictResolutionPolicy
{
public:
    /// Number of " (n)" candidates probed before falling back to a random suffix
    static constexpr int MaxNumberedCandidates = 999;

    /**
     * @brief Resume is possible only for a partial destination of a known-size source.
     * @return True iff 0 < existingSize < totalSize.
     */
    [[nodiscard]] static bool canResume(qint64 existingSize, qint64 totalSize);

    /**
     * @brief Maps the requested action to the one that will actually be applied.
     *
     * Resume degrades to Skip when the destination is already complete
     * (existingSize >= totalSize > 0) and to Overwrite when either size
     * is unknown or zero. Other actions pass through.
     */
    [[nodiscard]] static ConflictAction effectiveAction(ConflictAction requested,
                                                        qint64 existingSize,
                                                        qint64 totalSize);

    /**
     * @brief Builds "<stem> (n)<.ext>" inside the same directory.
     * @param separator '/' for remote paths, QDir separator semantics for local ones.
     */
    [[nodiscard]] static QString numberedCandidate(const QString &path, int n, QChar separator = QLatin1Char('/'));

    /**
     * @brief Finds a path that does not collide with an existing one.
     * @param path The colliding path.
     * @param exists Existence probe for candidates.
     * @param separator Path separator used by @p path.
     * @return The first free " (n)" candidate for n = 1..999, otherwise a
     *         candidate with a random suffix.
     */
    [[nodiscard]] static QString uniquePath(const QString &path,
                                            const std::function<bool(const QString &)> &exists,
                                            QChar separator = QLatin1Char('/'));

    /**
     * @brief uniquePath() against the local filesystem.
     */
    [[nodiscard]] static QString uniqueLocalPath(const QString &localPath);
};

#endif // CONFLICTRESOLUTIONPOLICY_H
