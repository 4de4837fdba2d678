#include "conflictresolutionpolicy.h"

#include <QFileInfo>
#include <QUuid>

namespace {

struct PathParts {
    QString directory;  // including the trailing separator, may be empty
    QString stem;
    QString extension;  // including the leading dot, may be empty
};

PathParts splitPath(const QString &path, QChar separator)
{
    PathParts parts;
    const qsizetype lastSeparator = path.lastIndexOf(separator);
    parts.directory = lastSeparator >= 0 ? path.left(lastSeparator + 1) : QString();

    const QString name = lastSeparator >= 0 ? path.mid(lastSeparator + 1) : path;
    const qsizetype lastDot = name.lastIndexOf(QLatin1Char('.'));
    if (lastDot > 0) {
        parts.stem = name.left(lastDot);
        parts.extension = name.mid(lastDot);
    } else {
        parts.stem = name;
    }
    return parts;
}

} // namespace

bool ConflictResolutionPolicy::canResume(qint64 existingSize, qint64 totalSize)
{
    return existingSize > 0 && totalSize > 0 && existingSize < totalSize;
}

ConflictAction ConflictResolutionPolicy::effectiveAction(ConflictAction requested,
                                                         qint64 existingSize,
                                                         qint64 totalSize)
{
    if (requested != ConflictAction::Resume) {
        return requested;
    }
    if (totalSize > 0 && existingSize >= totalSize) {
        return ConflictAction::Skip;
    }
    if (existingSize <= 0 || totalSize <= 0) {
        return ConflictAction::Overwrite;
    }
    return ConflictAction::Resume;
}

QString ConflictResolutionPolicy::numberedCandidate(const QString &path, int n, QChar separator)
{
    const PathParts parts = splitPath(path, separator);
    return parts.directory + parts.stem + QStringLiteral(" (%1)").arg(n) + parts.extension;
}

QString ConflictResolutionPolicy::uniquePath(const QString &path,
                                             const std::function<bool(const QString &)> &exists,
                                             QChar separator)
{
    for (int n = 1; n <= MaxNumberedCandidates; ++n) {
        QString candidate = numberedCandidate(path, n, separator);
        if (!exists(candidate)) {
            return candidate;
        }
    }

    const PathParts parts = splitPath(path, separator);
    const QString suffix = QUuid::createUuid().toString(QUuid::Id128);
    return parts.directory + parts.stem + QStringLiteral(" (") + suffix + QLatin1Char(')') + parts.extension;
}

QString ConflictResolutionPolicy::uniqueLocalPath(const QString &localPath)
{
    return uniquePath(localPath,
                      [](const QString &candidate) { return QFileInfo::exists(candidate); },
                      QLatin1Char('/'));
}
