#include "transferrecord.h"

#include <QCoreApplication>
#include <QDebug>
#include <QtGlobal>

bool isValidTransition(TransferStatus from, TransferStatus to)
{
    switch (from) {
    case TransferStatus::Pending:
        return to == TransferStatus::InProgress || to == TransferStatus::Cancelled;
    case TransferStatus::InProgress:
        return to == TransferStatus::Completed || to == TransferStatus::Failed ||
               to == TransferStatus::Cancelled;
    case TransferStatus::Failed:
    case TransferStatus::Cancelled:
        return to == TransferStatus::Pending;
    case TransferStatus::Completed:
        return false;
    }
    return false;
}

QString formatSpeed(double bytesPerSecond)
{
    static const char *const suffixes[] = {"B/s", "KB/s", "MB/s", "GB/s"};
    constexpr int suffixCount = 4;

    int suffixIndex = 0;
    double size = bytesPerSecond;
    while (size >= 1024.0 && suffixIndex < suffixCount - 1) {
        size /= 1024.0;
        suffixIndex++;
    }

    return QStringLiteral("%1 %2").arg(size, 0, 'f', 1).arg(QLatin1String(suffixes[suffixIndex]));
}

std::optional<double> TransferRecord::progressPercent() const
{
    if (totalBytes <= 0) {
        return std::nullopt;
    }
    const double percent = static_cast<double>(transferredBytes) / static_cast<double>(totalBytes) * 100.0;
    return qBound(0.0, percent, 100.0);
}

QString TransferRecord::statusDisplay() const
{
    switch (status) {
    case TransferStatus::Pending:
        return QCoreApplication::translate("TransferRecord", "Queued");
    case TransferStatus::InProgress: {
        const auto percent = progressPercent();
        return QStringLiteral("%1%").arg(qRound(percent.value_or(0.0)));
    }
    case TransferStatus::Completed:
        return QCoreApplication::translate("TransferRecord", "Done");
    case TransferStatus::Failed:
        return QCoreApplication::translate("TransferRecord", "Failed");
    case TransferStatus::Cancelled:
        return QCoreApplication::translate("TransferRecord", "Cancelled");
    }
    return QCoreApplication::translate("TransferRecord", "Unknown");
}

QString TransferRecord::directionDisplay() const
{
    return direction == TransferDirection::Upload ? QStringLiteral("↑") : QStringLiteral("↓");
}

QString TransferRecord::speedDisplay(const QDateTime &now) const
{
    if (!startedAt.isValid() || status != TransferStatus::InProgress) {
        return QString();
    }

    const qint64 elapsedMs = startedAt.msecsTo(now);
    if (elapsedMs < 500) {
        return QString();
    }

    const double bytesPerSecond = static_cast<double>(transferredBytes) / (static_cast<double>(elapsedMs) / 1000.0);
    return formatSpeed(bytesPerSecond);
}

bool TransferRecord::transitionTo(TransferStatus to)
{
    if (status == to) {
        return true;
    }
    if (!isValidTransition(status, to)) {
        qWarning() << "TransferRecord: rejected transition" << transferStatusToString(status)
                   << "->" << transferStatusToString(to) << "for" << fileName;
        return false;
    }
    status = to;
    return true;
}

void TransferRecord::initializeResumeProgress()
{
    resumeOffset = qBound<qint64>(0, resumeOffset, qMax<qint64>(totalBytes, 0));
    if (totalBytes > 0 && resumeOffset > 0) {
        transferredBytes = resumeOffset;
    }
}

void TransferRecord::updateProgress(qint64 bytes)
{
    if (totalBytes > 0) {
        transferredBytes = qBound(resumeOffset, bytes, totalBytes);
    } else {
        transferredBytes = qMax<qint64>(bytes, 0);
    }
}
