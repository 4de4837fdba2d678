/**
 * @file logging.h
 * @brief Runtime verbose flag for transfer engine diagnostics.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>
#include <QtGlobal>

namespace sftpqueue {

/// Set via --verbose; gates drain steps, probe errors and conflict decisions
inline bool verboseLogging = false;

/**
 * @brief Enables or disables verbose output.
 *
 * Verbose mode prefixes every message with a millisecond timestamp so
 * chunk and drain timings can be read straight from the log.
 */
inline void setVerboseLogging(bool enabled)
{
    verboseLogging = enabled;
    qSetMessagePattern(enabled
        ? QStringLiteral("%{time hh:mm:ss.zzz} %{type}: %{message}")
        : QStringLiteral("%{message}"));
}

} // namespace sftpqueue

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (sftpqueue::verboseLogging) qDebug()

#endif // LOGGING_H
