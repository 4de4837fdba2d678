/**
 * @file remotepath.h
 * @brief Helpers for remote (always '/'-separated) paths.
 */

#ifndef REMOTEPATH_H
#define REMOTEPATH_H

#include <QString>

/**
 * @brief Path helpers for the remote side of a session.
 *
 * Remote paths use '/' regardless of the host platform, so QDir and
 * QFileInfo must not be used to split or join them.
 */
class RemotePath
{
public:
    /**
     * @brief Joins a remote directory and a file name.
     * @param directory Remote directory ("/" or empty means the root).
     * @param name File name to append.
     * @return The joined path, with exactly one '/' between the parts.
     */
    static QString join(const QString &directory, const QString &name);

    /**
     * @brief Returns the last path segment (text after the final '/').
     */
    static QString fileName(const QString &remotePath);
};

#endif // REMOTEPATH_H
