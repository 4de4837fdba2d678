#ifndef REMOTEFILEINFO_H
#define REMOTEFILEINFO_H

#include <QDateTime>
#include <QString>

/**
 * @brief Metadata for one remote file or directory.
 */
struct RemoteFileInfo {
    QString path;              ///< Absolute remote path
    bool isDirectory = false;  ///< True if this entry is a directory
    qint64 size = 0;           ///< Size in bytes (0 for directories)
    QDateTime modified;        ///< Last modification timestamp
};

#endif // REMOTEFILEINFO_H
