#include "remotepath.h"

QString RemotePath::join(const QString &directory, const QString &name)
{
    if (directory.isEmpty() || directory == QLatin1String("/")) {
        return QLatin1Char('/') + name;
    }
    if (directory.endsWith(QLatin1Char('/'))) {
        return directory + name;
    }
    return directory + QLatin1Char('/') + name;
}

QString RemotePath::fileName(const QString &remotePath)
{
    if (remotePath.isEmpty()) {
        return QString();
    }
    const qsizetype lastSlash = remotePath.lastIndexOf(QLatin1Char('/'));
    return lastSlash >= 0 ? remotePath.mid(lastSlash + 1) : remotePath;
}
