#ifndef REMOTEENTRY_H
#define REMOTEENTRY_H

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

/**
 * @brief Represents a single entry in a remote directory listing.
 */
struct RemoteEntry {
    QString name;              ///< Name of the file or directory
    bool isDirectory = false;  ///< True if this entry is a directory
    qint64 size = 0;           ///< Size in bytes (0 for directories)
    QDateTime modified;        ///< Last modification timestamp (invalid if unknown)
};

Q_DECLARE_METATYPE(RemoteEntry)

#endif // REMOTEENTRY_H
