#ifndef SYNCPLANNER_H
#define SYNCPLANNER_H

#include <QDateTime>
#include <QList>
#include <QString>

/**
 * @brief A file on one side of a sync, relative to the drive root.
 */
struct SyncEntry {
    QString relativePath;   ///< "docs/a.txt", no leading slash
    qint64 size = 0;
    QDateTime modified;     ///< Invalid if unknown
};

/**
 * @brief A transfer the sync needs to make.
 */
struct SyncAction {
    enum class Kind { Upload, Download };

    Kind kind = Kind::Download;
    QString relativePath;
    qint64 size = 0;
};

/**
 * @brief Computes the transfers that bring a local tree and a remote tree in line.
 *
 * Files are matched by relative path. A file present on one side only is
 * copied to the other. For a file present on both sides:
 * - same size and modification times within @p toleranceSec: nothing to do;
 * - both times known: the newer side wins;
 * - a time missing and sizes differing: the remote copy wins.
 *
 * Nothing is deleted. The result is ordered by relative path.
 */
[[nodiscard]] QList<SyncAction> planSync(const QList<SyncEntry> &local,
                                         const QList<SyncEntry> &remote,
                                         int toleranceSec = 2);

/**
 * @brief Lists the regular files below a local directory, recursively.
 * @param root Directory to scan; a missing directory yields an empty list.
 */
[[nodiscard]] QList<SyncEntry> scanLocalTree(const QString &root);

#endif // SYNCPLANNER_H
