#include "syncplanner.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QMap>

#include <algorithm>

QList<SyncAction> planSync(const QList<SyncEntry> &local, const QList<SyncEntry> &remote,
                           int toleranceSec)
{
    QMap<QString, SyncEntry> localByPath;
    for (const SyncEntry &entry : local) {
        localByPath.insert(entry.relativePath, entry);
    }
    QMap<QString, SyncEntry> remoteByPath;
    for (const SyncEntry &entry : remote) {
        remoteByPath.insert(entry.relativePath, entry);
    }

    QList<SyncAction> actions;
    auto add = [&actions](SyncAction::Kind kind, const SyncEntry &source) {
        SyncAction action;
        action.kind = kind;
        action.relativePath = source.relativePath;
        action.size = source.size;
        actions.append(action);
    };

    for (auto it = remoteByPath.cbegin(); it != remoteByPath.cend(); ++it) {
        const SyncEntry &remoteEntry = it.value();
        const auto localIt = localByPath.constFind(it.key());
        if (localIt == localByPath.cend()) {
            add(SyncAction::Kind::Download, remoteEntry);
            continue;
        }

        const SyncEntry &localEntry = localIt.value();
        if (localEntry.modified.isValid() && remoteEntry.modified.isValid()) {
            const qint64 delta = localEntry.modified.secsTo(remoteEntry.modified);
            if (localEntry.size == remoteEntry.size && qAbs(delta) <= toleranceSec) {
                continue;
            }
            if (delta > toleranceSec) {
                add(SyncAction::Kind::Download, remoteEntry);
            } else if (delta < -toleranceSec) {
                add(SyncAction::Kind::Upload, localEntry);
            } else {
                // Same time, different size
                add(SyncAction::Kind::Download, remoteEntry);
            }
        } else if (localEntry.size != remoteEntry.size) {
            add(SyncAction::Kind::Download, remoteEntry);
        }
    }

    for (auto it = localByPath.cbegin(); it != localByPath.cend(); ++it) {
        if (!remoteByPath.contains(it.key())) {
            add(SyncAction::Kind::Upload, it.value());
        }
    }

    std::sort(actions.begin(), actions.end(), [](const SyncAction &a, const SyncAction &b) {
        return a.relativePath < b.relativePath;
    });
    return actions;
}

QList<SyncEntry> scanLocalTree(const QString &root)
{
    QList<SyncEntry> entries;
    const QDir rootDir(root);
    if (!rootDir.exists()) {
        return entries;
    }

    QDirIterator it(root, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        SyncEntry entry;
        entry.relativePath = rootDir.relativeFilePath(info.absoluteFilePath());
        entry.size = info.size();
        entry.modified = info.lastModified().toUTC();
        entries.append(entry);
    }
    return entries;
}
