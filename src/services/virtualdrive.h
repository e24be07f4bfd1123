/**
 * @file virtualdrive.h
 * @brief Drive bindings, mount errors and drive events.
 */

#ifndef VIRTUALDRIVE_H
#define VIRTUALDRIVE_H

#include <QDateTime>
#include <QMetaType>
#include <QString>

#include "connectionparams.h"
#include "transfererror.h"

/**
 * @brief What the user (or configuration) asks to mount.
 */
struct DriveConfig {
    QString name;
    ConnectionParams params;
    QString localRoot;       ///< Local mirror used by sync; may be empty if never synced
    bool autoSync = false;   ///< Sync right after a successful mount
};

Q_DECLARE_METATYPE(DriveConfig)

/**
 * @brief Reasons a mount can fail.
 */
enum class MountError {
    InvalidConfig,
    AuthenticationFailed,
    HostUnreachable,
    UnsupportedProtocol,
    Timeout,
    ProtocolError
};

Q_DECLARE_METATYPE(MountError)

/// @brief Maps a connector failure to the mount error reported for it.
[[nodiscard]] inline MountError mountErrorForKind(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Authentication: return MountError::AuthenticationFailed;
    case ErrorKind::Connection: return MountError::HostUnreachable;
    case ErrorKind::Timeout: return MountError::Timeout;
    case ErrorKind::UnsupportedProtocol: return MountError::UnsupportedProtocol;
    default: return MountError::ProtocolError;
    }
}

/// @brief Convert MountError to string for logs
[[nodiscard]] inline const char *mountErrorToString(MountError error)
{
    switch (error) {
    case MountError::InvalidConfig: return "InvalidConfig";
    case MountError::AuthenticationFailed: return "AuthenticationFailed";
    case MountError::HostUnreachable: return "HostUnreachable";
    case MountError::UnsupportedProtocol: return "UnsupportedProtocol";
    case MountError::Timeout: return "Timeout";
    case MountError::ProtocolError: return "ProtocolError";
    }
    return "Unknown";
}

/**
 * @brief Totals from the most recent sync listing of a drive.
 */
struct DriveStats {
    int fileCount = 0;
    int directoryCount = 0;
    qint64 totalBytes = 0;
};

/**
 * @brief Snapshot of a mounted (or previously mounted) drive.
 *
 * online is derived from the drive's ActiveConnection when the snapshot is
 * taken; it is never stored.
 */
struct VirtualDrive {
    QString id;
    QString name;
    ConnectionParams params;
    QString localRoot;
    bool autoSync = false;
    bool online = false;
    QDateTime lastSync;       ///< Invalid until the first successful sync
    quint64 connectionId = 0; ///< 0 while no ActiveConnection exists
    DriveStats stats;

    [[nodiscard]] Protocol protocol() const { return params.protocol; }
};

Q_DECLARE_METATYPE(VirtualDrive)

/**
 * @brief Notification about a drive, emitted by VirtualDriveManager.
 */
struct DriveEvent {
    enum class Type {
        Mounted,       ///< Connected and online
        Unmounted,     ///< Disconnected on request
        Synced,        ///< Sync planned; count holds the queued transfers
        Disconnected,  ///< Connection lost without an unmount
        Error          ///< Mount or sync failed; see errorKind and message
    };

    Type type = Type::Mounted;
    QString driveId;
    int count = 0;
    ErrorKind errorKind = ErrorKind::None;
    QString message;
};

Q_DECLARE_METATYPE(DriveEvent)

/// @brief Convert DriveEvent::Type to string for logs
[[nodiscard]] inline const char *driveEventTypeToString(DriveEvent::Type type)
{
    switch (type) {
    case DriveEvent::Type::Mounted: return "Mounted";
    case DriveEvent::Type::Unmounted: return "Unmounted";
    case DriveEvent::Type::Synced: return "Synced";
    case DriveEvent::Type::Disconnected: return "Disconnected";
    case DriveEvent::Type::Error: return "Error";
    }
    return "Unknown";
}

#endif // VIRTUALDRIVE_H
