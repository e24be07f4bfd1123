/**
 * @file engineconfig.h
 * @brief Read-only configuration snapshot for the drive engine.
 */

#ifndef ENGINECONFIG_H
#define ENGINECONFIG_H

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

#include "models/transferqueue.h"
#include "virtualdrive.h"

class QSettings;

/**
 * @brief Tunables of the network discovery service.
 */
struct DiscoverySettings {
    int intervalSec = 30;
    int unreachableAfterMisses = 3;
    int pruneAfterHours = 24;
    int probeTimeoutMs = 300;
    int parallelProbes = 32;
};

/**
 * @brief Everything the engine reads from its INI file.
 *
 * Loaded once and never written back. Out-of-range numbers are clamped and
 * reported as warnings; drive groups that cannot be used are skipped with a
 * warning.
 *
 * @par File layout:
 * @code
 * [transfers]
 * concurrentLimit=3
 * maxRetries=3
 *
 * [discovery]
 * intervalSec=30
 *
 * [connection]
 * timeoutSec=15
 *
 * [drive.nas]
 * protocol=sftp
 * host=192.168.1.20
 * user=me
 * passwordEnv=NAS_PASSWORD
 * remoteRoot=/volume1/share
 * localRoot=/home/me/nas
 * autoSync=true
 * @endcode
 */
struct EngineConfig {
    static constexpr const char *DriveGroupPrefix = "drive.";

    TransferSettings transfers;
    DiscoverySettings discovery;
    int connectionTimeoutSec = 15;
    QList<DriveConfig> drives;

    /// @brief Drive configuration by name (case-sensitive).
    [[nodiscard]] std::optional<DriveConfig> driveByName(const QString &name) const;

    /**
     * @brief Reads a snapshot from open settings.
     * @param settings Source; only read.
     * @param warnings Optional sink for clamped values and skipped drives.
     */
    [[nodiscard]] static EngineConfig load(QSettings &settings, QStringList *warnings = nullptr);

    /**
     * @brief Reads a snapshot from an INI file.
     * @param path File to read.
     * @param error Set when the file is missing or unreadable.
     * @param warnings Optional sink for clamped values and skipped drives.
     * @return The snapshot, or std::nullopt on error.
     */
    [[nodiscard]] static std::optional<EngineConfig> loadFile(const QString &path, QString *error,
                                                              QStringList *warnings = nullptr);
};

#endif // ENGINECONFIG_H
