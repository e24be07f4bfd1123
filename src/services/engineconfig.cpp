#include "engineconfig.h"

#include <QDebug>
#include <QFileInfo>
#include <QSettings>

namespace {

int readClamped(QSettings &settings, const QString &key, int defaultValue, int minimum,
                int maximum, QStringList *warnings)
{
    const QVariant raw = settings.value(key, defaultValue);
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok) {
        const QString remark = QStringLiteral("%1/%2: '%3' is not a number, using %4")
                                   .arg(settings.group(), key, raw.toString())
                                   .arg(defaultValue);
        qWarning().noquote() << "EngineConfig:" << remark;
        if (warnings) {
            warnings->append(remark);
        }
        return defaultValue;
    }

    const int clamped = qBound(minimum, value, maximum);
    if (clamped != value) {
        const QString remark = QStringLiteral("%1/%2=%3 clamped to %4")
                                   .arg(settings.group(), key)
                                   .arg(value)
                                   .arg(clamped);
        qWarning().noquote() << "EngineConfig:" << remark;
        if (warnings) {
            warnings->append(remark);
        }
    }
    return clamped;
}

void skipDrive(const QString &name, const QString &reason, QStringList *warnings)
{
    const QString remark = QStringLiteral("drive %1 skipped: %2").arg(name, reason);
    qWarning().noquote() << "EngineConfig:" << remark;
    if (warnings) {
        warnings->append(remark);
    }
}

} // namespace

std::optional<DriveConfig> EngineConfig::driveByName(const QString &name) const
{
    for (const DriveConfig &drive : drives) {
        if (drive.name == name) {
            return drive;
        }
    }
    return std::nullopt;
}

EngineConfig EngineConfig::load(QSettings &settings, QStringList *warnings)
{
    EngineConfig config;

    settings.beginGroup(QStringLiteral("transfers"));
    config.transfers.concurrentLimit = readClamped(settings, QStringLiteral("concurrentLimit"),
        TransferQueue::DefaultConcurrentLimit, TransferQueue::MinConcurrentLimit,
        TransferQueue::MaxConcurrentLimit, warnings);
    config.transfers.maxRetries = readClamped(settings, QStringLiteral("maxRetries"),
        TransferQueue::DefaultMaxRetries, 0, 20, warnings);
    config.transfers.retryBaseDelayMs = readClamped(settings, QStringLiteral("retryBaseDelayMs"),
        TransferQueue::DefaultRetryBaseDelayMs, 0, 600000, warnings);
    config.transfers.retryMaxDelayMs = readClamped(settings, QStringLiteral("retryMaxDelayMs"),
        TransferQueue::DefaultRetryMaxDelayMs, config.transfers.retryBaseDelayMs, 3600000, warnings);
    config.transfers.maxHistory = readClamped(settings, QStringLiteral("maxHistory"),
        TransferQueue::DefaultMaxHistory, 1, 100000, warnings);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("discovery"));
    config.discovery.intervalSec = readClamped(settings, QStringLiteral("intervalSec"),
        30, 10, 86400, warnings);
    config.discovery.unreachableAfterMisses = readClamped(settings,
        QStringLiteral("unreachableAfterMisses"), 3, 1, 100, warnings);
    config.discovery.pruneAfterHours = readClamped(settings, QStringLiteral("pruneAfterHours"),
        24, 1, 24 * 365, warnings);
    config.discovery.probeTimeoutMs = readClamped(settings, QStringLiteral("probeTimeoutMs"),
        300, 50, 10000, warnings);
    config.discovery.parallelProbes = readClamped(settings, QStringLiteral("parallelProbes"),
        32, 1, 256, warnings);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("connection"));
    config.connectionTimeoutSec = readClamped(settings, QStringLiteral("timeoutSec"),
        15, 1, 600, warnings);
    settings.endGroup();

    const QStringList groups = settings.childGroups();
    for (const QString &group : groups) {
        if (!group.startsWith(QLatin1String(DriveGroupPrefix))) {
            continue;
        }
        const QString name = group.mid(int(qstrlen(DriveGroupPrefix)));
        if (name.isEmpty()) {
            skipDrive(group, QStringLiteral("empty drive name"), warnings);
            continue;
        }

        settings.beginGroup(group);
        const QString protocolName = settings.value(QStringLiteral("protocol")).toString();
        const std::optional<Protocol> protocol = protocolFromString(protocolName);
        bool portOk = false;
        const int port = settings.value(QStringLiteral("port"), 0).toInt(&portOk);

        DriveConfig drive;
        drive.name = name;
        drive.params.host = settings.value(QStringLiteral("host")).toString().trimmed();
        drive.params.user = settings.value(QStringLiteral("user")).toString();
        drive.params.password = settings.value(QStringLiteral("password")).toString();
        const QString passwordEnv = settings.value(QStringLiteral("passwordEnv")).toString();
        if (!passwordEnv.isEmpty()) {
            drive.params.password = qEnvironmentVariable(passwordEnv.toLocal8Bit().constData());
        }
        drive.params.rootPath = settings.value(QStringLiteral("remoteRoot"), QStringLiteral("/")).toString();
        drive.params.secure = settings.value(QStringLiteral("secure"), false).toBool();
        drive.params.timeoutSec = readClamped(settings, QStringLiteral("timeoutSec"),
            config.connectionTimeoutSec, 1, 600, warnings);
        drive.localRoot = settings.value(QStringLiteral("localRoot")).toString();
        drive.autoSync = settings.value(QStringLiteral("autoSync"), false).toBool();
        settings.endGroup();

        if (!protocol) {
            skipDrive(name, QStringLiteral("unknown protocol '%1'").arg(protocolName), warnings);
            continue;
        }
        if (!portOk || port < 0 || port > 65535) {
            skipDrive(name, QStringLiteral("port %1 out of range").arg(port), warnings);
            continue;
        }
        drive.params.protocol = *protocol;
        drive.params.port = static_cast<quint16>(port);
        config.drives.append(drive);
    }

    qDebug() << "EngineConfig: loaded" << config.drives.size() << "drives";
    return config;
}

std::optional<EngineConfig> EngineConfig::loadFile(const QString &path, QString *error,
                                                   QStringList *warnings)
{
    const QFileInfo info(path);
    if (!info.isFile() || !info.isReadable()) {
        if (error) {
            *error = QStringLiteral("Cannot read configuration file %1").arg(path);
        }
        return std::nullopt;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (error) {
            *error = QStringLiteral("Malformed configuration file %1").arg(path);
        }
        return std::nullopt;
    }
    return load(settings, warnings);
}
