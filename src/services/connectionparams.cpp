#include "connectionparams.h"

#include "utils/logging.h"

quint16 ConnectionParams::effectivePort() const
{
    return port != 0 ? port : defaultPort(protocol, secure);
}

quint16 defaultPort(Protocol protocol, bool secure)
{
    switch (protocol) {
    case Protocol::Ftp:
        return 21;
    case Protocol::Sftp:
        return 22;
    case Protocol::WebDav:
        return secure ? 443 : 80;
    case Protocol::Smb:
        return 445;
    case Protocol::Cloud:
        return 443;
    }
    return 0;
}

QString protocolToString(Protocol protocol)
{
    switch (protocol) {
    case Protocol::Ftp:
        return QStringLiteral("ftp");
    case Protocol::Sftp:
        return QStringLiteral("sftp");
    case Protocol::WebDav:
        return QStringLiteral("webdav");
    case Protocol::Smb:
        return QStringLiteral("smb");
    case Protocol::Cloud:
        return QStringLiteral("cloud");
    }
    return QStringLiteral("unknown");
}

std::optional<Protocol> protocolFromString(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == "ftp") {
        return Protocol::Ftp;
    }
    if (key == "sftp" || key == "ssh") {
        return Protocol::Sftp;
    }
    if (key == "webdav" || key == "dav") {
        return Protocol::WebDav;
    }
    if (key == "smb" || key == "cifs" || key == "nas") {
        return Protocol::Smb;
    }
    if (key == "cloud") {
        return Protocol::Cloud;
    }
    return std::nullopt;
}

QString validateConnectionParams(const ConnectionParams &params, QStringList *warnings)
{
    if (params.host.trimmed().isEmpty()) {
        return QStringLiteral("Host cannot be empty");
    }
    if (params.host.contains(QLatin1Char(' ')) || params.host.contains(QLatin1Char('/'))) {
        return QStringLiteral("Host contains invalid characters: %1").arg(params.host);
    }
    if (!params.rootPath.startsWith(QLatin1Char('/'))) {
        return QStringLiteral("Remote root must be an absolute path: %1").arg(params.rootPath);
    }
    if (params.timeoutSec <= 0) {
        return QStringLiteral("Timeout must be positive");
    }
    if (params.protocol == Protocol::Cloud && params.password.isEmpty()) {
        return QStringLiteral("Cloud drives require an access token");
    }

    const quint16 port = params.effectivePort();
    const quint16 standard = defaultPort(params.protocol, params.secure);
    if (port != standard) {
        const QString remark = QStringLiteral("Using non-standard %1 port: %2")
                                   .arg(protocolToString(params.protocol))
                                   .arg(port);
        LOG_VERBOSE() << remark;
        if (warnings) {
            warnings->append(remark);
        }
    }
    if (params.protocol == Protocol::Ftp && !params.secure && warnings) {
        warnings->append(QStringLiteral("Using standard FTP without TLS"));
    }

    return QString();
}

QString joinRemotePath(const QString &dir, const QString &name)
{
    if (dir.isEmpty()) {
        return name.startsWith(QLatin1Char('/')) ? name : QLatin1Char('/') + name;
    }
    QString result = dir;
    if (!result.endsWith(QLatin1Char('/'))) {
        result += QLatin1Char('/');
    }
    QString child = name;
    while (child.startsWith(QLatin1Char('/'))) {
        child.remove(0, 1);
    }
    return result + child;
}

QString remoteFileName(const QString &path)
{
    QString trimmed = path;
    while (trimmed.length() > 1 && trimmed.endsWith(QLatin1Char('/'))) {
        trimmed.chop(1);
    }
    const int slash = trimmed.lastIndexOf(QLatin1Char('/'));
    return slash >= 0 ? trimmed.mid(slash + 1) : trimmed;
}
