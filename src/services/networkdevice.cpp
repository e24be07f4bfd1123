#include "networkdevice.h"

namespace {

bool hasPort(const QList<NetworkService> &services, quint16 port)
{
    for (const NetworkService &service : services) {
        if (service.port == port) {
            return true;
        }
    }
    return false;
}

} // namespace

bool NetworkDevice::hasFileSharing() const
{
    for (const NetworkService &service : services) {
        if (service.type == ServiceType::FileSharing) {
            return true;
        }
    }
    return false;
}

QList<Protocol> NetworkDevice::supportedProtocols() const
{
    QList<Protocol> protocols;
    auto add = [&protocols](Protocol protocol) {
        if (!protocols.contains(protocol)) {
            protocols.append(protocol);
        }
    };

    for (const NetworkService &service : services) {
        switch (service.port) {
        case 21:
            add(Protocol::Ftp);
            break;
        case 22:
            add(Protocol::Sftp);
            break;
        case 445:
            add(Protocol::Smb);
            break;
        case 5005:
        case 5006:
            add(Protocol::WebDav);
            break;
        case 80:
        case 443:
            // Plain web servers only count on storage devices
            if (type == DeviceType::Nas) {
                add(Protocol::WebDav);
            }
            break;
        default:
            break;
        }
    }
    return protocols;
}

const QList<ProbePort> &probePortTable()
{
    static const QList<ProbePort> table = {
        {21, "FTP"},
        {22, "SSH"},
        {80, "HTTP"},
        {443, "HTTPS"},
        {445, "SMB"},
        {548, "AFP"},
        {5005, "WebDAV"},
        {5006, "WebDAV (TLS)"},
        {8080, "HTTP Alt"},
        {8443, "HTTPS Alt"},
    };
    return table;
}

QList<quint16> probePorts()
{
    QList<quint16> ports;
    for (const ProbePort &entry : probePortTable()) {
        ports.append(entry.port);
    }
    return ports;
}

ServiceType serviceTypeForPort(quint16 port)
{
    switch (port) {
    case 21:
    case 22:
    case 445:
    case 548:
    case 5005:
    case 5006:
        return ServiceType::FileSharing;
    case 80:
    case 443:
    case 8000:
    case 8080:
    case 8443:
        return ServiceType::Web;
    case 25:
    case 53:
        return ServiceType::Network;
    case 631:
        return ServiceType::Printing;
    case 3689:
        return ServiceType::Media;
    default:
        return ServiceType::Other;
    }
}

bool isSecurePort(quint16 port)
{
    return port == 22 || port == 443 || port == 5006 || port == 8443;
}

NetworkService serviceForPort(quint16 port)
{
    NetworkService service;
    service.port = port;
    service.type = serviceTypeForPort(port);
    service.secure = isSecurePort(port);
    service.name = QStringLiteral("Port %1").arg(port);
    for (const ProbePort &entry : probePortTable()) {
        if (entry.port == port) {
            service.name = QString::fromLatin1(entry.name);
            break;
        }
    }
    return service;
}

DeviceType classifyDevice(const QString &hostname, const QList<NetworkService> &services)
{
    const QString name = hostname.toLower();
    if (!name.isEmpty()) {
        if (name.contains("router") || name.contains("gateway")) {
            return DeviceType::Router;
        }
        if (name.contains("nas") || name.contains("storage")) {
            return DeviceType::Nas;
        }
        if (name.contains("print")) {
            return DeviceType::Printer;
        }
        if (name.contains("iphone") || name.contains("ipad") || name.contains("android")
            || name.contains("mobile")) {
            return DeviceType::Mobile;
        }
        if (name.contains("laptop") || name.contains("desktop") || name.contains("pc")
            || name.contains("mac")) {
            return DeviceType::Computer;
        }
        if (name.contains("server")) {
            return DeviceType::Server;
        }
    }

    int fileSharing = 0;
    for (const NetworkService &service : services) {
        if (service.type == ServiceType::FileSharing) {
            fileSharing++;
        }
    }
    if ((hasPort(services, 445) || hasPort(services, 548)) && fileSharing >= 2) {
        return DeviceType::Nas;
    }
    if (hasPort(services, 22) && (hasPort(services, 80) || hasPort(services, 443))) {
        return DeviceType::Server;
    }
    return DeviceType::Unknown;
}

QString deviceTypeToString(DeviceType type)
{
    switch (type) {
    case DeviceType::Nas: return QStringLiteral("nas");
    case DeviceType::Computer: return QStringLiteral("computer");
    case DeviceType::Router: return QStringLiteral("router");
    case DeviceType::Server: return QStringLiteral("server");
    case DeviceType::Printer: return QStringLiteral("printer");
    case DeviceType::Mobile: return QStringLiteral("mobile");
    case DeviceType::Unknown: break;
    }
    return QStringLiteral("unknown");
}

QString serviceTypeToString(ServiceType type)
{
    switch (type) {
    case ServiceType::FileSharing: return QStringLiteral("fileSharing");
    case ServiceType::Web: return QStringLiteral("web");
    case ServiceType::Network: return QStringLiteral("network");
    case ServiceType::Printing: return QStringLiteral("printing");
    case ServiceType::Media: return QStringLiteral("media");
    case ServiceType::Other: break;
    }
    return QStringLiteral("other");
}
