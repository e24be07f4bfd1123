/**
 * @file networkdevice.h
 * @brief Records produced by network discovery.
 */

#ifndef NETWORKDEVICE_H
#define NETWORKDEVICE_H

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

#include "connectionparams.h"

enum class DeviceType {
    Nas,
    Computer,
    Router,
    Server,
    Printer,
    Mobile,
    Unknown
};

enum class ServiceType {
    FileSharing,
    Web,
    Network,
    Printing,
    Media,
    Other
};

/**
 * @brief An open TCP service found on a device.
 */
struct NetworkService {
    QString name;           ///< e.g., "FTP", "SMB"
    quint16 port = 0;
    bool secure = false;    ///< Encrypted by default (SSH, HTTPS)
    ServiceType type = ServiceType::Other;
};

/**
 * @brief A device seen on the local network.
 *
 * Created and refreshed by NetworkDiscoveryService only. A device that was
 * not seen in the latest scan is stale; after several consecutive misses it
 * is unreachable, and once its lastSeen is older than the prune window it is
 * dropped.
 */
struct NetworkDevice {
    QString name;           ///< Hostname if known, else the IP address
    DeviceType type = DeviceType::Unknown;
    QString ipAddress;
    QString hostname;       ///< Empty if reverse lookup failed
    QList<NetworkService> services;
    bool reachable = true;
    bool stale = false;
    int missedScans = 0;
    QDateTime lastSeen;

    /// @brief True if any service is a file sharing service.
    [[nodiscard]] bool hasFileSharing() const;

    /// @brief Protocols a drive could use against this device, in port order.
    [[nodiscard]] QList<Protocol> supportedProtocols() const;
};

Q_DECLARE_METATYPE(NetworkService)
Q_DECLARE_METATYPE(NetworkDevice)

/// @name Discovery helpers
/// @{

/// @brief A port in the discovery probe table.
struct ProbePort {
    quint16 port;
    const char *name;
};

/// @brief Ports probed on every host, in ascending order.
[[nodiscard]] const QList<ProbePort> &probePortTable();

/// @brief Port numbers of probePortTable().
[[nodiscard]] QList<quint16> probePorts();

/// @brief Builds the service record for an open port.
[[nodiscard]] NetworkService serviceForPort(quint16 port);

[[nodiscard]] ServiceType serviceTypeForPort(quint16 port);
[[nodiscard]] bool isSecurePort(quint16 port);

/**
 * @brief Infers a device type from its hostname, then its services.
 *
 * Hostname keywords win (router/gateway, nas/storage, printer/print,
 * iphone/ipad/android/mobile, laptop/desktop/pc/mac, server). Without a
 * match, a host offering SMB or AFP together with another file sharing
 * service is taken for a NAS and one offering SSH and a web server for a
 * server.
 */
[[nodiscard]] DeviceType classifyDevice(const QString &hostname, const QList<NetworkService> &services);

[[nodiscard]] QString deviceTypeToString(DeviceType type);
[[nodiscard]] QString serviceTypeToString(ServiceType type);
/// @}

#endif // NETWORKDEVICE_H
