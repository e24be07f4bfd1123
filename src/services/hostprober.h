/**
 * @file hostprober.h
 * @brief Interface and TCP implementation for probing hosts on the local network.
 */

#ifndef HOSTPROBER_H
#define HOSTPROBER_H

#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QStringList>

class QTcpSocket;
class QTimer;

/**
 * @brief Abstract source of scan candidates and per-host port probes.
 *
 * Lets NetworkDiscoveryService run against a scripted network in tests.
 */
class IHostProber : public QObject
{
    Q_OBJECT

public:
    explicit IHostProber(QObject *parent = nullptr) : QObject(parent) {}
    ~IHostProber() override = default;

    /**
     * @brief Returns the addresses one scan should probe.
     * @param error Set when no usable network interface exists.
     * @return IPv4 addresses in dotted form; empty on error.
     */
    [[nodiscard]] virtual QStringList candidateHosts(QString *error) = 0;

    /**
     * @brief Probes TCP ports on one host; emits probeFinished() once.
     * @param ip Address to probe.
     * @param ports Ports to try.
     * @param timeoutMs Per-port connect timeout.
     */
    virtual void probe(const QString &ip, const QList<quint16> &ports, int timeoutMs) = 0;

    /// @brief Abandons all running probes without emitting their results.
    virtual void cancelAll() = 0;

signals:
    /**
     * @brief Result of one probe.
     * @param ip The probed address.
     * @param openPorts Ports that accepted a connection (empty: host absent).
     * @param hostname Reverse-resolved name, empty if unknown.
     */
    void probeFinished(const QString &ip, const QList<quint16> &openPorts, const QString &hostname);
};

/**
 * @brief Probes hosts with QTcpSocket connects and QHostInfo reverse lookups.
 *
 * Candidates are every host of the /24 subnet of each up, non-loopback IPv4
 * interface, excluding the interface's own address.
 */
class TcpHostProber : public IHostProber
{
    Q_OBJECT

public:
    explicit TcpHostProber(QObject *parent = nullptr);
    ~TcpHostProber() override;

    [[nodiscard]] QStringList candidateHosts(QString *error) override;
    void probe(const QString &ip, const QList<quint16> &ports, int timeoutMs) override;
    void cancelAll() override;

    /// @brief "a.b.c.0/24" for an IPv4 address, empty if not IPv4.
    [[nodiscard]] static QString subnetFor(const QHostAddress &address);

    /// @brief The 254 host addresses of an address's /24, minus the address itself.
    [[nodiscard]] static QStringList subnetHosts(const QHostAddress &address);

private:
    struct PendingProbe {
        QList<QPointer<QTcpSocket>> sockets;
        QList<quint16> openPorts;
        int remaining = 0;
        QPointer<QTimer> timer;
        int lookupId = -1;
    };

    void onSocketDone(const QString &ip, QTcpSocket *socket, quint16 port, bool open);
    void onProbeTimeout(const QString &ip);
    void finishPortScan(const QString &ip);
    void discard(PendingProbe &probe);

    QHash<QString, PendingProbe> probes_;
};

#endif // HOSTPROBER_H
