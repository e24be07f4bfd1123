#include "hostprober.h"

#include <QHostInfo>
#include <QNetworkInterface>
#include <QTcpSocket>
#include <QTimer>

#include <algorithm>

#include "utils/logging.h"

TcpHostProber::TcpHostProber(QObject *parent)
    : IHostProber(parent)
{
}

TcpHostProber::~TcpHostProber()
{
    cancelAll();
}

QString TcpHostProber::subnetFor(const QHostAddress &address)
{
    bool ok = false;
    const quint32 ip = address.toIPv4Address(&ok);
    if (!ok) {
        return QString();
    }
    return QHostAddress(ip & 0xFFFFFF00u).toString() + QStringLiteral("/24");
}

QStringList TcpHostProber::subnetHosts(const QHostAddress &address)
{
    QStringList hosts;
    bool ok = false;
    const quint32 ip = address.toIPv4Address(&ok);
    if (!ok) {
        return hosts;
    }

    const quint32 base = ip & 0xFFFFFF00u;
    for (quint32 host = 1; host < 255; ++host) {
        if (base + host != ip) {
            hosts.append(QHostAddress(base + host).toString());
        }
    }
    return hosts;
}

QStringList TcpHostProber::candidateHosts(QString *error)
{
    QStringList hosts;
    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &iface : interfaces) {
        const auto flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) || !flags.testFlag(QNetworkInterface::IsRunning)
            || flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }
        const auto entries = iface.addressEntries();
        for (const QNetworkAddressEntry &entry : entries) {
            const QHostAddress address = entry.ip();
            if (address.protocol() != QAbstractSocket::IPv4Protocol || address.isLoopback()) {
                continue;
            }
            LOG_VERBOSE() << "TcpHostProber: scanning" << subnetFor(address) << "via" << iface.name();
            for (const QString &host : subnetHosts(address)) {
                if (!hosts.contains(host)) {
                    hosts.append(host);
                }
            }
        }
    }

    if (hosts.isEmpty() && error) {
        *error = tr("No active IPv4 network interface");
    }
    return hosts;
}

void TcpHostProber::probe(const QString &ip, const QList<quint16> &ports, int timeoutMs)
{
    if (probes_.contains(ip)) {
        return;
    }
    if (ports.isEmpty()) {
        emit probeFinished(ip, {}, QString());
        return;
    }

    PendingProbe &pending = probes_[ip];
    pending.remaining = static_cast<int>(ports.size());

    auto *timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, ip]() { onProbeTimeout(ip); });
    pending.timer = timer;

    for (quint16 port : ports) {
        auto *socket = new QTcpSocket(this);
        pending.sockets.append(socket);
        connect(socket, &QTcpSocket::connected, this, [this, ip, socket, port]() {
            onSocketDone(ip, socket, port, true);
        });
        connect(socket, &QTcpSocket::errorOccurred, this, [this, ip, socket, port]() {
            onSocketDone(ip, socket, port, false);
        });
    }

    // Sockets are started after the bookkeeping is complete; an immediate
    // error may call back synchronously
    const QList<QPointer<QTcpSocket>> sockets = pending.sockets;
    timer->start(timeoutMs);
    for (int i = 0; i < sockets.size(); ++i) {
        if (sockets[i]) {
            sockets[i]->connectToHost(ip, ports[i]);
        }
    }
}

void TcpHostProber::onSocketDone(const QString &ip, QTcpSocket *socket, quint16 port, bool open)
{
    auto it = probes_.find(ip);
    if (it == probes_.end()) {
        return;
    }
    const int index = static_cast<int>(it->sockets.indexOf(socket));
    if (index < 0) {
        return;
    }

    it->sockets.removeAt(index);
    socket->disconnect(this);
    socket->abort();
    socket->deleteLater();

    if (open) {
        LOG_VERBOSE() << "TcpHostProber:" << ip << "port" << port << "open";
        it->openPorts.append(port);
    }
    if (--it->remaining == 0) {
        finishPortScan(ip);
    }
}

void TcpHostProber::onProbeTimeout(const QString &ip)
{
    auto it = probes_.find(ip);
    if (it == probes_.end()) {
        return;
    }
    for (const QPointer<QTcpSocket> &socket : it->sockets) {
        if (socket) {
            socket->disconnect(this);
            socket->abort();
            socket->deleteLater();
        }
    }
    it->sockets.clear();
    it->remaining = 0;
    finishPortScan(ip);
}

void TcpHostProber::finishPortScan(const QString &ip)
{
    auto it = probes_.find(ip);
    if (it == probes_.end()) {
        return;
    }
    if (it->timer) {
        it->timer->stop();
        it->timer->deleteLater();
    }

    if (it->openPorts.isEmpty()) {
        probes_.erase(it);
        emit probeFinished(ip, {}, QString());
        return;
    }

    it->lookupId = QHostInfo::lookupHost(ip, this, [this, ip](const QHostInfo &info) {
        auto found = probes_.find(ip);
        if (found == probes_.end()) {
            return;
        }
        QList<quint16> ports = found->openPorts;
        std::sort(ports.begin(), ports.end());
        probes_.erase(found);

        QString hostname;
        if (info.error() == QHostInfo::NoError && info.hostName() != ip) {
            hostname = info.hostName();
        }
        emit probeFinished(ip, ports, hostname);
    });
}

void TcpHostProber::discard(PendingProbe &probe)
{
    for (const QPointer<QTcpSocket> &socket : probe.sockets) {
        if (socket) {
            socket->disconnect(this);
            socket->abort();
            socket->deleteLater();
        }
    }
    if (probe.timer) {
        probe.timer->stop();
        probe.timer->deleteLater();
    }
    if (probe.lookupId >= 0) {
        QHostInfo::abortHostLookup(probe.lookupId);
    }
}

void TcpHostProber::cancelAll()
{
    for (auto it = probes_.begin(); it != probes_.end(); ++it) {
        discard(it.value());
    }
    probes_.clear();
}
