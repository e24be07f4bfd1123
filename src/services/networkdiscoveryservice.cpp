#include "networkdiscoveryservice.h"

#include <QHostAddress>
#include <QTimer>

#include "utils/logging.h"

NetworkDiscoveryService::NetworkDiscoveryService(IHostProber *prober, QObject *parent)
    : QObject(parent)
    , prober_(prober)
    , monitorTimer_(new QTimer(this))
{
    if (prober_) {
        prober_->setParent(this);
        connect(prober_, &IHostProber::probeFinished,
                this, &NetworkDiscoveryService::onProbeFinished);
    }

    connect(monitorTimer_, &QTimer::timeout, this, [this]() {
        if (!scanning_) {
            scan();
        }
    });
}

NetworkDiscoveryService::~NetworkDiscoveryService()
{
    if (prober_) {
        prober_->cancelAll();
    }
}

QDateTime NetworkDiscoveryService::now() const
{
    return clock_ ? clock_() : QDateTime::currentDateTimeUtc();
}

quint32 NetworkDiscoveryService::sortKey(const QString &ipAddress)
{
    bool ok = false;
    const quint32 key = QHostAddress(ipAddress).toIPv4Address(&ok);
    return ok ? key : 0;
}

std::optional<NetworkDevice> NetworkDiscoveryService::device(const QString &ipAddress) const
{
    const auto it = devices_.constFind(sortKey(ipAddress));
    if (it == devices_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool NetworkDiscoveryService::scan()
{
    if (scanning_) {
        qDebug() << "NetworkDiscoveryService: scan already running";
        return false;
    }
    if (!prober_) {
        emit scanFailed(tr("No host prober available"));
        return true;
    }

    QString error;
    const QStringList hosts = prober_->candidateHosts(&error);
    if (!error.isEmpty()) {
        qWarning() << "NetworkDiscoveryService: scan failed:" << error;
        emit scanFailed(error);
        return true;
    }

    qDebug() << "NetworkDiscoveryService: scanning" << hosts.size() << "hosts";
    scanning_ = true;
    seenThisScan_.clear();
    inFlight_.clear();
    pendingHosts_ = hosts;
    emit scanStarted(static_cast<int>(hosts.size()));

    if (pendingHosts_.isEmpty()) {
        // Finish on the next iteration so callers always see scanStarted first
        QTimer::singleShot(0, this, &NetworkDiscoveryService::finishScan);
        return true;
    }
    launchProbes();
    return true;
}

void NetworkDiscoveryService::launchProbes()
{
    const QList<quint16> ports = probePorts();
    while (!pendingHosts_.isEmpty() && inFlight_.size() < parallelProbes_) {
        const QString ip = pendingHosts_.takeFirst();
        inFlight_.insert(ip);
        prober_->probe(ip, ports, probeTimeoutMs_);
    }
}

void NetworkDiscoveryService::onProbeFinished(const QString &ip, const QList<quint16> &openPorts,
                                              const QString &hostname)
{
    if (!scanning_ || !inFlight_.remove(ip)) {
        return;
    }

    if (!openPorts.isEmpty()) {
        NetworkDevice device;
        device.ipAddress = ip;
        device.hostname = hostname;
        device.name = hostname.isEmpty() ? ip : hostname;
        for (quint16 port : openPorts) {
            device.services.append(serviceForPort(port));
        }
        device.type = classifyDevice(hostname, device.services);
        device.reachable = true;
        device.stale = false;
        device.missedScans = 0;
        device.lastSeen = now();

        devices_.insert(sortKey(ip), device);
        seenThisScan_.insert(ip);
        LOG_VERBOSE() << "NetworkDiscoveryService: found" << ip << deviceTypeToString(device.type)
                      << device.services.size() << "services";
        emit deviceDiscovered(device);
    }

    if (pendingHosts_.isEmpty() && inFlight_.isEmpty()) {
        finishScan();
    } else {
        launchProbes();
    }
}

void NetworkDiscoveryService::finishScan()
{
    if (!scanning_) {
        return;
    }
    scanning_ = false;
    ageUnseenDevices();

    const int found = static_cast<int>(seenThisScan_.size());
    qDebug() << "NetworkDiscoveryService: scan finished," << found << "devices found,"
             << devices_.size() << "known";
    emit scanFinished(found);
}

void NetworkDiscoveryService::ageUnseenDevices()
{
    const QDateTime current = now();
    QList<quint32> pruned;

    for (auto it = devices_.begin(); it != devices_.end(); ++it) {
        NetworkDevice &device = it.value();
        if (seenThisScan_.contains(device.ipAddress)) {
            continue;
        }

        device.missedScans++;
        device.stale = true;
        if (device.reachable && device.missedScans >= unreachableAfterMisses_) {
            device.reachable = false;
            qDebug() << "NetworkDiscoveryService:" << device.ipAddress << "unreachable after"
                     << device.missedScans << "missed scans";
            emit deviceUnreachable(device);
        }
        if (device.lastSeen.isValid() && device.lastSeen.msecsTo(current) >= pruneAfterMs_) {
            pruned.append(it.key());
        }
    }

    for (quint32 key : pruned) {
        const QString ip = devices_.take(key).ipAddress;
        qDebug() << "NetworkDiscoveryService: pruned" << ip;
        emit devicePruned(ip);
    }
}

void NetworkDiscoveryService::startContinuousMonitoring(int intervalSec)
{
    if (intervalSec < MinimumIntervalSec) {
        qWarning() << "NetworkDiscoveryService: monitoring interval" << intervalSec
                   << "s raised to" << MinimumIntervalSec << "s";
        intervalSec = MinimumIntervalSec;
    }
    intervalSec_ = intervalSec;
    monitorTimer_->start(intervalSec_ * 1000);
    qDebug() << "NetworkDiscoveryService: started continuous monitoring every" << intervalSec_ << "s";
}

void NetworkDiscoveryService::stopContinuousMonitoring()
{
    monitorTimer_->stop();
    qDebug() << "NetworkDiscoveryService: stopped continuous monitoring";
}

bool NetworkDiscoveryService::isMonitoring() const
{
    return monitorTimer_->isActive();
}
