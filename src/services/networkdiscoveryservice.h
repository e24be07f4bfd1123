/**
 * @file networkdiscoveryservice.h
 * @brief Scanning of the local network for storage endpoints.
 */

#ifndef NETWORKDISCOVERYSERVICE_H
#define NETWORKDISCOVERYSERVICE_H

#include <QDateTime>
#include <QMap>
#include <QObject>
#include <QPointer>
#include <QSet>
#include <QStringList>

#include <functional>
#include <optional>

#include "hostprober.h"  // Full include needed for QPointer
#include "networkdevice.h"

class QTimer;

/**
 * @brief Discovers devices and their file services on the local network.
 *
 * A scan asks the prober for candidate hosts, probes them with at most
 * parallelProbes() probes in flight, and reports every responding host as
 * soon as its probe finishes. When the last probe is back, hosts that were
 * known but not seen are aged: stale after one missed scan, unreachable
 * after unreachableAfterMisses() consecutive misses, and dropped once their
 * lastSeen is older than the prune window.
 *
 * Scan failures (no usable interface) are reported through scanFailed()
 * once per scan and never stop continuous monitoring.
 *
 * @par Example usage:
 * @code
 * NetworkDiscoveryService discovery(new TcpHostProber);
 * connect(&discovery, &NetworkDiscoveryService::deviceDiscovered, this, &MyClass::onDevice);
 * discovery.startContinuousMonitoring(60);
 * @endcode
 */
class NetworkDiscoveryService : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultIntervalSec = 30;
    static constexpr int MinimumIntervalSec = 10;
    static constexpr int DefaultUnreachableAfterMisses = 3;
    static constexpr int DefaultPruneAfterHours = 24;
    static constexpr int DefaultProbeTimeoutMs = 300;
    static constexpr int DefaultParallelProbes = 32;

    /**
     * @brief Constructs the service.
     * @param prober Host source and port prober; reparented to the service.
     * @param parent Optional parent QObject.
     */
    explicit NetworkDiscoveryService(IHostProber *prober, QObject *parent = nullptr);
    ~NetworkDiscoveryService() override;

    /// @name Settings
    /// @{
    void setProbeTimeoutMs(int timeoutMs) { probeTimeoutMs_ = qMax(1, timeoutMs); }
    void setParallelProbes(int count) { parallelProbes_ = qMax(1, count); }
    void setUnreachableAfterMisses(int misses) { unreachableAfterMisses_ = qMax(1, misses); }
    void setPruneAfterMs(qint64 ms) { pruneAfterMs_ = qMax<qint64>(0, ms); }
    [[nodiscard]] int probeTimeoutMs() const { return probeTimeoutMs_; }
    [[nodiscard]] int parallelProbes() const { return parallelProbes_; }
    [[nodiscard]] int unreachableAfterMisses() const { return unreachableAfterMisses_; }
    [[nodiscard]] qint64 pruneAfterMs() const { return pruneAfterMs_; }

    /// @brief Replaces the wall clock (used for lastSeen and pruning).
    void setClock(std::function<QDateTime()> clock) { clock_ = std::move(clock); }
    /// @}

    /**
     * @brief Starts one scan.
     * @return False if a scan is already running (the call is ignored).
     */
    bool scan();

    [[nodiscard]] bool isScanning() const { return scanning_; }

    /**
     * @brief Scans repeatedly every @p intervalSec seconds.
     *
     * Intervals below MinimumIntervalSec are raised to it. The first scan
     * runs after one interval; call scan() for an immediate one.
     */
    void startContinuousMonitoring(int intervalSec = DefaultIntervalSec);
    void stopContinuousMonitoring();
    [[nodiscard]] bool isMonitoring() const;
    [[nodiscard]] int monitoringIntervalSec() const { return intervalSec_; }

    /// @brief Known devices ordered by IP address.
    [[nodiscard]] QList<NetworkDevice> devices() const { return devices_.values(); }
    [[nodiscard]] std::optional<NetworkDevice> device(const QString &ipAddress) const;

signals:
    void scanStarted(int candidateCount);
    void deviceDiscovered(const NetworkDevice &device);
    void deviceUnreachable(const NetworkDevice &device);
    void devicePruned(const QString &ipAddress);
    void scanFinished(int devicesFound);
    void scanFailed(const QString &message);

private slots:
    void onProbeFinished(const QString &ip, const QList<quint16> &openPorts, const QString &hostname);

private:
    void launchProbes();
    void finishScan();
    void ageUnseenDevices();
    [[nodiscard]] QDateTime now() const;
    [[nodiscard]] static quint32 sortKey(const QString &ipAddress);

    QPointer<IHostProber> prober_;
    QTimer *monitorTimer_ = nullptr;
    std::function<QDateTime()> clock_;

    QMap<quint32, NetworkDevice> devices_;
    QStringList pendingHosts_;
    QSet<QString> inFlight_;
    QSet<QString> seenThisScan_;
    bool scanning_ = false;

    int intervalSec_ = DefaultIntervalSec;
    int probeTimeoutMs_ = DefaultProbeTimeoutMs;
    int parallelProbes_ = DefaultParallelProbes;
    int unreachableAfterMisses_ = DefaultUnreachableAfterMisses;
    qint64 pruneAfterMs_ = qint64(DefaultPruneAfterHours) * 3600 * 1000;
};

#endif // NETWORKDISCOVERYSERVICE_H
