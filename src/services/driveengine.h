/**
 * @file driveengine.h
 * @brief Assembly point owning every engine service.
 */

#ifndef DRIVEENGINE_H
#define DRIVEENGINE_H

#include <QObject>

#include <memory>

#include "connectionregistry.h"
#include "connectorfactory.h"
#include "engineconfig.h"
#include "errorhandler.h"
#include "hostprober.h"
#include "networkdiscoveryservice.h"
#include "virtualdrivemanager.h"

/**
 * @brief Builds and wires the drive engine from a configuration snapshot.
 *
 * Owns the connector factory, the connection registry, the drive manager,
 * the discovery service and the error handler. Engine errors from all of
 * them are routed into the error handler.
 *
 * @par Example usage:
 * @code
 * DriveEngine engine(config);
 * connect(engine.errors(), &ErrorHandler::statusMessage, this, &MyClass::showStatus);
 * engine.mountConfigured("nas");
 * engine.discovery()->startContinuousMonitoring(config.discovery.intervalSec);
 * @endcode
 */
class DriveEngine : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs the engine.
     * @param config Snapshot applied to the services; kept for mountConfigured().
     * @param factory Connector factory to use; nullptr selects ConnectorFactory.
     * @param prober Host prober to use; nullptr selects TcpHostProber. Ownership
     *               passes to the discovery service.
     * @param parent Optional parent QObject.
     */
    explicit DriveEngine(const EngineConfig &config,
                         std::unique_ptr<IConnectorFactory> factory = nullptr,
                         IHostProber *prober = nullptr, QObject *parent = nullptr);
    ~DriveEngine() override;

    [[nodiscard]] const EngineConfig &config() const { return config_; }
    [[nodiscard]] ConnectionRegistry *registry() const { return registry_; }
    [[nodiscard]] VirtualDriveManager *drives() const { return drives_; }
    [[nodiscard]] NetworkDiscoveryService *discovery() const { return discovery_; }
    [[nodiscard]] ErrorHandler *errors() const { return errors_; }

    /**
     * @brief Mounts a drive from the configuration by name.
     * @param name Name of a [drive.NAME] group.
     * @param error Set when the name is unknown or its configuration invalid.
     * @return Drive id, or empty on error.
     */
    QString mountConfigured(const QString &name, QString *error = nullptr);

    /// @brief Mounts every configured drive; returns the drive ids started.
    QStringList mountAll();

    /// @brief Unmounts every drive.
    void unmountAll();

private:
    EngineConfig config_;
    std::unique_ptr<IConnectorFactory> factory_;
    ConnectionRegistry *registry_ = nullptr;
    VirtualDriveManager *drives_ = nullptr;
    NetworkDiscoveryService *discovery_ = nullptr;
    ErrorHandler *errors_ = nullptr;
};

#endif // DRIVEENGINE_H
