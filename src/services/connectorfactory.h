/**
 * @file connectorfactory.h
 * @brief Creation of protocol connectors for the closed protocol set.
 */

#ifndef CONNECTORFACTORY_H
#define CONNECTORFACTORY_H

#include "protocolconnector.h"

/**
 * @brief Interface for creating connector sessions.
 *
 * Injected into the drive manager and connection pools so tests can hand out
 * mock connectors instead of network-backed ones.
 */
class IConnectorFactory
{
public:
    virtual ~IConnectorFactory() = default;

    /**
     * @brief Creates a new, disconnected session for a protocol.
     * @param protocol The protocol the session speaks.
     * @param parent Owner of the returned connector.
     * @return The connector; never null.
     */
    virtual ProtocolConnector *create(Protocol protocol, QObject *parent) = 0;
};

/**
 * @brief Production factory: libcurl for FTP/SFTP/SMB, Qt Network for
 *        WebDAV and Cloud.
 */
class ConnectorFactory : public IConnectorFactory
{
public:
    ProtocolConnector *create(Protocol protocol, QObject *parent) override;
};

#endif // CONNECTORFACTORY_H
