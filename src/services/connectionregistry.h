/**
 * @file connectionregistry.h
 * @brief Bookkeeping of live sessions and their connect gate.
 */

#ifndef CONNECTIONREGISTRY_H
#define CONNECTIONREGISTRY_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QString>

#include "protocolconnector.h"

/**
 * @brief A live session against a device for one protocol.
 */
struct ActiveConnection {
    quint64 id = 0;
    QString host;
    Protocol protocol = Protocol::Ftp;
    ProtocolConnector::State status = ProtocolConnector::State::Disconnected;
};

Q_DECLARE_METATYPE(ActiveConnection)

/**
 * @brief Tracks every ActiveConnection the engine holds.
 *
 * Enforces that at most one connection per (host, protocol) pair is in the
 * Connecting state. A session that cannot begin connecting waits for
 * connectSlotFreed() for its pair and asks again.
 *
 * @par Example usage:
 * @code
 * quint64 id = registry->open(host, Protocol::Sftp);
 * if (registry->tryBeginConnect(id)) {
 *     session->connectToHost(params);
 * }
 * // ... once the connector reports back
 * registry->setStatus(id, ProtocolConnector::State::Connected);
 * @endcode
 */
class ConnectionRegistry : public QObject
{
    Q_OBJECT

public:
    explicit ConnectionRegistry(QObject *parent = nullptr);

    /// @brief Registers a new connection in Disconnected state and returns its id.
    quint64 open(const QString &host, Protocol protocol);

    /**
     * @brief Moves a connection to Connecting if its pair has no other
     *        connection in that state.
     * @return True if the caller may start connecting now.
     */
    [[nodiscard]] bool tryBeginConnect(quint64 id);

    /// @brief Records the connector's observed status.
    void setStatus(quint64 id, ProtocolConnector::State status);

    /// @brief Forgets a connection (after disconnect).
    void close(quint64 id);

    [[nodiscard]] bool contains(quint64 id) const { return connections_.contains(id); }
    [[nodiscard]] ActiveConnection connection(quint64 id) const { return connections_.value(id); }
    [[nodiscard]] QList<ActiveConnection> connections() const { return connections_.values(); }

    /// @brief Number of connections for a pair currently in Connecting state.
    [[nodiscard]] int connectingCount(const QString &host, Protocol protocol) const;

signals:
    void statusChanged(quint64 id, ProtocolConnector::State status);
    void connectSlotFreed(const QString &host, Protocol protocol);

private:
    QHash<quint64, ActiveConnection> connections_;
    quint64 nextId_ = 1;
};

#endif // CONNECTIONREGISTRY_H
