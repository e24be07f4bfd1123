#include "connectionregistry.h"

#include "utils/logging.h"

namespace {

bool sameEndpoint(const ActiveConnection &a, const QString &host, Protocol protocol)
{
    return a.protocol == protocol && a.host.compare(host, Qt::CaseInsensitive) == 0;
}

} // namespace

ConnectionRegistry::ConnectionRegistry(QObject *parent)
    : QObject(parent)
{
}

quint64 ConnectionRegistry::open(const QString &host, Protocol protocol)
{
    ActiveConnection connection;
    connection.id = nextId_++;
    connection.host = host;
    connection.protocol = protocol;
    connections_.insert(connection.id, connection);
    LOG_VERBOSE() << "ConnectionRegistry: opened" << connection.id << protocolToString(protocol) << host;
    return connection.id;
}

int ConnectionRegistry::connectingCount(const QString &host, Protocol protocol) const
{
    int count = 0;
    for (const ActiveConnection &connection : connections_) {
        if (connection.status == ProtocolConnector::State::Connecting
            && sameEndpoint(connection, host, protocol)) {
            count++;
        }
    }
    return count;
}

bool ConnectionRegistry::tryBeginConnect(quint64 id)
{
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }
    if (it->status == ProtocolConnector::State::Connecting) {
        return true;
    }
    if (connectingCount(it->host, it->protocol) > 0) {
        LOG_VERBOSE() << "ConnectionRegistry:" << id << "waits for another connect to" << it->host;
        return false;
    }
    setStatus(id, ProtocolConnector::State::Connecting);
    return true;
}

void ConnectionRegistry::setStatus(quint64 id, ProtocolConnector::State status)
{
    auto it = connections_.find(id);
    if (it == connections_.end() || it->status == status) {
        return;
    }

    const bool wasConnecting = it->status == ProtocolConnector::State::Connecting;
    it->status = status;
    const QString host = it->host;
    const Protocol protocol = it->protocol;

    emit statusChanged(id, status);
    if (wasConnecting) {
        emit connectSlotFreed(host, protocol);
    }
}

void ConnectionRegistry::close(quint64 id)
{
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return;
    }

    const bool wasConnecting = it->status == ProtocolConnector::State::Connecting;
    const QString host = it->host;
    const Protocol protocol = it->protocol;
    connections_.erase(it);

    if (wasConnecting) {
        emit connectSlotFreed(host, protocol);
    }
}
