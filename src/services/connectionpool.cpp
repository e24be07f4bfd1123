#include "connectionpool.h"

#include <QTimer>

#include "utils/logging.h"

ConnectionPool::ConnectionPool(IConnectorFactory *factory, ConnectionRegistry *registry,
                               const ConnectionParams &params, int maxSessions, QObject *parent)
    : QObject(parent)
    , factory_(factory)
    , registry_(registry)
    , params_(params)
    , maxSessions_(qMax(1, maxSessions))
{
    connect(registry_, &ConnectionRegistry::connectSlotFreed,
            this, &ConnectionPool::onConnectSlotFreed);
}

ConnectionPool::~ConnectionPool()
{
    waiters_.clear();
    while (!sessions_.isEmpty()) {
        destroySession(sessions_.first().connector);
    }
}

quint64 ConnectionPool::acquire()
{
    const quint64 ticket = nextTicket_++;
    waiters_.enqueue(ticket);
    scheduleService();
    return ticket;
}

void ConnectionPool::cancelAcquire(quint64 ticket)
{
    waiters_.removeAll(ticket);
}

void ConnectionPool::release(ProtocolConnector *session)
{
    Session *entry = findSession(session);
    if (!entry) {
        return;
    }

    entry->inUse = false;
    if (!entry->connector || entry->connector->state() != ProtocolConnector::State::Connected) {
        destroySession(session);
    }
    scheduleService();
}

void ConnectionPool::closeAll()
{
    qDebug() << "ConnectionPool: closing" << sessions_.size() << "sessions to" << params_.host;

    const QQueue<quint64> waiting = waiters_;
    waiters_.clear();
    while (!sessions_.isEmpty()) {
        destroySession(sessions_.first().connector);
    }
    growthBlocked_ = false;

    for (quint64 ticket : waiting) {
        emit acquireFailed(ticket, ErrorKind::Cancelled, tr("Connection pool closed"));
    }
}

void ConnectionPool::setMaxSessions(int maxSessions)
{
    maxSessions_ = qMax(1, maxSessions);
    scheduleService();
}

int ConnectionPool::idleCount() const
{
    int count = 0;
    for (const Session &session : sessions_) {
        if (!session.inUse && session.connector
            && session.connector->state() == ProtocolConnector::State::Connected) {
            count++;
        }
    }
    return count;
}

void ConnectionPool::scheduleService()
{
    if (!serviceScheduled_) {
        serviceScheduled_ = true;
        QTimer::singleShot(0, this, &ConnectionPool::serviceWaiters);
    }
}

void ConnectionPool::serviceWaiters()
{
    serviceScheduled_ = false;

    while (!waiters_.isEmpty()) {
        Session *idle = nullptr;
        for (Session &session : sessions_) {
            if (!session.inUse && session.connector
                && session.connector->state() == ProtocolConnector::State::Connected) {
                idle = &session;
                break;
            }
        }
        if (!idle) {
            break;
        }
        idle->inUse = true;
        const quint64 ticket = waiters_.dequeue();
        emit acquired(ticket, idle->connector);
    }

    if (!waiters_.isEmpty() && !hasStartingSession() && !growthBlocked_
        && sessions_.size() < maxSessions_) {
        startSession();
    }
}

bool ConnectionPool::hasStartingSession() const
{
    for (const Session &session : sessions_) {
        if (!session.established) {
            return true;
        }
    }
    return false;
}

void ConnectionPool::startSession()
{
    ProtocolConnector *connector = factory_->create(params_.protocol, this);

    connect(connector, &ProtocolConnector::connected, this, [this, connector]() {
        onSessionConnected(connector);
    });
    connect(connector, &ProtocolConnector::connectFailed, this,
            [this, connector](ErrorKind kind, const QString &message) {
        onSessionConnectFailed(connector, kind, message);
    });
    connect(connector, &ProtocolConnector::stateChanged, this,
            [this, connector](ProtocolConnector::State state) {
        onSessionStateChanged(connector, state);
    });

    Session session;
    session.connector = connector;
    session.connectionId = registry_->open(params_.host, params_.protocol);
    sessions_.append(session);

    LOG_VERBOSE() << "ConnectionPool: opening session" << sessions_.size() << "of" << maxSessions_
                  << "to" << params_.host;
    beginConnect(sessions_.last());
}

void ConnectionPool::beginConnect(Session &session)
{
    if (session.connector->state() != ProtocolConnector::State::Disconnected) {
        return;
    }
    if (registry_->tryBeginConnect(session.connectionId)) {
        session.connector->connectToHost(params_);
    }
}

void ConnectionPool::onConnectSlotFreed(const QString &host, Protocol protocol)
{
    if (protocol != params_.protocol || host.compare(params_.host, Qt::CaseInsensitive) != 0) {
        return;
    }
    for (Session &session : sessions_) {
        if (!session.established && session.connector
            && session.connector->state() == ProtocolConnector::State::Disconnected) {
            beginConnect(session);
            return;
        }
    }
}

void ConnectionPool::onSessionConnected(ProtocolConnector *connector)
{
    Session *session = findSession(connector);
    if (!session) {
        return;
    }
    session->established = true;
    registry_->setStatus(session->connectionId, ProtocolConnector::State::Connected);
    scheduleService();
}

void ConnectionPool::onSessionConnectFailed(ProtocolConnector *connector, ErrorKind kind,
                                            const QString &message)
{
    if (!findSession(connector)) {
        return;
    }
    qDebug() << "ConnectionPool: session to" << params_.host << "failed:" << errorKindToString(kind)
             << message;
    destroySession(connector);

    if (!sessions_.isEmpty()) {
        // Live sessions remain; serve waiters from them instead of failing
        growthBlocked_ = true;
    } else if (!waiters_.isEmpty()) {
        emit acquireFailed(waiters_.dequeue(), kind, message);
    }
    scheduleService();
}

void ConnectionPool::onSessionStateChanged(ProtocolConnector *connector, ProtocolConnector::State state)
{
    Session *session = findSession(connector);
    if (!session) {
        return;
    }
    registry_->setStatus(session->connectionId, state);

    // An established idle session that dropped is not worth keeping
    if (session->established && !session->inUse
        && (state == ProtocolConnector::State::Error || state == ProtocolConnector::State::Disconnected)) {
        destroySession(connector);
        scheduleService();
    }
}

void ConnectionPool::destroySession(ProtocolConnector *connector)
{
    for (int i = 0; i < sessions_.size(); ++i) {
        if (sessions_[i].connector != connector) {
            continue;
        }
        const Session session = sessions_.takeAt(i);
        if (registry_) {
            registry_->close(session.connectionId);
        }
        if (session.connector) {
            session.connector->disconnect(this);
            session.connector->disconnectFromHost();
            session.connector->deleteLater();
        }
        break;
    }
    if (sessions_.isEmpty()) {
        growthBlocked_ = false;
    }
}

ConnectionPool::Session *ConnectionPool::findSession(ProtocolConnector *connector)
{
    for (Session &session : sessions_) {
        if (session.connector == connector) {
            return &session;
        }
    }
    return nullptr;
}
