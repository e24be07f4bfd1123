/**
 * @file connectionpool.h
 * @brief Per-drive pool of connector sessions used for transfers.
 */

#ifndef CONNECTIONPOOL_H
#define CONNECTIONPOOL_H

#include <QList>
#include <QObject>
#include <QPointer>
#include <QQueue>

#include "connectionregistry.h"
#include "connectorfactory.h"

/**
 * @brief Hands out connected sessions for one drive's endpoint.
 *
 * A session carries one transfer at a time, so the pool opens up to
 * maxSessions() sessions and reuses idle ones. Sessions are opened one at a
 * time and every connect goes through the ConnectionRegistry gate.
 *
 * Requests are asynchronous: acquire() returns a ticket and the pool later
 * emits acquired() or acquireFailed() for it, never from inside acquire().
 * A failed connect fails only the oldest waiting request; when other
 * sessions are alive the pool stops growing instead and the waiters are
 * served as those sessions are released.
 */
class ConnectionPool : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a pool.
     * @param factory Creates sessions; must outlive the pool.
     * @param registry Connect gate and ActiveConnection bookkeeping; must outlive the pool.
     * @param params Endpoint snapshot used for every session.
     * @param maxSessions Upper bound on open sessions (at least 1).
     * @param parent Optional parent QObject.
     */
    ConnectionPool(IConnectorFactory *factory, ConnectionRegistry *registry,
                   const ConnectionParams &params, int maxSessions, QObject *parent = nullptr);
    ~ConnectionPool() override;

    /// @brief Requests a session; returns the ticket echoed in the result signal.
    quint64 acquire();

    /// @brief Withdraws a request that has not been served yet.
    void cancelAcquire(quint64 ticket);

    /**
     * @brief Returns a session obtained through acquired().
     *
     * Sessions that are no longer connected are closed instead of reused.
     */
    void release(ProtocolConnector *session);

    /// @brief Disconnects every session and fails all waiting requests as Cancelled.
    void closeAll();

    void setMaxSessions(int maxSessions);
    [[nodiscard]] int maxSessions() const { return maxSessions_; }
    [[nodiscard]] int sessionCount() const { return static_cast<int>(sessions_.size()); }
    [[nodiscard]] int idleCount() const;
    [[nodiscard]] int waitingCount() const { return static_cast<int>(waiters_.size()); }
    [[nodiscard]] const ConnectionParams &params() const { return params_; }

signals:
    void acquired(quint64 ticket, ProtocolConnector *session);
    void acquireFailed(quint64 ticket, ErrorKind kind, const QString &message);

private:
    struct Session {
        QPointer<ProtocolConnector> connector;
        quint64 connectionId = 0;
        bool inUse = false;
        bool established = false;
    };

    void scheduleService();
    void serviceWaiters();
    void startSession();
    void beginConnect(Session &session);
    void onConnectSlotFreed(const QString &host, Protocol protocol);
    void onSessionConnected(ProtocolConnector *connector);
    void onSessionConnectFailed(ProtocolConnector *connector, ErrorKind kind, const QString &message);
    void onSessionStateChanged(ProtocolConnector *connector, ProtocolConnector::State state);
    void destroySession(ProtocolConnector *connector);
    [[nodiscard]] Session *findSession(ProtocolConnector *connector);
    [[nodiscard]] bool hasStartingSession() const;

    IConnectorFactory *factory_;
    QPointer<ConnectionRegistry> registry_;
    ConnectionParams params_;
    int maxSessions_;

    QList<Session> sessions_;
    QQueue<quint64> waiters_;
    quint64 nextTicket_ = 1;
    bool serviceScheduled_ = false;
    bool growthBlocked_ = false;
};

#endif // CONNECTIONPOOL_H
