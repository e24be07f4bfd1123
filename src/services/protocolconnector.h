/**
 * @file protocolconnector.h
 * @brief Interface for protocol-specific remote storage sessions.
 *
 * This interface allows dependency injection of connectors, enabling
 * runtime swapping between production backends and mock implementations
 * for testing.
 */

#ifndef PROTOCOLCONNECTOR_H
#define PROTOCOLCONNECTOR_H

#include <QList>
#include <QObject>
#include <QString>

#include "cancellationtoken.h"
#include "connectionparams.h"
#include "remoteentry.h"
#include "transfererror.h"

/**
 * @brief Abstract interface for one session against one remote endpoint.
 *
 * A connector instance is a single session: it is created for one protocol,
 * connected once, used for listings and transfers, and disconnected by its
 * owner. Implementations hold no process-wide mutable state, so any number
 * of sessions can exist side by side.
 *
 * All operations are asynchronous. Results are delivered through signals on
 * the thread that owns the connector. A connector runs at most one transfer
 * at a time; callers that need parallel transfers open several sessions.
 *
 * @par Example usage:
 * @code
 * ProtocolConnector *session = factory->create(Protocol::Sftp, this);
 * connect(session, &ProtocolConnector::connected, this, &MyClass::onConnected);
 * connect(session, &ProtocolConnector::connectFailed, this, &MyClass::onFailed);
 * session->connectToHost(params);
 *
 * // Later, once connected
 * CancellationToken token;
 * session->download(42, "/photos/a.jpg", "/tmp/a.jpg", token);
 * @endcode
 */
class ProtocolConnector : public QObject
{
    Q_OBJECT

public:
    /// Minimum interval between two progress signals for one transfer
    static constexpr int ProgressIntervalMs = 250;
    /// Byte delta that forces a progress signal regardless of elapsed time
    static constexpr qint64 ProgressByteDelta = 256 * 1024;

    /**
     * @brief Session state of the connector.
     */
    enum class State {
        Disconnected,  ///< No session
        Connecting,    ///< Connect in progress
        Connected,     ///< Session established and idle or busy
        Error          ///< Last connect or session operation failed
    };
    Q_ENUM(State)

    /**
     * @brief Constructs a connector interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ProtocolConnector(QObject *parent = nullptr) : QObject(parent) {}

    /**
     * @brief Virtual destructor.
     */
    ~ProtocolConnector() override = default;

    /**
     * @brief Returns the protocol this connector speaks.
     */
    [[nodiscard]] virtual Protocol protocol() const = 0;

    /**
     * @brief Returns the current session state.
     */
    [[nodiscard]] virtual State state() const = 0;

    /**
     * @brief Returns true while a transfer is running on this session.
     */
    [[nodiscard]] virtual bool isBusy() const = 0;

    /// @name Session Management
    /// @{

    /**
     * @brief Establishes a session.
     * @param params Endpoint, credentials and timeout.
     *
     * Emits connected() on success or connectFailed() with one of
     * Authentication, Connection, Timeout, Protocol or UnsupportedProtocol.
     */
    virtual void connectToHost(const ConnectionParams &params) = 0;

    /**
     * @brief Closes the session.
     *
     * Idempotent and always safe to call, including after a failed connect.
     * Aborts a running transfer without emitting its result.
     */
    virtual void disconnectFromHost() = 0;
    /// @}

    /// @name Remote Operations
    /// @{

    /**
     * @brief Lists a remote directory without modifying remote state.
     * @param remotePath Absolute remote directory path.
     */
    virtual void list(const QString &remotePath) = 0;

    /**
     * @brief Uploads a local file.
     * @param transferId Caller-chosen id echoed in progress/result signals.
     * @param localPath Local source file.
     * @param remotePath Absolute remote destination path.
     * @param token Cancellation flag polled between chunks.
     */
    virtual void upload(quint64 transferId, const QString &localPath,
                        const QString &remotePath, const CancellationToken &token) = 0;

    /**
     * @brief Downloads a remote file.
     * @param transferId Caller-chosen id echoed in progress/result signals.
     * @param remotePath Absolute remote source path.
     * @param localPath Local destination file (parent directory must exist).
     * @param token Cancellation flag polled between chunks.
     */
    virtual void download(quint64 transferId, const QString &remotePath,
                          const QString &localPath, const CancellationToken &token) = 0;
    /// @}

signals:
    /// @name Session Signals
    /// @{
    void stateChanged(ProtocolConnector::State state);
    void connected();
    void connectFailed(ErrorKind kind, const QString &message);
    void disconnected();
    /// @}

    /// @name Listing Signals
    /// @{
    void entriesListed(const QString &path, const QList<RemoteEntry> &entries);
    void listFailed(const QString &path, ErrorKind kind, const QString &message);
    /// @}

    /// @name Transfer Signals
    /// @{

    /**
     * @brief Progress of a running transfer, rate-limited by the connector.
     * @param transferId The id passed to upload()/download().
     * @param bytesTransferred Bytes moved so far.
     * @param totalBytes Total size, or 0 if unknown.
     */
    void transferProgress(quint64 transferId, qint64 bytesTransferred, qint64 totalBytes);

    void transferFinished(quint64 transferId);
    void transferFailed(quint64 transferId, ErrorKind kind, const QString &message);
    /// @}
};

#endif // PROTOCOLCONNECTOR_H
