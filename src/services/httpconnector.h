/**
 * @file httpconnector.h
 * @brief Shared QNetworkAccessManager plumbing for HTTP-based connectors.
 */

#ifndef HTTPCONNECTOR_H
#define HTTPCONNECTOR_H

#include <QElapsedTimer>
#include <QHash>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QUrl>

#include "protocolconnector.h"
#include "utils/progressgate.h"

class QFile;

/**
 * @brief Base class for connectors that talk HTTP(S) through Qt Network.
 *
 * Handles the session state machine, the pending request map, streaming
 * GET/PUT transfers with throttled progress and cooperative cancellation,
 * and translation of network errors into ErrorKind. Subclasses only decide
 * how URLs look, how a directory is requested and how its reply is parsed.
 *
 * A successful listing of the session root is what "connected" means.
 * Remote paths reach the subclasses as absolute server paths; the session
 * root is already part of them.
 */
class HttpConnector : public ProtocolConnector
{
    Q_OBJECT

public:
    explicit HttpConnector(QObject *parent = nullptr);
    ~HttpConnector() override;

    [[nodiscard]] State state() const override { return state_; }
    [[nodiscard]] bool isBusy() const override;

    void connectToHost(const ConnectionParams &params) override;
    void disconnectFromHost() override;

    void list(const QString &remotePath) override;
    void upload(quint64 transferId, const QString &localPath,
                const QString &remotePath, const CancellationToken &token) override;
    void download(quint64 transferId, const QString &remotePath,
                  const QString &localPath, const CancellationToken &token) override;

    /**
     * @brief Maps a finished reply's error and HTTP status to ErrorKind.
     * @param error Qt network error code of the reply.
     * @param httpStatus HTTP status code, or 0 if none was received.
     */
    [[nodiscard]] static ErrorKind errorKindForReply(QNetworkReply::NetworkError error,
                                                     int httpStatus);

protected:
    /// Session parameters of the current connection
    [[nodiscard]] const ConnectionParams &params() const { return params_; }

    /// @brief Scheme, host and port of the endpoint without a path.
    [[nodiscard]] static QUrl baseUrl(const ConnectionParams &params, bool secure);

    /// @brief Request with timeout and credentials applied.
    [[nodiscard]] QNetworkRequest createRequest(const QUrl &url) const;

    /// @brief Issues the request that lists a directory.
    virtual QNetworkReply *sendListRequest(const QString &remotePath) = 0;

    /**
     * @brief Parses the body of a successful listing reply.
     * @param remotePath The directory that was listed.
     * @param body Raw reply body.
     * @param error Set to a reason when the body is malformed.
     */
    [[nodiscard]] virtual QList<RemoteEntry> parseListing(const QString &remotePath,
                                                          const QByteArray &body,
                                                          QString *error) const = 0;

    /// @brief URL a file's content is read from (GET) and written to (PUT).
    [[nodiscard]] virtual QUrl contentUrl(const QString &remotePath) const = 0;

    /// @brief Adds authentication to an outgoing request.
    virtual void authorize(QNetworkRequest &request) const = 0;

    QNetworkAccessManager *networkManager_ = nullptr;

private slots:
    void onReplyFinished(QNetworkReply *reply);

private:
    enum class OperationType {
        Connect,
        List,
        Upload,
        Download
    };

    struct PendingOperation {
        OperationType type = OperationType::List;
        QString path;
        quint64 transferId = 0;
        QPointer<QFile> file;
        CancellationToken token;
        bool cancelled = false;
        bool ioError = false;
        QString ioMessage;
        std::shared_ptr<ProgressGate> gate;
        QElapsedTimer clock;
    };

    void setState(State state);
    void track(QNetworkReply *reply, PendingOperation operation);
    void onTransferProgress(QNetworkReply *reply, qint64 bytes, qint64 total);
    void onDownloadReadyRead(QNetworkReply *reply);
    void finishOperation(QNetworkReply *reply, const PendingOperation &operation);
    void abortAll();

    ConnectionParams params_;
    State state_ = State::Disconnected;
    QHash<QNetworkReply *, PendingOperation> pendingOperations_;
};

#endif // HTTPCONNECTOR_H
