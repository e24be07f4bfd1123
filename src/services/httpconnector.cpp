#include "httpconnector.h"

#include <QFile>

#include "utils/logging.h"

HttpConnector::HttpConnector(QObject *parent)
    : ProtocolConnector(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
    connect(networkManager_, &QNetworkAccessManager::finished,
            this, &HttpConnector::onReplyFinished);
}

HttpConnector::~HttpConnector()
{
    abortAll();
}

bool HttpConnector::isBusy() const
{
    for (auto it = pendingOperations_.cbegin(); it != pendingOperations_.cend(); ++it) {
        if (it->type == OperationType::Upload || it->type == OperationType::Download) {
            return true;
        }
    }
    return false;
}

void HttpConnector::setState(State state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

QUrl HttpConnector::baseUrl(const ConnectionParams &params, bool secure)
{
    QUrl url;
    url.setScheme(secure ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(params.host);
    url.setPort(params.effectivePort());
    return url;
}

QNetworkRequest HttpConnector::createRequest(const QUrl &url) const
{
    QNetworkRequest request(url);
    request.setTransferTimeout(params_.timeoutSec * 1000);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    authorize(request);
    return request;
}

void HttpConnector::track(QNetworkReply *reply, PendingOperation operation)
{
    operation.clock.start();
    pendingOperations_.insert(reply, operation);
}

ErrorKind HttpConnector::errorKindForReply(QNetworkReply::NetworkError error, int httpStatus)
{
    if (httpStatus == 401 || httpStatus == 403) {
        return ErrorKind::Authentication;
    }
    if (httpStatus == 405 || httpStatus == 501) {
        return ErrorKind::UnsupportedProtocol;
    }
    if (httpStatus == 408 || httpStatus == 504) {
        return ErrorKind::Timeout;
    }
    if (httpStatus == 502 || httpStatus == 503) {
        return ErrorKind::Connection;
    }

    switch (error) {
    case QNetworkReply::NoError:
        return httpStatus >= 400 ? ErrorKind::Protocol : ErrorKind::None;
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::SslHandshakeFailedError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyNotFoundError:
        return ErrorKind::Connection;
    case QNetworkReply::TimeoutError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::OperationCanceledError:  // transfer timeout expired
        return ErrorKind::Timeout;
    case QNetworkReply::AuthenticationRequiredError:
    case QNetworkReply::ContentAccessDenied:
    case QNetworkReply::ProxyAuthenticationRequiredError:
        return ErrorKind::Authentication;
    case QNetworkReply::ProtocolUnknownError:
    case QNetworkReply::ContentOperationNotPermittedError:
        return ErrorKind::UnsupportedProtocol;
    default:
        return ErrorKind::Protocol;
    }
}

void HttpConnector::connectToHost(const ConnectionParams &params)
{
    if (state_ == State::Connecting || state_ == State::Connected) {
        qDebug() << "Http: connectToHost called but session already active";
        return;
    }

    params_ = params;
    params_.protocol = protocol();

    qDebug() << "Http: Connecting to" << protocolToString(params_.protocol) << params_.host
             << ":" << params_.effectivePort();
    setState(State::Connecting);

    PendingOperation operation;
    operation.type = OperationType::Connect;
    operation.path = params_.rootPath.isEmpty() ? QStringLiteral("/") : params_.rootPath;
    track(sendListRequest(operation.path), operation);
}

void HttpConnector::disconnectFromHost()
{
    if (state_ == State::Disconnected) {
        return;
    }

    abortAll();
    setState(State::Disconnected);
    emit disconnected();
}

void HttpConnector::abortAll()
{
    // Forget the requests first so their finished() is ignored
    const auto pending = pendingOperations_;
    pendingOperations_.clear();
    for (auto it = pending.cbegin(); it != pending.cend(); ++it) {
        QNetworkReply *reply = it.key();
        reply->abort();
        reply->deleteLater();
    }
}

void HttpConnector::list(const QString &remotePath)
{
    if (state_ != State::Connected) {
        emit listFailed(remotePath, ErrorKind::Connection, tr("Cannot list directory: not connected"));
        return;
    }

    PendingOperation operation;
    operation.type = OperationType::List;
    operation.path = remotePath;
    track(sendListRequest(remotePath), operation);
}

void HttpConnector::download(quint64 transferId, const QString &remotePath,
                             const QString &localPath, const CancellationToken &token)
{
    if (state_ != State::Connected) {
        emit transferFailed(transferId, ErrorKind::Connection, tr("Cannot download: not connected"));
        return;
    }
    if (token.isCancelled()) {
        emit transferFailed(transferId, ErrorKind::Cancelled, tr("Download cancelled"));
        return;
    }

    auto *file = new QFile(localPath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        const QString message = tr("Cannot open %1 for writing: %2").arg(localPath, file->errorString());
        delete file;
        emit transferFailed(transferId, ErrorKind::Io, message);
        return;
    }

    QNetworkReply *reply = networkManager_->get(createRequest(contentUrl(remotePath)));
    file->setParent(reply);

    PendingOperation operation;
    operation.type = OperationType::Download;
    operation.path = remotePath;
    operation.transferId = transferId;
    operation.file = file;
    operation.token = token;
    operation.gate = std::make_shared<ProgressGate>(ProgressIntervalMs, ProgressByteDelta);
    track(reply, operation);

    connect(reply, &QNetworkReply::readyRead, this, [this, reply]() {
        onDownloadReadyRead(reply);
    });
    connect(reply, &QNetworkReply::downloadProgress, this, [this, reply](qint64 bytes, qint64 total) {
        onTransferProgress(reply, bytes, total);
    });
}

void HttpConnector::upload(quint64 transferId, const QString &localPath,
                           const QString &remotePath, const CancellationToken &token)
{
    if (state_ != State::Connected) {
        emit transferFailed(transferId, ErrorKind::Connection, tr("Cannot upload: not connected"));
        return;
    }
    if (token.isCancelled()) {
        emit transferFailed(transferId, ErrorKind::Cancelled, tr("Upload cancelled"));
        return;
    }

    auto *file = new QFile(localPath);
    if (!file->open(QIODevice::ReadOnly)) {
        const QString message = tr("Cannot open %1 for reading: %2").arg(localPath, file->errorString());
        delete file;
        emit transferFailed(transferId, ErrorKind::Io, message);
        return;
    }

    QNetworkRequest request = createRequest(contentUrl(remotePath));
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/octet-stream");
    request.setHeader(QNetworkRequest::ContentLengthHeader, file->size());
    QNetworkReply *reply = networkManager_->put(request, file);
    file->setParent(reply);

    PendingOperation operation;
    operation.type = OperationType::Upload;
    operation.path = remotePath;
    operation.transferId = transferId;
    operation.file = file;
    operation.token = token;
    operation.gate = std::make_shared<ProgressGate>(ProgressIntervalMs, ProgressByteDelta);
    track(reply, operation);

    connect(reply, &QNetworkReply::uploadProgress, this, [this, reply](qint64 bytes, qint64 total) {
        onTransferProgress(reply, bytes, total);
    });
}

void HttpConnector::onDownloadReadyRead(QNetworkReply *reply)
{
    auto it = pendingOperations_.find(reply);
    if (it == pendingOperations_.end() || !it->file) {
        return;
    }
    if (it->token.isCancelled()) {
        it->cancelled = true;
        reply->abort();
        return;
    }

    const QByteArray chunk = reply->readAll();
    if (it->file->write(chunk) != chunk.size()) {
        it->ioError = true;
        it->ioMessage = it->file->errorString();
        reply->abort();
    }
}

void HttpConnector::onTransferProgress(QNetworkReply *reply, qint64 bytes, qint64 total)
{
    auto it = pendingOperations_.find(reply);
    if (it == pendingOperations_.end()) {
        return;
    }
    if (it->token.isCancelled()) {
        it->cancelled = true;
        reply->abort();
        return;
    }

    const qint64 knownTotal = total > 0 ? total : 0;
    if (it->gate->shouldReport(it->clock.elapsed(), bytes, knownTotal)) {
        LOG_VERBOSE() << "Http: transfer" << it->transferId << "at" << bytes << "of" << knownTotal;
        emit transferProgress(it->transferId, bytes, knownTotal);
    }
}

void HttpConnector::onReplyFinished(QNetworkReply *reply)
{
    reply->deleteLater();

    if (!pendingOperations_.contains(reply)) {
        return;
    }
    const PendingOperation operation = pendingOperations_.take(reply);
    finishOperation(reply, operation);
}

void HttpConnector::finishOperation(QNetworkReply *reply, const PendingOperation &operation)
{
    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    ErrorKind kind = errorKindForReply(reply->error(), httpStatus);
    QString message;
    if (operation.ioError) {
        kind = ErrorKind::Io;
        message = tr("Write to %1 failed: %2").arg(operation.file ? operation.file->fileName()
                                                                   : operation.path,
                                                   operation.ioMessage);
    } else if (operation.cancelled) {
        kind = ErrorKind::Cancelled;
        message = operation.type == OperationType::Upload ? tr("Upload cancelled")
                                                          : tr("Download cancelled");
    } else if (kind != ErrorKind::None) {
        message = httpStatus > 0
                      ? QStringLiteral("HTTP %1: %2").arg(httpStatus).arg(reply->errorString())
                      : reply->errorString();
    }

    switch (operation.type) {
    case OperationType::Connect:
    case OperationType::List: {
        QList<RemoteEntry> entries;
        if (kind == ErrorKind::None) {
            QString parseError;
            entries = parseListing(operation.path, reply->readAll(), &parseError);
            if (!parseError.isEmpty()) {
                kind = ErrorKind::Protocol;
                message = parseError;
            }
        }
        if (operation.type == OperationType::Connect) {
            if (kind == ErrorKind::None) {
                setState(State::Connected);
                emit connected();
            } else {
                qDebug() << "Http: connect failed:" << message;
                setState(State::Error);
                emit connectFailed(kind, message);
            }
        } else if (kind == ErrorKind::None) {
            emit entriesListed(operation.path, entries);
        } else {
            emit listFailed(operation.path, kind, message);
        }
        break;
    }
    case OperationType::Download:
        if (operation.file) {
            if (kind == ErrorKind::None) {
                // Drain anything that arrived after the last readyRead
                const QByteArray rest = reply->readAll();
                if (!rest.isEmpty() && operation.file->write(rest) != rest.size()) {
                    kind = ErrorKind::Io;
                    message = tr("Write to %1 failed: %2")
                                  .arg(operation.file->fileName(), operation.file->errorString());
                }
            }
            operation.file->close();
        }
        [[fallthrough]];
    case OperationType::Upload:
        if (kind == ErrorKind::None) {
            emit transferFinished(operation.transferId);
        } else {
            emit transferFailed(operation.transferId, kind, message);
        }
        break;
    }
}
