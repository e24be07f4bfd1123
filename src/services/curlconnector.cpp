#include "curlconnector.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QUrl>

#include <curl/curl.h>

#include "listingparser.h"
#include "utils/logging.h"
#include "utils/progressgate.h"

namespace {

void ensureCurlInitialized()
{
    static const bool initialized = [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            qCritical() << "curl_global_init failed:" << curl_easy_strerror(rc);
        }
        return rc == CURLE_OK;
    }();
    Q_UNUSED(initialized)
}

/// Owns one easy handle for the duration of a single operation
class CurlHandle
{
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle()
    {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }
    CurlHandle(const CurlHandle &) = delete;
    CurlHandle &operator=(const CurlHandle &) = delete;

    [[nodiscard]] CURL *get() const { return handle_; }

private:
    CURL *handle_;
};

/// State shared with the C callbacks of one curl_easy_perform() call
struct CallbackContext {
    const std::atomic_bool *abort = nullptr;
    const CancellationToken *token = nullptr;
    QFile *file = nullptr;
    QByteArray *buffer = nullptr;
    std::function<void(qint64 bytes, qint64 total)> onProgress;
    bool cancelled = false;
    bool ioError = false;
    QString ioMessage;
};

size_t writeCallback(char *data, size_t size, size_t nitems, void *userdata)
{
    auto *ctx = static_cast<CallbackContext *>(userdata);
    const size_t length = size * nitems;
    if (ctx->buffer) {
        ctx->buffer->append(data, static_cast<qsizetype>(length));
        return length;
    }
    if (ctx->file) {
        const qint64 written = ctx->file->write(data, static_cast<qint64>(length));
        if (written != static_cast<qint64>(length)) {
            ctx->ioError = true;
            ctx->ioMessage = ctx->file->errorString();
            return length + 1;  // signal error condition => CURLE_WRITE_ERROR
        }
    }
    return length;
}

size_t readCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    auto *ctx = static_cast<CallbackContext *>(userdata);
    if (ctx->abort->load() || ctx->token->isCancelled()) {
        ctx->cancelled = true;
        return CURL_READFUNC_ABORT;
    }
    const qint64 bytesRead = ctx->file->read(buffer, static_cast<qint64>(size * nitems));
    if (bytesRead < 0) {
        ctx->ioError = true;
        ctx->ioMessage = ctx->file->errorString();
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(bytesRead);
}

int transferInfoCallback(void *clientp, curl_off_t dltotal, curl_off_t dlnow,
                         curl_off_t ultotal, curl_off_t ulnow)
{
    auto *ctx = static_cast<CallbackContext *>(clientp);
    if (ctx->abort->load() || (ctx->token && ctx->token->isCancelled())) {
        ctx->cancelled = true;
        return 1;  // => CURLE_ABORTED_BY_CALLBACK
    }
    if (ctx->onProgress) {
        if (ultotal > 0 || ulnow > 0) {
            ctx->onProgress(static_cast<qint64>(ulnow), static_cast<qint64>(ultotal));
        } else {
            ctx->onProgress(static_cast<qint64>(dlnow), static_cast<qint64>(dltotal));
        }
    }
    return 0;
}

// Options every operation shares: URL, credentials, timeouts, TLS and callbacks
bool applyCommonOptions(CURL *curl, const ConnectionParams &params, const QByteArray &url,
                        CallbackContext *ctx, char *errorBuffer)
{
    const QByteArray user = params.user.toUtf8();
    const QByteArray password = params.password.toUtf8();
    bool ok = true;
    ok &= curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer) == CURLE_OK;
    ok &= curl_easy_setopt(curl, CURLOPT_URL, url.constData()) == CURLE_OK;
    ok &= curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L) == CURLE_OK;
    ok &= curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(params.timeoutSec)) == CURLE_OK;
    // Abort stalled transfers instead of imposing a hard total limit
    ok &= curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(params.timeoutSec)) == CURLE_OK;
    ok &= curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L) == CURLE_OK;
    if (!params.user.isEmpty()) {
        ok &= curl_easy_setopt(curl, CURLOPT_USERNAME, user.constData()) == CURLE_OK;
        ok &= curl_easy_setopt(curl, CURLOPT_PASSWORD, password.constData()) == CURLE_OK;
    }
    if (params.protocol == Protocol::Ftp) {
        ok &= curl_easy_setopt(curl, CURLOPT_USE_SSL,
                               params.secure ? static_cast<long>(CURLUSESSL_ALL)
                                             : static_cast<long>(CURLUSESSL_NONE)) == CURLE_OK;
        ok &= curl_easy_setopt(curl, CURLOPT_FTP_CREATE_MISSING_DIRS,
                               static_cast<long>(CURLFTP_CREATE_DIR)) == CURLE_OK;
    } else if (params.protocol == Protocol::Sftp) {
        ok &= curl_easy_setopt(curl, CURLOPT_SSH_AUTH_TYPES,
                               static_cast<long>(CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD)) == CURLE_OK;
        ok &= curl_easy_setopt(curl, CURLOPT_FTP_CREATE_MISSING_DIRS,
                               static_cast<long>(CURLFTP_CREATE_DIR)) == CURLE_OK;
    }
    ok &= curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L) == CURLE_OK;
    ok &= curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, transferInfoCallback) == CURLE_OK;
    ok &= curl_easy_setopt(curl, CURLOPT_XFERINFODATA, ctx) == CURLE_OK;
    ok &= curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback) == CURLE_OK;
    ok &= curl_easy_setopt(curl, CURLOPT_WRITEDATA, ctx) == CURLE_OK;
    return ok;
}

QString describeFailure(CURLcode rc, const char *errorBuffer)
{
    const QString detail = QString::fromUtf8(errorBuffer).trimmed();
    const QString summary = QString::fromUtf8(curl_easy_strerror(rc));
    return detail.isEmpty() ? summary : QStringLiteral("%1 (%2)").arg(summary, detail);
}

} // namespace

CurlConnector::CurlConnector(Protocol protocol, QObject *parent)
    : ProtocolConnector(parent)
    , protocol_(protocol)
    , abort_(std::make_shared<std::atomic_bool>(false))
{
    ensureCurlInitialized();
}

CurlConnector::~CurlConnector()
{
    abort_->store(true);
    jobs_.clear();
    for (const QPointer<QThread> &worker : std::as_const(workers_)) {
        if (worker) {
            worker->wait();
        }
    }
}

void CurlConnector::setState(State state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

QString CurlConnector::urlScheme(Protocol protocol, bool secure)
{
    switch (protocol) {
    case Protocol::Ftp:
        return QStringLiteral("ftp");
    case Protocol::Sftp:
        return QStringLiteral("sftp");
    case Protocol::Smb:
        return secure ? QStringLiteral("smbs") : QStringLiteral("smb");
    case Protocol::WebDav:
    case Protocol::Cloud:
        break;
    }
    return QString();
}

QByteArray CurlConnector::buildUrl(const ConnectionParams &params, const QString &remotePath,
                                   bool directory)
{
    QString path = remotePath.isEmpty() ? QStringLiteral("/") : remotePath;
    if (directory && !path.endsWith(QLatin1Char('/'))) {
        path += QLatin1Char('/');
    }

    QByteArray url = urlScheme(params.protocol, params.secure).toLatin1();
    url += "://";
    url += QUrl::toAce(params.host).isEmpty() ? params.host.toUtf8() : QUrl::toAce(params.host);
    url += ':' + QByteArray::number(params.effectivePort());
    url += QUrl::toPercentEncoding(path, "/");
    return url;
}

ErrorKind CurlConnector::errorKindForCurlCode(int curlCode)
{
    switch (static_cast<CURLcode>(curlCode)) {
    case CURLE_OK:
        return ErrorKind::None;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
    case CURLE_SSL_CONNECT_ERROR:
        return ErrorKind::Connection;
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_FTP_ACCEPT_TIMEOUT:
        return ErrorKind::Timeout;
    case CURLE_LOGIN_DENIED:
    case CURLE_FTP_WEIRD_PASS_REPLY:
    case CURLE_PEER_FAILED_VERIFICATION:
        return ErrorKind::Authentication;
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_NOT_BUILT_IN:
        return ErrorKind::UnsupportedProtocol;
    case CURLE_WRITE_ERROR:
    case CURLE_READ_ERROR:
    case CURLE_FILE_COULDNT_READ_FILE:
        return ErrorKind::Io;
    case CURLE_ABORTED_BY_CALLBACK:
        return ErrorKind::Cancelled;
    default:
        return ErrorKind::Protocol;
    }
}

void CurlConnector::connectToHost(const ConnectionParams &params)
{
    if (state_ == State::Connecting || state_ == State::Connected) {
        qDebug() << "Curl: connectToHost called but session already active";
        return;
    }

    params_ = params;
    params_.protocol = protocol_;

    if (urlScheme(protocol_, params_.secure).isEmpty()) {
        setState(State::Error);
        emit connectFailed(ErrorKind::UnsupportedProtocol,
                           tr("%1 is not served by the curl backend")
                               .arg(protocolToString(protocol_)));
        return;
    }

    qDebug() << "Curl: Connecting to" << protocolToString(protocol_) << params_.host
             << ":" << params_.effectivePort();
    setState(State::Connecting);

    const ConnectionParams snapshot = params_;
    const AbortFlag abort = abort_;
    submit({[snapshot, abort](quint64) { return performConnect(snapshot, abort); },
            [this](const JobResult &result) {
                if (result.kind == ErrorKind::None) {
                    setState(State::Connected);
                    emit connected();
                } else {
                    qDebug() << "Curl: connect failed:" << result.message;
                    setState(State::Error);
                    emit connectFailed(result.kind, result.message);
                }
            }});
}

void CurlConnector::disconnectFromHost()
{
    if (state_ == State::Disconnected) {
        return;
    }

    // Abandon queued and running work; the worker notices the flag at its
    // next callback and its result is dropped by the generation check
    jobs_.clear();
    abort_->store(true);
    abort_ = std::make_shared<std::atomic_bool>(false);
    generation_++;
    running_ = false;

    setState(State::Disconnected);
    emit disconnected();
}

void CurlConnector::list(const QString &remotePath)
{
    if (state_ != State::Connected) {
        emit listFailed(remotePath, ErrorKind::Connection, tr("Cannot list directory: not connected"));
        return;
    }

    const ConnectionParams snapshot = params_;
    const AbortFlag abort = abort_;
    submit({[snapshot, abort, remotePath](quint64) {
                return performList(snapshot, abort, remotePath);
            },
            [this, remotePath](const JobResult &result) {
                if (result.kind == ErrorKind::None) {
                    emit entriesListed(remotePath, parseUnixListing(result.body));
                } else {
                    emit listFailed(remotePath, result.kind, result.message);
                }
            }});
}

void CurlConnector::upload(quint64 transferId, const QString &localPath,
                           const QString &remotePath, const CancellationToken &token)
{
    if (state_ != State::Connected) {
        emit transferFailed(transferId, ErrorKind::Connection, tr("Cannot upload: not connected"));
        return;
    }

    const ConnectionParams snapshot = params_;
    const AbortFlag abort = abort_;
    submit({[this, snapshot, abort, transferId, localPath, remotePath, token](quint64 generation) {
                return performUpload(snapshot, abort, localPath, remotePath, token,
                                     progressReporter(generation, transferId));
            },
            [this, transferId](const JobResult &result) {
                if (result.kind == ErrorKind::None) {
                    emit transferFinished(transferId);
                } else {
                    emit transferFailed(transferId, result.kind, result.message);
                }
            }});
}

void CurlConnector::download(quint64 transferId, const QString &remotePath,
                             const QString &localPath, const CancellationToken &token)
{
    if (state_ != State::Connected) {
        emit transferFailed(transferId, ErrorKind::Connection, tr("Cannot download: not connected"));
        return;
    }

    const ConnectionParams snapshot = params_;
    const AbortFlag abort = abort_;
    submit({[this, snapshot, abort, transferId, remotePath, localPath, token](quint64 generation) {
                return performDownload(snapshot, abort, remotePath, localPath, token,
                                       progressReporter(generation, transferId));
            },
            [this, transferId](const JobResult &result) {
                if (result.kind == ErrorKind::None) {
                    emit transferFinished(transferId);
                } else {
                    emit transferFailed(transferId, result.kind, result.message);
                }
            }});
}

void CurlConnector::submit(Job job)
{
    jobs_.enqueue(std::move(job));
    if (!running_) {
        startNextJob();
    }
}

void CurlConnector::startNextJob()
{
    if (jobs_.isEmpty()) {
        return;
    }

    workers_.removeIf([](const QPointer<QThread> &worker) { return worker.isNull(); });

    Job job = jobs_.dequeue();
    running_ = true;
    const quint64 generation = generation_;
    auto done = std::make_shared<std::function<void(const JobResult &)>>(std::move(job.done));
    auto work = std::move(job.work);

    // A worker abandoned by disconnect may still be running; it is not joined
    // here, its result is dropped by the generation check
    QThread *worker = QThread::create([this, generation, done, work] {
        const JobResult result = work(generation);
        QMetaObject::invokeMethod(this, [this, generation, done, result] {
            if (generation != generation_) {
                return;
            }
            running_ = false;
            (*done)(result);
            startNextJob();
        }, Qt::QueuedConnection);
    });
    connect(worker, &QThread::finished, worker, &QObject::deleteLater);
    workers_.append(worker);
    worker->start();
}

CurlConnector::ProgressFn CurlConnector::progressReporter(quint64 generation, quint64 transferId)
{
    return [this, generation, transferId](qint64 bytes, qint64 total) {
        QMetaObject::invokeMethod(this, [this, generation, transferId, bytes, total] {
            if (generation == generation_) {
                emit transferProgress(transferId, bytes, total);
            }
        }, Qt::QueuedConnection);
    };
}

CurlConnector::JobResult CurlConnector::performConnect(const ConnectionParams &params,
                                                       const AbortFlag &abort)
{
    JobResult result;
    CurlHandle curl;
    if (!curl.get()) {
        result.kind = ErrorKind::Io;
        result.message = QStringLiteral("curl_easy_init failed");
        return result;
    }

    char errorBuffer[CURL_ERROR_SIZE] = {};
    QByteArray discard;
    CallbackContext ctx;
    ctx.abort = abort.get();
    ctx.buffer = &discard;

    const QByteArray url = buildUrl(params, params.rootPath, true);
    if (!applyCommonOptions(curl.get(), params, url, &ctx, errorBuffer)) {
        result.kind = ErrorKind::Protocol;
        result.message = QStringLiteral("Failed to configure curl session");
        return result;
    }
    if (params.protocol == Protocol::Smb) {
        curl_easy_setopt(curl.get(), CURLOPT_CONNECT_ONLY, 1L);
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        result.kind = errorKindForCurlCode(rc);
        result.message = describeFailure(rc, errorBuffer);
    }
    return result;
}

CurlConnector::JobResult CurlConnector::performList(const ConnectionParams &params,
                                                    const AbortFlag &abort,
                                                    const QString &remotePath)
{
    JobResult result;
    if (params.protocol == Protocol::Smb) {
        result.kind = ErrorKind::Protocol;
        result.message = QStringLiteral("Directory listing is not supported for SMB shares");
        return result;
    }

    CurlHandle curl;
    if (!curl.get()) {
        result.kind = ErrorKind::Io;
        result.message = QStringLiteral("curl_easy_init failed");
        return result;
    }

    char errorBuffer[CURL_ERROR_SIZE] = {};
    CallbackContext ctx;
    ctx.abort = abort.get();
    ctx.buffer = &result.body;

    const QByteArray url = buildUrl(params, remotePath, true);
    if (!applyCommonOptions(curl.get(), params, url, &ctx, errorBuffer)) {
        result.kind = ErrorKind::Protocol;
        result.message = QStringLiteral("Failed to configure curl session");
        return result;
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        result.kind = errorKindForCurlCode(rc);
        result.message = describeFailure(rc, errorBuffer);
        result.body.clear();
    }
    return result;
}

CurlConnector::JobResult CurlConnector::performDownload(const ConnectionParams &params,
                                                        const AbortFlag &abort,
                                                        const QString &remotePath,
                                                        const QString &localPath,
                                                        const CancellationToken &token,
                                                        const ProgressFn &report)
{
    JobResult result;
    QFile file(localPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        result.kind = ErrorKind::Io;
        result.message = QStringLiteral("Cannot open %1 for writing: %2").arg(localPath, file.errorString());
        return result;
    }

    CurlHandle curl;
    if (!curl.get()) {
        result.kind = ErrorKind::Io;
        result.message = QStringLiteral("curl_easy_init failed");
        return result;
    }

    char errorBuffer[CURL_ERROR_SIZE] = {};
    QElapsedTimer clock;
    clock.start();
    ProgressGate gate(ProgressIntervalMs, ProgressByteDelta);

    CallbackContext ctx;
    ctx.abort = abort.get();
    ctx.token = &token;
    ctx.file = &file;
    ctx.onProgress = [&](qint64 bytes, qint64 total) {
        if (gate.shouldReport(clock.elapsed(), bytes, total)) {
            report(bytes, total);
        }
    };

    const QByteArray url = buildUrl(params, remotePath, false);
    if (!applyCommonOptions(curl.get(), params, url, &ctx, errorBuffer)) {
        result.kind = ErrorKind::Protocol;
        result.message = QStringLiteral("Failed to configure curl session");
        return result;
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    file.close();

    if (ctx.ioError) {
        result.kind = ErrorKind::Io;
        result.message = QStringLiteral("Write to %1 failed: %2").arg(localPath, ctx.ioMessage);
    } else if (ctx.cancelled) {
        result.kind = ErrorKind::Cancelled;
        result.message = QStringLiteral("Download cancelled");
    } else if (rc != CURLE_OK) {
        result.kind = errorKindForCurlCode(rc);
        result.message = describeFailure(rc, errorBuffer);
    }
    LOG_VERBOSE() << "Curl: download" << remotePath << "finished with" << errorKindToString(result.kind);
    return result;
}

CurlConnector::JobResult CurlConnector::performUpload(const ConnectionParams &params,
                                                      const AbortFlag &abort,
                                                      const QString &localPath,
                                                      const QString &remotePath,
                                                      const CancellationToken &token,
                                                      const ProgressFn &report)
{
    JobResult result;
    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.kind = ErrorKind::Io;
        result.message = QStringLiteral("Cannot open %1 for reading: %2").arg(localPath, file.errorString());
        return result;
    }

    CurlHandle curl;
    if (!curl.get()) {
        result.kind = ErrorKind::Io;
        result.message = QStringLiteral("curl_easy_init failed");
        return result;
    }

    char errorBuffer[CURL_ERROR_SIZE] = {};
    QElapsedTimer clock;
    clock.start();
    ProgressGate gate(ProgressIntervalMs, ProgressByteDelta);

    CallbackContext ctx;
    ctx.abort = abort.get();
    ctx.token = &token;
    ctx.file = &file;
    ctx.onProgress = [&](qint64 bytes, qint64 total) {
        if (gate.shouldReport(clock.elapsed(), bytes, total)) {
            report(bytes, total);
        }
    };

    const QByteArray url = buildUrl(params, remotePath, false);
    if (!applyCommonOptions(curl.get(), params, url, &ctx, errorBuffer)) {
        result.kind = ErrorKind::Protocol;
        result.message = QStringLiteral("Failed to configure curl session");
        return result;
    }
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(file.size()));

    const CURLcode rc = curl_easy_perform(curl.get());

    if (ctx.ioError) {
        result.kind = ErrorKind::Io;
        result.message = QStringLiteral("Read from %1 failed: %2").arg(localPath, ctx.ioMessage);
    } else if (ctx.cancelled) {
        result.kind = ErrorKind::Cancelled;
        result.message = QStringLiteral("Upload cancelled");
    } else if (rc != CURLE_OK) {
        result.kind = errorKindForCurlCode(rc);
        result.message = describeFailure(rc, errorBuffer);
    }
    LOG_VERBOSE() << "Curl: upload" << localPath << "finished with" << errorKindToString(result.kind);
    return result;
}
