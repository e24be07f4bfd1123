/**
 * @file curlconnector.h
 * @brief libcurl-backed connector for FTP, SFTP and SMB endpoints.
 */

#ifndef CURLCONNECTOR_H
#define CURLCONNECTOR_H

#include <QByteArray>
#include <QPointer>
#include <QQueue>
#include <QThread>

#include <atomic>
#include <functional>
#include <memory>

#include "protocolconnector.h"

/**
 * @brief Connector that drives the libcurl easy interface.
 *
 * libcurl speaks the wire protocol; this class maps the connector contract
 * onto it. Each curl call blocks, so operations run one at a time on a
 * dedicated worker thread and report back to the owning thread through
 * queued invocations. Operations submitted while another one runs are queued
 * in submission order. Remote paths are absolute server paths and are used
 * as given; connect probes the session root.
 *
 * Session semantics per protocol:
 * - FTP/FTPS and SFTP: connect lists the remote root, which exercises login
 *   and path access; listings are parsed from "ls -l" output.
 * - SMB: connect only establishes the transport; directory listing is not
 *   supported by libcurl and reports a Protocol error.
 */
class CurlConnector : public ProtocolConnector
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a connector for one of Ftp, Sftp or Smb.
     * @param protocol The protocol (others report UnsupportedProtocol on connect).
     * @param parent Optional parent QObject for memory management.
     */
    explicit CurlConnector(Protocol protocol, QObject *parent = nullptr);

    /**
     * @brief Destructor. Aborts any running operation and joins the worker.
     */
    ~CurlConnector() override;

    [[nodiscard]] Protocol protocol() const override { return protocol_; }
    [[nodiscard]] State state() const override { return state_; }
    [[nodiscard]] bool isBusy() const override { return running_ || !jobs_.isEmpty(); }

    void connectToHost(const ConnectionParams &params) override;
    void disconnectFromHost() override;

    void list(const QString &remotePath) override;
    void upload(quint64 transferId, const QString &localPath,
                const QString &remotePath, const CancellationToken &token) override;
    void download(quint64 transferId, const QString &remotePath,
                  const QString &localPath, const CancellationToken &token) override;

    /// @name Helpers exposed for testing
    /// @{

    /**
     * @brief Returns the URL scheme libcurl uses for a protocol.
     * @return "ftp" (TLS is negotiated explicitly), "sftp", "smb" or "smbs".
     */
    [[nodiscard]] static QString urlScheme(Protocol protocol, bool secure);

    /**
     * @brief Builds the request URL for a remote path.
     * @param params Session parameters (scheme, host and port).
     * @param remotePath Absolute remote path; empty means "/".
     * @param directory True to force a trailing slash (directory listing).
     */
    [[nodiscard]] static QByteArray buildUrl(const ConnectionParams &params,
                                             const QString &remotePath, bool directory);

    /**
     * @brief Maps a CURLcode to the engine's error taxonomy.
     * @param curlCode The CURLcode returned by curl_easy_perform().
     */
    [[nodiscard]] static ErrorKind errorKindForCurlCode(int curlCode);
    /// @}

private:
    /// Outcome of one blocking curl operation, produced on the worker thread
    struct JobResult {
        ErrorKind kind = ErrorKind::None;
        QString message;
        QByteArray body;
    };

    struct Job {
        /// Runs on the worker thread with the generation it was started in
        std::function<JobResult(quint64 generation)> work;
        std::function<void(const JobResult &)> done;
    };

    void setState(State state);
    void submit(Job job);
    void startNextJob();

    using AbortFlag = std::shared_ptr<std::atomic_bool>;
    using ProgressFn = std::function<void(qint64 bytes, qint64 total)>;

    // Run on the worker thread; they only touch their arguments
    static JobResult performConnect(const ConnectionParams &params, const AbortFlag &abort);
    static JobResult performList(const ConnectionParams &params, const AbortFlag &abort,
                                 const QString &remotePath);
    static JobResult performDownload(const ConnectionParams &params, const AbortFlag &abort,
                                     const QString &remotePath, const QString &localPath,
                                     const CancellationToken &token, const ProgressFn &report);
    static JobResult performUpload(const ConnectionParams &params, const AbortFlag &abort,
                                   const QString &localPath, const QString &remotePath,
                                   const CancellationToken &token, const ProgressFn &report);

    // Safe to call from the worker thread
    [[nodiscard]] ProgressFn progressReporter(quint64 generation, quint64 transferId);

    Protocol protocol_;
    ConnectionParams params_;
    State state_ = State::Disconnected;

    QQueue<Job> jobs_;
    bool running_ = false;
    // Workers abandoned by a disconnect run out on their own; all are joined on destruction
    QList<QPointer<QThread>> workers_;

    // Incremented on disconnect so results of abandoned jobs are dropped
    quint64 generation_ = 0;
    // Polled by curl callbacks; set on disconnect and destruction
    AbortFlag abort_;
};

#endif // CURLCONNECTOR_H
