/**
 * @file connectionparams.h
 * @brief Protocol selection and endpoint parameters for a remote session.
 */

#ifndef CONNECTIONPARAMS_H
#define CONNECTIONPARAMS_H

#include <QMetaType>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief Closed set of supported remote storage protocols.
 */
enum class Protocol {
    Ftp,     ///< File Transfer Protocol
    Sftp,    ///< SSH File Transfer Protocol
    WebDav,  ///< WebDAV over HTTP(S)
    Smb,     ///< SMB/CIFS share
    Cloud    ///< HTTPS JSON file API with bearer token
};

Q_DECLARE_METATYPE(Protocol)

/**
 * @brief Everything needed to open a session against one endpoint.
 *
 * Supplied as a read-only snapshot at mount time. A port of 0 selects the
 * protocol's default port.
 */
struct ConnectionParams {
    Protocol protocol = Protocol::Ftp;
    QString host;
    quint16 port = 0;
    QString user;
    QString password;          ///< Password, or bearer token for Cloud
    QString rootPath = "/";    ///< Remote root all paths are relative to
    bool secure = false;       ///< Use TLS where the protocol allows it
    int timeoutSec = 15;       ///< Connect and stall timeout

    /// @brief Port to connect to, substituting the protocol default for 0.
    [[nodiscard]] quint16 effectivePort() const;
};

Q_DECLARE_METATYPE(ConnectionParams)

/// @name Protocol helpers
/// @{

/**
 * @brief Returns the well-known port for a protocol.
 * @param protocol The protocol.
 * @param secure Whether TLS is requested (affects WebDAV).
 */
[[nodiscard]] quint16 defaultPort(Protocol protocol, bool secure = false);

/// @brief Lower-case protocol name used in configuration files and logs.
[[nodiscard]] QString protocolToString(Protocol protocol);

/// @brief Parses a protocol name (case-insensitive); std::nullopt if unknown.
[[nodiscard]] std::optional<Protocol> protocolFromString(const QString &name);

/**
 * @brief Validates connection parameters before a connect attempt.
 * @param params The parameters to check.
 * @param warnings Optional sink for non-fatal remarks (e.g., non-standard port).
 * @return Empty string when valid, otherwise a human-readable reason.
 */
[[nodiscard]] QString validateConnectionParams(const ConnectionParams &params,
                                               QStringList *warnings = nullptr);
/// @}

/// @name Remote path helpers
/// @{

/// @brief Joins a directory and a child name with exactly one separator.
[[nodiscard]] QString joinRemotePath(const QString &dir, const QString &name);

/// @brief Returns the last path component ("/a/b.txt" -> "b.txt").
[[nodiscard]] QString remoteFileName(const QString &path);
/// @}

#endif // CONNECTIONPARAMS_H
