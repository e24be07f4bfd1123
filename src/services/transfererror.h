/**
 * @file transfererror.h
 * @brief Error taxonomy shared by connectors, the transfer queue and drives.
 */

#ifndef TRANSFERERROR_H
#define TRANSFERERROR_H

#include <QMetaType>
#include <QString>

/**
 * @brief Kind of failure reported by a connector or detected by the engine.
 */
enum class ErrorKind {
    None,                ///< No error
    Connection,          ///< Host unreachable, connection refused or dropped
    Timeout,             ///< Operation or connect timed out
    Authentication,      ///< Credentials rejected
    Protocol,            ///< Malformed or unexpected server response
    Io,                  ///< Local filesystem read/write failure
    Integrity,           ///< Checksum mismatch after transfer
    Cancelled,           ///< User-initiated cancellation
    UnsupportedProtocol  ///< Protocol or operation not supported by the backend
};

Q_DECLARE_METATYPE(ErrorKind)

/**
 * @brief Returns true for error kinds that are retried automatically.
 *
 * Only network-level failures are transient. Everything else needs user
 * intervention or would fail the same way again.
 */
[[nodiscard]] inline bool isTransientError(ErrorKind kind)
{
    return kind == ErrorKind::Connection || kind == ErrorKind::Timeout;
}

/// @brief Convert ErrorKind to string for logs and status messages
[[nodiscard]] inline const char *errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None: return "None";
    case ErrorKind::Connection: return "ConnectionError";
    case ErrorKind::Timeout: return "TimedOut";
    case ErrorKind::Authentication: return "AuthenticationError";
    case ErrorKind::Protocol: return "ProtocolError";
    case ErrorKind::Io: return "IoError";
    case ErrorKind::Integrity: return "IntegrityError";
    case ErrorKind::Cancelled: return "CancelledError";
    case ErrorKind::UnsupportedProtocol: return "UnsupportedProtocol";
    }
    return "Unknown";
}

#endif // TRANSFERERROR_H
