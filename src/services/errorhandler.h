/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error reporting.
 *
 * This service standardizes how engine errors are categorized, graded and
 * logged, so every front end reports them the same way.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "models/transferitem.h"
#include "transfererror.h"
#include "virtualdrive.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Connection,     ///< Mount, session and discovery errors
    FileOperation,  ///< File transfer and listing errors
    Validation,     ///< Drive configuration errors
    System          ///< General system/application errors
};

/**
 * @brief Severity levels determining how long errors stay visible.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - short timeout
    Warning,   ///< Warning - longer timeout
    Critical   ///< Critical - stays until replaced
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error reporting across the engine:
 * - Categorizes errors for appropriate handling
 * - Grades them by severity (timeout of the status message)
 * - Logs errors through Qt logging
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * // Connect error signals from various sources
 * connect(drives, &VirtualDriveManager::transferEvent,
 *         handler, &ErrorHandler::handleTransferEvent);
 *
 * // Handle with custom severity
 * handler->handleError(ErrorCategory::FileOperation,
 *                      ErrorSeverity::Warning,
 *                      "Upload failed: file.txt",
 *                      "The file could not be uploaded");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());
    /// @}

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles a connection error (critical severity).
     * @param message The error message.
     */
    void handleConnectionError(const QString &message);

    /**
     * @brief Handles a file operation error (warning severity).
     * @param operation The operation that failed (e.g., "upload", "download").
     * @param error The error message.
     */
    void handleOperationFailed(const QString &operation, const QString &error);

    /**
     * @brief Handles a failed mount (critical, or validation for bad config).
     * @param driveName Display name of the drive.
     * @param error Why the mount failed.
     * @param message Details from the connector.
     */
    void handleMountFailed(const QString &driveName, MountError error, const QString &message);

    /// @brief Reports Failed and Cancelled transfer events; ignores the rest.
    void handleTransferEvent(const TransferEvent &event);

    /// @brief Reports Error and Disconnected drive events; ignores the rest.
    void handleDriveEvent(const DriveEvent &event);

    /// @brief Reports a discovery scan that could not start (warning severity).
    void handleScanFailed(const QString &message);
    /// @}

    /**
     * @brief Severity an engine error of @p kind is reported with.
     *
     * Authentication and unsupported protocol need the user; cancellations are
     * informational; everything else is a warning.
     */
    [[nodiscard]] static ErrorSeverity severityForKind(ErrorKind kind);

    /**
     * @brief Gets the status message timeout for a severity level.
     * @param severity The error severity.
     * @return Timeout in milliseconds.
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted to display a status message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    /**
     * @brief Logs an error for debugging.
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    /**
     * @brief Converts category to string for logging.
     * @param category The error category.
     * @return String representation.
     */
    [[nodiscard]] static QString categoryToString(ErrorCategory category);

    /**
     * @brief Converts severity to string for logging.
     * @param severity The error severity.
     * @return String representation.
     */
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);
};

Q_DECLARE_METATYPE(ErrorCategory)
Q_DECLARE_METATYPE(ErrorSeverity)

#endif // ERRORHANDLER_H
