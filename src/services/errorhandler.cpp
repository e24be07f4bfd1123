#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorHandler::handleConnectionError(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Critical,
                tr("Connection Error"),
                message);
}

void ErrorHandler::handleOperationFailed(const QString &operation, const QString &error)
{
    handleError(ErrorCategory::FileOperation,
                ErrorSeverity::Warning,
                tr("%1 failed").arg(operation),
                error);
}

void ErrorHandler::handleMountFailed(const QString &driveName, MountError error,
                                     const QString &message)
{
    const QString title = tr("Cannot mount %1 (%2)")
                              .arg(driveName, QString::fromLatin1(mountErrorToString(error)));
    if (error == MountError::InvalidConfig) {
        handleError(ErrorCategory::Validation, ErrorSeverity::Critical, title, message);
    } else {
        handleError(ErrorCategory::Connection, ErrorSeverity::Critical, title, message);
    }
}

void ErrorHandler::handleTransferEvent(const TransferEvent &event)
{
    switch (event.type) {
    case TransferEvent::Type::Failed: {
        // A scheduled retry is not yet a failure the user has to act on
        const ErrorSeverity severity = event.willRetry ? ErrorSeverity::Info
                                                       : severityForKind(event.errorKind);
        const QString title = event.willRetry
            ? tr("Transfer %1 failed, retrying").arg(event.itemId)
            : tr("Transfer %1 failed (%2)")
                  .arg(event.itemId)
                  .arg(QString::fromLatin1(errorKindToString(event.errorKind)));
        handleError(ErrorCategory::FileOperation, severity, title, event.message);
        break;
    }
    case TransferEvent::Type::Cancelled:
        handleError(ErrorCategory::FileOperation, ErrorSeverity::Info,
                    tr("Transfer %1 cancelled").arg(event.itemId));
        break;
    default:
        break;
    }
}

void ErrorHandler::handleDriveEvent(const DriveEvent &event)
{
    switch (event.type) {
    case DriveEvent::Type::Error:
        handleError(ErrorCategory::Connection, severityForKind(event.errorKind),
                    tr("Drive %1: %2")
                        .arg(event.driveId, QString::fromLatin1(errorKindToString(event.errorKind))),
                    event.message);
        break;
    case DriveEvent::Type::Disconnected:
        handleError(ErrorCategory::Connection, ErrorSeverity::Warning,
                    tr("Drive %1 went offline").arg(event.driveId), event.message);
        break;
    default:
        break;
    }
}

void ErrorHandler::handleScanFailed(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Warning,
                tr("Network scan failed"),
                message);
}

ErrorSeverity ErrorHandler::severityForKind(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Authentication:
    case ErrorKind::UnsupportedProtocol:
        return ErrorSeverity::Critical;
    case ErrorKind::Cancelled:
    case ErrorKind::None:
        return ErrorSeverity::Info;
    default:
        return ErrorSeverity::Warning;
    }
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    // Emit signal for any listeners (monitoring, front ends)
    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;  // 3 seconds
    case ErrorSeverity::Warning:
        return 5000;  // 5 seconds
    case ErrorSeverity::Critical:
        return 0;     // No timeout - stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::FileOperation:
        return QStringLiteral("FileOp");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
