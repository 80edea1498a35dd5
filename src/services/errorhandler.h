/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error reporting.
 *
 * This service standardizes how errors are categorized, logged and turned
 * into user-facing status messages across the application.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "storageerror.h"

struct TransferItem;

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Connection,     ///< Endpoint unreachable or credentials rejected
    FileOperation,  ///< Transfer, delete, listing and local file errors
    Validation,     ///< Input validation, configuration errors
    System          ///< General system/application errors
};

/**
 * @brief Severity levels determining how errors are reported.
 */
enum class ErrorSeverity {
    Info,      ///< Informational, short-lived status message
    Warning,   ///< Warning, longer-lived status message
    Critical   ///< Critical, message stays until replaced
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error reporting across the application:
 * - Categorizes errors for appropriate handling
 * - Logs at a level matching the severity
 * - Re-emits every error as a status message for the front end
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 * connect(handler, &ErrorHandler::statusMessage, this, &Cli::printStatus);
 *
 * connect(session->uploads(), &UploadQueue::transferFailed, this,
 *         [handler, session](const QString &id, const QString &) {
 *     if (auto item = session->uploads()->item(id)) {
 *         handler->handleTransferFailed(*item);
 *     }
 * });
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
     * @brief Handles a failed storage call.
     * @param operation The operation that failed (e.g., "list", "rename").
     * @param error The error reported by the storage client.
     *
     * Transport and authorization failures are connection errors and
     * critical; the rest are file operation warnings.
     */
    void handleStorageError(const QString &operation, const StorageError &error);

    /**
     * @brief Handles a transfer item that ended Failed.
     * @param item Snapshot of the failed item.
     */
    void handleTransferFailed(const TransferItem &item);

    /**
     * @brief Handles invalid user input or configuration (warning severity).
     * @param message The error message.
     */
    void handleValidationError(const QString &message);
    /// @}

    /**
     * @brief Maps a storage error kind to its category.
     */
    [[nodiscard]] static ErrorCategory categoryForKind(StorageError::Kind kind);

    /**
     * @brief Maps a storage error kind to its severity.
     */
    [[nodiscard]] static ErrorSeverity severityForKind(StorageError::Kind kind);

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
     * @brief Logs an error at the level matching its severity.
     */
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);
};

#endif // ERRORHANDLER_H
