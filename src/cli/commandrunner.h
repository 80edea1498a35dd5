/**
 * @file commandrunner.h
 * @brief Executes one s3ui command-line invocation.
 */

#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>

#include "models/serverconfig.h"

class AppSettings;
class ErrorHandler;
class QTextStream;
class ServerConfigStore;
class StorageSession;
class TransferQueueBase;

/**
 * @brief A parsed command line.
 */
struct CommandLine {
    QString command;           ///< First positional argument
    QStringList arguments;     ///< Remaining positional arguments
    QString profile;           ///< --profile, id or name
    QString downloadDirectory; ///< --download-dir
    ServerConfig newProfile;   ///< Fields given to add-profile
};

/**
 * @brief Runs a CommandLine against the saved profiles and a storage session.
 *
 * Commands that touch the bucket run asynchronously; finished() reports the
 * exit code once the work is done, always from the event loop.
 *
 * @par Example usage:
 * @code
 * CommandRunner runner(&store, &settings, out, err);
 * QObject::connect(&runner, &CommandRunner::finished, &app, &QCoreApplication::exit);
 * runner.start(commandLine);
 * return app.exec();
 * @endcode
 */
class CommandRunner : public QObject
{
    Q_OBJECT

public:
    static constexpr int ExitSuccess = 0;
    static constexpr int ExitFailure = 1;
    static constexpr int ExitUsage = 2;

    using SessionFactory = std::function<StorageSession *(const ServerConfig &config, QObject *parent)>;

    /**
     * @brief Constructs a runner.
     * @param store Saved profiles (not owned).
     * @param settings Application preferences (not owned).
     * @param out Stream for command output.
     * @param err Stream for diagnostics.
     * @param parent Optional parent QObject.
     */
    CommandRunner(ServerConfigStore *store, AppSettings *settings,
                  QTextStream &out, QTextStream &err, QObject *parent = nullptr);
    ~CommandRunner() override;

    /**
     * @brief Replaces how storage sessions are created, for tests.
     */
    void setSessionFactory(SessionFactory factory) { sessionFactory_ = std::move(factory); }

    /// Names of all commands, in help order
    [[nodiscard]] static QStringList commandNames();

    /// One-line usage text per command
    [[nodiscard]] static QString usage();

    void start(const CommandLine &commandLine);

    [[nodiscard]] StorageSession *session() const { return session_; }

signals:
    void finished(int exitCode);

private:
    /// @name Profile commands
    /// @{
    void listProfiles();
    void addProfile(const ServerConfig &config);
    void removeProfile(const QString &idOrName);
    /// @}

    /// @name Bucket commands
    /// @{
    void list(const QString &prefix);
    void upload(const QString &prefix, const QStringList &files);
    void download(const QStringList &keys);
    void printUrl(const QString &key);
    void runOperation(const QString &command, const QStringList &arguments);
    /// @}

    bool openSession(const CommandLine &commandLine);
    void watchQueue(TransferQueueBase *queue);
    void reportProgress(TransferQueueBase *queue);
    void usageError(const QString &message);
    void finish(int exitCode);

    ServerConfigStore *store_ = nullptr;
    AppSettings *settings_ = nullptr;
    QTextStream &out_;
    QTextStream &err_;
    ErrorHandler *errorHandler_ = nullptr;
    StorageSession *session_ = nullptr;
    SessionFactory sessionFactory_;
    QHash<QString, int> reportedPercent_;
    bool finished_ = false;
};

#endif // COMMANDRUNNER_H
