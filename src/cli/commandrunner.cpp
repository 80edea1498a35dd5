#include "commandrunner.h"

#include <QLocale>
#include <QTextStream>
#include <QTimer>

#include "models/downloadqueue.h"
#include "models/uploadqueue.h"
#include "services/appsettings.h"
#include "services/errorhandler.h"
#include "services/serverconfigstore.h"
#include "services/storagesession.h"
#include "utils/logging.h"

namespace {

QString normalizedPrefix(const QString &prefix)
{
    QString result = prefix;
    while (result.startsWith('/')) {
        result.remove(0, 1);
    }
    if (!result.isEmpty() && !result.endsWith('/')) {
        result += '/';
    }
    return result;
}

} // namespace

CommandRunner::CommandRunner(ServerConfigStore *store, AppSettings *settings,
                             QTextStream &out, QTextStream &err, QObject *parent)
    : QObject(parent)
    , store_(store)
    , settings_(settings)
    , out_(out)
    , err_(err)
    , errorHandler_(new ErrorHandler(this))
    , sessionFactory_([](const ServerConfig &config, QObject *owner) {
          return new StorageSession(config, owner);
      })
{
    connect(errorHandler_, &ErrorHandler::statusMessage, this,
            [this](const QString &message, int) {
        err_ << message << Qt::endl;
    });
}

CommandRunner::~CommandRunner() = default;

QStringList CommandRunner::commandNames()
{
    return {"profiles", "add-profile", "remove-profile", "ls", "upload", "download",
            "rm", "rmdir", "mv", "mkdir", "url", "test"};
}

QString CommandRunner::usage()
{
    return QStringLiteral(
        "Commands:\n"
        "  profiles                        List saved profiles\n"
        "  add-profile                     Save a profile (--name --endpoint --access-key\n"
        "                                  --secret-key --bucket [--region] [--cdn-url])\n"
        "  remove-profile <id|name>        Delete a saved profile\n"
        "  ls [prefix]                     List a folder\n"
        "  upload <prefix> <files...>      Upload local files under a prefix\n"
        "  download <key...>               Download objects\n"
        "  rm <key>                        Delete an object\n"
        "  rmdir <prefix>                  Delete a folder and everything in it\n"
        "  mv <old> <new>                  Rename an object\n"
        "  mkdir <path>                    Create a folder\n"
        "  url <key>                       Print the public URL of a key\n"
        "  test                            Check the profile's credentials and bucket\n");
}

void CommandRunner::finish(int exitCode)
{
    if (finished_) {
        return;
    }
    finished_ = true;
    out_.flush();
    err_.flush();
    QTimer::singleShot(0, this, [this, exitCode]() { emit finished(exitCode); });
}

void CommandRunner::usageError(const QString &message)
{
    errorHandler_->handleValidationError(message);
    finish(ExitUsage);
}

void CommandRunner::start(const CommandLine &commandLine)
{
    const QString &command = commandLine.command;
    const QStringList &args = commandLine.arguments;

    LOG_VERBOSE() << "CommandRunner: command" << command << "arguments" << args;

    if (command.isEmpty()) {
        usageError(tr("No command given\n%1").arg(usage()));
        return;
    }
    if (!commandNames().contains(command)) {
        usageError(tr("Unknown command '%1'\n%2").arg(command, usage()));
        return;
    }

    if (command == "profiles") {
        listProfiles();
        return;
    }
    if (command == "add-profile") {
        addProfile(commandLine.newProfile);
        return;
    }
    if (command == "remove-profile") {
        if (args.size() != 1) {
            usageError(tr("remove-profile takes one profile id or name"));
            return;
        }
        removeProfile(args.first());
        return;
    }

    // Argument checks come before the session is opened
    static const QHash<QString, int> minArgs = {
        {"ls", 0}, {"upload", 2}, {"download", 1}, {"rm", 1}, {"rmdir", 1},
        {"mv", 2}, {"mkdir", 1}, {"url", 1}, {"test", 0}
    };
    static const QHash<QString, int> maxArgs = {
        {"ls", 1}, {"rm", 1}, {"rmdir", 1}, {"mv", 2}, {"mkdir", 1}, {"url", 1}, {"test", 0}
    };
    if (args.size() < minArgs.value(command)
        || (maxArgs.contains(command) && args.size() > maxArgs.value(command))) {
        usageError(tr("Wrong number of arguments for '%1'\n%2").arg(command, usage()));
        return;
    }
    if ((command == "rmdir" || command == "mkdir") && normalizedPrefix(args.first()).isEmpty()) {
        usageError(tr("'%1' needs a folder path other than the bucket root").arg(command));
        return;
    }

    if (!openSession(commandLine)) {
        finish(ExitFailure);
        return;
    }

    if (command == "ls") {
        list(args.value(0));
    } else if (command == "upload") {
        upload(args.first(), args.mid(1));
    } else if (command == "download") {
        download(args);
    } else if (command == "url") {
        printUrl(args.first());
    } else {
        runOperation(command, args);
    }
}

// ---------------------------------------------------------------------------
// Profiles
// ---------------------------------------------------------------------------

void CommandRunner::listProfiles()
{
    const QList<ServerConfig> configs = store_->configs();
    if (configs.isEmpty()) {
        out_ << tr("No profiles saved") << Qt::endl;
    }
    for (const ServerConfig &config : configs) {
        const bool active = config.id == settings_->activeProfileId();
        out_ << (active ? "* " : "  ") << config.id << "  " << config.name
             << "  " << config.bucket << "  " << config.address << Qt::endl;
    }
    finish(ExitSuccess);
}

void CommandRunner::addProfile(const ServerConfig &config)
{
    if (config.name.isEmpty() || !config.isValid()) {
        usageError(tr("add-profile needs --name, --endpoint (http or https URL), "
                      "--access-key, --secret-key and --bucket"));
        return;
    }

    // Saving under an existing name replaces that profile
    ServerConfig stored = config;
    if (auto existing = store_->find(config.name)) {
        stored.id = existing->id;
    }
    const QString id = store_->upsert(stored);

    if (settings_->activeProfileId().isEmpty() || !store_->find(settings_->activeProfileId())) {
        settings_->setActiveProfileId(id);
        settings_->save();
    }

    out_ << id << Qt::endl;
    finish(ExitSuccess);
}

void CommandRunner::removeProfile(const QString &idOrName)
{
    auto config = store_->find(idOrName);
    if (!config) {
        errorHandler_->handleValidationError(tr("No profile '%1'").arg(idOrName));
        finish(ExitFailure);
        return;
    }

    store_->remove(config->id);
    if (settings_->activeProfileId() == config->id) {
        settings_->setActiveProfileId(QString());
        settings_->save();
    }
    out_ << tr("Removed %1").arg(config->name) << Qt::endl;
    finish(ExitSuccess);
}

// ---------------------------------------------------------------------------
// Bucket commands
// ---------------------------------------------------------------------------

bool CommandRunner::openSession(const CommandLine &commandLine)
{
    std::optional<ServerConfig> config;
    if (!commandLine.profile.isEmpty()) {
        config = store_->find(commandLine.profile);
    } else if (!settings_->activeProfileId().isEmpty()) {
        config = store_->find(settings_->activeProfileId());
    } else if (store_->count() == 1) {
        config = store_->configs().first();
    }

    if (!config) {
        errorHandler_->handleValidationError(
            commandLine.profile.isEmpty()
                ? tr("No profile selected; use --profile or add-profile")
                : tr("No profile '%1'").arg(commandLine.profile));
        return false;
    }
    if (!config->isValid()) {
        errorHandler_->handleValidationError(tr("Profile '%1' is incomplete").arg(config->name));
        return false;
    }

    LOG_VERBOSE() << "CommandRunner: using profile" << config->name << "bucket" << config->bucket;

    session_ = sessionFactory_(*config, this);
    session_->setDownloadDirectory(commandLine.downloadDirectory.isEmpty()
                                       ? settings_->downloadDirectory()
                                       : commandLine.downloadDirectory);

    connect(session_, &StorageSession::operationFailed, this,
            [this](const QString &operation, const QString &, const StorageError &error) {
        errorHandler_->handleStorageError(operation, error);
        finish(ExitFailure);
    });
    return true;
}

void CommandRunner::list(const QString &prefix)
{
    const QString folder = normalizedPrefix(prefix);
    connect(session_, &StorageSession::directoryListed, this,
            [this, folder](const QString &listed, const QList<StorageEntry> &entries) {
        if (listed != folder) {
            return;
        }
        const QLocale locale;
        for (const StorageEntry &entry : entries) {
            if (entry.isDirectory) {
                out_ << QString("%1  %2  %3").arg(QString(), 10).arg(QString(), 19).arg(entry.key)
                     << Qt::endl;
            } else {
                out_ << QString("%1  %2  %3")
                            .arg(locale.formattedDataSize(entry.size), 10)
                            .arg(entry.lastModified.toString("yyyy-MM-dd HH:mm:ss"), 19)
                            .arg(entry.key)
                     << Qt::endl;
            }
        }
        finish(ExitSuccess);
    });
    session_->listDirectory(folder, true);
}

void CommandRunner::watchQueue(TransferQueueBase *queue)
{
    connect(queue, &TransferQueueBase::transferStarted, this, [this, queue](const QString &id) {
        if (auto item = queue->item(id)) {
            out_ << (item->direction == TransferDirection::Upload ? tr("Uploading ") : tr("Downloading "))
                 << item->key << Qt::endl;
        }
    });
    connect(queue, &TransferQueueBase::transferCompleted, this, [this, queue](const QString &id) {
        if (auto item = queue->item(id)) {
            if (item->direction == TransferDirection::Upload) {
                out_ << "  -> " << item->resultUrl << Qt::endl;
            } else {
                out_ << "  -> " << item->savePath << Qt::endl;
            }
        }
    });
    connect(queue, &TransferQueueBase::transferFailed, this, [this, queue](const QString &id) {
        if (auto item = queue->item(id)) {
            errorHandler_->handleTransferFailed(*item);
        }
    });
    connect(queue, &TransferQueueBase::queueChanged, this, [this, queue]() {
        reportProgress(queue);
    });
    connect(queue, &TransferQueueBase::allTransfersFinished, this, [this, queue]() {
        finish(queue->failedCount() > 0 ? ExitFailure : ExitSuccess);
    });
}

void CommandRunner::reportProgress(TransferQueueBase *queue)
{
    if (!s3ui::verboseLogging) {
        return;
    }
    const QList<TransferItem> items = queue->items();
    for (const TransferItem &item : items) {
        if (item.status != TransferItem::Status::Active || !item.size) {
            continue;
        }
        // Ten-percent steps keep per-chunk notifications from flooding the log
        const int percent = static_cast<int>(item.progress * 10) * 10;
        if (percent > reportedPercent_.value(item.id, -1)) {
            reportedPercent_.insert(item.id, percent);
            qDebug().noquote() << QString("%1: %2%").arg(item.key).arg(percent);
        }
    }
}

void CommandRunner::upload(const QString &prefix, const QStringList &files)
{
    watchQueue(session_->uploads());
    session_->uploads()->addToQueue(files, normalizedPrefix(prefix));
}

void CommandRunner::download(const QStringList &keys)
{
    watchQueue(session_->downloads());
    for (const QString &key : keys) {
        session_->downloads()->addToQueue(key);
    }
}

void CommandRunner::printUrl(const QString &key)
{
    out_ << session_->fileUrl(key) << Qt::endl;
    finish(ExitSuccess);
}

void CommandRunner::runOperation(const QString &command, const QStringList &arguments)
{
    connect(session_, &StorageSession::operationSucceeded, this,
            [this, command](const QString &, const QString &key) {
        if (command == "test") {
            out_ << tr("Connection OK") << Qt::endl;
        } else {
            out_ << tr("%1 %2: done").arg(command, key) << Qt::endl;
        }
        finish(ExitSuccess);
    });

    if (command == "rm") {
        session_->deleteObject(arguments.at(0));
    } else if (command == "rmdir") {
        session_->deleteFolder(normalizedPrefix(arguments.at(0)));
    } else if (command == "mv") {
        session_->renameObject(arguments.at(0), arguments.at(1));
    } else if (command == "mkdir") {
        session_->createFolder(normalizedPrefix(arguments.at(0)));
    } else if (command == "test") {
        session_->testConnection();
    }
}
