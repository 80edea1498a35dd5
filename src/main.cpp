#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>

#include "cli/commandrunner.h"
#include "services/appsettings.h"
#include "services/serverconfigstore.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("s3ui");
    app.setApplicationVersion(S3UI_VERSION);
    app.setOrganizationName("s3ui");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Browse, upload and download objects in S3-compatible storage");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", CommandRunner::commandNames().join(", "));
    parser.addPositionalArgument("arguments", "Command arguments", "[arguments...]");

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption profileOption("profile", "Profile id or name to use", "id|name");
    QCommandLineOption downloadDirOption("download-dir", "Directory downloads are saved to", "dir");
    QCommandLineOption nameOption("name", "add-profile: display name", "name");
    QCommandLineOption endpointOption("endpoint", "add-profile: endpoint URL", "url");
    QCommandLineOption accessKeyOption("access-key", "add-profile: access key id", "key");
    QCommandLineOption secretKeyOption("secret-key", "add-profile: secret access key", "secret");
    QCommandLineOption bucketOption("bucket", "add-profile: bucket name", "bucket");
    QCommandLineOption regionOption("region", "add-profile: signing region", "region");
    QCommandLineOption cdnOption("cdn-url", "add-profile: public base URL for objects", "url");
    parser.addOptions({verboseOption, profileOption, downloadDirOption, nameOption,
                       endpointOption, accessKeyOption, secretKeyOption, bucketOption,
                       regionOption, cdnOption});

    QTextStream out(stdout);
    QTextStream err(stderr);

    if (!parser.parse(app.arguments())) {
        err << parser.errorText() << Qt::endl;
        return CommandRunner::ExitUsage;
    }
    if (parser.isSet("help")) {
        out << parser.helpText() << Qt::endl << CommandRunner::usage();
        return CommandRunner::ExitSuccess;
    }
    if (parser.isSet("version")) {
        parser.showVersion();
    }

    // Set verbose logging flag
    s3ui::verboseLogging = parser.isSet(verboseOption);

    if (s3ui::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    CommandLine commandLine;
    const QStringList positional = parser.positionalArguments();
    commandLine.command = positional.value(0);
    commandLine.arguments = positional.mid(1);
    commandLine.profile = parser.value(profileOption);
    commandLine.downloadDirectory = parser.value(downloadDirOption);
    commandLine.newProfile.name = parser.value(nameOption);
    commandLine.newProfile.address = parser.value(endpointOption);
    commandLine.newProfile.accessKeyId = parser.value(accessKeyOption);
    commandLine.newProfile.secretAccessKey = parser.value(secretKeyOption);
    commandLine.newProfile.bucket = parser.value(bucketOption);
    commandLine.newProfile.region = parser.value(regionOption);
    commandLine.newProfile.cdnUrl = parser.value(cdnOption);

    AppSettings settings;
    ServerConfigStore store;

    CommandRunner runner(&store, &settings, out, err);
    QObject::connect(&runner, &CommandRunner::finished, &app, &QCoreApplication::exit);
    runner.start(commandLine);

    return app.exec();
}
