#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>

#include "models/transferqueue.h"
#include "services/batchcoordinator.h"
#include "services/consoleconflictprompt.h"
#include "services/localfoldersession.h"
#include "services/transfersettings.h"
#include "utils/logging.h"
#include "version.h"

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitTransferFailed = 1,
    ExitUsage = 2
};

int usageError(const QCommandLineParser &parser, const QString &message)
{
    QTextStream err(stderr);
    err << message << Qt::endl << Qt::endl << parser.helpText();
    return ExitUsage;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("sftpqueue");
    app.setApplicationVersion(SFTPQUEUE_VERSION);
    app.setOrganizationName("sftpqueue");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Queue uploads and downloads against a file-transfer session");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addPositionalArgument("command", "upload or download");
    parser.addPositionalArgument("sources", "Files to transfer (remote paths for download)", "<sources...>");

    QCommandLineOption rootOption(
        QStringList() << "r" << "root",
        "Directory served as the remote side of the session",
        "dir");
    parser.addOption(rootOption);

    QCommandLineOption destOption(
        QStringList() << "d" << "dest",
        "Destination directory (remote for upload, local for download)",
        "dir");
    parser.addOption(destOption);

    QCommandLineOption conflictOption(
        QStringList() << "c" << "on-conflict",
        "ask, overwrite, skip, resume or keep-both",
        "action");
    parser.addOption(conflictOption);

    QCommandLineOption keepCompletedOption(
        QStringList() << "k" << "keep-completed",
        "Do not auto-remove completed transfers from the queue");
    parser.addOption(keepCompletedOption);

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    parser.process(app);

    sftpqueue::setVerboseLogging(parser.isSet(verboseOption));

    if (sftpqueue::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() < 2) {
        return usageError(parser, QCoreApplication::translate("main", "Missing command or sources."));
    }

    const QString command = positional.first();
    if (command != QLatin1String("upload") && command != QLatin1String("download")) {
        return usageError(parser, QCoreApplication::translate("main", "Unknown command: %1").arg(command));
    }
    const TransferDirection direction = command == QLatin1String("upload")
        ? TransferDirection::Upload
        : TransferDirection::Download;
    const QStringList sources = positional.mid(1);

    if (!parser.isSet(rootOption) || !parser.isSet(destOption)) {
        return usageError(parser, QCoreApplication::translate("main", "--root and --dest are required."));
    }

    const QString rootPath = parser.value(rootOption);
    if (!QFileInfo(rootPath).isDir()) {
        return usageError(parser, QCoreApplication::translate("main", "Not a directory: %1").arg(rootPath));
    }

    // Stored preferences, overridden by flags for this run
    TransferSettings settings = TransferSettings::load();
    if (parser.isSet(keepCompletedOption)) {
        settings.autoRemoveCompleted = false;
    }
    if (parser.isSet(conflictOption)) {
        const QString value = parser.value(conflictOption);
        const std::optional<ConflictAction> action = TransferSettings::parseConflictAction(value);
        if (!action && value.trimmed().toLower() != QLatin1String("ask")) {
            return usageError(parser, QCoreApplication::translate("main", "Unknown conflict action: %1").arg(value));
        }
        settings.defaultConflictAction = action;
    }

    LocalFolderSession session(rootPath);
    TransferQueue queue(&session);
    queue.setSettings(settings);
    BatchCoordinator coordinator(&session, &queue);

    QTextStream out(stdout);
    QTextStream in(stdin);
    ConsoleConflictPrompt prompt(in, out);
    int failures = 0;

    QObject::connect(&coordinator, &BatchCoordinator::statusMessage,
                     [](const QString &message, int) { qInfo().noquote() << message; });
    QObject::connect(&queue, &TransferQueue::transferStarted,
                     [&out](const QString &fileName, TransferDirection dir) {
        out << (dir == TransferDirection::Upload ? "Uploading " : "Downloading ") << fileName << Qt::endl;
    });
    QObject::connect(&queue, &TransferQueue::transferCompleted,
                     [&out](const QString &fileName) { out << "  done: " << fileName << Qt::endl; });
    QObject::connect(&queue, &TransferQueue::transferFailed,
                     [&out, &failures](const QString &fileName, const QString &error) {
        failures++;
        out << "  failed: " << fileName << " (" << error << ")" << Qt::endl;
    });
    QObject::connect(&queue, &TransferQueue::transferCancelled,
                     [&out, &failures](const QString &fileName) {
        failures++;
        out << "  cancelled: " << fileName << Qt::endl;
    });

    BatchResult result;
    QObject::connect(&queue, &TransferQueue::queueDrained, &app, [&]() {
        if (queue.pendingCount() > 0) {
            return;
        }
        if (parser.isSet(keepCompletedOption)) {
            for (const QUuid &id : queue.recordIds()) {
                const auto record = queue.record(id);
                if (record) {
                    out << record->directionDisplay() << ' ' << record->fileName
                        << "  " << record->statusDisplay() << Qt::endl;
                }
            }
        }
        const bool incomplete = failures > 0 || result.aborted || result.inaccessible > 0;
        app.exit(incomplete ? ExitTransferFailed : ExitSuccess);
    });

    QTimer::singleShot(0, &app, [&]() {
        // A fixed action presets the batch override, so the prompt is never shown
        const ConflictResolver resolver = [&prompt](const ConflictRequest &request) {
            return prompt.ask(request);
        };

        const QString dest = parser.value(destOption);
        result = direction == TransferDirection::Upload
            ? coordinator.uploadFiles(sources, dest, resolver, settings.defaultConflictAction)
            : coordinator.downloadFiles(sources, dest, resolver, settings.defaultConflictAction);

        out << QCoreApplication::translate("main",
                   "%1 requested, %2 queued, %3 skipped, %4 inaccessible, %5 not classified")
                   .arg(result.requested).arg(result.enqueued).arg(result.skipped)
                   .arg(result.inaccessible).arg(result.unclassified)
            << Qt::endl;

        if (result.enqueued == 0) {
            app.exit((result.aborted || result.inaccessible > 0) ? ExitTransferFailed : ExitSuccess);
        }
    });

    return app.exec();
}
