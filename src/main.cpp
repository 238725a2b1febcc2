#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QTextStream>
#include <QTimer>
#include <QRegularExpression>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <memory>

#include "log_manager.h"
#include "batch_settings.h"
#include "net/http_transport.h"
#include "net/file_host_uploader.h"
#include "net/link_converter.h"
#include "pipeline/batch_pipeline.h"
#include "tools/seven_zip_archiver.h"
#include "tools/process_crack_operation.h"

namespace {

std::atomic_bool g_interrupted{false};

void onSigInt(int)
{
    g_interrupted.store(true);
}

QString shortId(const QString& name, int index)
{
    QString id = name.toLower();
    id.replace(QRegularExpression("[^a-z0-9]+"), "-");
    return QString("%1-%2").arg(index + 1).arg(id);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Identify app for QSettings
    QCoreApplication::setOrganizationName("BatchShare");
    QCoreApplication::setOrganizationDomain("batchshare.local");
    QCoreApplication::setApplicationName("BatchShare");
    QCoreApplication::setApplicationVersion("1.0");

    qInstallMessageHandler(customMessageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Clean, transform, archive and upload game folders in one batch.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("dirs", "Folders to process, one work item each.", "<dir>...");

    const QCommandLineOption noTransform("no-transform", "Skip the Transform phase.");
    const QCommandLineOption noArchive("no-archive", "Skip the Archive phase.");
    const QCommandLineOption noUpload("no-upload", "Skip the Upload phase.");
    const QCommandLineOption convert("convert", "Convert uploaded links after the Upload phase.");
    const QCommandLineOption transformCmd("transform-cmd", "Transform command; {path} and {id} are expanded.", "cmd");
    const QCommandLineOption sevenZip("7z", "Path to the 7z executable.", "path", "7z");
    const QCommandLineOption format("format", "Archive format: 7z or zip.", "fmt");
    const QCommandLineOption level("level", "Compression level 0-9.", "n");
    const QCommandLineOption password("password", "Archive password.", "pw");
    const QCommandLineOption output("output", "Output directory for archives.", "dir");
    const QCommandLineOption parallel("parallel", "Maximum concurrent archive tasks (0 = all).", "n");
    const QCommandLineOption retries("retries", "Upload attempts per item.", "n");
    const QCommandLineOption apiKey("api-key", "Upload service API key (or BATCHSHARE_API_KEY).", "key");
    const QCommandLineOption logFile("log", "Write the log to this file.", "file");
    const QCommandLineOption links("links", "Link list format: plain, markdown or bbcode.", "fmt", "plain");
    parser.addOptions({noTransform, noArchive, noUpload, convert, transformCmd, sevenZip, format, level,
                       password, output, parallel, retries, apiKey, logFile, links});
    parser.process(app);

    if (parser.isSet(logFile) && !LogManager::instance().openLogFile(parser.value(logFile))) {
        qWarning() << "[MAIN] Cannot open log file" << parser.value(logFile);
    }
    LogManager::instance().addLog("[MAIN] BatchShare started; log=" + LogManager::instance().logFilePath());

    const QStringList dirs = parser.positionalArguments();
    if (dirs.isEmpty()) {
        parser.showHelp(1);
    }

    QSettings store;
    BatchSettings settings;
    settings.load(store);
    ServiceSettings service;
    service.load(store);

    if (parser.isSet(noTransform)) settings.runTransform = false;
    if (parser.isSet(noArchive)) settings.runArchive = false;
    if (parser.isSet(noUpload)) settings.runUpload = false;
    if (parser.isSet(convert)) settings.convertLinks = true;
    if (parser.isSet(format)) {
        bool ok = false;
        settings.archiveFormat = BatchSettings::formatFromString(parser.value(format), &ok);
        if (!ok) {
            qCritical() << "[MAIN] Unknown archive format" << parser.value(format);
            return 1;
        }
    }
    if (parser.isSet(level)) settings.compressionLevel = std::clamp(parser.value(level).toInt(), 0, 9);
    if (parser.isSet(password)) settings.archivePassword = parser.value(password);
    if (parser.isSet(output)) settings.outputDirectory = parser.value(output);
    if (parser.isSet(parallel)) settings.maxParallelArchives = std::max(0, parser.value(parallel).toInt());
    if (parser.isSet(retries)) settings.uploadMaxAttempts = std::max(1, parser.value(retries).toInt());
    if (parser.isSet(apiKey)) service.apiKey = parser.value(apiKey);
    service.applyEnvironment();

    if (settings.runTransform && !parser.isSet(transformCmd)) {
        qInfo() << "[MAIN] No --transform-cmd given, Transform disabled";
        settings.runTransform = false;
    }
    if (settings.runUpload && service.apiKey.isEmpty()) {
        qCritical() << "[MAIN] Upload needs an API key (--api-key or BATCHSHARE_API_KEY)";
        return 1;
    }

    QVector<WorkItemSpec> items;
    for (int i = 0; i < dirs.size(); ++i) {
        const QFileInfo fi(dirs.at(i));
        if (!fi.exists()) {
            qWarning() << "[MAIN] Skipping missing path" << dirs.at(i);
            continue;
        }
        WorkItemSpec spec;
        spec.name = fi.fileName().isEmpty() ? QDir(fi.absoluteFilePath()).dirName() : fi.fileName();
        spec.id = shortId(spec.name, i);
        spec.sourcePath = fi.absoluteFilePath();
        items << spec;
    }
    if (items.isEmpty()) {
        qCritical() << "[MAIN] Nothing to process";
        return 1;
    }

    QtHttpTransport transport;
    FileHostUploader uploader(transport, service);
    LinkConverter converter(transport, service);
    SevenZipArchiver archiver(parser.value(sevenZip));
    std::unique_ptr<ProcessCrackOperation> crack;
    if (parser.isSet(transformCmd)) crack = std::make_unique<ProcessCrackOperation>(parser.value(transformCmd));

    BatchPipeline pipeline;
    pipeline.setCrackOperation(crack.get());
    pipeline.setArchiveOperation(&archiver);
    pipeline.setUploadClient(&uploader);
    pipeline.setLinkConverter(&converter);

    QObject::connect(&pipeline, &BatchPipeline::itemStatus, &app,
                     [](const QString& id, const QString& phase, const QString& message) {
        qInfo().noquote() << QString("[%1] %2: %3").arg(phase, id, message);
    });
    QObject::connect(&pipeline, &BatchPipeline::progressChanged, &app, [](const QString& context, int percent) {
        qInfo().noquote() << QString("[Progress] %1 %2%").arg(context).arg(percent);
    });

    int exitCode = 1;
    const LinkFormat linkFormat = BatchReport::linkFormatFromString(parser.value(links));
    QObject::connect(&pipeline, &BatchPipeline::batchFinished, &app, [&](const BatchReport& report) {
        QTextStream out(stdout);
        out << report.describe() << "\n";
        const QString list = report.formatLinks(linkFormat);
        if (!list.isEmpty()) out << "\n" << list << "\n";
        out.flush();
        exitCode = report.allSucceeded() ? 0 : 1;
        app.quit();
    });

    // Ctrl-C raises cancel all; the handler only flips a flag
    std::signal(SIGINT, onSigInt);
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &pipeline, [&pipeline]() {
        if (g_interrupted.exchange(false)) {
            qWarning() << "[MAIN] Interrupted, cancelling remaining work";
            pipeline.cancelAll();
        }
    });
    interruptPoll.start(100);

    if (!pipeline.start(items, settings)) {
        qCritical() << "[MAIN] Batch could not be started";
        return 1;
    }
    app.exec();

    LogManager::instance().addLog("[MAIN] Exit code " + QString::number(exitCode));
    LogManager::instance().flush();
    return exitCode;
}
