#include "tools/seven_zip_archiver.h"
#include "retry_loop.h"

#include <QProcess>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QRegularExpression>
#include <QDebug>
#include <algorithm>

SevenZipArchiver::SevenZipArchiver(const QString& program)
    : m_program(program)
{
}

QStringList SevenZipArchiver::buildArguments(const ArchiveRequest& request, int level)
{
    QStringList args;
    args << "a"
         << (request.format == ArchiveFormat::Zip ? "-tzip" : "-t7z")
         << QString("-mx=%1").arg(std::clamp(level, 0, 9))
         << "-bsp1";
    if (!request.password.isEmpty()) {
        args << "-p" + request.password;
        if (request.format == ArchiveFormat::SevenZip) args << "-mhe=on";
    }
    args << QDir::toNativeSeparators(request.destinationPath);
    if (QFileInfo(request.sourcePath).isDir()) {
        args << QDir::toNativeSeparators(QDir(request.sourcePath).filePath("*")) << "-r";
    } else {
        args << QDir::toNativeSeparators(request.sourcePath);
    }
    return args;
}

int SevenZipArchiver::parseProgress(const QString& chunk)
{
    static const QRegularExpression rx("(\\d{1,3})%");
    int latest = -1;
    auto it = rx.globalMatch(chunk);
    while (it.hasNext()) {
        latest = it.next().captured(1).toInt();
    }
    return latest > 100 ? -1 : latest;
}

bool SevenZipArchiver::isOutOfMemory(const QString& output)
{
    return output.contains("Can't allocate", Qt::CaseInsensitive)
        || output.contains("out of memory", Qt::CaseInsensitive)
        || output.contains("E_OUTOFMEMORY", Qt::CaseInsensitive);
}

ArchiveResult SevenZipArchiver::archive(const ArchiveRequest& request, const ArchiveProgressFn& progress,
                                        const CancellationToken& token)
{
    if (!QFileInfo::exists(request.sourcePath)) {
        return ArchiveResult::failure(QString("Source not found: %1").arg(request.sourcePath));
    }

    int level = request.compressionLevel;

    // One rising sequence across attempts: a fallback run fills what the failed run left
    int base = 0;
    int reached = 0;
    const ArchiveProgressFn forward = [&](int percent) {
        reached = std::max(reached, base + percent * (100 - base) / 100);
        if (progress) progress(reached);
    };

    ArchiveResult result;
    RetryLoop loop(RetryPolicy::fixed(2, 0), token);
    loop.run([&](RetryState& st) {
        QString log;
        result = runOnce(request, level, forward, token, &log);
        if (result.ok) return RetryLoop::Attempt::Succeeded;
        if (result.cancelled) return RetryLoop::Attempt::Fail;
        st.lastError = result.errorMessage;
        if (isOutOfMemory(log) && level > FALLBACK_LEVEL) {
            qWarning() << "[Archive] 7z ran out of memory at level" << level << "- retrying at" << FALLBACK_LEVEL;
            level = FALLBACK_LEVEL;
            base = reached;
            return RetryLoop::Attempt::Retry;
        }
        return RetryLoop::Attempt::Fail;
    });

    if (!result.ok && token.isCancelled()) return ArchiveResult::aborted();
    return result;
}

ArchiveResult SevenZipArchiver::runOnce(const ArchiveRequest& request, int level, const ArchiveProgressFn& progress,
                                        const CancellationToken& token, QString* outputLog)
{
    // 7z "a" appends to an existing archive
    if (QFileInfo::exists(request.destinationPath) && !QFile::remove(request.destinationPath)) {
        return ArchiveResult::failure(QString("Cannot replace %1").arg(request.destinationPath));
    }

    const QStringList args = buildArguments(request, level);
    QProcess proc;
    proc.setProgram(m_program);
    proc.setArguments(args);
    qInfo() << "[Archive]" << QFileInfo(m_program).fileName() << "level" << level << "->" << request.destinationPath;
    proc.start();
    if (!proc.waitForStarted(10000)) {
        return ArchiveResult::failure(QString("Cannot start %1: %2").arg(m_program, proc.errorString()));
    }

    QString errText;
    while (proc.state() != QProcess::NotRunning) {
        if (token.isCancelled()) {
            proc.kill();
            proc.waitForFinished(5000);
            QFile::remove(request.destinationPath);
            qInfo() << "[Archive] Cancelled" << request.destinationPath;
            return ArchiveResult::aborted();
        }
        proc.waitForReadyRead(100);
        const QString out = QString::fromLocal8Bit(proc.readAllStandardOutput());
        errText += QString::fromLocal8Bit(proc.readAllStandardError());
        if (outputLog) *outputLog += out;
        const int percent = parseProgress(out);
        if (percent >= 0 && progress) progress(percent);
    }
    const QString tail = QString::fromLocal8Bit(proc.readAllStandardOutput());
    errText += QString::fromLocal8Bit(proc.readAllStandardError());
    if (outputLog) *outputLog += tail + errText;
    const int tailPercent = parseProgress(tail);
    if (tailPercent >= 0 && progress) progress(tailPercent);

    if (proc.exitStatus() == QProcess::NormalExit && proc.exitCode() == 0) {
        if (progress) progress(100);
        return ArchiveResult::success();
    }

    QFile::remove(request.destinationPath);
    const QString detail = errText.trimmed().isEmpty() ? QString("exit code %1").arg(proc.exitCode())
                                                       : errText.trimmed().section('\n', -1);
    return ArchiveResult::failure(QString("7z failed: %1").arg(detail));
}
