#include "tools/process_crack_operation.h"
#include "pipeline/transform_target.h"

#include <QProcess>
#include <QFileInfo>
#include <QDebug>

ProcessCrackOperation::ProcessCrackOperation(const QString& commandTemplate)
    : m_template(commandTemplate)
{
}

QStringList ProcessCrackOperation::expandCommand(const QString& commandTemplate, const QString& path,
                                                 const QString& itemId)
{
    QStringList parts = QProcess::splitCommand(commandTemplate);
    for (QString& p : parts) {
        p.replace("{path}", path);
        p.replace("{id}", itemId);
    }
    return parts;
}

CrackResult ProcessCrackOperation::crack(const TransformTarget& target, const CancellationToken& token)
{
    QStringList cmd = expandCommand(m_template, target.path(), target.itemId());
    if (cmd.isEmpty()) return CrackResult::failure("No transform command configured");

    QProcess proc;
    proc.setProgram(cmd.takeFirst());
    proc.setArguments(cmd);
    proc.setProcessChannelMode(QProcess::MergedChannels);
    if (QFileInfo(target.path()).isDir()) proc.setWorkingDirectory(target.path());

    qInfo() << "[Transform]" << proc.program() << proc.arguments().join(' ');
    proc.start();
    if (!proc.waitForStarted(10000)) {
        return CrackResult::failure(QString("Cannot start %1: %2").arg(proc.program(), proc.errorString()));
    }

    QString output;
    while (!proc.waitForFinished(100)) {
        if (proc.state() == QProcess::NotRunning) break;
        output += QString::fromLocal8Bit(proc.readAll());
        if (token.isCancelled()) {
            proc.kill();
            proc.waitForFinished(5000);
            return CrackResult::failure("Cancelled");
        }
    }
    output += QString::fromLocal8Bit(proc.readAll());

    if (proc.exitStatus() == QProcess::NormalExit && proc.exitCode() == 0) {
        return CrackResult::success();
    }
    const QString last = output.trimmed().section('\n', -1);
    return CrackResult::failure(last.isEmpty() ? QString("Transform exited with code %1").arg(proc.exitCode())
                                               : QString("Transform failed: %1").arg(last));
}
