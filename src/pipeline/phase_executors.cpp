#include "pipeline/phase_executors.h"
#include "pipeline/transform_target.h"
#include "net/upload_client.h"
#include "progress_reporter.h"
#include "retry_loop.h"

#include <QtConcurrent>
#include <QThreadPool>
#include <QFuture>
#include <QDir>
#include <QFileInfo>
#include <QElapsedTimer>
#include <QRegularExpression>
#include <QDebug>
#include <exception>
#include <algorithm>

bool PhaseContext::isPhaseEnabled(BatchPhase phase) const
{
    switch (phase) {
        case BatchPhase::Cleanup: return true;
        case BatchPhase::Transform: return settings.runTransform;
        case BatchPhase::Archive: return settings.runArchive;
        case BatchPhase::Upload: return settings.runUpload;
    }
    return false;
}

void PhaseContext::cancelFrom(WorkItem& item, BatchPhase phase) const
{
    for (int p = static_cast<int>(phase); p < kPhaseCount; ++p) {
        const auto ph = static_cast<BatchPhase>(p);
        if (isPhaseEnabled(ph) && !item.outcome(ph).wasRun()) {
            item.outcome(ph) = PhaseOutcome::cancelled();
        }
    }
    status(item, phase, "Cancelled");
}

// ---------------------------------------------------------------- Cleanup

CleanupPhase::CleanupPhase(const ArtifactCleaner& cleaner)
    : m_cleaner(cleaner)
{
}

void CleanupPhase::run(const QVector<WorkItem*>& items, const PhaseContext& ctx)
{
    for (WorkItem* item : items) {
        // Best-effort: a warning never changes the outcome
        if (QFileInfo(item->sourcePath).isDir()) {
            try {
                const CleanupReport report = m_cleaner.clean(item->sourcePath);
                item->cleanupWarnings = report.warnings;
                ctx.status(*item, phase(), QString("Cleaned (%1 restored, %2 removed)")
                           .arg(report.restored).arg(report.removed));
            } catch (const std::exception& e) {
                item->cleanupWarnings += 1;
                qWarning() << "[Cleanup]" << item->name << "threw:" << e.what();
            }
        }
        item->outcome(phase()) = PhaseOutcome::success();
    }
}

// ---------------------------------------------------------------- Transform

TransformPhase::TransformPhase(CrackOperation* operation, TransformTarget& target)
    : m_operation(operation), m_target(target)
{
}

void TransformPhase::run(const QVector<WorkItem*>& items, const PhaseContext& ctx)
{
    for (int i = 0; i < items.size(); ++i) {
        WorkItem& item = *items[i];

        if (ctx.cancellation.isCancelAllRequested()) {
            qInfo() << "[Transform] Cancel all - marking" << items.size() - i << "remaining item(s)";
            for (int j = i; j < items.size(); ++j) ctx.cancelFrom(*items[j], phase());
            return;
        }
        if (!m_operation) {
            item.outcome(phase()) = PhaseOutcome::failed("No transform operation configured");
            continue;
        }

        ctx.cancellation.beginItem(item.id);
        const CancellationToken token = ctx.cancellation.itemToken();
        ctx.status(item, phase(), "Transforming...");
        qInfo() << "[Transform] Start" << item.name;

        CrackResult result;
        {
            TransformTarget::Lease lease(m_target, item.id, item.sourcePath);
            if (!lease.isValid()) {
                result = CrackResult::failure(lease.errorString());
            } else {
                try {
                    result = m_operation->crack(m_target, token);
                } catch (const std::exception& e) {
                    result = CrackResult::failure(QString("Transform threw: %1").arg(e.what()));
                }
            }
        }

        if (result.ok) {
            item.outcome(phase()) = PhaseOutcome::success();
        } else if (token.isCancelAllRequested()) {
            ctx.cancelFrom(item, phase());
        } else if (token.isSkipRequested()) {
            item.outcome(phase()) = PhaseOutcome::skipped("Skipped by user");
        } else {
            item.outcome(phase()) = PhaseOutcome::failed(result.errorMessage.isEmpty()
                                                         ? QString("Transform failed") : result.errorMessage);
        }
        ctx.cancellation.endItem();

        qInfo() << "[Transform] Done" << item.name << WorkItem::statusName(item.outcome(phase()).status);
        ctx.status(item, phase(), WorkItem::statusName(item.outcome(phase()).status));
    }
}

// ---------------------------------------------------------------- Archive

ArchivePhase::ArchivePhase(ArchiveOperation* operation)
    : m_operation(operation)
{
}

QString ArchivePhase::sanitizeFileName(const QString& name)
{
    static const QRegularExpression invalid(R"([<>:"/\\|?*\x00-\x1F])");
    QString out = name;
    out.remove(invalid);
    return out.trimmed();
}

QString ArchivePhase::archiveFileName(const QString& itemName, bool transformed, const QString& extension)
{
    return QString("[BatchShare] %1 %2.%3")
        .arg(transformed ? "CRACKED" : "CLEAN", sanitizeFileName(itemName), extension);
}

void ArchivePhase::run(const QVector<WorkItem*>& items, const PhaseContext& ctx)
{
    if (items.isEmpty()) return;

    if (ctx.cancellation.isCancelAllRequested()) {
        for (WorkItem* item : items) ctx.cancelFrom(*item, phase());
        return;
    }

    const QString outDir = ctx.settings.resolvedOutputDirectory();
    if (!QDir().mkpath(outDir)) {
        for (WorkItem* item : items) {
            item->outcome(phase()) = PhaseOutcome::failed(QString("Cannot create output directory %1").arg(outDir));
        }
        return;
    }

    QThreadPool pool;
    const int parallel = ctx.settings.maxParallelArchives > 0 ? ctx.settings.maxParallelArchives : items.size();
    pool.setMaxThreadCount(std::max(1, parallel));
    qInfo() << "[Archive] Launching" << items.size() << "task(s), parallel" << pool.maxThreadCount();

    const CancellationToken token = ctx.cancellation.batchToken();
    QList<QFuture<void>> tasks;
    for (WorkItem* item : items) {
        // Each task writes only to its own WorkItem
        tasks << QtConcurrent::run(&pool, [this, item, &ctx, token]() {
            archiveOne(*item, ctx, token);
        });
    }
    for (QFuture<void>& f : tasks) f.waitForFinished();
}

void ArchivePhase::archiveOne(WorkItem& item, const PhaseContext& ctx, const CancellationToken& token)
{
    if (token.isCancelled()) {
        ctx.cancelFrom(item, phase());
        return;
    }
    if (!m_operation) {
        item.outcome(phase()) = PhaseOutcome::failed("No archive operation configured");
        return;
    }

    const bool transformed = item.outcome(BatchPhase::Transform).isSuccess();
    ArchiveRequest req;
    req.sourcePath = item.sourcePath;
    req.destinationPath = QDir(ctx.settings.resolvedOutputDirectory())
        .filePath(archiveFileName(item.name, transformed, ctx.settings.archiveExtension()));
    req.format = ctx.settings.archiveFormat;
    req.compressionLevel = ctx.settings.compressionLevel;
    req.password = ctx.settings.archivePassword;

    const QString context = "archive:" + item.id;
    ctx.progress.begin(context);
    ctx.status(item, phase(), "Archiving...");

    QElapsedTimer timer;
    timer.start();
    ArchiveResult result;
    try {
        result = m_operation->archive(req, [&ctx, &context](int percent) {
            ctx.progress.report(percent, context);
        }, token);
    } catch (const std::exception& e) {
        result = ArchiveResult::failure(QString("Archiver threw: %1").arg(e.what()));
    }
    ctx.progress.finish(context);

    if (result.ok) {
        item.archive.outputPath = req.destinationPath;
        item.archive.sizeBytes = QFileInfo(req.destinationPath).size();
        item.archive.durationMs = timer.elapsed();
        item.outcome(phase()) = PhaseOutcome::success();
        qInfo() << "[Archive] Done" << item.name << item.archive.sizeBytes << "bytes in" << item.archive.durationMs << "ms";
        ctx.status(item, phase(), "Archived");
    } else if (result.cancelled || token.isCancelled()) {
        ctx.cancelFrom(item, phase());
    } else {
        item.outcome(phase()) = PhaseOutcome::failed(result.errorMessage.isEmpty()
                                                     ? QString("Archive failed") : result.errorMessage);
        qWarning() << "[Archive] Failed" << item.name << item.outcome(phase()).reason;
        ctx.status(item, phase(), item.outcome(phase()).reason);
    }
}

// ---------------------------------------------------------------- Upload

UploadPhase::UploadPhase(UploadClient* client)
    : m_client(client)
{
}

void UploadPhase::run(const QVector<WorkItem*>& items, const PhaseContext& ctx)
{
    for (int i = 0; i < items.size(); ++i) {
        WorkItem& item = *items[i];

        if (ctx.cancellation.isCancelAllRequested()) {
            qInfo() << "[Upload] Cancel all - marking" << items.size() - i << "remaining item(s)";
            for (int j = i; j < items.size(); ++j) ctx.cancelFrom(*items[j], phase());
            return;
        }

        ctx.cancellation.beginItem(item.id);
        const PhaseOutcome outcome = uploadOne(item, ctx);
        ctx.cancellation.endItem();

        if (outcome.status == PhaseStatus::Cancelled) {
            ctx.cancelFrom(item, phase());
        } else {
            item.outcome(phase()) = outcome;
            ctx.status(item, phase(), outcome.isSuccess() ? QString("Uploaded: %1").arg(item.upload.downloadUrl)
                                                          : WorkItem::statusName(outcome.status) + ": " + outcome.reason);
        }
    }
}

QString UploadPhase::uploadSource(const WorkItem& item, const PhaseContext& ctx, QString* errorOut) const
{
    if (item.archive.isValid()) return item.archive.outputPath;
    if (!ctx.settings.runArchive && QFileInfo(item.sourcePath).isFile()) return item.sourcePath;
    if (errorOut) *errorOut = "No archive to upload";
    return QString();
}

PhaseOutcome UploadPhase::uploadOne(WorkItem& item, const PhaseContext& ctx)
{
    if (!m_client) return PhaseOutcome::failed("No upload client configured");

    QString error;
    const QString path = uploadSource(item, ctx, &error);
    if (path.isEmpty()) return PhaseOutcome::failed(error);

    const CancellationToken token = ctx.cancellation.itemToken();
    const int attempts = std::max(1, ctx.settings.uploadMaxAttempts);
    const RetryPolicy policy = RetryPolicy::linear(attempts, 0, ctx.settings.uploadRetryStepSeconds,
                                                   ctx.settings.uploadRetryStepSeconds * attempts,
                                                   ctx.settings.countdownStepMs);
    const QString context = "upload:" + item.id;
    qInfo() << "[Upload] Item" << item.name << "file" << path;

    RetryLoop loop(policy, token);
    const RetryLoop::Outcome outcome = loop.run([&](RetryState& st) {
        item.uploadAttempts = st.attempt;
        ctx.progress.begin(context);
        ctx.status(item, phase(), QString("Uploading (attempt %1/%2)...").arg(st.attempt).arg(st.maxAttempts));

        UploadResult result;
        try {
            result = m_client->upload(path,
                [&ctx, &context](double fraction) { ctx.progress.reportFraction(fraction, context); },
                [&ctx, &item, this](UploadStage, const QString& message) { ctx.status(item, phase(), message); },
                token);
        } catch (const std::exception& e) {
            result = UploadResult::failure(UploadError::TransferFailed, QString("Uploader threw: %1").arg(e.what()));
        }
        ctx.progress.finish(context);

        if (result.ok) {
            item.upload = result;
            return RetryLoop::Attempt::Succeeded;
        }
        st.lastError = result.errorMessage;
        qWarning() << "[Upload] Attempt" << st.attempt << "for" << item.name << "failed:" << result.errorMessage;
        return result.isRetryable() ? RetryLoop::Attempt::Retry : RetryLoop::Attempt::Fail;
    }, [&](const RetryState& st, int remaining) {
        ctx.status(item, phase(), QString("Retrying in %1s (attempt %2/%3)")
                   .arg(remaining).arg(st.attempt + 1).arg(st.maxAttempts));
    });

    switch (outcome) {
        case RetryLoop::Outcome::Succeeded:
            return PhaseOutcome::success();
        case RetryLoop::Outcome::Cancelled:
            break;
        case RetryLoop::Outcome::Failed:
            if (!token.isCancelled()) return PhaseOutcome::failed(loop.state().lastError);
            break;
        case RetryLoop::Outcome::Exhausted:
            return PhaseOutcome::failed(QString("Upload failed after %1 attempts: %2")
                                        .arg(loop.state().attempt).arg(loop.state().lastError));
    }
    if (token.isCancelAllRequested()) return PhaseOutcome::cancelled();
    return PhaseOutcome::skipped("Skipped by user");
}
