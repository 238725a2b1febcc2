#include "pipeline/batch_pipeline.h"
#include "pipeline/phase_executors.h"
#include "net/link_converter.h"
#include "log_manager.h"

#include <QtConcurrent>
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QDebug>

BatchPipeline::BatchPipeline(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<BatchReport>("BatchReport");
    qRegisterMetaType<BatchPipeline::State>("BatchPipeline::State");

    connect(&m_progress, &ProgressReporter::progressChanged, this, &BatchPipeline::progressChanged,
            Qt::DirectConnection);
    connect(&m_watcher, &QFutureWatcher<BatchReport>::finished, this, [this]() {
        emit batchFinished(m_watcher.result());
    });
}

BatchPipeline::~BatchPipeline()
{
    if (m_running.load()) {
        m_cancellation.requestCancelAll();
        waitForFinished();
    }
}

QString BatchPipeline::stateName(State state)
{
    switch (state) {
        case State::Idle: return "Idle";
        case State::Cleanup: return "Cleanup";
        case State::Transform: return "Transform";
        case State::Archive: return "Archive";
        case State::Upload: return "Upload";
        case State::Converting: return "Converting";
        case State::Done: return "Done";
        case State::Cancelled: return "Cancelled";
    }
    return "";
}

BatchPipeline::State BatchPipeline::state() const
{
    QMutexLocker lk(&m_mutex);
    return m_state;
}

BatchReport BatchPipeline::lastReport() const
{
    QMutexLocker lk(&m_mutex);
    return m_lastReport;
}

void BatchPipeline::setState(State state)
{
    {
        QMutexLocker lk(&m_mutex);
        if (m_state == state) return;
        m_state = state;
    }
    LogManager::instance().addLog("[Batch] State -> " + stateName(state));
    emit stateChanged(state);
}

void BatchPipeline::skipCurrent()
{
    if (!m_cancellation.requestSkip()) {
        qInfo() << "[Batch] Skip ignored, no item in flight";
    }
}

void BatchPipeline::cancelAll()
{
    m_cancellation.requestCancelAll();
}

QVector<WorkItem*> BatchPipeline::eligibleFor(WorkItemList& items, BatchPhase phase) const
{
    QVector<WorkItem*> out;
    for (WorkItem& it : items) {
        if (it.isEligibleFor(phase)) out << &it;
    }
    return out;
}

bool BatchPipeline::start(const QVector<WorkItemSpec>& items, const BatchSettings& settings)
{
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) return false;
    m_watcher.setFuture(QtConcurrent::run([this, items, settings]() {
        return execute(items, settings);
    }));
    return true;
}

void BatchPipeline::waitForFinished()
{
    m_watcher.waitForFinished();
}

BatchReport BatchPipeline::run(const QVector<WorkItemSpec>& items, const BatchSettings& settings)
{
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        qWarning() << "[Batch] Run refused, a batch is already running";
        return BatchReport();
    }
    return execute(items, settings);
}

BatchReport BatchPipeline::execute(const QVector<WorkItemSpec>& specs, const BatchSettings& settings)
{
    QElapsedTimer timer;
    timer.start();
    m_cancellation.beginBatch();

    WorkItemList items;
    items.reserve(specs.size());
    for (const WorkItemSpec& s : specs) items.append(WorkItem(s));
    qInfo() << "[Batch] Starting" << items.size() << "item(s)"
            << "transform" << settings.runTransform << "archive" << settings.runArchive
            << "upload" << settings.runUpload;

    PhaseContext ctx{m_cancellation, m_progress, settings,
        [this](const QString& id, BatchPhase phase, const QString& message) {
            emit itemStatus(id, WorkItem::phaseName(phase), message);
        }};

    CleanupPhase cleanup(m_cleaner);
    TransformPhase transform(m_crack, m_target);
    ArchivePhase archive(m_archiver);
    UploadPhase upload(m_uploader);
    const QVector<QPair<PhaseExecutor*, State>> phases = {
        {&cleanup, State::Cleanup},
        {&transform, State::Transform},
        {&archive, State::Archive},
        {&upload, State::Upload},
    };

    for (const auto& entry : phases) {
        PhaseExecutor* executor = entry.first;
        if (!ctx.isPhaseEnabled(executor->phase())) continue;

        setState(entry.second);
        const QVector<WorkItem*> eligible = eligibleFor(items, executor->phase());
        qInfo() << "[Batch]" << WorkItem::phaseName(executor->phase()) << "-" << eligible.size() << "eligible";
        executor->run(eligible, ctx);

        // A request seen during a phase is applied by that phase; items that completed it
        // carry on. Cleanup never observes it, so the request stays pending for Transform.
        if (executor->phase() != BatchPhase::Cleanup && m_cancellation.isCancelAllRequested()) {
            qInfo() << "[Batch] Cancel all applied during" << WorkItem::phaseName(executor->phase());
            m_cancellation.settleCancelAll();
        }
    }

    if (settings.runUpload && settings.convertLinks && m_converter) {
        if (m_cancellation.wasCancelAllRequested()) {
            qInfo() << "[Batch] Link conversion skipped after cancel all";
        } else {
            setState(State::Converting);
            convertLinks(items, settings);
        }
    }

    BatchReport report;
    report.items = items;
    report.cancelRequested = m_cancellation.wasCancelAllRequested();
    report.elapsedMs = timer.elapsed();
    m_cancellation.endBatch();

    qInfo() << "[Batch] Finished:" << report.summary();
    {
        QMutexLocker lk(&m_mutex);
        m_lastReport = report;
    }
    setState(report.cancelRequested ? State::Cancelled : State::Done);
    m_running.store(false);
    return report;
}

void BatchPipeline::convertLinks(WorkItemList& items, const BatchSettings& settings)
{
    const CancellationToken token = m_cancellation.batchToken();
    for (WorkItem& item : items) {
        if (!item.upload.ok || !LinkConverter::isConvertible(item.upload.downloadUrl)) continue;
        if (token.isCancelled()) break;

        // Give the host time to scan the file before asking for a conversion
        const int wait = LinkConverter::recommendedInitialWaitSeconds(item.upload.fileSize);
        const bool waited = Interruptible::countdown(wait, settings.countdownStepMs, token, [&](int remaining) {
            emit itemStatus(item.id, "Convert", QString("Waiting for scan... %1s").arg(remaining));
        });
        if (!waited) break;

        const QString converted = m_converter->convert(item.upload.downloadUrl, [&](const QString& message) {
            emit itemStatus(item.id, "Convert", message);
        }, token);
        if (converted != item.upload.downloadUrl) item.convertedLink = converted;
    }
}
