#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <QFutureWatcher>
#include <QMutex>
#include <atomic>

#include "work_item.h"
#include "batch_settings.h"
#include "cancellation.h"
#include "progress_reporter.h"
#include "pipeline/batch_report.h"
#include "pipeline/transform_target.h"
#include "pipeline/artifact_cleaner.h"

class CrackOperation;
class ArchiveOperation;
class UploadClient;
class LinkConverter;

// Runs Cleanup -> Transform -> Archive -> Upload (-> link conversion) over a list of
// work items. An item leaves the run at the first phase that does not end in Success.
// Collaborators are borrowed and must outlive the pipeline.
class BatchPipeline : public QObject {
    Q_OBJECT

public:
    enum class State { Idle, Cleanup, Transform, Archive, Upload, Converting, Done, Cancelled };
    Q_ENUM(State)

    explicit BatchPipeline(QObject* parent = nullptr);
    ~BatchPipeline() override;

    void setCrackOperation(CrackOperation* op) { m_crack = op; }
    void setArchiveOperation(ArchiveOperation* op) { m_archiver = op; }
    void setUploadClient(UploadClient* client) { m_uploader = client; }
    void setLinkConverter(LinkConverter* converter) { m_converter = converter; }
    void setCleanupRules(const CleanupRules& rules) { m_cleaner = ArtifactCleaner(rules); }

    // Blocking; safe to call from any thread. One run at a time.
    BatchReport run(const QVector<WorkItemSpec>& items, const BatchSettings& settings);
    // Runs on the global thread pool and emits batchFinished. False when already running.
    bool start(const QVector<WorkItemSpec>& items, const BatchSettings& settings);
    void waitForFinished();
    bool isRunning() const { return m_running.load(); }

    State state() const;
    BatchReport lastReport() const;

    CancellationController& cancellation() { return m_cancellation; }
    ProgressReporter& progressReporter() { return m_progress; }
    TransformTarget& transformTarget() { return m_target; }

    static QString stateName(State state);

public slots:
    void skipCurrent();
    void cancelAll();

signals:
    void stateChanged(BatchPipeline::State state);
    void itemStatus(const QString& itemId, const QString& phase, const QString& message);
    void progressChanged(const QString& context, int percent);
    void batchFinished(const BatchReport& report);

private:
    BatchReport execute(const QVector<WorkItemSpec>& items, const BatchSettings& settings);
    void setState(State state);
    QVector<WorkItem*> eligibleFor(WorkItemList& items, BatchPhase phase) const;
    void convertLinks(WorkItemList& items, const BatchSettings& settings);

    CrackOperation* m_crack = nullptr;
    ArchiveOperation* m_archiver = nullptr;
    UploadClient* m_uploader = nullptr;
    LinkConverter* m_converter = nullptr;
    ArtifactCleaner m_cleaner;

    CancellationController m_cancellation;
    ProgressReporter m_progress;
    TransformTarget m_target;

    mutable QMutex m_mutex;
    State m_state = State::Idle;
    BatchReport m_lastReport;
    std::atomic_bool m_running{false};
    QFutureWatcher<BatchReport> m_watcher;
};

Q_DECLARE_METATYPE(BatchPipeline::State)
