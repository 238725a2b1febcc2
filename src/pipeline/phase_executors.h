#pragma once
#include <QString>
#include <QVector>
#include <functional>

#include "work_item.h"
#include "batch_settings.h"
#include "cancellation.h"
#include "pipeline/operations.h"
#include "pipeline/artifact_cleaner.h"

class ProgressReporter;
class TransformTarget;
class UploadClient;

using ItemStatusFn = std::function<void(const QString& itemId, BatchPhase phase, const QString& message)>;

// Shared by every executor of one run.
struct PhaseContext {
    CancellationController& cancellation;
    ProgressReporter& progress;
    const BatchSettings& settings;
    ItemStatusFn itemStatus;

    void status(const WorkItem& item, BatchPhase phase, const QString& message) const {
        if (itemStatus) itemStatus(item.id, phase, message);
    }
    bool isPhaseEnabled(BatchPhase phase) const;
    // Records Cancelled for phase and every later enabled phase.
    void cancelFrom(WorkItem& item, BatchPhase phase) const;
};

// Each executor receives the items the orchestrator found eligible, in list order.
class PhaseExecutor {
public:
    virtual ~PhaseExecutor() = default;
    virtual BatchPhase phase() const = 0;
    virtual void run(const QVector<WorkItem*>& items, const PhaseContext& ctx) = 0;
};

class CleanupPhase : public PhaseExecutor {
public:
    explicit CleanupPhase(const ArtifactCleaner& cleaner);
    BatchPhase phase() const override { return BatchPhase::Cleanup; }
    void run(const QVector<WorkItem*>& items, const PhaseContext& ctx) override;

private:
    const ArtifactCleaner& m_cleaner;
};

// Strictly one item at a time: the target is a single shared slot.
class TransformPhase : public PhaseExecutor {
public:
    TransformPhase(CrackOperation* operation, TransformTarget& target);
    BatchPhase phase() const override { return BatchPhase::Transform; }
    void run(const QVector<WorkItem*>& items, const PhaseContext& ctx) override;

private:
    CrackOperation* m_operation;
    TransformTarget& m_target;
};

// One task per item on a bounded pool; joins all tasks before returning.
class ArchivePhase : public PhaseExecutor {
public:
    explicit ArchivePhase(ArchiveOperation* operation);
    BatchPhase phase() const override { return BatchPhase::Archive; }
    void run(const QVector<WorkItem*>& items, const PhaseContext& ctx) override;

    static QString archiveFileName(const QString& itemName, bool transformed, const QString& extension);
    static QString sanitizeFileName(const QString& name);

private:
    void archiveOne(WorkItem& item, const PhaseContext& ctx, const CancellationToken& token);

    ArchiveOperation* m_operation;
};

// Sequential uploads, each wrapped in a retry loop with an interruptible countdown.
class UploadPhase : public PhaseExecutor {
public:
    explicit UploadPhase(UploadClient* client);
    BatchPhase phase() const override { return BatchPhase::Upload; }
    void run(const QVector<WorkItem*>& items, const PhaseContext& ctx) override;

private:
    PhaseOutcome uploadOne(WorkItem& item, const PhaseContext& ctx);
    QString uploadSource(const WorkItem& item, const PhaseContext& ctx, QString* errorOut) const;

    UploadClient* m_client;
};
