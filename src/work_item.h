#pragma once
#include <QString>
#include <QVector>
#include <array>

#include "net/upload_client.h"

enum class BatchPhase { Cleanup = 0, Transform, Archive, Upload };
constexpr int kPhaseCount = 4;

enum class PhaseStatus { NotRun, Success, Failed, Skipped, Cancelled };

struct PhaseOutcome {
    PhaseStatus status = PhaseStatus::NotRun;
    QString reason;

    bool isSuccess() const { return status == PhaseStatus::Success; }
    bool wasRun() const { return status != PhaseStatus::NotRun; }
    // Failed, Skipped and Cancelled all exclude the item from later phases
    bool excludes() const { return wasRun() && !isSuccess(); }

    static PhaseOutcome success() { return {PhaseStatus::Success, QString()}; }
    static PhaseOutcome failed(const QString& reason) { return {PhaseStatus::Failed, reason}; }
    static PhaseOutcome skipped(const QString& reason = QString()) { return {PhaseStatus::Skipped, reason}; }
    static PhaseOutcome cancelled() { return {PhaseStatus::Cancelled, QStringLiteral("Cancelled")}; }
};

// Produced by the Archive phase, consumed by the Upload phase.
struct ArchiveDescriptor {
    QString outputPath;
    qint64 sizeBytes = 0;
    qint64 durationMs = 0;

    bool isValid() const { return !outputPath.isEmpty(); }
};

// What the caller submits.
struct WorkItemSpec {
    QString id;
    QString name;
    QString sourcePath;
};

// Owned by the orchestrator for the duration of one batch run.
struct WorkItem {
    QString id;
    QString name;
    QString sourcePath;

    std::array<PhaseOutcome, kPhaseCount> outcomes;
    ArchiveDescriptor archive;
    UploadResult upload;
    QString convertedLink;
    int uploadAttempts = 0;
    int cleanupWarnings = 0;

    explicit WorkItem(const WorkItemSpec& spec = WorkItemSpec())
        : id(spec.id), name(spec.name), sourcePath(spec.sourcePath) {}

    PhaseOutcome& outcome(BatchPhase phase) { return outcomes[static_cast<int>(phase)]; }
    const PhaseOutcome& outcome(BatchPhase phase) const { return outcomes[static_cast<int>(phase)]; }

    // Eligible when no earlier executed phase ended in anything but Success.
    bool isEligibleFor(BatchPhase phase) const;
    // Last phase that recorded an outcome; Cleanup when nothing ran.
    BatchPhase finalPhase() const;
    const PhaseOutcome& finalOutcome() const { return outcome(finalPhase()); }
    // Converted link when present, durable reference otherwise.
    QString finalUrl() const { return convertedLink.isEmpty() ? upload.downloadUrl : convertedLink; }

    static QString phaseName(BatchPhase phase);
    static QString statusName(PhaseStatus status);
};

using WorkItemList = QVector<WorkItem>;
