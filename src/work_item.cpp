#include "work_item.h"

bool WorkItem::isEligibleFor(BatchPhase phase) const
{
    for (int i = 0; i < static_cast<int>(phase); ++i) {
        if (outcomes[i].excludes()) return false;
    }
    return !outcome(phase).wasRun();
}

BatchPhase WorkItem::finalPhase() const
{
    for (int i = kPhaseCount - 1; i > 0; --i) {
        if (outcomes[i].wasRun()) return static_cast<BatchPhase>(i);
    }
    return BatchPhase::Cleanup;
}

QString WorkItem::phaseName(BatchPhase phase)
{
    switch (phase) {
        case BatchPhase::Cleanup: return "Cleanup";
        case BatchPhase::Transform: return "Transform";
        case BatchPhase::Archive: return "Archive";
        case BatchPhase::Upload: return "Upload";
    }
    return "";
}

QString WorkItem::statusName(PhaseStatus status)
{
    switch (status) {
        case PhaseStatus::NotRun: return "Not run";
        case PhaseStatus::Success: return "Success";
        case PhaseStatus::Failed: return "Failed";
        case PhaseStatus::Skipped: return "Skipped";
        case PhaseStatus::Cancelled: return "Cancelled";
    }
    return "";
}
