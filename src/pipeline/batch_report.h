#pragma once
#include <QString>
#include <QVector>
#include <QMetaType>

#include "work_item.h"

enum class LinkFormat { Plain, Markdown, BBCode };

// Final per-item picture of one batch run.
struct BatchReport {
    QVector<WorkItem> items;
    qint64 elapsedMs = 0;
    bool cancelRequested = false;

    int count(BatchPhase phase, PhaseStatus status) const;
    int skippedCount() const;
    int cancelledCount() const;

    // "2 transformed, 2 archived, 1 uploaded, 1 archive failed" or "No operations performed"
    QString summary() const;
    // One line per uploaded item.
    QString formatLinks(LinkFormat format) const;
    // Multi-line human readable table: name, final phase, outcome, reason, link.
    QString describe() const;

    // True when every executed phase of every item succeeded.
    bool allSucceeded() const;
    const WorkItem* find(const QString& id) const;

    static QString failureReason(const WorkItem& item);
    static QString formatLink(const WorkItem& item, LinkFormat format);
    static LinkFormat linkFormatFromString(const QString& text);
};

Q_DECLARE_METATYPE(BatchReport)
