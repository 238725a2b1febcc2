#include "pipeline/batch_report.h"

#include <QStringList>
#include <algorithm>

int BatchReport::count(BatchPhase phase, PhaseStatus status) const
{
    return static_cast<int>(std::count_if(items.cbegin(), items.cend(), [&](const WorkItem& it) {
        return it.outcome(phase).status == status;
    }));
}

int BatchReport::skippedCount() const
{
    return static_cast<int>(std::count_if(items.cbegin(), items.cend(), [](const WorkItem& it) {
        return std::any_of(it.outcomes.cbegin(), it.outcomes.cend(),
                           [](const PhaseOutcome& o) { return o.status == PhaseStatus::Skipped; });
    }));
}

int BatchReport::cancelledCount() const
{
    return static_cast<int>(std::count_if(items.cbegin(), items.cend(), [](const WorkItem& it) {
        return std::any_of(it.outcomes.cbegin(), it.outcomes.cend(),
                           [](const PhaseOutcome& o) { return o.status == PhaseStatus::Cancelled; });
    }));
}

QString BatchReport::summary() const
{
    QStringList parts;
    auto add = [&parts](int n, const char* what) {
        if (n > 0) parts << QString("%1 %2").arg(n).arg(QLatin1String(what));
    };
    add(count(BatchPhase::Transform, PhaseStatus::Success), "transformed");
    add(count(BatchPhase::Archive, PhaseStatus::Success), "archived");
    add(count(BatchPhase::Upload, PhaseStatus::Success), "uploaded");
    add(count(BatchPhase::Transform, PhaseStatus::Failed), "transform failed");
    add(count(BatchPhase::Archive, PhaseStatus::Failed), "archive failed");
    add(count(BatchPhase::Upload, PhaseStatus::Failed), "upload failed");
    add(skippedCount(), "skipped");
    add(cancelledCount(), "cancelled");
    return parts.isEmpty() ? QString("No operations performed") : parts.join(", ");
}

QString BatchReport::formatLink(const WorkItem& item, LinkFormat format)
{
    const QString url = item.finalUrl();
    switch (format) {
        case LinkFormat::Markdown: return QString("[%1](%2)").arg(item.name, url);
        case LinkFormat::BBCode: return QString("[url=%1]%2[/url]").arg(url, item.name);
        case LinkFormat::Plain: break;
    }
    return QString("%1: %2").arg(item.name, url);
}

QString BatchReport::formatLinks(LinkFormat format) const
{
    QStringList lines;
    for (const WorkItem& it : items) {
        if (it.upload.ok) lines << formatLink(it, format);
    }
    return lines.join('\n');
}

QString BatchReport::failureReason(const WorkItem& item)
{
    for (const PhaseOutcome& o : item.outcomes) {
        if (o.excludes()) return o.reason.isEmpty() ? WorkItem::statusName(o.status) : o.reason;
    }
    return QString();
}

QString BatchReport::describe() const
{
    QStringList lines;
    for (const WorkItem& it : items) {
        const BatchPhase last = it.finalPhase();
        QString line = QString("%1 | %2 | %3")
            .arg(it.name, WorkItem::phaseName(last), WorkItem::statusName(it.outcome(last).status));
        const QString reason = failureReason(it);
        if (!reason.isEmpty()) line += " | " + reason;
        if (it.upload.ok) line += " | " + it.finalUrl();
        lines << line;
    }
    lines << QString("%1 (%2 s)").arg(summary()).arg(elapsedMs / 1000.0, 0, 'f', 1);
    return lines.join('\n');
}

bool BatchReport::allSucceeded() const
{
    return std::all_of(items.cbegin(), items.cend(), [](const WorkItem& it) {
        return std::none_of(it.outcomes.cbegin(), it.outcomes.cend(),
                            [](const PhaseOutcome& o) { return o.excludes(); });
    });
}

const WorkItem* BatchReport::find(const QString& id) const
{
    auto it = std::find_if(items.cbegin(), items.cend(), [&id](const WorkItem& w) { return w.id == id; });
    return it == items.cend() ? nullptr : &*it;
}

LinkFormat BatchReport::linkFormatFromString(const QString& text)
{
    const QString t = text.trimmed().toLower();
    if (t == "markdown" || t == "md") return LinkFormat::Markdown;
    if (t == "bbcode" || t == "bb") return LinkFormat::BBCode;
    return LinkFormat::Plain;
}
