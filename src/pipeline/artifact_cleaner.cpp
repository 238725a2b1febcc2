#include "pipeline/artifact_cleaner.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QDebug>
#include <algorithm>

CleanupRules CleanupRules::defaults()
{
    CleanupRules r;
    r.backupSuffixes = {".dll.bak", ".exe.bak"};
    r.directoryNames = {"steam_settings"};
    r.topLevelPatterns = {"_[*", "*.lnk"};
    r.recursivePatterns = {"_lobby_connect*", "lobby_connect*", "CreamAPI.dll", "cream_api.ini",
                           "CreamLinux", "steam_api_o.dll", "steam_api64_o.dll", "local_save.txt"};
    return r;
}

ArtifactCleaner::ArtifactCleaner(CleanupRules rules)
    : m_rules(std::move(rules))
{
}

bool ArtifactCleaner::matches(const QString& name, const QString& pattern)
{
    QString rx;
    rx.reserve(pattern.size() * 2 + 2);
    rx += '^';
    for (const QChar c : pattern) {
        if (c == '*') rx += ".*";
        else if (c == '?') rx += '.';
        else rx += QRegularExpression::escape(QString(c));
    }
    rx += '$';
    const QRegularExpression re(rx, QRegularExpression::CaseInsensitiveOption);
    return re.match(name).hasMatch();
}

bool ArtifactCleaner::matchesAny(const QString& name, const QStringList& patterns) const
{
    return std::any_of(patterns.cbegin(), patterns.cend(),
                       [&name](const QString& p) { return matches(name, p); });
}

void ArtifactCleaner::warn(CleanupReport& report, const QString& message) const
{
    ++report.warnings;
    report.messages << message;
    qWarning() << "[Cleanup]" << message;
}

CleanupReport ArtifactCleaner::clean(const QString& rootPath) const
{
    CleanupReport report;
    const QFileInfo root(rootPath);
    if (!root.exists() || !root.isDir()) {
        warn(report, QString("Not a directory: %1").arg(rootPath));
        return report;
    }

    restoreBackups(rootPath, report);
    removeDirectories(rootPath, report);
    removeFiles(rootPath, report);

    qInfo() << "[Cleanup]" << root.fileName() << "restored" << report.restored
            << "removed" << report.removed << "warnings" << report.warnings;
    return report;
}

void ArtifactCleaner::restoreBackups(const QString& rootPath, CleanupReport& report) const
{
    if (m_rules.backupSuffixes.isEmpty()) return;

    QStringList backups;
    QDirIterator it(rootPath, QDir::Files | QDir::Hidden | QDir::System, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        for (const QString& suffix : m_rules.backupSuffixes) {
            if (path.endsWith(suffix, Qt::CaseInsensitive)) {
                backups << path;
                break;
            }
        }
    }

    for (const QString& backup : backups) {
        // foo.dll.bak -> foo.dll
        const QString original = backup.left(backup.lastIndexOf('.'));
        if (QFile::exists(original) && !QFile::remove(original)) {
            warn(report, QString("Cannot replace %1").arg(original));
            continue;
        }
        if (!QFile::rename(backup, original)) {
            warn(report, QString("Cannot restore %1").arg(backup));
            continue;
        }
        ++report.restored;
    }
}

void ArtifactCleaner::removeDirectories(const QString& rootPath, CleanupReport& report) const
{
    QStringList doomed;
    QDirIterator it(rootPath, QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QString name = it.fileName();
        if (matchesAny(name, m_rules.directoryNames) || matchesAny(name, m_rules.recursivePatterns)) {
            doomed << path;
        }
    }
    // Parents first; nested matches inside an already removed tree no longer exist
    std::sort(doomed.begin(), doomed.end());
    for (const QString& dir : doomed) {
        if (!QFileInfo::exists(dir)) continue;
        if (QDir(dir).removeRecursively()) {
            ++report.removed;
        } else {
            warn(report, QString("Cannot remove directory %1").arg(dir));
        }
    }
}

void ArtifactCleaner::removeFiles(const QString& rootPath, CleanupReport& report) const
{
    QStringList doomed;
    const QDir root(rootPath);
    const QFileInfoList top = root.entryInfoList(QDir::Files | QDir::Hidden | QDir::System);
    for (const QFileInfo& fi : top) {
        if (matchesAny(fi.fileName(), m_rules.topLevelPatterns)) doomed << fi.absoluteFilePath();
    }

    QDirIterator it(rootPath, QDir::Files | QDir::Hidden | QDir::System, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (matchesAny(it.fileName(), m_rules.recursivePatterns)) doomed << QFileInfo(path).absoluteFilePath();
    }
    doomed.removeDuplicates();

    for (const QString& file : doomed) {
        if (QFile::remove(file)) {
            ++report.removed;
        } else {
            warn(report, QString("Cannot remove %1").arg(file));
        }
    }
}
