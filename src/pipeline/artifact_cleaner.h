#pragma once
#include <QString>
#include <QStringList>

// Leftovers of earlier transforms, matched by simple wildcard patterns (* and ? only;
// brackets are literal). Matching is case-insensitive.
struct CleanupRules {
    QStringList backupSuffixes;       // "<name><suffix>" is restored over "<name>"
    QStringList directoryNames;       // removed wherever found
    QStringList topLevelPatterns;     // files removed from the root only
    QStringList recursivePatterns;    // files or directories removed at any depth

    static CleanupRules defaults();
};

struct CleanupReport {
    int restored = 0;
    int removed = 0;
    int warnings = 0;
    QStringList messages;

    bool isClean() const { return warnings == 0; }
};

// Best-effort: every failed action is logged and counted, nothing aborts the pass.
class ArtifactCleaner {
public:
    explicit ArtifactCleaner(CleanupRules rules = CleanupRules::defaults());

    CleanupReport clean(const QString& rootPath) const;

    const CleanupRules& rules() const { return m_rules; }

    static bool matches(const QString& name, const QString& pattern);

private:
    void restoreBackups(const QString& rootPath, CleanupReport& report) const;
    void removeDirectories(const QString& rootPath, CleanupReport& report) const;
    void removeFiles(const QString& rootPath, CleanupReport& report) const;
    bool matchesAny(const QString& name, const QStringList& patterns) const;
    void warn(CleanupReport& report, const QString& message) const;

    CleanupRules m_rules;
};
