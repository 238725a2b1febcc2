#pragma once
#include <QString>
#include <QStringList>

#include "pipeline/operations.h"

// ArchiveOperation backed by the 7z command line tool.
// Runs `7z a -t7z|-tzip -mx=N -bsp1 [-p...] <dest> <source>/* -r` and reads NN% lines from stdout.
// When 7z runs out of memory at a high level, the archive is retried once at level 5;
// progress keeps rising across that retry.
class SevenZipArchiver : public ArchiveOperation {
public:
    explicit SevenZipArchiver(const QString& program = QStringLiteral("7z"));

    ArchiveResult archive(const ArchiveRequest& request, const ArchiveProgressFn& progress,
                          const CancellationToken& token) override;

    QString program() const { return m_program; }

    static QStringList buildArguments(const ArchiveRequest& request, int level);
    // Last NN% in a chunk of output, -1 when there is none.
    static int parseProgress(const QString& chunk);
    static bool isOutOfMemory(const QString& output);

    static constexpr int FALLBACK_LEVEL = 5;

private:
    ArchiveResult runOnce(const ArchiveRequest& request, int level, const ArchiveProgressFn& progress,
                          const CancellationToken& token, QString* outputLog);

    QString m_program;
};
