#pragma once
#include <QString>
#include <functional>

#include "batch_settings.h"
#include "cancellation.h"

class TransformTarget;

struct CrackResult {
    bool ok = false;
    QString errorMessage;

    static CrackResult success() { return {true, QString()}; }
    static CrackResult failure(const QString& message) { return {false, message}; }
};

// Opaque DRM replacement step. Invoked with the target already held for the item.
class CrackOperation {
public:
    virtual ~CrackOperation() = default;
    virtual CrackResult crack(const TransformTarget& target, const CancellationToken& token) = 0;
};

struct ArchiveRequest {
    QString sourcePath;
    QString destinationPath;
    ArchiveFormat format = ArchiveFormat::SevenZip;
    int compressionLevel = 5;
    QString password;
};

struct ArchiveResult {
    bool ok = false;
    bool cancelled = false;
    QString errorMessage;

    static ArchiveResult success() { return {true, false, QString()}; }
    static ArchiveResult failure(const QString& message) { return {false, false, message}; }
    static ArchiveResult aborted() { return {false, true, QStringLiteral("Cancelled")}; }
};

using ArchiveProgressFn = std::function<void(int percent)>;

// Opaque archiver. Called concurrently for different items; must be reentrant.
class ArchiveOperation {
public:
    virtual ~ArchiveOperation() = default;
    virtual ArchiveResult archive(const ArchiveRequest& request, const ArchiveProgressFn& progress,
                                  const CancellationToken& token) = 0;
};
