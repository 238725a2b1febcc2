#pragma once
#include <QString>
#include <functional>

#include "cancellation.h"

enum class UploadError {
    None,
    FileNotFound,
    EndpointUnavailable,
    TransferFailed,
    UnexpectedResponse,
    ProcessingTimedOut,
    Cancelled
};

// Durable outcome of one upload call. Once ok, the fields never change.
struct UploadResult {
    bool ok = false;
    QString downloadUrl;     // durable reference
    QString fileName;
    qint64 fileSize = 0;     // remote size when the service reports one, local size otherwise
    QString remoteId;
    UploadError error = UploadError::None;
    QString errorMessage;

    explicit operator bool() const noexcept { return ok; }

    // Cancellation and a missing source file are never worth another attempt.
    bool isRetryable() const noexcept {
        return !ok && error != UploadError::Cancelled && error != UploadError::FileNotFound;
    }

    static UploadResult failure(UploadError error, const QString& message) {
        UploadResult r;
        r.error = error;
        r.errorMessage = message;
        return r;
    }

    static QString errorName(UploadError error) {
        switch (error) {
            case UploadError::None: return "None";
            case UploadError::FileNotFound: return "FileNotFound";
            case UploadError::EndpointUnavailable: return "EndpointUnavailable";
            case UploadError::TransferFailed: return "TransferFailed";
            case UploadError::UnexpectedResponse: return "UnexpectedResponse";
            case UploadError::ProcessingTimedOut: return "ProcessingTimedOut";
            case UploadError::Cancelled: return "Cancelled";
        }
        return "";
    }
};

// Coarse step of an upload, reported alongside each human-readable status line.
enum class UploadStage {
    RequestingServer,
    Streaming,
    AwaitingServer,
    Processing,      // service still scanning; a retry follows
    Completed,
    Failed
};

using UploadProgressFn = std::function<void(double fraction)>;
using UploadStatusFn = std::function<void(UploadStage stage, const QString& message)>;

class UploadClient {
public:
    virtual ~UploadClient() = default;

    // Either returns a usable durable reference or a classified error, never a partial result.
    virtual UploadResult upload(const QString& filePath,
                                const UploadProgressFn& progress,
                                const UploadStatusFn& status,
                                const CancellationToken& token) = 0;
};
