#pragma once
#include <QString>
#include <QByteArray>

#include "net/upload_client.h"
#include "net/http_transport.h"
#include "batch_settings.h"

// Three-step upload to the file host:
//   1. acquire a per-upload server from the API,
//   2. stream the file as multipart/form-data,
//   3. resolve the session (redirect xid or inline page) and poll end.pl until
//      the host has finished scanning the file.
// Each call owns a fresh UploadSession; nothing survives between attempts.
class FileHostUploader : public UploadClient {
public:
    FileHostUploader(HttpTransport& transport, const ServiceSettings& settings);

    UploadResult upload(const QString& filePath,
                        const UploadProgressFn& progress,
                        const UploadStatusFn& status,
                        const CancellationToken& token) override;

    // Session id from a redirect Location header, empty when absent.
    static QString extractSessionId(const QByteArray& location);
    // First canonical file link in an inline result page, empty when absent.
    static QString extractInlineLink(const QString& body);
    static bool isPleaseWait(const QString& body);
    static QString formatThroughput(double currentMBps, double averageMBps, qint64 etaSeconds);

    static constexpr int STATUS_INTERVAL_MS = 500;

private:
    struct UploadSession {
        QString serverHost;
        QString uploadId;
        QString sessionId;
        qint64 bytesSent = 0;
        qint64 totalBytes = 0;
    };

    UploadResult acquireEndpoint(UploadSession& session, const CancellationToken& token);
    UploadResult stream(UploadSession& session, const QString& filePath,
                        const UploadProgressFn& progress, const UploadStatusFn& status,
                        const CancellationToken& token);
    UploadResult awaitProcessing(UploadSession& session, const QString& filePath,
                                 const UploadStatusFn& status, const CancellationToken& token);

    HttpRequest apiRequest(const QUrl& url) const;

    HttpTransport& m_transport;
    ServiceSettings m_settings;
};
