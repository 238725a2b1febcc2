#include "net/file_host_uploader.h"
#include "retry_loop.h"

#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QElapsedTimer>
#include <QUuid>
#include <QDebug>
#include <algorithm>

namespace {

const char* kHostPage = "https://1fichier.com/?";

UploadResult report(const UploadStatusFn& status, UploadResult result)
{
    if (!result.ok) {
        qWarning() << "[Upload] Failed:" << UploadResult::errorName(result.error) << result.errorMessage;
        if (status) status(UploadStage::Failed, result.errorMessage);
    }
    return result;
}

} // namespace

FileHostUploader::FileHostUploader(HttpTransport& transport, const ServiceSettings& settings)
    : m_transport(transport), m_settings(settings)
{
}

HttpRequest FileHostUploader::apiRequest(const QUrl& url) const
{
    HttpRequest req;
    req.url = url;
    req.withHeader("User-Agent", m_settings.userAgent.toUtf8());
    if (!m_settings.apiKey.isEmpty()) {
        req.withHeader("Authorization", "Bearer " + m_settings.apiKey.toUtf8());
    }
    return req;
}

UploadResult FileHostUploader::upload(const QString& filePath,
                                      const UploadProgressFn& progress,
                                      const UploadStatusFn& status,
                                      const CancellationToken& token)
{
    const QFileInfo fi(filePath);
    if (!fi.exists() || !fi.isFile()) {
        return report(status, UploadResult::failure(UploadError::FileNotFound,
                                                     QString("File not found: %1").arg(filePath)));
    }
    if (token.isCancelled()) {
        return report(status, UploadResult::failure(UploadError::Cancelled, "Upload cancelled"));
    }

    UploadSession session;
    session.totalBytes = fi.size();
    qInfo() << "[Upload] Starting" << fi.fileName() << "size" << session.totalBytes;

    if (status) status(UploadStage::RequestingServer, "Requesting upload server...");
    UploadResult r = acquireEndpoint(session, token);
    if (!r.ok && r.error != UploadError::None) return report(status, r);

    r = stream(session, filePath, progress, status, token);
    if (r.ok) {
        // Inline page already carried the final link
        if (status) status(UploadStage::Completed, QString("Upload complete: %1").arg(r.downloadUrl));
        return r;
    }
    if (r.error != UploadError::None) return report(status, r);

    r = awaitProcessing(session, filePath, status, token);
    if (!r.ok) return report(status, r);

    qInfo() << "[Upload] Completed" << r.fileName << "->" << r.downloadUrl;
    if (status) status(UploadStage::Completed, QString("Upload complete: %1").arg(r.downloadUrl));
    return r;
}

UploadResult FileHostUploader::acquireEndpoint(UploadSession& session, const CancellationToken& token)
{
    const QUrl url(m_settings.uploadApiBase + "/upload/get_upload_server.cgi");
    const HttpResponse resp = m_transport.get(apiRequest(url), token);
    if (resp.cancelled || token.isCancelled()) {
        return UploadResult::failure(UploadError::Cancelled, "Upload cancelled");
    }
    if (!resp.isSuccess()) {
        return UploadResult::failure(UploadError::EndpointUnavailable,
                                     QString("Failed to get upload server: %1").arg(resp.describe()));
    }

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(resp.body, &perr);
    const QJsonObject obj = doc.object();
    session.serverHost = obj.value("url").toString();
    session.uploadId = obj.value("id").toString();
    if (perr.error != QJsonParseError::NoError || session.serverHost.isEmpty() || session.uploadId.isEmpty()) {
        return UploadResult::failure(UploadError::EndpointUnavailable, "Invalid upload server response");
    }
    qInfo() << "[Upload] Server" << session.serverHost << "id" << session.uploadId;
    return UploadResult();
}

UploadResult FileHostUploader::stream(UploadSession& session, const QString& filePath,
                                      const UploadProgressFn& progress, const UploadStatusFn& status,
                                      const CancellationToken& token)
{
    const QFileInfo fi(filePath);
    HttpRequest req = apiRequest(QUrl(QString("https://%1/upload.cgi?id=%2").arg(session.serverHost, session.uploadId)));
    req.timeoutMs = 0;

    const QByteArray boundary = "----WebKitFormBoundary" + QUuid::createUuid().toString(QUuid::Id128).toLatin1();
    const QList<MultipartPart> parts = {
        MultipartPart::field("domain", "0"),
        MultipartPart::file("file[]", filePath, fi.fileName())
    };

    if (status) status(UploadStage::Streaming, QString("Uploading %1...").arg(fi.fileName()));

    QElapsedTimer sinceStart;
    sinceStart.start();
    QElapsedTimer sinceStatus;
    sinceStatus.start();
    qint64 bytesAtStatus = 0;

    auto onProgress = [&](qint64 sent, qint64 total) {
        if (total <= 0) total = session.totalBytes;
        session.bytesSent = std::max(session.bytesSent, sent);
        if (progress && total > 0) {
            progress(std::clamp(static_cast<double>(session.bytesSent) / static_cast<double>(total), 0.0, 1.0));
        }
        const qint64 interval = sinceStatus.elapsed();
        if (!status || interval < STATUS_INTERVAL_MS) return;

        const double mb = 1024.0 * 1024.0;
        const double current = (session.bytesSent - bytesAtStatus) / mb / (interval / 1000.0);
        const double elapsedSec = std::max<qint64>(1, sinceStart.elapsed()) / 1000.0;
        const double average = session.bytesSent / mb / elapsedSec;
        const qint64 remaining = std::max<qint64>(0, total - session.bytesSent);
        const qint64 eta = average > 0.0 ? static_cast<qint64>(remaining / mb / average) : 0;
        status(UploadStage::Streaming, formatThroughput(current, average, eta));
        bytesAtStatus = session.bytesSent;
        sinceStatus.restart();
    };

    const HttpResponse resp = m_transport.postMultipart(req, parts, boundary, onProgress, token);
    if (resp.cancelled || token.isCancelled()) {
        return UploadResult::failure(UploadError::Cancelled, "Upload cancelled");
    }
    if (resp.networkError) {
        return UploadResult::failure(UploadError::TransferFailed,
                                     QString("Upload transfer failed: %1").arg(resp.describe()));
    }

    if (resp.isRedirect()) {
        session.sessionId = extractSessionId(resp.header("location"));
        if (session.sessionId.isEmpty()) {
            return UploadResult::failure(UploadError::UnexpectedResponse, "Redirect without session id");
        }
        qInfo() << "[Upload] Session" << session.sessionId;
        return UploadResult();
    }

    if (resp.isSuccess()) {
        const QString body = resp.text();
        if (body.contains("Pas de fichier", Qt::CaseInsensitive)) {
            return UploadResult::failure(UploadError::UnexpectedResponse, "Server received no file");
        }
        const QString link = extractInlineLink(body);
        if (link.isEmpty()) {
            return UploadResult::failure(UploadError::UnexpectedResponse, "No download link in upload response");
        }
        UploadResult ok;
        ok.ok = true;
        ok.downloadUrl = link;
        ok.fileName = fi.fileName();
        ok.fileSize = fi.size();
        ok.remoteId = link.mid(link.indexOf('?') + 1);
        if (progress) progress(1.0);
        qInfo() << "[Upload] Inline result" << link;
        return ok;
    }

    return UploadResult::failure(UploadError::TransferFailed, QString("Upload failed: %1").arg(resp.describe()));
}

UploadResult FileHostUploader::awaitProcessing(UploadSession& session, const QString& filePath,
                                               const UploadStatusFn& status, const CancellationToken& token)
{
    const QFileInfo fi(filePath);
    HttpRequest req = apiRequest(QUrl(QString("https://%1/end.pl?xid=%2").arg(session.serverHost, session.sessionId)));
    req.withHeader("JSON", "1");

    if (status) status(UploadStage::AwaitingServer, "Waiting for server to process file...");

    UploadResult result;
    RetryLoop loop(RetryPolicy::fixed(m_settings.pollMaxAttempts, m_settings.pollDelaySeconds, m_settings.stepMs), token);
    const RetryLoop::Outcome outcome = loop.run([&](RetryState& st) {
        const HttpResponse resp = m_transport.get(req, token);
        if (resp.cancelled) return RetryLoop::Attempt::Retry;

        const QString body = resp.text();
        if (isPleaseWait(body)) {
            st.lastError = "Server still processing";
            if (status) {
                status(UploadStage::Processing, QString("Server is scanning the file, please wait (check %1/%2)")
                    .arg(st.attempt).arg(st.maxAttempts));
            }
            return RetryLoop::Attempt::Retry;
        }
        if (!resp.isSuccess()) {
            st.lastError = resp.describe();
            qWarning() << "[Upload] Completion check" << st.attempt << "failed:" << st.lastError;
            return RetryLoop::Attempt::Retry;
        }

        QJsonParseError perr;
        const QJsonDocument doc = QJsonDocument::fromJson(resp.body, &perr);
        if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
            // Plain success page: the session id doubles as the public file id
            result.ok = true;
            result.downloadUrl = QString(kHostPage) + session.sessionId;
            result.fileName = fi.fileName();
            result.fileSize = fi.size();
            result.remoteId = session.sessionId;
            return RetryLoop::Attempt::Succeeded;
        }

        const QJsonArray links = doc.object().value("links").toArray();
        if (links.isEmpty()) {
            st.lastError = "No links in completion response";
            return RetryLoop::Attempt::Retry;
        }
        const QJsonObject first = links.at(0).toObject();
        const QString download = first.value("download").toString();
        if (download.isEmpty()) {
            st.lastError = "Empty download link in completion response";
            return RetryLoop::Attempt::Retry;
        }
        result.ok = true;
        result.downloadUrl = download;
        result.fileName = first.value("filename").toString(fi.fileName());
        // size arrives as a number or a numeric string depending on the server
        const QJsonValue size = first.value("size");
        result.fileSize = size.isString() ? size.toString().toLongLong() : static_cast<qint64>(size.toDouble());
        if (result.fileSize <= 0) result.fileSize = fi.size();
        const int q = download.indexOf('?');
        result.remoteId = q >= 0 ? download.mid(q + 1) : session.sessionId;
        return RetryLoop::Attempt::Succeeded;
    });

    switch (outcome) {
        case RetryLoop::Outcome::Succeeded:
            return result;
        case RetryLoop::Outcome::Cancelled:
            return UploadResult::failure(UploadError::Cancelled, "Upload cancelled");
        case RetryLoop::Outcome::Exhausted:
        case RetryLoop::Outcome::Failed:
            break;
    }
    QString message = QString("Server did not finish processing after %1 checks").arg(loop.state().attempt);
    if (!loop.state().lastError.isEmpty()) message += QString(" (%1)").arg(loop.state().lastError);
    return UploadResult::failure(UploadError::ProcessingTimedOut, message);
}

QString FileHostUploader::extractSessionId(const QByteArray& location)
{
    const QString loc = QString::fromUtf8(location);
    const int at = loc.indexOf("xid=");
    if (at < 0) return QString();
    const int start = at + 4;
    const int end = loc.indexOf('&', start);
    return (end < 0 ? loc.mid(start) : loc.mid(start, end - start)).trimmed();
}

QString FileHostUploader::extractInlineLink(const QString& body)
{
    static const QRegularExpression re(R"(https://1fichier\.com/\?(\w+))");
    const QRegularExpressionMatch m = re.match(body);
    return m.hasMatch() ? m.captured(0) : QString();
}

bool FileHostUploader::isPleaseWait(const QString& body)
{
    return body.contains("Please wait", Qt::CaseInsensitive)
        || body.contains("Veuillez patienter", Qt::CaseInsensitive);
}

QString FileHostUploader::formatThroughput(double currentMBps, double averageMBps, qint64 etaSeconds)
{
    const qint64 h = etaSeconds / 3600;
    const qint64 m = (etaSeconds % 3600) / 60;
    const qint64 s = etaSeconds % 60;
    return QString("Uploading: %1 MB/s (Avg: %2 MB/s) - ETA %3:%4:%5")
        .arg(currentMBps, 0, 'f', 1)
        .arg(averageMBps, 0, 'f', 1)
        .arg(h, 2, 10, QChar('0'))
        .arg(m, 2, 10, QChar('0'))
        .arg(s, 2, 10, QChar('0'));
}
