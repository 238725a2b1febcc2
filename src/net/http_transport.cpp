#include "net/http_transport.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QHttpMultiPart>
#include <QEventLoop>
#include <QTimer>
#include <QFile>
#include <QDebug>

QString HttpResponse::describe() const
{
    if (cancelled) return "Cancelled";
    if (timedOut) return "Timed out";
    if (networkError) return errorString.isEmpty() ? QString("Network error") : errorString;
    return QString("HTTP %1").arg(status);
}

namespace {

QNetworkRequest buildRequest(const HttpRequest& r)
{
    QNetworkRequest req(r.url);
    // Redirects carry the upload session id; the caller reads Location itself
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    for (const auto& h : r.headers) {
        req.setRawHeader(h.first, h.second);
    }
    return req;
}

} // namespace

HttpResponse QtHttpTransport::get(const HttpRequest& request, const CancellationToken& token)
{
    const QNetworkRequest req = buildRequest(request);
    return execute([&req](QNetworkAccessManager& nam) { return nam.get(req); },
                   request.timeoutMs, {}, token);
}

HttpResponse QtHttpTransport::postJson(const HttpRequest& request, const QByteArray& json,
                                       const CancellationToken& token)
{
    QNetworkRequest req = buildRequest(request);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    return execute([&req, &json](QNetworkAccessManager& nam) { return nam.post(req, json); },
                   request.timeoutMs, {}, token);
}

HttpResponse QtHttpTransport::postMultipart(const HttpRequest& request, const QList<MultipartPart>& parts,
                                            const QByteArray& boundary, const TransferProgressFn& progress,
                                            const CancellationToken& token)
{
    auto* multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);
    if (!boundary.isEmpty()) multiPart->setBoundary(boundary);

    for (const MultipartPart& p : parts) {
        QHttpPart part;
        if (p.isFile()) {
            auto* file = new QFile(p.filePath, multiPart);
            if (!file->open(QIODevice::ReadOnly)) {
                HttpResponse failed;
                failed.networkError = true;
                failed.errorString = QString("Cannot open %1: %2").arg(p.filePath, file->errorString());
                delete multiPart;
                return failed;
            }
            const QString disposition = QString("form-data; name=\"%1\"; filename=\"%2\"")
                .arg(QString::fromUtf8(p.name), p.fileName);
            part.setHeader(QNetworkRequest::ContentDispositionHeader, disposition);
            part.setHeader(QNetworkRequest::ContentTypeHeader, QString::fromLatin1(p.contentType));
            part.setBodyDevice(file);
        } else {
            part.setHeader(QNetworkRequest::ContentDispositionHeader,
                           QString("form-data; name=\"%1\"").arg(QString::fromUtf8(p.name)));
            part.setBody(p.value);
        }
        multiPart->append(part);
    }

    const QNetworkRequest req = buildRequest(request);
    return execute([&req, multiPart](QNetworkAccessManager& nam) {
        QNetworkReply* reply = nam.post(req, multiPart);
        multiPart->setParent(reply);
        return reply;
    }, request.timeoutMs, progress, token);
}

HttpResponse QtHttpTransport::execute(const SendFn& send, int timeoutMs, const TransferProgressFn& progress,
                                      const CancellationToken& token)
{
    HttpResponse response;
    if (token.isCancelled()) {
        response.cancelled = true;
        return response;
    }

    QNetworkAccessManager nam;
    QNetworkReply* reply = send(nam);
    QEventLoop loop;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (progress) {
        QObject::connect(reply, &QNetworkReply::uploadProgress, &loop, [&progress](qint64 sent, qint64 total) {
            progress(sent, total);
        });
    }

    QTimer cancelPoll;
    cancelPoll.setInterval(CANCEL_POLL_MS);
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&]() {
        if (token.isCancelled() && !reply->isFinished()) {
            response.cancelled = true;
            reply->abort();
        }
    });
    cancelPoll.start();

    QTimer timeout;
    timeout.setSingleShot(true);
    if (timeoutMs > 0) {
        QObject::connect(&timeout, &QTimer::timeout, &loop, [&]() {
            if (!reply->isFinished()) {
                response.timedOut = true;
                reply->abort();
            }
        });
        timeout.start(timeoutMs);
    }

    if (!reply->isFinished()) loop.exec();
    cancelPoll.stop();
    timeout.stop();

    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    for (const auto& pair : reply->rawHeaderPairs()) {
        response.headers.insert(pair.first.toLower(), pair.second);
    }
    response.body = reply->readAll();

    // HTTP error statuses still carry a status code; only transport failures lack one
    if (reply->error() != QNetworkReply::NoError && response.status == 0) {
        response.networkError = true;
        response.errorString = reply->errorString();
    }
    if (response.timedOut) {
        response.networkError = true;
        response.errorString = "Request timed out";
    }

    // reply is owned by nam and goes with it
    return response;
}
