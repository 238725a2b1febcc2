#pragma once
#include <QByteArray>
#include <QHash>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>
#include <functional>

#include "cancellation.h"

class QNetworkAccessManager;
class QNetworkReply;

struct HttpRequest {
    QUrl url;
    QList<QPair<QByteArray, QByteArray>> headers;
    int timeoutMs = 30000;   // 0 = unbounded (streaming)

    HttpRequest& withHeader(const QByteArray& name, const QByteArray& value) {
        headers.append(qMakePair(name, value));
        return *this;
    }
};

// One part of a multipart/form-data body. File parts are streamed from disk.
struct MultipartPart {
    QByteArray name;
    QByteArray value;
    QString filePath;
    QString fileName;
    QByteArray contentType;

    bool isFile() const { return !filePath.isEmpty(); }

    static MultipartPart field(const QByteArray& name, const QByteArray& value) {
        MultipartPart p;
        p.name = name;
        p.value = value;
        return p;
    }
    static MultipartPart file(const QByteArray& name, const QString& path, const QString& fileName,
                              const QByteArray& contentType = "application/octet-stream") {
        MultipartPart p;
        p.name = name;
        p.filePath = path;
        p.fileName = fileName;
        p.contentType = contentType;
        return p;
    }
};

struct HttpResponse {
    int status = 0;
    QHash<QByteArray, QByteArray> headers;   // lower-cased names
    QByteArray body;
    bool networkError = false;
    bool cancelled = false;
    bool timedOut = false;
    QString errorString;

    bool isSuccess() const { return !networkError && !cancelled && status >= 200 && status < 300; }
    bool isRedirect() const {
        return !cancelled && (status == 301 || status == 302 || status == 303 || status == 307 || status == 308);
    }
    QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
    QString text() const { return QString::fromUtf8(body); }
    QString describe() const;
};

using TransferProgressFn = std::function<void(qint64 sent, qint64 total)>;

// Blocking request/response seam. Implementations must abort the in-flight request
// within ~100 ms of the token tripping and return a response marked cancelled.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const HttpRequest& request, const CancellationToken& token) = 0;
    virtual HttpResponse postJson(const HttpRequest& request, const QByteArray& json,
                                  const CancellationToken& token) = 0;
    virtual HttpResponse postMultipart(const HttpRequest& request, const QList<MultipartPart>& parts,
                                       const QByteArray& boundary, const TransferProgressFn& progress,
                                       const CancellationToken& token) = 0;
};

// QNetworkAccessManager-backed transport. Each call builds its own manager and runs a
// local event loop, so it can be used from any thread that has an event dispatcher.
class QtHttpTransport : public HttpTransport {
public:
    QtHttpTransport() = default;

    HttpResponse get(const HttpRequest& request, const CancellationToken& token) override;
    HttpResponse postJson(const HttpRequest& request, const QByteArray& json,
                          const CancellationToken& token) override;
    HttpResponse postMultipart(const HttpRequest& request, const QList<MultipartPart>& parts,
                               const QByteArray& boundary, const TransferProgressFn& progress,
                               const CancellationToken& token) override;

    static constexpr int CANCEL_POLL_MS = 100;

private:
    using SendFn = std::function<QNetworkReply*(QNetworkAccessManager& nam)>;
    HttpResponse execute(const SendFn& send, int timeoutMs, const TransferProgressFn& progress,
                         const CancellationToken& token);
};
