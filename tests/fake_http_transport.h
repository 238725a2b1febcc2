#pragma once
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QPair>
#include <algorithm>
#include <functional>

#include "../src/net/http_transport.h"

// Scripted transport: each rule matches a URL substring and replays its queued
// responses in order, repeating the last one once the queue runs dry.
class FakeHttpTransport : public HttpTransport {
public:
    struct Call {
        QString method;
        HttpRequest request;
        QByteArray body;
        QList<MultipartPart> parts;
        QByteArray boundary;
    };
    using Handler = std::function<HttpResponse(const Call& call, const TransferProgressFn& progress,
                                               const CancellationToken& token)>;

    void enqueue(const QString& urlContains, const HttpResponse& response) {
        QMutexLocker lk(&m_mutex);
        rule(urlContains).responses << response;
    }
    void setHandler(const QString& urlContains, const Handler& handler) {
        QMutexLocker lk(&m_mutex);
        rule(urlContains).handler = handler;
    }

    QList<Call> calls() const {
        QMutexLocker lk(&m_mutex);
        return m_calls;
    }
    int count(const QString& urlContains) const {
        QMutexLocker lk(&m_mutex);
        int n = 0;
        for (const Call& c : m_calls) {
            if (c.request.url.toString().contains(urlContains)) ++n;
        }
        return n;
    }

    HttpResponse get(const HttpRequest& request, const CancellationToken& token) override {
        Call c;
        c.method = "GET";
        c.request = request;
        return dispatch(c, {}, token);
    }
    HttpResponse postJson(const HttpRequest& request, const QByteArray& json,
                          const CancellationToken& token) override {
        Call c;
        c.method = "POST";
        c.request = request;
        c.body = json;
        return dispatch(c, {}, token);
    }
    HttpResponse postMultipart(const HttpRequest& request, const QList<MultipartPart>& parts,
                               const QByteArray& boundary, const TransferProgressFn& progress,
                               const CancellationToken& token) override {
        Call c;
        c.method = "MULTIPART";
        c.request = request;
        c.parts = parts;
        c.boundary = boundary;
        return dispatch(c, progress, token);
    }

    static HttpResponse json(int status, const QByteArray& body) {
        HttpResponse r;
        r.status = status;
        r.headers.insert("content-type", "application/json");
        r.body = body;
        return r;
    }
    static HttpResponse text(int status, const QByteArray& body) {
        HttpResponse r;
        r.status = status;
        r.headers.insert("content-type", "text/html");
        r.body = body;
        return r;
    }
    static HttpResponse redirect(const QByteArray& location) {
        HttpResponse r;
        r.status = 302;
        r.headers.insert("location", location);
        return r;
    }
    static HttpResponse networkFailure(const QString& message = "Connection refused") {
        HttpResponse r;
        r.networkError = true;
        r.errorString = message;
        return r;
    }
    static HttpResponse cancelledResponse() {
        HttpResponse r;
        r.cancelled = true;
        r.networkError = true;
        return r;
    }

private:
    struct Rule {
        QString match;
        QList<HttpResponse> responses;
        int served = 0;
        Handler handler;
    };

    Rule& rule(const QString& match) {
        for (Rule& r : m_rules) {
            if (r.match == match) return r;
        }
        Rule r;
        r.match = match;
        m_rules << r;
        return m_rules.last();
    }

    HttpResponse dispatch(const Call& call, const TransferProgressFn& progress, const CancellationToken& token) {
        Handler handler;
        HttpResponse response = networkFailure("No scripted response");
        {
            QMutexLocker lk(&m_mutex);
            m_calls << call;
            if (token.isCancelled()) return cancelledResponse();
            const QString url = call.request.url.toString();
            for (Rule& r : m_rules) {
                if (!url.contains(r.match)) continue;
                if (r.handler) {
                    handler = r.handler;
                } else if (!r.responses.isEmpty()) {
                    const int idx = std::min(r.served, static_cast<int>(r.responses.size()) - 1);
                    response = r.responses.at(idx);
                    ++r.served;
                }
                break;
            }
        }
        if (handler) return handler(call, progress, token);
        return response;
    }

    mutable QMutex m_mutex;
    QList<Rule> m_rules;
    QList<Call> m_calls;
};
