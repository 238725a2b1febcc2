#include "net/link_converter.h"
#include "retry_loop.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>
#include <QDebug>
#include <algorithm>

LinkConverter::LinkConverter(HttpTransport& transport, const ServiceSettings& settings)
    : m_transport(transport), m_settings(settings)
{
}

QString LinkConverter::convert(const QString& reference, const StatusFn& status, const CancellationToken& token)
{
    m_lastAttempts = 0;
    if (reference.trimmed().isEmpty()) return reference;

    const QString link = forceHttps(reference.trimmed());
    QJsonObject payload;
    payload.insert("link", link);
    const QByteArray json = QJsonDocument(payload).toJson(QJsonDocument::Compact);

    HttpRequest req;
    req.url = QUrl(m_settings.conversionEndpoint);
    req.withHeader("User-Agent", m_settings.userAgent.toUtf8());

    const RetryPolicy policy = RetryPolicy::linear(m_settings.conversionMaxAttempts,
                                                   m_settings.conversionBaseDelaySeconds,
                                                   m_settings.conversionStepDelaySeconds,
                                                   m_settings.conversionMaxDelaySeconds,
                                                   m_settings.stepMs);
    bool scanning = false;
    QString converted;

    RetryLoop loop(policy, token);
    const RetryLoop::Outcome outcome = loop.run([&](RetryState& st) {
        const HttpResponse resp = m_transport.postJson(req, json, token);
        if (resp.cancelled) return RetryLoop::Attempt::Retry;

        const QString body = resp.text();
        if (resp.isSuccess()) {
            const QString value = QJsonDocument::fromJson(resp.body).object().value("link").toString().trimmed();
            if (!value.isEmpty()) {
                converted = value;
                return RetryLoop::Attempt::Succeeded;
            }
            scanning = false;
            st.lastError = "Response without link";
            st.nextDelaySteps = m_settings.conversionBaseDelaySeconds;
            return RetryLoop::Attempt::Retry;
        }

        if (!resp.networkError && isNotReady(body)) {
            scanning = true;
            st.lastError = "Not ready";
            return RetryLoop::Attempt::Retry;
        }

        scanning = false;
        st.lastError = resp.describe();
        st.nextDelaySteps = m_settings.conversionErrorDelaySeconds;
        qWarning() << "[Convert] Attempt" << st.attempt << "failed:" << st.lastError;
        return RetryLoop::Attempt::Retry;
    }, [&](const RetryState& st, int remaining) {
        if (!status) return;
        if (scanning) {
            status(QString("1fichier scanning... retry in %1s (attempt %2/%3)")
                   .arg(remaining).arg(st.attempt).arg(st.maxAttempts));
        } else {
            status(QString("Error, retry in %1s (attempt %2/%3)")
                   .arg(remaining).arg(st.attempt).arg(st.maxAttempts));
        }
    });

    m_lastAttempts = loop.state().attempt;
    if (outcome == RetryLoop::Outcome::Succeeded) {
        qInfo() << "[Convert]" << link << "->" << converted;
        return converted;
    }

    qWarning() << "[Convert] Giving up on" << reference << "after" << m_lastAttempts << "attempts:"
               << RetryLoop::outcomeName(outcome);
    return reference;
}

bool LinkConverter::isNotReady(const QString& body) const
{
    for (const QString& marker : m_settings.notReadyMarkers) {
        if (!marker.isEmpty() && body.contains(marker, Qt::CaseInsensitive)) return true;
    }
    return false;
}

bool LinkConverter::isConvertible(const QString& url)
{
    const QString host = QUrl(url.trimmed()).host().toLower();
    return host == "1fichier.com" || host.endsWith(".1fichier.com");
}

bool LinkConverter::isConverted(const QString& url)
{
    const QUrl u(url.trimmed());
    return u.isValid() && (u.scheme() == "https" || u.scheme() == "http") && !u.host().isEmpty()
        && !isConvertible(url);
}

QString LinkConverter::forceHttps(const QString& url)
{
    if (url.startsWith("http://", Qt::CaseInsensitive)) return "https://" + url.mid(7);
    return url;
}

int LinkConverter::recommendedInitialWaitSeconds(qint64 fileSize)
{
    constexpr qint64 MB = 1024LL * 1024;
    constexpr qint64 GB = 1024LL * MB;
    if (fileSize > 5 * GB) {
        const double gb = static_cast<double>(fileSize) / static_cast<double>(GB);
        return std::clamp(static_cast<int>(gb * 12.0), 30, 1800);
    }
    if (fileSize > 100 * MB) return 10;
    return 3;
}
