#pragma once
#include <QString>
#include <functional>

#include "net/http_transport.h"
#include "batch_settings.h"
#include "cancellation.h"

// Asks the conversion service for an alternate link to an uploaded file. The service
// needs the host to have finished scanning first, so "not ready" answers are retried
// with a growing countdown. Never fails: when it gives up it hands back the input.
class LinkConverter {
public:
    using StatusFn = std::function<void(const QString& message)>;

    LinkConverter(HttpTransport& transport, const ServiceSettings& settings);

    QString convert(const QString& reference, const StatusFn& status,
                    const CancellationToken& token = CancellationToken());

    // Attempts made by the last convert() call.
    int lastAttemptCount() const { return m_lastAttempts; }

    bool isNotReady(const QString& body) const;

    static bool isConvertible(const QString& url);
    static bool isConverted(const QString& url);
    static QString forceHttps(const QString& url);
    // Seconds to let the host scan a file of this size before the first conversion request.
    static int recommendedInitialWaitSeconds(qint64 fileSize);

private:
    HttpTransport& m_transport;
    ServiceSettings m_settings;
    int m_lastAttempts = 0;
};
