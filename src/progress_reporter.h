#ifndef PROGRESS_REPORTER_H
#define PROGRESS_REPORTER_H

#include <QObject>
#include <QString>
#include <QHash>
#include <QMutex>
#include <QElapsedTimer>

// Rate-limited progress channel shared by the Archive tasks and the Upload phase.
// A value is forwarded when its integer percentage changes or when MIN_INTERVAL_MS
// has elapsed since the last forward for that context; everything else is coalesced.
class ProgressReporter : public QObject {
    Q_OBJECT

public:
    explicit ProgressReporter(QObject* parent = nullptr);

    void setMinIntervalMs(int ms);
    int minIntervalMs() const;

    // Starts a fresh sequence for context (a new upload attempt, a new archive task).
    void begin(const QString& context);
    // Returns true when the value was forwarded to listeners.
    bool report(int percent, const QString& context);
    bool reportFraction(double fraction, const QString& context);
    void finish(const QString& context);

    int lastPercent(const QString& context) const;
    int forwardedCount() const;

    static constexpr int MIN_INTERVAL_MS = 150;

signals:
    void progressChanged(const QString& context, int percent);

private:
    struct Channel {
        int lastPercent = -1;
        QElapsedTimer sinceForward;
    };

    mutable QMutex m_mutex;
    QMutex m_emitMutex;   // listeners see one emission at a time
    QHash<QString, Channel> m_channels;
    int m_minIntervalMs = MIN_INTERVAL_MS;
    int m_forwarded = 0;
};

#endif // PROGRESS_REPORTER_H
