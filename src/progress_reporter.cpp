#include "progress_reporter.h"
#include <QMutexLocker>
#include <QDebug>
#include <algorithm>
#include <cmath>

ProgressReporter::ProgressReporter(QObject* parent) : QObject(parent) {
}

void ProgressReporter::setMinIntervalMs(int ms) {
    QMutexLocker locker(&m_mutex);
    m_minIntervalMs = std::max(0, ms);
}

int ProgressReporter::minIntervalMs() const {
    QMutexLocker locker(&m_mutex);
    return m_minIntervalMs;
}

void ProgressReporter::begin(const QString& context) {
    QMutexLocker locker(&m_mutex);
    m_channels.insert(context, Channel());
}

bool ProgressReporter::report(int percent, const QString& context) {
    const int value = std::clamp(percent, 0, 100);
    {
        QMutexLocker locker(&m_mutex);
        Channel& ch = m_channels[context];

        // Monotonic within a sequence: stale or reordered values are dropped
        if (value < ch.lastPercent) {
            return false;
        }
        const bool changed = value != ch.lastPercent;
        const bool due = !ch.sinceForward.isValid() || ch.sinceForward.elapsed() >= m_minIntervalMs;
        if (!changed && !due) {
            return false;
        }
        ch.lastPercent = value;
        ch.sinceForward.restart();
        ++m_forwarded;
    }

    QMutexLocker emitLock(&m_emitMutex);
    emit progressChanged(context, value);
    return true;
}

bool ProgressReporter::reportFraction(double fraction, const QString& context) {
    if (std::isnan(fraction)) {
        return false;
    }
    return report(static_cast<int>(std::floor(std::clamp(fraction, 0.0, 1.0) * 100.0)), context);
}

void ProgressReporter::finish(const QString& context) {
    QMutexLocker locker(&m_mutex);
    m_channels.remove(context);
}

int ProgressReporter::lastPercent(const QString& context) const {
    QMutexLocker locker(&m_mutex);
    auto it = m_channels.constFind(context);
    return it == m_channels.constEnd() ? -1 : it->lastPercent;
}

int ProgressReporter::forwardedCount() const {
    QMutexLocker locker(&m_mutex);
    return m_forwarded;
}
