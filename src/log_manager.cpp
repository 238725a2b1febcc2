#include "log_manager.h"
#include <QDebug>
#include <QMutexLocker>
#include <QCoreApplication>
#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_sinceFlush.start();

    // Default persistent log next to the executable; the CLI may redirect it with --log
    if (QCoreApplication::instance()) {
        openLogFile(QCoreApplication::applicationDirPath() + "/batchshare.log");
    }
}

LogManager::~LogManager() {
    flush();
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

bool LogManager::openLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    if (m_file.isOpen()) {
        m_file.close();
    }
    m_pendingFlush = false;
    if (path.isEmpty()) {
        return false;
    }

    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    return true;
}

QString LogManager::logFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_file.isOpen() ? m_file.fileName() : QString();
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        // Write-through to disk log with buffered flushing
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            m_pendingFlush = true;
            if (shouldFlushImmediately(level) || m_sinceFlush.elapsed() >= FLUSH_INTERVAL_MS) {
                flushLocked();
            }
        }
    } // unlock before emitting signals to avoid listener deadlocks

    emit logsChanged();
    emit logAdded(logEntry);
}

void LogManager::flush() {
    QMutexLocker locker(&m_mutex);
    flushLocked();
}

void LogManager::flushLocked() {
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
    m_sinceFlush.restart();
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::clear() {
    {
        QMutexLocker locker(&m_mutex);
        m_logs.clear();
    }
    emit logsChanged();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    LogManager::instance().addLog(msg, level);

    // Also output to stderr so headless runs show the log live
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    fprintf(stderr, "[%s] [%s] %s\n",
            timestamp.toLocal8Bit().constData(),
            level.toLocal8Bit().constData(),
            msg.toLocal8Bit().constData());
    fflush(stderr);

    if (type == QtFatalMsg) {
        LogManager::instance().flush();
        abort();
    }
}
