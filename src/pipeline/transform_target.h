#pragma once
#include <QString>
#include <QMutex>

// The single external "current target" the Transform collaborator works on.
// Only one item may hold it at a time; the orchestrator hands it to the Transform
// phase explicitly instead of relying on global state.
class TransformTarget {
public:
    TransformTarget() = default;
    TransformTarget(const TransformTarget&) = delete;
    TransformTarget& operator=(const TransformTarget&) = delete;

    // Fails when another item already holds the target.
    bool acquire(const QString& itemId, const QString& path, QString* errorOut = nullptr);
    void release();

    bool isHeld() const;
    QString itemId() const;
    QString path() const;
    // Number of successful acquisitions since construction.
    int acquisitions() const;

    // Holds the target for one scope.
    class Lease {
    public:
        Lease(TransformTarget& target, const QString& itemId, const QString& path);
        ~Lease();
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        bool isValid() const { return m_held; }
        QString errorString() const { return m_error; }

    private:
        TransformTarget& m_target;
        bool m_held = false;
        QString m_error;
    };

private:
    mutable QMutex m_mutex;
    QString m_itemId;
    QString m_path;
    bool m_held = false;
    int m_acquisitions = 0;
};
