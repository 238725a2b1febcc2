#include "pipeline/transform_target.h"
#include <QMutexLocker>
#include <QDebug>

bool TransformTarget::acquire(const QString& itemId, const QString& path, QString* errorOut)
{
    QMutexLocker lk(&m_mutex);
    if (m_held) {
        if (errorOut) *errorOut = QString("Transform target busy with %1").arg(m_itemId);
        qWarning() << "[Transform] Target already held by" << m_itemId << "- refused" << itemId;
        return false;
    }
    m_held = true;
    m_itemId = itemId;
    m_path = path;
    ++m_acquisitions;
    return true;
}

void TransformTarget::release()
{
    QMutexLocker lk(&m_mutex);
    m_held = false;
    m_itemId.clear();
    m_path.clear();
}

bool TransformTarget::isHeld() const
{
    QMutexLocker lk(&m_mutex);
    return m_held;
}

QString TransformTarget::itemId() const
{
    QMutexLocker lk(&m_mutex);
    return m_itemId;
}

QString TransformTarget::path() const
{
    QMutexLocker lk(&m_mutex);
    return m_path;
}

int TransformTarget::acquisitions() const
{
    QMutexLocker lk(&m_mutex);
    return m_acquisitions;
}

TransformTarget::Lease::Lease(TransformTarget& target, const QString& itemId, const QString& path)
    : m_target(target)
{
    m_held = m_target.acquire(itemId, path, &m_error);
}

TransformTarget::Lease::~Lease()
{
    if (m_held) m_target.release();
}
