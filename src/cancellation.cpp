#include "cancellation.h"

#include <QMutexLocker>
#include <QThread>
#include <QElapsedTimer>
#include <QDebug>
#include <algorithm>

CancellationToken::CancellationToken(std::shared_ptr<const CancellationState> state, Scope scope, quint64 generation)
    : m_state(std::move(state)), m_scope(scope), m_generation(generation)
{
}

bool CancellationToken::isCancelAllRequested() const
{
    return m_state && m_state->cancelAll.load();
}

bool CancellationToken::isSkipRequested() const
{
    // A skip only applies to the item this token was issued for
    return m_state && m_scope == Scope::Item
        && m_state->skipCurrent.load()
        && m_state->itemGeneration.load() == m_generation;
}

bool CancellationToken::isCancelled() const
{
    return isCancelAllRequested() || isSkipRequested();
}

CancellationController::CancellationController()
    : m_state(std::make_shared<CancellationState>())
{
}

void CancellationController::beginBatch()
{
    QMutexLocker lk(&m_mutex);
    m_state->cancelAll.store(false);
    m_state->cancelAllRaised.store(false);
    m_state->skipCurrent.store(false);
    m_state->itemGeneration.fetch_add(1);
    m_currentItem.clear();
}

void CancellationController::endBatch()
{
    QMutexLocker lk(&m_mutex);
    m_state->skipCurrent.store(false);
    m_currentItem.clear();
}

void CancellationController::beginItem(const QString& itemId)
{
    QMutexLocker lk(&m_mutex);
    m_state->itemGeneration.fetch_add(1);
    m_state->skipCurrent.store(false);
    m_currentItem = itemId;
}

void CancellationController::endItem()
{
    QMutexLocker lk(&m_mutex);
    m_currentItem.clear();
}

bool CancellationController::requestSkip()
{
    QMutexLocker lk(&m_mutex);
    if (m_currentItem.isEmpty()) return false;
    qInfo() << "[Batch] Skip requested for" << m_currentItem;
    m_state->skipCurrent.store(true);
    return true;
}

bool CancellationController::requestSkip(const QString& itemId)
{
    QMutexLocker lk(&m_mutex);
    if (m_currentItem.isEmpty() || m_currentItem != itemId) return false;
    qInfo() << "[Batch] Skip requested for" << itemId;
    m_state->skipCurrent.store(true);
    return true;
}

void CancellationController::requestCancelAll()
{
    m_state->cancelAllRaised.store(true);
    if (!m_state->cancelAll.exchange(true)) {
        qInfo() << "[Batch] Cancel all requested";
    }
}

void CancellationController::settleCancelAll()
{
    m_state->cancelAll.store(false);
}

QString CancellationController::currentItem() const
{
    QMutexLocker lk(&m_mutex);
    return m_currentItem;
}

CancellationToken CancellationController::itemToken() const
{
    QMutexLocker lk(&m_mutex);
    return CancellationToken(m_state, CancellationToken::Scope::Item, m_state->itemGeneration.load());
}

CancellationToken CancellationController::batchToken() const
{
    return CancellationToken(m_state, CancellationToken::Scope::Batch, 0);
}

namespace Interruptible {

bool sleep(int ms, const CancellationToken& token, int tickMs)
{
    if (token.isCancelled()) return false;
    if (ms <= 0) return true;
    tickMs = std::max(1, tickMs);

    QElapsedTimer timer;
    timer.start();
    qint64 remaining = ms;
    while (remaining > 0) {
        QThread::msleep(static_cast<unsigned long>(std::min<qint64>(remaining, tickMs)));
        if (token.isCancelled()) return false;
        remaining = ms - timer.elapsed();
    }
    return true;
}

bool countdown(int steps, int stepMs, const CancellationToken& token,
               const std::function<void(int remaining)>& onTick)
{
    for (int i = steps; i > 0; --i) {
        if (token.isCancelled()) return false;
        if (onTick) onTick(i);
        if (!sleep(stepMs, token)) return false;
    }
    return !token.isCancelled();
}

} // namespace Interruptible
