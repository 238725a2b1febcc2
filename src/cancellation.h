#pragma once
#include <QString>
#include <QMutex>
#include <atomic>
#include <functional>
#include <memory>

// Shared flags behind a CancellationController and every token it hands out.
struct CancellationState {
    std::atomic_bool cancelAll{false};        // pending: trips tokens
    std::atomic_bool cancelAllRaised{false};  // recorded for the rest of the run
    std::atomic_bool skipCurrent{false};
    std::atomic<quint64> itemGeneration{0};
};

// Read-only view threaded through every suspension point (network I/O, retry waits, polling).
// A default-constructed token is never cancelled.
class CancellationToken {
public:
    enum class Scope { Batch, Item };

    CancellationToken() = default;

    bool isCancelled() const;
    bool isCancelAllRequested() const;
    bool isSkipRequested() const;
    Scope scope() const { return m_scope; }

private:
    friend class CancellationController;
    CancellationToken(std::shared_ptr<const CancellationState> state, Scope scope, quint64 generation);

    std::shared_ptr<const CancellationState> m_state;
    Scope m_scope = Scope::Batch;
    quint64 m_generation = 0;
};

// Two independent signals scoped to one batch run:
//  - cancelAll is recorded until the next beginBatch(). While pending it trips every token;
//    the orchestrator settles it once the affected items have been marked Cancelled.
//  - skipCurrent is reset by beginItem() and only affects tokens of the current item
class CancellationController {
public:
    CancellationController();

    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    void beginBatch();
    void endBatch();

    // Marks itemId as the one eligible for skip and clears any previous skip request.
    void beginItem(const QString& itemId);
    void endItem();

    // Skips whatever item is current. Returns false when no item is in flight.
    bool requestSkip();
    // Skips only if itemId is still the current item.
    bool requestSkip(const QString& itemId);
    void requestCancelAll();

    // Marks the pending cancel-all as applied. Tokens stop tripping; wasCancelAllRequested() stays true.
    void settleCancelAll();

    bool isCancelAllRequested() const { return m_state->cancelAll.load(); }
    bool wasCancelAllRequested() const { return m_state->cancelAllRaised.load(); }
    bool isSkipRequested() const { return m_state->skipCurrent.load(); }
    QString currentItem() const;

    // Trips on cancel-all or on a skip of the item current at the time of the call.
    CancellationToken itemToken() const;
    // Trips on cancel-all only.
    CancellationToken batchToken() const;

private:
    std::shared_ptr<CancellationState> m_state;
    mutable QMutex m_mutex;
    QString m_currentItem;
};

namespace Interruptible {

constexpr int kDefaultTickMs = 100;

// Sleeps for ms, waking every tickMs to check the token. Returns false when interrupted.
bool sleep(int ms, const CancellationToken& token, int tickMs = kDefaultTickMs);

// Counts down `steps` steps of stepMs each, calling onTick(remaining) before every step.
// Returns false when interrupted.
bool countdown(int steps, int stepMs, const CancellationToken& token,
               const std::function<void(int remaining)>& onTick);

} // namespace Interruptible
