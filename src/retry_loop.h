#pragma once
#include <QString>
#include <functional>

#include "cancellation.h"

// Attempt cap plus a delay schedule expressed in countdown steps, so callers can
// render "retry in Ns" while the wait stays interruptible.
struct RetryPolicy {
    int maxAttempts = 3;
    int baseDelaySteps = 0;    // delay after attempt n = min(base + step * n, max)
    int stepDelaySteps = 2;
    int maxDelaySteps = 60;
    int stepMs = 1000;         // wall-clock length of one step

    int delayStepsAfter(int attempt) const;

    static RetryPolicy fixed(int attempts, int delaySteps, int stepMs = 1000);
    static RetryPolicy linear(int attempts, int baseSteps, int stepSteps, int maxSteps, int stepMs = 1000);
};

// Scoped to one phase-item-operation; a new RetryLoop starts from a clean state.
struct RetryState {
    int attempt = 0;
    int maxAttempts = 0;
    QString lastError;
    int nextDelaySteps = 0;   // an attempt may override the scheduled delay
};

class RetryLoop {
public:
    enum class Attempt { Succeeded, Retry, Fail };
    enum class Outcome { Succeeded, Exhausted, Failed, Cancelled };

    using AttemptFn = std::function<Attempt(RetryState& state)>;
    using WaitFn = std::function<void(const RetryState& state, int remainingSteps)>;

    RetryLoop(const RetryPolicy& policy, const CancellationToken& token);

    // Runs attempt() until it succeeds, fails permanently, the cap is reached or the
    // token trips. onWait is called once per countdown step between attempts.
    Outcome run(const AttemptFn& attempt, const WaitFn& onWait = {});

    const RetryState& state() const { return m_state; }

    static QString outcomeName(Outcome outcome);

private:
    RetryPolicy m_policy;
    CancellationToken m_token;
    RetryState m_state;
};
