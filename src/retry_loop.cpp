#include "retry_loop.h"

#include <algorithm>

int RetryPolicy::delayStepsAfter(int attempt) const
{
    const int steps = baseDelaySteps + stepDelaySteps * attempt;
    return std::clamp(steps, 0, std::max(0, maxDelaySteps));
}

RetryPolicy RetryPolicy::fixed(int attempts, int delaySteps, int stepMs)
{
    RetryPolicy p;
    p.maxAttempts = attempts;
    p.baseDelaySteps = delaySteps;
    p.stepDelaySteps = 0;
    p.maxDelaySteps = delaySteps;
    p.stepMs = stepMs;
    return p;
}

RetryPolicy RetryPolicy::linear(int attempts, int baseSteps, int stepSteps, int maxSteps, int stepMs)
{
    RetryPolicy p;
    p.maxAttempts = attempts;
    p.baseDelaySteps = baseSteps;
    p.stepDelaySteps = stepSteps;
    p.maxDelaySteps = maxSteps;
    p.stepMs = stepMs;
    return p;
}

RetryLoop::RetryLoop(const RetryPolicy& policy, const CancellationToken& token)
    : m_policy(policy), m_token(token)
{
    m_state.maxAttempts = std::max(1, m_policy.maxAttempts);
}

RetryLoop::Outcome RetryLoop::run(const AttemptFn& attempt, const WaitFn& onWait)
{
    while (m_state.attempt < m_state.maxAttempts) {
        if (m_token.isCancelled()) return Outcome::Cancelled;

        m_state.attempt += 1;
        m_state.nextDelaySteps = m_policy.delayStepsAfter(m_state.attempt);

        const Attempt result = attempt(m_state);
        if (result == Attempt::Succeeded) return Outcome::Succeeded;
        if (m_token.isCancelled()) return Outcome::Cancelled;
        if (result == Attempt::Fail) return Outcome::Failed;
        if (m_state.attempt >= m_state.maxAttempts) break;

        const bool waited = Interruptible::countdown(m_state.nextDelaySteps, m_policy.stepMs, m_token,
            [this, &onWait](int remaining) {
                if (onWait) onWait(m_state, remaining);
            });
        if (!waited) return Outcome::Cancelled;
    }
    return Outcome::Exhausted;
}

QString RetryLoop::outcomeName(Outcome outcome)
{
    switch (outcome) {
        case Outcome::Succeeded: return "Succeeded";
        case Outcome::Exhausted: return "Exhausted";
        case Outcome::Failed: return "Failed";
        case Outcome::Cancelled: return "Cancelled";
    }
    return "";
}
