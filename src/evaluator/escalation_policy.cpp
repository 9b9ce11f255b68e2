#include "evaluator/escalation_policy.hpp"

namespace skyshield {

EscalationPolicy::EscalationPolicy(int escalationThreshold)
    : m_threshold(escalationThreshold)
{
}

std::optional<LifecycleState> EscalationPolicy::decide(int score,
                                                       LifecycleState current) const
{
    if (current != LifecycleState::Live) {
        return std::nullopt;
    }
    if (score > m_threshold) {
        return LifecycleState::Engaged;
    }
    return std::nullopt;
}

} // namespace skyshield
