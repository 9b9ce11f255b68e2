#pragma once

#include <optional>

#include "common/enums.hpp"

namespace skyshield {

// One-way LIVE -> ENGAGED transition. There is deliberately no path back;
// releasing an engaged track is an operator action outside the evaluator.
class EscalationPolicy
{
public:
    explicit EscalationPolicy(int escalationThreshold);

    // Returns the state to persist, or std::nullopt when no transition applies.
    std::optional<LifecycleState> decide(int score, LifecycleState current) const;

    int threshold() const
    {
        return m_threshold;
    }

private:
    int m_threshold;
};

} // namespace skyshield
