#pragma once

#include "common/evaluator_config.hpp"
#include "common/models.hpp"

namespace skyshield {

// ScoringEngine combines the three risk factors into one integer threat score.
// It only holds configuration, so identical tracks always score identically.
class ScoringEngine
{
public:
    explicit ScoringEngine(const EvaluatorConfig &config);

    ThreatAssessment assess(const Track &track) const;

    // Weighted sum, clamped to [0, 100] and truncated toward zero.
    int combine(double speedRisk, double proximityRisk, double identificationRisk) const;

    const Position &protectedPoint() const
    {
        return m_protectedPoint;
    }

private:
    Position m_protectedPoint;
    ScoringWeights m_weights;
    double m_speedCeiling;
    double m_innerRadius;
    double m_outerRadius;
};

} // namespace skyshield
