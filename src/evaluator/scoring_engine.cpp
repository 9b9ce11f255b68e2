#include "evaluator/scoring_engine.hpp"

#include <algorithm>

#include "evaluator/risk_factors.hpp"

namespace skyshield {

ScoringEngine::ScoringEngine(const EvaluatorConfig &config)
    : m_protectedPoint(config.protectedPoint)
    , m_weights(config.weights)
    , m_speedCeiling(config.speedCeiling)
    , m_innerRadius(config.innerRadius)
    , m_outerRadius(config.outerRadius)
{
}

ThreatAssessment ScoringEngine::assess(const Track &track) const
{
    ThreatAssessment assessment;
    assessment.distance = distanceBetween(track.position, m_protectedPoint);
    assessment.speedRisk = speedRisk(track.speed, m_speedCeiling);
    assessment.proximityRisk =
        proximityRisk(assessment.distance, m_innerRadius, m_outerRadius);
    assessment.identificationRisk = identificationRisk(track.identification);
    assessment.score = combine(assessment.speedRisk,
                               assessment.proximityRisk,
                               assessment.identificationRisk);
    return assessment;
}

int ScoringEngine::combine(double speedRisk, double proximityRisk,
                           double identificationRisk) const
{
    const double raw = speedRisk * m_weights.speed
        + proximityRisk * m_weights.proximity
        + identificationRisk * m_weights.identification;
    return static_cast<int>(std::clamp(raw, 0.0, kMaxRisk));
}

} // namespace skyshield
