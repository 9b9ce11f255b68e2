#pragma once

#include "common/evaluator_config.hpp"
#include "common/models.hpp"
#include "evaluator/escalation_policy.hpp"
#include "evaluator/scoring_engine.hpp"
#include "evaluator/track_store.hpp"

namespace skyshield {

/**
 * ThreatEvaluator runs one evaluation cycle at a time:
 * - opens a scoped session on the track store
 * - scores every LIVE track and writes scores that left the dead-band
 * - engages tracks whose fresh score crossed the escalation threshold
 * - commits and releases the session
 *
 * Fetch, data and persist failures are logged and folded into the returned
 * CycleReport. StoreConnectionError is the only exception that escapes.
 */
class ThreatEvaluator
{
public:
    ThreatEvaluator(TrackStore &store, const EvaluatorConfig &config);

    CycleReport runCycle();

    const ScoringEngine &scoringEngine() const
    {
        return m_scoring;
    }

    const EscalationPolicy &escalationPolicy() const
    {
        return m_policy;
    }

private:
    void evaluateRecord(TrackStoreSession &session, const TrackRecord &record,
                        CycleReport &report);

    TrackStore &m_store;
    ScoringEngine m_scoring;
    EscalationPolicy m_policy;
    int m_deadBandThreshold;
};

} // namespace skyshield
