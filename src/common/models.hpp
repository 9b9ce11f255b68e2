#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "common/enums.hpp"

namespace skyshield {

struct Position {
    double x = 0.0;
    double y = 0.0;
};

// A validated track, ready for scoring.
struct Track {
    int64_t id = 0;
    std::string externalRef;
    Position position;
    double speed = 0.0;
    Identification identification = Identification::Unknown;
    int threatScore = 0;
    LifecycleState lifecycleState = LifecycleState::Live;
};

// A row as the store returns it. Columns the producer may leave NULL or
// fill with garbage are kept loose here and checked by validateTrackRecord().
struct TrackRecord {
    int64_t id = 0;
    std::string externalRef;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> speed;
    std::string identification;
    int threatScore = 0;
    std::string lifecycleState;
};

struct ThreatAssessment {
    double distance = 0.0;
    double speedRisk = 0.0;
    double proximityRisk = 0.0;
    double identificationRisk = 0.0;
    int score = 0;
};

struct CycleReport {
    std::string cycleId;
    int tracksFetched = 0;
    int tracksEvaluated = 0;
    int scoresWritten = 0;
    int escalations = 0;
    int dataErrors = 0;
    int persistFailures = 0;
    bool fetchFailed = false;
    bool committed = false;
    std::chrono::milliseconds duration{0};
};

} // namespace skyshield
