#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace skyshield {

inline std::string toIdentificationString(Identification identification)
{
    switch (identification) {
    case Identification::Friendly:
        return "FRIENDLY";
    case Identification::Unknown:
        return "UNKNOWN";
    case Identification::Hostile:
        return "HOSTILE";
    }
    return "UNKNOWN";
}

// Identification values outside the known set are not mapped to a default:
// callers treat std::nullopt as a data error.
inline std::optional<Identification> parseIdentificationString(const std::string &value)
{
    if (value == "FRIENDLY") {
        return Identification::Friendly;
    }
    if (value == "UNKNOWN") {
        return Identification::Unknown;
    }
    if (value == "HOSTILE") {
        return Identification::Hostile;
    }
    return std::nullopt;
}

inline std::string toLifecycleString(LifecycleState state)
{
    switch (state) {
    case LifecycleState::Live:
        return "LIVE";
    case LifecycleState::Engaged:
        return "ENGAGED";
    }
    return "LIVE";
}

inline std::optional<LifecycleState> parseLifecycleString(const std::string &value)
{
    if (value == "LIVE") {
        return LifecycleState::Live;
    }
    if (value == "ENGAGED") {
        return LifecycleState::Engaged;
    }
    return std::nullopt;
}

inline std::string toEvaluatorStateString(EvaluatorState state)
{
    switch (state) {
    case EvaluatorState::Running:
        return "running";
    case EvaluatorState::Stopped:
        return "stopped";
    }
    return "stopped";
}

inline nlohmann::json toJson(const Position &position)
{
    return nlohmann::json{{"x", position.x}, {"y", position.y}};
}

inline nlohmann::json toJson(const Track &track)
{
    return nlohmann::json{
        {"id", track.id},
        {"externalRef", track.externalRef},
        {"position", toJson(track.position)},
        {"speed", track.speed},
        {"identification", toIdentificationString(track.identification)},
        {"threatScore", track.threatScore},
        {"lifecycleState", toLifecycleString(track.lifecycleState)}
    };
}

inline nlohmann::json toJson(const ThreatAssessment &assessment)
{
    return nlohmann::json{
        {"distance", assessment.distance},
        {"speedRisk", assessment.speedRisk},
        {"proximityRisk", assessment.proximityRisk},
        {"identificationRisk", assessment.identificationRisk},
        {"score", assessment.score}
    };
}

inline nlohmann::json toJson(const CycleReport &report)
{
    return nlohmann::json{
        {"cycleId", report.cycleId},
        {"tracksFetched", report.tracksFetched},
        {"tracksEvaluated", report.tracksEvaluated},
        {"scoresWritten", report.scoresWritten},
        {"escalations", report.escalations},
        {"dataErrors", report.dataErrors},
        {"persistFailures", report.persistFailures},
        {"fetchFailed", report.fetchFailed},
        {"committed", report.committed},
        {"durationMs", report.duration.count()}
    };
}

} // namespace skyshield
