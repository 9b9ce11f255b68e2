#include "evaluator/threat_evaluator.hpp"

#include <chrono>
#include <memory>

#include <QDebug>
#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "evaluator/dead_band_filter.hpp"
#include "evaluator/track_validation.hpp"

namespace skyshield {

namespace {

std::string newCycleId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

} // namespace

ThreatEvaluator::ThreatEvaluator(TrackStore &store, const EvaluatorConfig &config)
    : m_store(store)
    , m_scoring(config)
    , m_policy(config.escalationThreshold)
    , m_deadBandThreshold(config.deadBandThreshold)
{
}

CycleReport ThreatEvaluator::runCycle()
{
    CycleReport report;
    report.cycleId = newCycleId();
    logging::CorrelationScope correlation(QString::fromStdString(report.cycleId));
    const auto cycleStart = std::chrono::steady_clock::now();

    std::unique_ptr<TrackStoreSession> session;
    std::vector<TrackRecord> records;
    try {
        session = m_store.openSession();
        records = session->fetchLiveTracks();
    } catch (const FetchError &ex) {
        report.fetchFailed = true;
        SLOG_ERROR(QStringLiteral("ThreatEvaluator"),
                   QStringLiteral("runCycle"),
                   QStringLiteral("fetch_failed"),
                   QStringLiteral("store_read_error"),
                   QStringLiteral("skip_cycle"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()}});
    }

    if (!report.fetchFailed) {
        report.tracksFetched = static_cast<int>(records.size());
        for (const auto &record : records) {
            evaluateRecord(*session, record, report);
        }

        try {
            session->commit();
            report.committed = true;
        } catch (const PersistError &ex) {
            ++report.persistFailures;
            SLOG_ERROR(QStringLiteral("ThreatEvaluator"),
                       QStringLiteral("runCycle"),
                       QStringLiteral("commit_failed"),
                       QStringLiteral("store_write_error"),
                       QStringLiteral("recompute_next_cycle"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"error", ex.what()}});
        }
    }

    session.reset();

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - cycleStart);
    SLOG_DEBUG(QStringLiteral("ThreatEvaluator"),
               QStringLiteral("runCycle"),
               QStringLiteral("cycle_complete"),
               QStringLiteral("poll_tick"),
               QStringLiteral("score_and_escalate"),
               logging::defaultWho(),
               QString(),
               toJson(report));
    return report;
}

void ThreatEvaluator::evaluateRecord(TrackStoreSession &session,
                                     const TrackRecord &record,
                                     CycleReport &report)
{
    Track track;
    try {
        track = validateTrackRecord(record);
    } catch (const DataError &ex) {
        ++report.dataErrors;
        SLOG_WARN(QStringLiteral("ThreatEvaluator"),
                  QStringLiteral("evaluateRecord"),
                  QStringLiteral("track_skipped"),
                  QStringLiteral("malformed_record"),
                  QStringLiteral("skip_track"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"trackId", ex.trackId()}, {"error", ex.what()}});
        return;
    }

    if (track.lifecycleState != LifecycleState::Live) {
        return;
    }

    const ThreatAssessment assessment = m_scoring.assess(track);
    ++report.tracksEvaluated;

    if (shouldPersistScore(assessment.score, track.threatScore, m_deadBandThreshold)) {
        try {
            session.persistScore(track.id, assessment.score);
            ++report.scoresWritten;
            SLOG_INFO(QStringLiteral("ThreatEvaluator"),
                      QStringLiteral("evaluateRecord"),
                      QStringLiteral("score_updated"),
                      QStringLiteral("score_left_dead_band"),
                      QStringLiteral("persist_score"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"externalRef", track.externalRef},
                                     {"speed", track.speed},
                                     {"distance", static_cast<long long>(assessment.distance)},
                                     {"previousScore", track.threatScore},
                                     {"score", assessment.score}});
        } catch (const PersistError &ex) {
            ++report.persistFailures;
            SLOG_ERROR(QStringLiteral("ThreatEvaluator"),
                       QStringLiteral("evaluateRecord"),
                       QStringLiteral("score_write_failed"),
                       QStringLiteral("store_write_error"),
                       QStringLiteral("recompute_next_cycle"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"trackId", track.id}, {"error", ex.what()}});
        }
    }

    const auto transition = m_policy.decide(assessment.score, track.lifecycleState);
    if (!transition.has_value()) {
        return;
    }

    try {
        if (!session.persistStatus(track.id, *transition)) {
            SLOG_WARN(QStringLiteral("ThreatEvaluator"),
                      QStringLiteral("evaluateRecord"),
                      QStringLiteral("status_write_ignored"),
                      QStringLiteral("track_missing_or_regression"),
                      QStringLiteral("persist_status"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"trackId", track.id},
                                     {"status", toLifecycleString(*transition)}});
            return;
        }
        ++report.escalations;
        qWarning() << "Skyshield: auto-engaging hostile track"
                   << QString::fromStdString(track.externalRef)
                   << "score" << assessment.score;
        SLOG_WARN(QStringLiteral("ThreatEvaluator"),
                  QStringLiteral("evaluateRecord"),
                  QStringLiteral("track_engaged"),
                  QStringLiteral("score_above_escalation_threshold"),
                  QStringLiteral("persist_status"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"externalRef", track.externalRef},
                                 {"threshold", m_policy.threshold()},
                                 {"assessment", toJson(assessment)}});
    } catch (const PersistError &ex) {
        ++report.persistFailures;
        SLOG_ERROR(QStringLiteral("ThreatEvaluator"),
                   QStringLiteral("evaluateRecord"),
                   QStringLiteral("status_write_failed"),
                   QStringLiteral("store_write_error"),
                   QStringLiteral("recompute_next_cycle"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"trackId", track.id}, {"error", ex.what()}});
    }
}

} // namespace skyshield
