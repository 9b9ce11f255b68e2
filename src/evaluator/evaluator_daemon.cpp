#include "evaluator/evaluator_daemon.hpp"

#include <utility>

#include <QDebug>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace skyshield {

EvaluatorDaemon::EvaluatorDaemon(const EvaluatorConfig &config,
                                 std::unique_ptr<TrackStore> store,
                                 QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_store(std::move(store))
    , m_evaluator(*m_store, m_config)
    , m_scheduler(m_config.pollInterval())
{
    connect(&m_scheduler, &CycleScheduler::tick, this, &EvaluatorDaemon::runCycle);
}

EvaluatorDaemon::~EvaluatorDaemon() = default;

void EvaluatorDaemon::start()
{
    SLOG_INFO(QStringLiteral("EvaluatorDaemon"),
              QStringLiteral("start"),
              QStringLiteral("evaluator_online"),
              QStringLiteral("daemon_start"),
              QStringLiteral("poll_timer"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"config", configToJson(m_config)},
                             {"maxCycles", m_maxCycles}});

    m_state = EvaluatorState::Running;
    m_scheduler.start();
}

void EvaluatorDaemon::stop(int exitCode)
{
    if (m_state == EvaluatorState::Stopped) {
        return;
    }

    m_state = EvaluatorState::Stopped;
    m_scheduler.stop();

    SLOG_INFO(QStringLiteral("EvaluatorDaemon"),
              QStringLiteral("stop"),
              QStringLiteral("evaluator_stopped"),
              exitCode == 0 ? QStringLiteral("requested") : QStringLiteral("fatal_error"),
              QStringLiteral("stop_scheduler"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"exitCode", exitCode},
                             {"cyclesRun", m_cyclesRun},
                             {"state", toEvaluatorStateString(m_state)}});
    emit stopped(exitCode);
}

void EvaluatorDaemon::setMaxCycles(int maxCycles)
{
    m_maxCycles = maxCycles;
}

void EvaluatorDaemon::runCycle()
{
    if (m_state != EvaluatorState::Running) {
        return;
    }

    try {
        m_lastReport = m_evaluator.runCycle();
    } catch (const StoreConnectionError &ex) {
        qCritical() << "Skyshield: track store unreachable:" << ex.what();
        SLOG_ERROR(QStringLiteral("EvaluatorDaemon"),
                   QStringLiteral("runCycle"),
                   QStringLiteral("store_unreachable"),
                   QStringLiteral("connection_failure"),
                   QStringLiteral("stop_evaluator"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()}});
        stop(1);
        return;
    }

    ++m_cyclesRun;
    emit cycleCompleted();

    if (m_maxCycles > 0 && m_cyclesRun >= m_maxCycles) {
        stop(0);
    }
}

} // namespace skyshield
