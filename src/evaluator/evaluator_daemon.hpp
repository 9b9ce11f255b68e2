#pragma once

#include <memory>

#include <QObject>

#include "common/evaluator_config.hpp"
#include "common/models.hpp"
#include "evaluator/cycle_scheduler.hpp"
#include "evaluator/threat_evaluator.hpp"
#include "evaluator/track_store.hpp"

namespace skyshield {

/**
 * EvaluatorDaemon wires the ThreatEvaluator to a CycleScheduler and owns the
 * Running -> Stopped state machine. A StoreConnectionError during a cycle
 * stops the daemon and reports exit code 1 through stopped().
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class EvaluatorDaemon : public QObject
{
    Q_OBJECT
public:
    EvaluatorDaemon(const EvaluatorConfig &config,
                    std::unique_ptr<TrackStore> store,
                    QObject *parent = nullptr);
    ~EvaluatorDaemon() override;

    void start();
    // Stops scheduling and emits stopped(exitCode). Safe to call twice.
    void stop(int exitCode = 0);

    // 0 means unlimited. Used by --once.
    void setMaxCycles(int maxCycles);

    EvaluatorState state() const
    {
        return m_state;
    }

    int cyclesRun() const
    {
        return m_cyclesRun;
    }

    const CycleReport &lastReport() const
    {
        return m_lastReport;
    }

    CycleScheduler &scheduler()
    {
        return m_scheduler;
    }

signals:
    void cycleCompleted();
    void stopped(int exitCode);

private slots:
    void runCycle();

private:
    EvaluatorConfig m_config;
    std::unique_ptr<TrackStore> m_store;
    ThreatEvaluator m_evaluator;
    CycleScheduler m_scheduler;

    EvaluatorState m_state = EvaluatorState::Running;
    CycleReport m_lastReport;
    int m_cyclesRun = 0;
    int m_maxCycles = 0;
};

} // namespace skyshield
