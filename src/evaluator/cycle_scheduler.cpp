#include "evaluator/cycle_scheduler.hpp"

namespace skyshield {

CycleScheduler::CycleScheduler(std::chrono::milliseconds interval, QObject *parent)
    : QObject(parent)
    , m_interval(interval)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &CycleScheduler::onTimeout);
}

void CycleScheduler::start()
{
    m_running = true;
    m_timer.start(0);
}

void CycleScheduler::stop()
{
    m_running = false;
    m_timer.stop();
}

void CycleScheduler::triggerNow()
{
    fire();
}

void CycleScheduler::onTimeout()
{
    if (!m_running) {
        return;
    }

    fire();

    if (m_running) {
        m_timer.start(m_interval);
    }
}

void CycleScheduler::fire()
{
    ++m_ticks;
    emit tick();
}

} // namespace skyshield
