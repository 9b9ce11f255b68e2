#pragma once

#include <chrono>

#include <QObject>
#include <QTimer>

namespace skyshield {

// CycleScheduler drives discrete evaluation cycles from the Qt event loop.
// The next tick is armed only after every tick() handler has returned, so
// the interval is the pause between cycles and cycles never overlap.
class CycleScheduler : public QObject
{
    Q_OBJECT
public:
    explicit CycleScheduler(std::chrono::milliseconds interval, QObject *parent = nullptr);

    // First tick is queued immediately, later ticks follow the interval.
    void start();
    // No further ticks are emitted after stop(), including an armed one.
    void stop();
    // Synthetic tick, delivered synchronously whether or not the timer runs.
    void triggerNow();

    bool isRunning() const
    {
        return m_running;
    }

    std::chrono::milliseconds interval() const
    {
        return m_interval;
    }

    quint64 tickCount() const
    {
        return m_ticks;
    }

signals:
    void tick();

private slots:
    void onTimeout();

private:
    void fire();

    QTimer m_timer;
    std::chrono::milliseconds m_interval;
    bool m_running = false;
    quint64 m_ticks = 0;
};

} // namespace skyshield
