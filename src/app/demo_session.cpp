#include "app/demo_session.hpp"

#include <algorithm>

namespace pomotray {

namespace {

constexpr int kTickIntervalMs = 1000;

} // namespace

DemoSession::DemoSession(int durationSeconds, QObject *parent)
    : QObject(parent)
    , m_durationMs(std::max(durationSeconds, 1) * qint64(1000))
{
    m_tickTimer.setInterval(kTickIntervalMs);
    connect(&m_tickTimer, &QTimer::timeout, this, &DemoSession::tick);
}

void DemoSession::start()
{
    if (m_tickTimer.isActive()) {
        return;
    }
    m_elapsed.start();
    m_tickTimer.start();
    emit sessionStarted();
    emit timerUpdated(0.0);
}

bool DemoSession::isRunning() const
{
    return m_tickTimer.isActive();
}

void DemoSession::tick()
{
    const double percent =
        std::min(100.0, 100.0 * static_cast<double>(m_elapsed.elapsed()) / m_durationMs);
    emit timerUpdated(percent);

    if (percent >= 100.0) {
        m_tickTimer.stop();
        emit sessionEnded();
    }
}

} // namespace pomotray
