#include "app/shutdown_watcher.hpp"

#include <atomic>
#include <csignal>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace pomotray {

namespace {

constexpr int kPollIntervalMs = 100;

std::atomic<int> g_pendingSignal{0};

using SignalHandler = void (*)(int);
SignalHandler g_previousInt = SIG_DFL;
SignalHandler g_previousTerm = SIG_DFL;

void onTerminationSignal(int signalNumber)
{
    g_pendingSignal.store(signalNumber, std::memory_order_relaxed);
}

} // namespace

ShutdownWatcher::ShutdownWatcher(QObject *parent)
    : QObject(parent)
{
    g_pendingSignal.store(0, std::memory_order_relaxed);
    g_previousInt = std::signal(SIGINT, onTerminationSignal);
    g_previousTerm = std::signal(SIGTERM, onTerminationSignal);

    m_pollTimer.setInterval(kPollIntervalMs);
    connect(&m_pollTimer, &QTimer::timeout, this, &ShutdownWatcher::poll);
    m_pollTimer.start();
}

ShutdownWatcher::~ShutdownWatcher()
{
    std::signal(SIGINT, g_previousInt == SIG_ERR ? SIG_DFL : g_previousInt);
    std::signal(SIGTERM, g_previousTerm == SIG_ERR ? SIG_DFL : g_previousTerm);
}

int ShutdownWatcher::receivedSignal() const
{
    return m_received;
}

void ShutdownWatcher::poll()
{
    const int signalNumber = g_pendingSignal.exchange(0, std::memory_order_relaxed);
    if (signalNumber == 0) {
        return;
    }

    m_received = signalNumber;
    m_pollTimer.stop();
    PLOG_INFO(QStringLiteral("ShutdownWatcher"),
              QStringLiteral("poll"),
              QStringLiteral("shutdown_requested"),
              QStringLiteral("signal"),
              QStringLiteral("quit_event_loop"),
              (nlohmann::json{{"signal", signalNumber}}));
    emit shutdownRequested(signalNumber);
}

} // namespace pomotray
