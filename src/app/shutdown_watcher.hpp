#pragma once

#include <QObject>
#include <QTimer>

namespace pomotray {

/**
 * ShutdownWatcher turns SIGINT and SIGTERM into a shutdownRequested() signal
 * on the event loop, so main() can publish the Passive status before exiting.
 *
 * The handler only sets a flag; a timer polls it. One instance per process.
 */
class ShutdownWatcher : public QObject
{
    Q_OBJECT
public:
    explicit ShutdownWatcher(QObject *parent = nullptr);
    ~ShutdownWatcher() override;

    // The signal number that triggered shutdownRequested(), 0 before that.
    int receivedSignal() const;

signals:
    void shutdownRequested(int signalNumber);

private slots:
    void poll();

private:
    QTimer m_pollTimer;
    int m_received = 0;
};

} // namespace pomotray
