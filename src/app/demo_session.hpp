#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

namespace pomotray {

/**
 * DemoSession plays one timed session so the tray item has something to
 * show: sessionStarted, a timerUpdated tick per interval, then sessionEnded.
 */
class DemoSession : public QObject
{
    Q_OBJECT
public:
    explicit DemoSession(int durationSeconds, QObject *parent = nullptr);

    void start();
    bool isRunning() const;

signals:
    void sessionStarted();
    void timerUpdated(double elapsedPercent);
    void sessionEnded();

private slots:
    void tick();

private:
    qint64 m_durationMs;
    QTimer m_tickTimer;
    QElapsedTimer m_elapsed;
};

} // namespace pomotray
