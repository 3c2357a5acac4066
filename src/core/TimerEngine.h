#ifndef TIMERENGINE_H
#define TIMERENGINE_H

#include <QObject>
#include <QTimer>
#include <chrono>

class Clock;

using TimerHandle = quint64;

// Countdown for a single focus session. Only one timer runs at a time:
// starting a new one makes the previous handle inert.
class TimerEngine : public QObject {
    Q_OBJECT
public:
    static constexpr TimerHandle InvalidHandle = 0;

    explicit TimerEngine(Clock& clock, QObject *parent = nullptr);

    TimerHandle start(int durationMinutes); // InvalidHandle if durationMinutes <= 0
    void cancel(TimerHandle handle);

    // Pure queries, safe to call from any display refresh.
    std::chrono::milliseconds remaining(TimerHandle handle) const;
    int remainingSeconds(TimerHandle handle) const; // Rounded up
    bool isActive(TimerHandle handle) const;

    // Delivers expiry if the deadline has passed. Returns true only on the
    // call that delivered it.
    bool poll();

    void setTickInterval(int milliseconds);

signals:
    void tick(int remainingSeconds);
    void expired(TimerHandle handle);

private slots:
    void onTimeout();

private:
    Clock& m_clock;
    QTimer m_timer;
    TimerHandle m_handle;
    TimerHandle m_nextHandle;
    qint64 m_deadlineMs;
    bool m_fired;
    bool m_cancelled;
};

#endif // TIMERENGINE_H
