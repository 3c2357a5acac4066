#ifndef CLOCK_H
#define CLOCK_H

#include <QDateTime>
#include <QElapsedTimer>

// Time source for the timer engine and the session controller.
// monotonicMs() drives all countdown arithmetic; wallNow() is only used to
// stamp the start of a session in the journal.
class Clock {
public:
    virtual ~Clock() = default;

    virtual qint64 monotonicMs() const = 0;
    virtual QDateTime wallNow() const = 0; // UTC
};

class SystemClock : public Clock {
public:
    SystemClock();

    qint64 monotonicMs() const override;
    QDateTime wallNow() const override;

private:
    QElapsedTimer m_elapsed;
};

#endif // CLOCK_H
