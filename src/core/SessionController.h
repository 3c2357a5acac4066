#ifndef SESSIONCONTROLLER_H
#define SESSIONCONTROLLER_H

#include "core/SessionResult.h"
#include "core/TimerEngine.h"
#include "models/SessionRecord.h"

#include <QObject>
#include <QDateTime>
#include <QList>
#include <chrono>
#include <optional>

class Clock;
class Notifier;
class SessionRepository;

// Drives one focus session from configuration to the journal:
//   Configuring -> Running -> AwaitingNote -> Completed
//                  Running -> Cancelled
// A controller serves a single session; create a new one for the next.
class SessionController : public QObject {
    Q_OBJECT
public:
    enum class State { Configuring, Running, AwaitingNote, Completed, Cancelled };
    Q_ENUM(State)

    SessionController(SessionRepository& repository, Notifier& notifier, Clock& clock,
                      QObject *parent = nullptr);
    ~SessionController() override;

    Result start(int durationMinutes, const QString& tag = QString());
    Result start(const QString& minutesText, const QString& tag);
    Result cancel();
    Result submitNote(const QString& note);

    std::chrono::milliseconds remaining() const;
    int remainingSeconds() const;
    QList<SessionRecord> history(int limit) const;

    // Checks the deadline now instead of waiting for the next tick.
    void poll();

    State state() const;
    bool isActive() const;
    bool isFinished() const;
    int durationMinutes() const;
    QString tag() const;
    QDateTime startTime() const;
    std::optional<qint64> recordId() const;

    static QString stateName(State state);

signals:
    void stateChanged(SessionController::State state);
    void tick(int remainingSeconds);
    void notificationWarning(const QString& message);

private slots:
    void onTimerExpired(TimerHandle handle);

private:
    void setState(State state);
    Result checkCanStart() const;
    Result invalidState(const QString& operation) const;

    SessionRepository& m_repository;
    Notifier& m_notifier;
    Clock& m_clock;
    TimerEngine m_timer;

    State m_state;
    TimerHandle m_timerHandle;
    int m_durationMinutes;
    QString m_tag;
    QDateTime m_startTime;
    std::optional<qint64> m_recordId;
};

#endif // SESSIONCONTROLLER_H
