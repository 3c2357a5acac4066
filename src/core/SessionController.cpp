#include "SessionController.h"
#include "audio/Notifier.h"
#include "core/Clock.h"
#include "db/SessionRepository.h"

#include <QDebug>
#include <exception>

SessionController::SessionController(SessionRepository& repository, Notifier& notifier, Clock& clock,
                                     QObject *parent)
    : QObject(parent), m_repository(repository), m_notifier(notifier), m_clock(clock),
      m_timer(clock), m_state(State::Configuring), m_timerHandle(TimerEngine::InvalidHandle),
      m_durationMinutes(0) {
    connect(&m_timer, &TimerEngine::expired, this, &SessionController::onTimerExpired);
    connect(&m_timer, &TimerEngine::tick, this, &SessionController::tick);
}

SessionController::~SessionController() {
    if (m_state == State::Running) {
        m_timer.cancel(m_timerHandle);
    } else if (m_state == State::AwaitingNote) {
        // Exiting before the note is entered discards the session.
        qWarning() << "SessionController: Discarding unsaved" << m_durationMinutes
                   << "minute session started at" << m_startTime.toString(Qt::ISODate);
    }
}

Result SessionController::checkCanStart() const {
    if (m_state != State::Configuring) {
        return invalidState(QStringLiteral("start"));
    }
    return Result::success();
}

Result SessionController::invalidState(const QString& operation) const {
    const QString message = tr("Cannot %1 while the session is %2.").arg(operation, stateName(m_state));
    qWarning() << "SessionController:" << message;
    return Result::failure(SessionError::InvalidState, message);
}

Result SessionController::start(int durationMinutes, const QString& tag) {
    Result allowed = checkCanStart();
    if (!allowed.ok()) return allowed;

    if (durationMinutes <= 0) {
        const QString message = tr("Duration must be a positive number of minutes, got %1.").arg(durationMinutes);
        qWarning() << "SessionController:" << message;
        return Result::failure(SessionError::InvalidDuration, message);
    }

    const QDateTime startTime = m_clock.wallNow();
    const TimerHandle handle = m_timer.start(durationMinutes);
    if (handle == TimerEngine::InvalidHandle) {
        return Result::failure(SessionError::InvalidDuration,
                               tr("Timer rejected a duration of %1 minutes.").arg(durationMinutes));
    }

    m_timerHandle = handle;
    m_durationMinutes = durationMinutes;
    m_tag = tag.trimmed();
    if (m_tag.isEmpty()) {
        m_tag = QString();
    }
    m_startTime = startTime;
    qInfo() << "SessionController:" << durationMinutes << "minute session started"
            << (m_tag.isNull() ? QString() : QString("[tag: %1]").arg(m_tag));
    setState(State::Running);
    return Result::success();
}

Result SessionController::start(const QString& minutesText, const QString& tag) {
    Result allowed = checkCanStart();
    if (!allowed.ok()) return allowed;

    bool ok = false;
    const int minutes = minutesText.trimmed().toInt(&ok);
    if (!ok) {
        const QString message = tr("Duration must be a whole number of minutes, got \"%1\".").arg(minutesText);
        qWarning() << "SessionController:" << message;
        return Result::failure(SessionError::InvalidDuration, message);
    }
    return start(minutes, tag);
}

Result SessionController::cancel() {
    if (m_state != State::Running) {
        return invalidState(QStringLiteral("cancel"));
    }
    m_timer.cancel(m_timerHandle);
    qInfo() << "SessionController: Session cancelled.";
    setState(State::Cancelled);
    return Result::success();
}

Result SessionController::submitNote(const QString& note) {
    if (m_state != State::AwaitingNote) {
        return invalidState(QStringLiteral("submit a note"));
    }

    SessionRecord record;
    record.startTime = m_startTime;
    record.durationMinutes = m_durationMinutes;
    record.tag = m_tag;
    record.notes = note.trimmed();
    if (record.notes.isEmpty()) {
        record.notes = QString();
    }

    const std::optional<qint64> id = m_repository.insertSession(record);
    if (!id) {
        // Stay in AwaitingNote so the caller can retry with the same data.
        const QString message = tr("Could not save the session: %1").arg(m_repository.lastError());
        qWarning() << "SessionController:" << message;
        return Result::failure(SessionError::Storage, message);
    }

    m_recordId = id;
    qInfo() << "SessionController: Session recorded with id" << *id;
    setState(State::Completed);
    return Result::success();
}

std::chrono::milliseconds SessionController::remaining() const {
    return m_timer.remaining(m_timerHandle);
}

int SessionController::remainingSeconds() const {
    return m_timer.remainingSeconds(m_timerHandle);
}

QList<SessionRecord> SessionController::history(int limit) const {
    return m_repository.recentSessions(limit);
}

void SessionController::poll() {
    m_timer.poll();
}

SessionController::State SessionController::state() const {
    return m_state;
}

bool SessionController::isActive() const {
    return m_state == State::Running || m_state == State::AwaitingNote;
}

bool SessionController::isFinished() const {
    return m_state == State::Completed || m_state == State::Cancelled;
}

int SessionController::durationMinutes() const {
    return m_durationMinutes;
}

QString SessionController::tag() const {
    return m_tag;
}

QDateTime SessionController::startTime() const {
    return m_startTime;
}

std::optional<qint64> SessionController::recordId() const {
    return m_recordId;
}

QString SessionController::stateName(State state) {
    switch (state) {
        case State::Configuring: return QStringLiteral("configuring");
        case State::Running: return QStringLiteral("running");
        case State::AwaitingNote: return QStringLiteral("awaiting a note");
        case State::Completed: return QStringLiteral("completed");
        case State::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

void SessionController::onTimerExpired(TimerHandle handle) {
    if (handle != m_timerHandle || m_state != State::Running) {
        return;
    }

    QString warning;
    bool played = false;
    try {
        played = m_notifier.play(&warning);
    } catch (const std::exception& e) {
        warning = QString::fromUtf8(e.what());
    } catch (...) {
        warning = tr("The notifier failed with an unknown error.");
    }

    setState(State::AwaitingNote);

    if (!played) {
        if (warning.isEmpty()) {
            warning = tr("Could not play the end-of-session sound.");
        }
        qWarning() << "SessionController: Notification failed:" << warning;
        emit notificationWarning(warning);
    }
}

void SessionController::setState(State state) {
    if (m_state == state) return;
    qInfo() << "SessionController: State" << stateName(m_state) << "->" << stateName(state);
    m_state = state;
    emit stateChanged(state);
}
