#include "TimerEngine.h"
#include "Clock.h"

#include <QDebug>
#include <algorithm>

TimerEngine::TimerEngine(Clock& clock, QObject *parent)
    : QObject(parent), m_clock(clock), m_handle(InvalidHandle), m_nextHandle(1),
      m_deadlineMs(0), m_fired(false), m_cancelled(false) {
    m_timer.setInterval(1000); // Tick every second
    connect(&m_timer, &QTimer::timeout, this, &TimerEngine::onTimeout);
}

TimerHandle TimerEngine::start(int durationMinutes) {
    if (durationMinutes <= 0) {
        qWarning() << "TimerEngine: Refusing to start timer with duration" << durationMinutes << "minutes.";
        return InvalidHandle;
    }
    m_handle = m_nextHandle++;
    m_deadlineMs = m_clock.monotonicMs() + qint64(durationMinutes) * 60 * 1000;
    m_fired = false;
    m_cancelled = false;
    m_timer.start();
    qInfo() << "TimerEngine: Timer" << m_handle << "started for" << durationMinutes << "minutes.";
    emit tick(remainingSeconds(m_handle));
    return m_handle;
}

void TimerEngine::cancel(TimerHandle handle) {
    if (handle == InvalidHandle || handle != m_handle || m_cancelled) {
        return;
    }
    m_cancelled = true;
    m_timer.stop();
    qInfo() << "TimerEngine: Timer" << handle << "cancelled.";
}

std::chrono::milliseconds TimerEngine::remaining(TimerHandle handle) const {
    if (!isActive(handle)) {
        return std::chrono::milliseconds(0);
    }
    const qint64 left = m_deadlineMs - m_clock.monotonicMs();
    return std::chrono::milliseconds(std::max<qint64>(0, left));
}

int TimerEngine::remainingSeconds(TimerHandle handle) const {
    const qint64 ms = remaining(handle).count();
    return static_cast<int>((ms + 999) / 1000);
}

bool TimerEngine::isActive(TimerHandle handle) const {
    return handle != InvalidHandle && handle == m_handle && !m_fired && !m_cancelled;
}

bool TimerEngine::poll() {
    if (!isActive(m_handle) || m_clock.monotonicMs() < m_deadlineMs) {
        return false;
    }
    // Mark before emitting so a re-entrant poll() from a slot cannot fire twice.
    m_fired = true;
    m_timer.stop();
    qInfo() << "TimerEngine: Timer" << m_handle << "expired.";
    emit tick(0);
    emit expired(m_handle);
    return true;
}

void TimerEngine::setTickInterval(int milliseconds) {
    m_timer.setInterval(milliseconds);
}

void TimerEngine::onTimeout() {
    if (!poll() && isActive(m_handle)) {
        emit tick(remainingSeconds(m_handle));
    }
}
