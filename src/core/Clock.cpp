#include "Clock.h"

SystemClock::SystemClock() {
    m_elapsed.start();
}

qint64 SystemClock::monotonicMs() const {
    return m_elapsed.elapsed();
}

QDateTime SystemClock::wallNow() const {
    return QDateTime::currentDateTimeUtc();
}
