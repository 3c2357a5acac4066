#include "SessionRepository.h"
#include "DatabaseManager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QDebug>

namespace {

QVariant nullableText(const QString& text) {
    if (text.isEmpty()) {
        return QVariant(QMetaType::fromType<QString>());
    }
    return text;
}

QString textOrNull(const QVariant& value) {
    return value.isNull() ? QString() : value.toString();
}

} // namespace

SessionRepository::SessionRepository(DatabaseManager& dbManager) : m_dbManager(dbManager) {}

QString SessionRepository::formatTimestamp(const QDateTime& timestamp) {
    // Fixed-width UTC text sorts chronologically.
    return timestamp.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime SessionRepository::parseTimestamp(const QString& text) {
    return QDateTime::fromString(text, Qt::ISODateWithMs);
}

std::optional<qint64> SessionRepository::insertSession(const SessionRecord& record) {
    if (record.durationMinutes <= 0 || !record.startTime.isValid()) {
        m_lastError = QString("Invalid session record (duration %1, start %2)")
                          .arg(record.durationMinutes)
                          .arg(record.startTime.toString(Qt::ISODate));
        qWarning() << "SessionRepository:" << m_lastError;
        return std::nullopt;
    }
    if (!m_dbManager.isConnected()) {
        m_lastError = QStringLiteral("Database not connected");
        qWarning() << "SessionRepository: Cannot save session," << m_lastError;
        return std::nullopt;
    }

    QSqlQuery query(m_dbManager.database());
    query.prepare("INSERT INTO sessions (start_time, duration_minutes, tag, notes) "
                  "VALUES (:start_time, :duration_minutes, :tag, :notes)");
    query.bindValue(":start_time", formatTimestamp(record.startTime));
    query.bindValue(":duration_minutes", record.durationMinutes);
    query.bindValue(":tag", nullableText(record.tag));
    query.bindValue(":notes", nullableText(record.notes));

    if (!m_dbManager.executeQuery(query)) {
        m_lastError = query.lastError().text();
        if (m_lastError.trimmed().isEmpty()) {
            m_lastError = m_dbManager.lastError();
        }
        qWarning() << "SessionRepository: Failed to save session:" << m_lastError;
        return std::nullopt;
    }

    const qint64 id = query.lastInsertId().toLongLong();
    m_lastError.clear();
    qInfo() << "SessionRepository: Session saved successfully. LastInsertId:" << id;
    return id;
}

QList<SessionRecord> SessionRepository::recentSessions(int limit) const {
    QList<SessionRecord> sessions;
    if (limit <= 0 || !m_dbManager.isConnected()) return sessions;

    QSqlQuery query(m_dbManager.database());
    query.prepare("SELECT id, start_time, duration_minutes, tag, notes "
                  "FROM sessions ORDER BY start_time DESC, id DESC LIMIT :limit");
    query.bindValue(":limit", limit);

    if (m_dbManager.executeQuery(query)) {
        while (query.next()) {
            SessionRecord s;
            s.id = query.value("id").toLongLong();
            s.startTime = parseTimestamp(query.value("start_time").toString());
            s.durationMinutes = query.value("duration_minutes").toInt();
            s.tag = textOrNull(query.value("tag"));
            s.notes = textOrNull(query.value("notes"));
            sessions.append(s);
        }
    } else {
        qWarning() << "SessionRepository: Failed to fetch recent sessions.";
    }
    return sessions;
}

int SessionRepository::sessionCount() const {
    if (!m_dbManager.isConnected()) return 0;

    QSqlQuery query(m_dbManager.database());
    query.prepare("SELECT COUNT(*) FROM sessions");
    if (m_dbManager.executeQuery(query) && query.next()) {
        return query.value(0).toInt();
    }
    return 0;
}

QString SessionRepository::lastError() const {
    return m_lastError;
}
