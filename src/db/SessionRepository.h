#ifndef SESSIONREPOSITORY_H
#define SESSIONREPOSITORY_H

#include "models/SessionRecord.h"

#include <QList>
#include <QString>
#include <optional>

class DatabaseManager;

// Append-only journal of completed sessions.
class SessionRepository {
public:
    explicit SessionRepository(DatabaseManager& dbManager);

    // Returns the new id once the row is committed, or nothing on failure
    // (see lastError()).
    std::optional<qint64> insertSession(const SessionRecord& record);

    // Most recent first: start_time descending, then id descending.
    QList<SessionRecord> recentSessions(int limit) const;
    int sessionCount() const;

    QString lastError() const;

    static QString formatTimestamp(const QDateTime& timestamp);
    static QDateTime parseTimestamp(const QString& text);

private:
    DatabaseManager& m_dbManager;
    QString m_lastError;
};

#endif // SESSIONREPOSITORY_H
