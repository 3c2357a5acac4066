#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QSet>
#include <QSqlDatabase>
#include <QString>
#include <QVariant>
#include <QSqlQuery>
#include <QStringList>

class DatabaseManager {
public:
    // Connection used by the application; tests create their own instances.
    static DatabaseManager& instance();

    explicit DatabaseManager(const QString& connectionName);
    ~DatabaseManager();

    bool connect(const QString& dbPath = "focus.sqlite");
    void disconnect();
    bool isConnected() const;

    QSqlDatabase database() const;
    QString databasePath() const;
    QString lastError() const;

    bool executeQuery(QSqlQuery& query) const;
    bool executeQuery(const QString& queryString);

private:
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    QString resolveDatabasePath(const QString& dbPath) const;
    bool executeSchemaStatements(const QStringList& statements, const QString& passName);
    bool createTablesIfNotExist();
    QSet<QString> sessionColumns(bool *ok);
    bool prepareLegacyJournal(const QSet<QString>& columns);
    bool importLegacyJournal(const QSet<QString>& legacyColumns);

    QSqlDatabase m_db;
    QString m_connectionName;
    mutable QString m_lastError;
};

#endif // DATABASEMANAGER_H
