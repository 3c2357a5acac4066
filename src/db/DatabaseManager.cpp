#include "DatabaseManager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDir>
#include <QSet>
#include <QTextStream>

namespace {
const QString kLegacyTable = QStringLiteral("sessions_legacy");
}

DatabaseManager& DatabaseManager::instance() {
    static DatabaseManager inst("FocusTimerDBConnection");
    return inst;
}

DatabaseManager::DatabaseManager(const QString& connectionName) : m_connectionName(connectionName) {
    // The schema lives in the resources of the static core library.
    Q_INIT_RESOURCE(focus_resources);
    qInfo() << "DatabaseManager: Instance created for connection" << m_connectionName;
}

DatabaseManager::~DatabaseManager() {
    disconnect();
}

QString DatabaseManager::resolveDatabasePath(const QString& dbPath) const {
    if (dbPath == ":memory:") {
        return dbPath;
    }
    QFileInfo info(dbPath);
    if (!dbPath.contains('/') && !dbPath.contains(QDir::separator())) {
        // A bare file name goes into the per-user data directory.
        QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
        if (dataPath.isEmpty()) {
            qWarning() << "DatabaseManager: AppLocalDataLocation is empty. Using current directory '.' as last resort.";
            dataPath = ".";
        }
        qInfo() << "DatabaseManager: Selected data path for DB:" << dataPath;
        info = QFileInfo(QDir(dataPath), dbPath);
    }

    QDir dir = info.absoluteDir();
    if (!dir.exists()) {
        qInfo() << "DatabaseManager: Data directory" << dir.path() << "does not exist. Attempting to create it.";
        if (!dir.mkpath(".")) {
            qWarning() << "DatabaseManager: WARNING: Could not create data directory:" << dir.path();
        }
    }
    return info.absoluteFilePath();
}

bool DatabaseManager::connect(const QString& dbPath) {
    qInfo() << "DatabaseManager: connect() called with path:" << dbPath;

    if (QSqlDatabase::contains(m_connectionName)) {
        qInfo() << "DatabaseManager: Connection" << m_connectionName << "already exists. Using it.";
        m_db = QSqlDatabase::database(m_connectionName, false);
    } else {
        m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
        if (!m_db.isValid()) {
            m_lastError = m_db.lastError().text();
            qCritical() << "DatabaseManager: CRITICAL: QSQLITE driver not valid!" << m_lastError;
            qCritical() << "DatabaseManager: CRITICAL: Ensure the SQLite plugin (libqsqlite.so) is available.";
            return false;
        }
    }

    const QString actualDbPath = resolveDatabasePath(dbPath);
    qInfo() << "DatabaseManager: Setting database name to:" << actualDbPath;
    if (m_db.isOpen()) {
        m_db.close();
    }
    m_db.setDatabaseName(actualDbPath);

    if (!m_db.open()) {
        m_lastError = m_db.lastError().text();
        qCritical() << "DatabaseManager: CRITICAL: Database file open error:" << m_lastError;
        qCritical() << "DatabaseManager: CRITICAL: Database path attempted:" << actualDbPath;
        return false;
    }
    qInfo() << "DatabaseManager: Database file opened successfully at:" << m_db.databaseName();

    if (!createTablesIfNotExist()) {
        qCritical() << "DatabaseManager: CRITICAL: Failed to process database schema.";
        m_db.close();
        return false;
    }
    m_lastError.clear();
    qInfo() << "DatabaseManager: Connection successful and database initialized.";
    return true;
}

void DatabaseManager::disconnect() {
    if (m_db.isOpen()) {
        qInfo() << "DatabaseManager: Closing database connection:" << m_connectionName << "for" << m_db.databaseName();
        m_db.close();
    }
    // Drop our handle first, otherwise removeDatabase() reports it as still in use.
    m_db = QSqlDatabase();
    if (QSqlDatabase::contains(m_connectionName)) {
        QSqlDatabase::removeDatabase(m_connectionName);
        qInfo() << "DatabaseManager: Removed database connection" << m_connectionName << "from global list.";
    }
}

bool DatabaseManager::isConnected() const {
    return m_db.isValid() && m_db.isOpen();
}

QSqlDatabase DatabaseManager::database() const {
    return m_db;
}

QString DatabaseManager::databasePath() const {
    return m_db.databaseName();
}

QString DatabaseManager::lastError() const {
    return m_lastError;
}

bool DatabaseManager::executeQuery(QSqlQuery& query) const {
    if (!isConnected()) {
        m_lastError = QStringLiteral("Database not connected");
        qWarning("DatabaseManager: Database not connected. Cannot execute query (QSqlQuery object).");
        return false;
    }
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qWarning() << "DatabaseManager: Query execution failed (QSqlQuery object):" << m_lastError;
        qWarning() << "DatabaseManager: Offending Query:" << query.lastQuery();
        if (!query.boundValues().isEmpty()) {
            qWarning() << "DatabaseManager: Bound values:" << query.boundValues();
        }
        return false;
    }
    return true;
}

bool DatabaseManager::executeQuery(const QString& queryString) {
    if (!isConnected()) {
        m_lastError = QStringLiteral("Database not connected");
        qWarning("DatabaseManager: Database not connected. Cannot execute query (QString).");
        return false;
    }
    QSqlQuery query(m_db);
    if (!query.exec(queryString)) {
        m_lastError = query.lastError().text();
        qWarning() << "DatabaseManager: Query execution failed (QString):" << m_lastError;
        qWarning() << "DatabaseManager: Offending Query:" << queryString;
        return false;
    }
    return true;
}

bool DatabaseManager::executeSchemaStatements(const QStringList& statements, const QString& passName) {
    QSqlQuery query(m_db);
    int stmtNumber = 0;
    for (const QString& stmt : statements) {
        stmtNumber++;
        const QString trimmedStmt = stmt.trimmed();
        if (trimmedStmt.isEmpty()) {
            continue;
        }
        qDebug().noquote() << QString("DatabaseManager: %1 - Executing schema statement #%2: %3")
                                  .arg(passName).arg(stmtNumber).arg(trimmedStmt.left(120));
        if (!query.exec(trimmedStmt)) {
            m_lastError = query.lastError().text();
            qWarning() << "DatabaseManager:" << passName << "- ERROR: Failed to execute schema statement #" << stmtNumber << ":" << m_lastError;
            qWarning() << "DatabaseManager:" << passName << "- Offending Statement:" << trimmedStmt;
            return false;
        }
    }
    return true;
}

QSet<QString> DatabaseManager::sessionColumns(bool *ok) {
    QSet<QString> columns;
    QSqlQuery query(m_db);
    if (!query.exec("PRAGMA table_info(sessions)")) {
        m_lastError = query.lastError().text();
        qWarning() << "DatabaseManager: Could not inspect sessions table:" << m_lastError;
        *ok = false;
        return columns;
    }
    while (query.next()) {
        columns.insert(query.value("name").toString());
    }
    *ok = true;
    return columns;
}

// Runs before the schema so the index statement sees the current layout.
// Journals written before tags and notes were tracked lack those columns;
// journals of the first release store epoch seconds in start_ts and are
// moved aside to be copied over once the new table exists.
bool DatabaseManager::prepareLegacyJournal(const QSet<QString>& columns) {
    if (columns.isEmpty()) {
        return true;
    }
    if (columns.contains("start_ts")) {
        qInfo() << "DatabaseManager: Epoch-based journal detected, moving it to" << kLegacyTable;
        return executeSchemaStatements({QString("ALTER TABLE sessions RENAME TO %1").arg(kLegacyTable)},
                                       "Migration");
    }

    QStringList alterStatements;
    for (const QString& column : {QStringLiteral("tag"), QStringLiteral("notes")}) {
        if (!columns.contains(column)) {
            qInfo() << "DatabaseManager: Legacy journal detected, adding column" << column;
            alterStatements.append(QString("ALTER TABLE sessions ADD COLUMN %1 TEXT").arg(column));
        }
    }
    return executeSchemaStatements(alterStatements, "Migration");
}

bool DatabaseManager::importLegacyJournal(const QSet<QString>& legacyColumns) {
    // The oldest journals predate the tag column.
    const QString tagExpr = legacyColumns.contains("tag") ? QStringLiteral("NULLIF(TRIM(tag), '')")
                                                           : QStringLiteral("NULL");
    const QString noteExpr = legacyColumns.contains("note") ? QStringLiteral("NULLIF(TRIM(note), '')")
                                                             : QStringLiteral("NULL");
    const QString copy = QString(
        "INSERT INTO sessions (start_time, duration_minutes, tag, notes) "
        "SELECT strftime('%Y-%m-%dT%H:%M:%fZ', start_ts, 'unixepoch'), duration_min, %1, %2 "
        "FROM %3 WHERE start_ts IS NOT NULL AND duration_min > 0 ORDER BY id")
        .arg(tagExpr, noteExpr, kLegacyTable);

    QSqlQuery query(m_db);
    if (!query.exec(copy)) {
        m_lastError = query.lastError().text();
        qWarning() << "DatabaseManager: Could not copy legacy sessions:" << m_lastError;
        return false;
    }
    qInfo() << "DatabaseManager: Copied" << query.numRowsAffected() << "legacy sessions.";
    return executeSchemaStatements({QString("DROP TABLE %1").arg(kLegacyTable)}, "Migration");
}

bool DatabaseManager::createTablesIfNotExist() {
    const QString schemaFilePath = QStringLiteral(":/db/schema.sql");
    if (!isConnected()) {
        m_lastError = QStringLiteral("Database not connected");
        qWarning("DatabaseManager: Database not connected. Cannot create tables.");
        return false;
    }

    QFile schemaFile(schemaFilePath);
    if (!schemaFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
        m_lastError = QString("Could not open schema file %1: %2").arg(schemaFilePath, schemaFile.errorString());
        qCritical() << "DatabaseManager: CRITICAL:" << m_lastError;
        return false;
    }

    QTextStream in(&schemaFile);
    QStringList lines;
    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (!line.trimmed().startsWith("--")) {
            lines.append(line);
        }
    }
    schemaFile.close();

    const QStringList statements = lines.join('\n').split(';', Qt::SkipEmptyParts);
    qInfo() << "DatabaseManager: Schema split into" << statements.count() << "statements.";

    if (!m_db.transaction()) {
        m_lastError = m_db.lastError().text();
        qWarning() << "DatabaseManager: WARNING: Failed to start transaction. DB Error:" << m_lastError;
        return false;
    }

    bool overallSuccess = false;
    const QSet<QString> columns = sessionColumns(&overallSuccess);
    const bool importLegacy = columns.contains("start_ts");
    overallSuccess = overallSuccess
                     && prepareLegacyJournal(columns)
                     && executeSchemaStatements(statements, "Schema")
                     && (!importLegacy || importLegacyJournal(columns));

    if (overallSuccess) {
        if (!m_db.commit()) {
            m_lastError = m_db.lastError().text();
            qWarning() << "DatabaseManager: WARNING: Failed to commit schema transaction:" << m_lastError;
            overallSuccess = false;
            if (!m_db.rollback()) {
                qWarning() << "DatabaseManager: CRITICAL: Rollback also failed:" << m_db.lastError().text();
            }
        } else {
            qInfo("DatabaseManager: Database schema transaction committed successfully.");
        }
    } else {
        qWarning("DatabaseManager: Database schema processing failed. Attempting to rollback transaction...");
        if (!m_db.rollback()) {
            qWarning() << "DatabaseManager: CRITICAL: Rollback failed after schema error:" << m_db.lastError().text();
        }
    }
    return overallSuccess;
}
