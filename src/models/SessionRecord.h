#ifndef SESSIONRECORD_H
#define SESSIONRECORD_H

#include <QDateTime>
#include <QString>

// A completed focus session as it is stored in the journal
struct SessionRecord {
    qint64 id = -1;           // Assigned by the store on insert
    QDateTime startTime;      // UTC, millisecond precision
    int durationMinutes = 0;
    QString tag;              // Null when the session had no tag
    QString notes;            // Null when no note was entered

    SessionRecord() = default;
};

#endif // SESSIONRECORD_H
