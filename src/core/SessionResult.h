#ifndef SESSIONRESULT_H
#define SESSIONRESULT_H

#include <QString>

enum class SessionError {
    None,
    InvalidDuration, // Non-positive or non-integer duration
    InvalidState,    // Operation not allowed in the current state
    Storage          // The journal could not be written
};

// Outcome of a controller operation. Failed operations never change state,
// except that a storage failure leaves the session waiting for a retry.
struct Result {
    SessionError error = SessionError::None;
    QString message;

    bool ok() const { return error == SessionError::None; }

    static Result success() { return Result(); }
    static Result failure(SessionError code, const QString& text) {
        Result r;
        r.error = code;
        r.message = text;
        return r;
    }
};

#endif // SESSIONRESULT_H
