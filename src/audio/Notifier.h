#ifndef NOTIFIER_H
#define NOTIFIER_H

#include <QString>

// Audible cue at the end of a session. Implementations must not throw:
// a failure returns false and describes itself in *warning.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual bool play(QString *warning) = 0;
};

// Used when sound is switched off in the settings.
class SilentNotifier : public Notifier {
public:
    bool play(QString *) override { return true; }
};

#endif // NOTIFIER_H
