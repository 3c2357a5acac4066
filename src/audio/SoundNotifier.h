#ifndef SOUNDNOTIFIER_H
#define SOUNDNOTIFIER_H

#include "audio/Notifier.h"

#include <QObject>
#include <QMediaPlayer>

class QAudioOutput;

// Plays a local audio file when a session ends. Falls back to the system
// beep when the file is missing or the player reports an error.
class SoundNotifier : public QObject, public Notifier {
    Q_OBJECT
public:
    // A relative soundPath is looked up next to the executable.
    explicit SoundNotifier(const QString& soundPath, float volume = 1.0f, QObject *parent = nullptr);

    static QString resolveSoundPath(const QString& soundPath, const QString& baseDir);

    bool play(QString *warning) override;
    bool hasAsset() const;
    QString soundPath() const;

signals:
    // Playback errors arrive asynchronously, after play() returned.
    void playbackFailed(const QString& message);

private slots:
    void onPlayerError(QMediaPlayer::Error error, const QString& errorString);

private:
    QString m_soundPath;
    QMediaPlayer *m_player;
    QAudioOutput *m_audioOutput;
};

#endif // SOUNDNOTIFIER_H
