#include "SoundNotifier.h"

#include <QApplication>
#include <QAudioOutput>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QUrl>

SoundNotifier::SoundNotifier(const QString& soundPath, float volume, QObject *parent)
    : QObject(parent), m_soundPath(resolveSoundPath(soundPath, QCoreApplication::applicationDirPath())) {
    m_player = new QMediaPlayer(this);
    m_audioOutput = new QAudioOutput(this);
    m_player->setAudioOutput(m_audioOutput);
    m_audioOutput->setVolume(volume);
    connect(m_player, &QMediaPlayer::errorOccurred, this, &SoundNotifier::onPlayerError);
}

QString SoundNotifier::resolveSoundPath(const QString& soundPath, const QString& baseDir) {
    if (soundPath.isEmpty()) {
        return soundPath;
    }
    QString path = soundPath;
    if (path == "~" || path.startsWith("~/")) {
        path = QDir::homePath() + path.mid(1);
    }
    if (QDir::isAbsolutePath(path)) {
        return QDir::cleanPath(path);
    }
    return QDir::cleanPath(QDir(baseDir).absoluteFilePath(path));
}

bool SoundNotifier::hasAsset() const {
    QFileInfo checkFile(m_soundPath);
    return checkFile.exists() && checkFile.isFile();
}

QString SoundNotifier::soundPath() const {
    return m_soundPath;
}

bool SoundNotifier::play(QString *warning) {
    if (!hasAsset()) {
        QApplication::beep();
        if (warning) {
            *warning = tr("Sound file %1 not found, used the system beep instead.").arg(m_soundPath);
        }
        return false;
    }

    m_player->stop(); // Stop any currently playing sound
    m_player->setSource(QUrl::fromLocalFile(m_soundPath));
    m_player->play();
    qInfo() << "SoundNotifier: Playing" << m_soundPath;
    return true;
}

void SoundNotifier::onPlayerError(QMediaPlayer::Error error, const QString& errorString) {
    if (error == QMediaPlayer::NoError) return;
    qWarning() << "SoundNotifier: Playback of" << m_soundPath << "failed:" << errorString;
    QApplication::beep();
    emit playbackFailed(tr("Could not play %1: %2").arg(m_soundPath, errorString));
}
