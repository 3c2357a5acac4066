#include "SettingsManager.h"
#include <QDebug>

namespace {
const char *const kDatabaseNameKey = "storage/database_name";
const char *const kSoundPathKey = "notifier/sound_path";
const char *const kSoundEnabledKey = "notifier/enabled";
const char *const kSoundVolumeKey = "notifier/volume";
const char *const kDefaultMinutesKey = "session/default_minutes";
const char *const kLastTagKey = "session/last_tag";
const char *const kHistoryLimitKey = "history/limit";
} // namespace

SettingsManager& SettingsManager::instance() {
    static SettingsManager inst;
    return inst;
}

SettingsManager::SettingsManager() : m_settings("FocusTimer", "FocusTimer") {}

void SettingsManager::setSetting(const QString& key, const QVariant& value) {
    qDebug("Setting %s to %s", qUtf8Printable(key), qUtf8Printable(value.toString()));
    m_settings.setValue(key, value);
}

QVariant SettingsManager::getSetting(const QString& key, const QVariant& defaultValue) const {
    return m_settings.value(key, defaultValue);
}

QString SettingsManager::getDatabaseName() const {
    return getSetting(kDatabaseNameKey, "focus.sqlite").toString();
}

QString SettingsManager::getSoundPath() const {
    return getSetting(kSoundPathKey, "alarm.wav").toString();
}

bool SettingsManager::isSoundEnabled() const {
    return getSetting(kSoundEnabledKey, true).toBool();
}

float SettingsManager::getSoundVolume() const {
    const float volume = getSetting(kSoundVolumeKey, 1.0).toFloat();
    return qBound(0.0f, volume, 1.0f);
}

int SettingsManager::getDefaultMinutes() const {
    const int minutes = getSetting(kDefaultMinutesKey, 25).toInt();
    return minutes > 0 ? minutes : 25;
}

void SettingsManager::setDefaultMinutes(int minutes) {
    setSetting(kDefaultMinutesKey, minutes);
}

QString SettingsManager::getLastTag() const {
    return getSetting(kLastTagKey, QString()).toString();
}

void SettingsManager::setLastTag(const QString& tag) {
    setSetting(kLastTagKey, tag);
}

int SettingsManager::getHistoryLimit() const {
    const int limit = getSetting(kHistoryLimitKey, 10).toInt();
    return limit > 0 ? limit : 10;
}

void SettingsManager::loadSettings() {
    m_settings.sync();
    qInfo() << "SettingsManager: Loaded settings from" << m_settings.fileName();
}

void SettingsManager::saveSettings() {
    m_settings.sync();
    if (m_settings.status() != QSettings::NoError) {
        qWarning() << "SettingsManager: Could not write settings to" << m_settings.fileName();
    }
}
