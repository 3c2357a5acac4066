#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QSettings>
#include <QString>
#include <QVariant>

class SettingsManager {
public:
    static SettingsManager& instance();

    void setSetting(const QString& key, const QVariant& value);
    QVariant getSetting(const QString& key, const QVariant& defaultValue = QVariant()) const;

    QString getDatabaseName() const;

    QString getSoundPath() const;
    bool isSoundEnabled() const;
    float getSoundVolume() const;

    int getDefaultMinutes() const;
    void setDefaultMinutes(int minutes);
    QString getLastTag() const;
    void setLastTag(const QString& tag);

    int getHistoryLimit() const;

    void loadSettings();
    void saveSettings();

private:
    SettingsManager();
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    QSettings m_settings;
};

#endif // SETTINGSMANAGER_H
