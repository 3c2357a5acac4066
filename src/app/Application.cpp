#include "Application.h"
#include "app/SettingsManager.h"
#include "db/DatabaseManager.h"
#include <QDebug>

Application::Application(int &argc, char **argv) : QApplication(argc, argv), m_storageReady(false) {
    QApplication::setApplicationName("FocusTimer");
    QApplication::setOrganizationName("FocusTimer");
    qInfo() << "Application: Name set to" << QApplication::applicationName();

    SettingsManager::instance().loadSettings();

    const QString dbName = SettingsManager::instance().getDatabaseName();
    m_storageReady = DatabaseManager::instance().connect(dbName);
    if (!m_storageReady) {
        // Sessions can still be timed; saving reports the storage error so the
        // note can be retried once the problem is fixed.
        qCritical() << "Application: CRITICAL FAILURE: Failed to open the session journal" << dbName;
    } else {
        qInfo() << "Application: Session journal ready at" << DatabaseManager::instance().databasePath();
    }
}

Application::~Application() {
    qInfo() << "Application: Destructor called. Saving settings and disconnecting DB.";
    DatabaseManager::instance().disconnect();
    SettingsManager::instance().saveSettings();
}

bool Application::isStorageReady() const {
    return m_storageReady;
}
