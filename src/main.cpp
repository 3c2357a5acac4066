#include "app/Application.h"
#include "app/SettingsManager.h"
#include "audio/Notifier.h"
#include "audio/SoundNotifier.h"
#include "core/Clock.h"
#include "db/DatabaseManager.h"
#include "db/SessionRepository.h"
#include "ui/MainWindow.h"

#include <QDebug>
#include <memory>

int main(int argc, char *argv[]) {
    Application app(argc, argv);

    SystemClock clock;
    SessionRepository repository(DatabaseManager::instance());

    SettingsManager& settings = SettingsManager::instance();
    std::unique_ptr<Notifier> notifier;
    QString soundWarning;
    if (settings.isSoundEnabled()) {
        auto soundNotifier = std::make_unique<SoundNotifier>(settings.getSoundPath(), settings.getSoundVolume());
        if (!soundNotifier->hasAsset()) {
            soundWarning = QObject::tr("Sound file %1 not found, the system beep will be used.")
                               .arg(soundNotifier->soundPath());
            qWarning() << "main:" << soundWarning;
        }
        notifier = std::move(soundNotifier);
    } else {
        notifier = std::make_unique<SilentNotifier>();
    }

    MainWindow w(repository, *notifier, clock);
    if (auto *soundNotifier = dynamic_cast<SoundNotifier *>(notifier.get())) {
        QObject::connect(soundNotifier, &SoundNotifier::playbackFailed, &w,
                         [&w](const QString& message) { w.showStatusMessage(message, true); });
    }
    if (!app.isStorageReady()) {
        w.showStatusMessage(QObject::tr("The session journal could not be opened: %1")
                                .arg(DatabaseManager::instance().lastError()), true);
    } else if (!soundWarning.isEmpty()) {
        w.showStatusMessage(soundWarning, true);
    }
    w.show();

    return app.exec();
}
