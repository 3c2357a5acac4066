#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "core/SessionController.h"

#include <QMainWindow>
#include <memory>

class QAction;
class QLabel;
class QLineEdit;
class QMenu;
class QPushButton;
class QSpinBox;
class Clock;
class Notifier;
class SessionRepository;
class HistoryViewWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    MainWindow(SessionRepository& repository, Notifier& notifier, Clock& clock, QWidget *parent = nullptr);
    ~MainWindow();

    void showStatusMessage(const QString& message, bool isError = false);

private slots:
    void startSession();
    void cancelSession();
    void promptForNote();
    void onStateChanged(SessionController::State state);
    void onTick(int remainingSeconds);
    void onNotificationWarning(const QString& message);

private:
    void createActions();
    void createMenus();
    void setupCentralWidget();
    void updateControls();
    static QString formatRemaining(int seconds);

    SessionRepository& m_repository;
    Notifier& m_notifier;
    Clock& m_clock;
    std::unique_ptr<SessionController> m_controller;
    QString m_pendingNote;

    QSpinBox *m_minutesSpinBox;
    QLineEdit *m_tagEdit;
    QPushButton *m_startButton;
    QPushButton *m_cancelButton;
    QPushButton *m_noteButton;
    QLabel *m_timeLabel;
    QLabel *m_statusLabel;
    HistoryViewWidget *m_historyWidget;

    QMenu *m_fileMenu;
    QMenu *m_helpMenu;
    QAction *m_exitAction;
    QAction *m_aboutAction;
};

#endif // MAINWINDOW_H
