#include "MainWindow.h"
#include "HistoryViewWidget.h"
#include "NoteDialog.h"
#include "app/SettingsManager.h"
#include "core/Clock.h"
#include "db/DatabaseManager.h"

#include <QAction>
#include <QDateTime>
#include <QDebug>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QTimer>
#include <QVBoxLayout>

MainWindow::MainWindow(SessionRepository& repository, Notifier& notifier, Clock& clock, QWidget *parent)
    : QMainWindow(parent), m_repository(repository), m_notifier(notifier), m_clock(clock) {
    setWindowTitle("Focus Timer");
    setMinimumSize(520, 480);

    createActions();
    createMenus();
    setupCentralWidget();
    updateControls();
}

MainWindow::~MainWindow() {}

void MainWindow::setupCentralWidget() {
    QWidget *central = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout(central);

    QFormLayout *form = new QFormLayout();
    m_minutesSpinBox = new QSpinBox(central);
    m_minutesSpinBox->setRange(1, 24 * 60);
    m_minutesSpinBox->setSuffix(tr(" min"));
    m_minutesSpinBox->setValue(SettingsManager::instance().getDefaultMinutes());
    form->addRow(tr("Duration:"), m_minutesSpinBox);

    m_tagEdit = new QLineEdit(central);
    m_tagEdit->setPlaceholderText(tr("optional, e.g. deep-work"));
    m_tagEdit->setText(SettingsManager::instance().getLastTag());
    form->addRow(tr("Tag:"), m_tagEdit);
    layout->addLayout(form);

    m_timeLabel = new QLabel(formatRemaining(m_minutesSpinBox->value() * 60), central);
    QFont timeFont = m_timeLabel->font();
    timeFont.setPointSize(timeFont.pointSize() * 3);
    timeFont.setBold(true);
    m_timeLabel->setFont(timeFont);
    m_timeLabel->setAlignment(Qt::AlignCenter);
    layout->addWidget(m_timeLabel);

    QHBoxLayout *buttonLayout = new QHBoxLayout();
    m_startButton = new QPushButton(tr("Start"), central);
    connect(m_startButton, &QPushButton::clicked, this, &MainWindow::startSession);
    buttonLayout->addWidget(m_startButton);

    m_cancelButton = new QPushButton(tr("Cancel"), central);
    connect(m_cancelButton, &QPushButton::clicked, this, &MainWindow::cancelSession);
    buttonLayout->addWidget(m_cancelButton);

    m_noteButton = new QPushButton(tr("Save Note..."), central);
    connect(m_noteButton, &QPushButton::clicked, this, &MainWindow::promptForNote);
    buttonLayout->addWidget(m_noteButton);
    layout->addLayout(buttonLayout);

    m_statusLabel = new QLabel(central);
    m_statusLabel->setWordWrap(true);
    layout->addWidget(m_statusLabel);

    m_historyWidget = new HistoryViewWidget(m_repository, SettingsManager::instance().getHistoryLimit(), central);
    layout->addWidget(m_historyWidget, 1);

    setCentralWidget(central);
}

void MainWindow::createActions() {
    m_exitAction = new QAction(tr("E&xit"), this);
    connect(m_exitAction, &QAction::triggered, this, &QWidget::close);

    m_aboutAction = new QAction(tr("&About"), this);
    connect(m_aboutAction, &QAction::triggered, this, [this]() {
        QMessageBox::about(this, tr("About"), tr("Focus Timer\nTimed focus sessions with a journal."));
    });
}

void MainWindow::createMenus() {
    m_fileMenu = menuBar()->addMenu(tr("&File"));
    m_fileMenu->addAction(m_exitAction);

    m_helpMenu = menuBar()->addMenu(tr("&Help"));
    m_helpMenu->addAction(m_aboutAction);
}

void MainWindow::showStatusMessage(const QString& message, bool isError) {
    m_statusLabel->setStyleSheet(isError ? "color: red;" : QString());
    m_statusLabel->setText(message);
}

void MainWindow::startSession() {
    if (!m_controller || m_controller->isFinished()) {
        m_controller = std::make_unique<SessionController>(m_repository, m_notifier, m_clock);
        connect(m_controller.get(), &SessionController::stateChanged, this, &MainWindow::onStateChanged);
        connect(m_controller.get(), &SessionController::tick, this, &MainWindow::onTick);
        connect(m_controller.get(), &SessionController::notificationWarning, this,
                &MainWindow::onNotificationWarning);
        m_pendingNote.clear();
    }

    const int minutes = m_minutesSpinBox->value();
    const QString tag = m_tagEdit->text();
    const Result result = m_controller->start(minutes, tag);
    if (!result.ok()) {
        showStatusMessage(result.message, true);
        return;
    }

    SettingsManager::instance().setDefaultMinutes(minutes);
    SettingsManager::instance().setLastTag(tag.trimmed());

    const QString ends = m_clock.wallNow().toLocalTime().addSecs(qint64(minutes) * 60).toString("hh:mm:ss");
    QString message = tr("%1-minute focus started").arg(minutes);
    if (!m_controller->tag().isEmpty()) {
        message += QString(" [tag: %1]").arg(m_controller->tag());
    }
    showStatusMessage(message + tr(", ends at %1").arg(ends));
}

void MainWindow::cancelSession() {
    if (!m_controller) return;
    const Result result = m_controller->cancel();
    if (!result.ok()) {
        showStatusMessage(result.message, true);
        return;
    }
    showStatusMessage(tr("Session cancelled."));
}

void MainWindow::promptForNote() {
    if (!m_controller || m_controller->state() != SessionController::State::AwaitingNote) return;

    NoteDialog dialog(m_controller->durationMinutes(), m_controller->tag(), this);
    dialog.setNote(m_pendingNote);
    while (dialog.exec() == QDialog::Accepted) {
        m_pendingNote = dialog.note();

        DatabaseManager& dbm = DatabaseManager::instance();
        if (!dbm.isConnected() && !dbm.connect(SettingsManager::instance().getDatabaseName())) {
            qWarning() << "MainWindow: Reconnecting to the session journal failed:" << dbm.lastError();
        }

        const Result result = m_controller->submitNote(m_pendingNote);
        if (result.ok()) {
            m_pendingNote.clear();
            showStatusMessage(tr("Saved. Keep it up!"));
            m_historyWidget->refreshData();
            return;
        }
        // The session is kept; let the user try again or come back later.
        dialog.setErrorMessage(result.message);
        showStatusMessage(result.message, true);
    }
    showStatusMessage(tr("Session finished. The note has not been saved yet."));
}

void MainWindow::onStateChanged(SessionController::State state) {
    updateControls();
    if (state == SessionController::State::AwaitingNote) {
        // Open the dialog after the expiry handling has returned.
        QTimer::singleShot(0, this, &MainWindow::promptForNote);
    }
}

void MainWindow::onTick(int remainingSeconds) {
    m_timeLabel->setText(formatRemaining(remainingSeconds));
}

void MainWindow::onNotificationWarning(const QString& message) {
    showStatusMessage(tr("Warning: %1").arg(message), true);
}

void MainWindow::updateControls() {
    const SessionController::State state =
        m_controller ? m_controller->state() : SessionController::State::Configuring;
    const bool configuring = !m_controller || m_controller->isFinished() ||
                             state == SessionController::State::Configuring;

    m_startButton->setEnabled(configuring);
    m_minutesSpinBox->setEnabled(configuring);
    m_tagEdit->setEnabled(configuring);
    m_cancelButton->setEnabled(state == SessionController::State::Running);
    m_noteButton->setEnabled(state == SessionController::State::AwaitingNote);
    if (configuring) {
        m_timeLabel->setText(formatRemaining(m_minutesSpinBox->value() * 60));
    }
}

QString MainWindow::formatRemaining(int seconds) {
    const int m = seconds / 60;
    const int s = seconds % 60;
    return QString("%1:%2").arg(m, 2, 10, QChar('0')).arg(s, 2, 10, QChar('0'));
}
