#include "NoteDialog.h"
#include <QVBoxLayout>
#include <QPlainTextEdit>
#include <QDialogButtonBox>
#include <QLabel>

NoteDialog::NoteDialog(int durationMinutes, const QString& tag, QWidget *parent) : QDialog(parent) {
    setWindowTitle(tr("Session Finished"));
    setModal(true);

    QVBoxLayout *layout = new QVBoxLayout(this);
    QString heading = tr("%1-minute block finished! What did you get done?").arg(durationMinutes);
    if (!tag.isEmpty()) {
        heading += QString(" [%1]").arg(tag);
    }
    layout->addWidget(new QLabel(heading, this));

    m_noteEdit = new QPlainTextEdit(this);
    m_noteEdit->setPlaceholderText(tr("Optional note"));
    layout->addWidget(m_noteEdit);

    m_errorLabel = new QLabel(this);
    m_errorLabel->setStyleSheet("color: red;");
    m_errorLabel->setWordWrap(true);
    m_errorLabel->hide();
    layout->addWidget(m_errorLabel);

    QDialogButtonBox *buttonBox = new QDialogButtonBox(QDialogButtonBox::Save | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttonBox);

    setLayout(layout);
}

void NoteDialog::setNote(const QString& note) {
    m_noteEdit->setPlainText(note);
}

QString NoteDialog::note() const {
    return m_noteEdit->toPlainText();
}

void NoteDialog::setErrorMessage(const QString& message) {
    m_errorLabel->setText(message);
    m_errorLabel->setVisible(!message.isEmpty());
}
