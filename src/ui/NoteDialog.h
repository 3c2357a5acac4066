#ifndef NOTEDIALOG_H
#define NOTEDIALOG_H

#include <QDialog>

class QPlainTextEdit;
class QLabel;

class NoteDialog : public QDialog {
    Q_OBJECT

public:
    NoteDialog(int durationMinutes, const QString& tag, QWidget *parent = nullptr);

    void setNote(const QString& note);
    QString note() const;
    void setErrorMessage(const QString& message);

private:
    QPlainTextEdit *m_noteEdit;
    QLabel *m_errorLabel;
};

#endif // NOTEDIALOG_H
