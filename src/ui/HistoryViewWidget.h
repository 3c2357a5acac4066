#ifndef HISTORYVIEWWIDGET_H
#define HISTORYVIEWWIDGET_H

#include <QWidget>

class QPushButton;
class QSpinBox;
class QTableWidget;
class SessionRepository;

class HistoryViewWidget : public QWidget {
    Q_OBJECT
public:
    HistoryViewWidget(SessionRepository& repository, int limit, QWidget *parent = nullptr);
    void refreshData();

private:
    void loadAndDisplayHistory();

    SessionRepository& m_repository;
    QTableWidget *m_sessionTable;
    QSpinBox *m_limitSpinBox;
    QPushButton *m_refreshButton;
};

#endif // HISTORYVIEWWIDGET_H
