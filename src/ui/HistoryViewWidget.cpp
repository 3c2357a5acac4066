#include "HistoryViewWidget.h"
#include "db/SessionRepository.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QPushButton>
#include <QSpinBox>
#include <QTableWidget>
#include <QHeaderView>
#include <QLabel>

HistoryViewWidget::HistoryViewWidget(SessionRepository& repository, int limit, QWidget *parent)
    : QWidget(parent), m_repository(repository) {
    QVBoxLayout *layout = new QVBoxLayout(this);

    QHBoxLayout *headerLayout = new QHBoxLayout();
    QLabel *titleLabel = new QLabel(tr("Session History"), this);
    QFont titleFont = titleLabel->font();
    titleFont.setPointSize(titleFont.pointSize() + 2);
    titleFont.setBold(true);
    titleLabel->setFont(titleFont);
    headerLayout->addWidget(titleLabel);
    headerLayout->addStretch();

    headerLayout->addWidget(new QLabel(tr("Last"), this));
    m_limitSpinBox = new QSpinBox(this);
    m_limitSpinBox->setRange(1, 1000);
    m_limitSpinBox->setValue(limit);
    connect(m_limitSpinBox, &QSpinBox::valueChanged, this, &HistoryViewWidget::loadAndDisplayHistory);
    headerLayout->addWidget(m_limitSpinBox);

    m_refreshButton = new QPushButton(tr("Refresh"), this);
    connect(m_refreshButton, &QPushButton::clicked, this, &HistoryViewWidget::loadAndDisplayHistory);
    headerLayout->addWidget(m_refreshButton);
    layout->addLayout(headerLayout);

    m_sessionTable = new QTableWidget(this);
    m_sessionTable->setColumnCount(4);
    m_sessionTable->setHorizontalHeaderLabels({tr("Date"), tr("Minutes"), tr("Tag"), tr("Notes")});
    m_sessionTable->horizontalHeader()->setStretchLastSection(true);
    m_sessionTable->verticalHeader()->setVisible(false);
    m_sessionTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_sessionTable->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_sessionTable->setAlternatingRowColors(true);
    layout->addWidget(m_sessionTable);

    setLayout(layout);
    loadAndDisplayHistory();
}

void HistoryViewWidget::refreshData() {
    loadAndDisplayHistory();
}

void HistoryViewWidget::loadAndDisplayHistory() {
    const QList<SessionRecord> sessions = m_repository.recentSessions(m_limitSpinBox->value());

    m_sessionTable->clearSpans();
    m_sessionTable->setRowCount(0);
    if (sessions.isEmpty()) {
        QTableWidgetItem *noDataItem = new QTableWidgetItem(tr("No sessions recorded yet."));
        noDataItem->setTextAlignment(Qt::AlignCenter);
        m_sessionTable->setRowCount(1);
        m_sessionTable->setItem(0, 0, noDataItem);
        m_sessionTable->setSpan(0, 0, 1, m_sessionTable->columnCount());
        return;
    }
    m_sessionTable->setRowCount(sessions.size());

    int row = 0;
    for (const auto& session : sessions) {
        const QDateTime localStart = session.startTime.toLocalTime();
        m_sessionTable->setItem(row, 0, new QTableWidgetItem(localStart.toString("yyyy-MM-dd hh:mm")));

        QTableWidgetItem *minutesItem = new QTableWidgetItem(QString::number(session.durationMinutes));
        minutesItem->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
        m_sessionTable->setItem(row, 1, minutesItem);

        m_sessionTable->setItem(row, 2, new QTableWidgetItem(session.tag));
        m_sessionTable->setItem(row, 3, new QTableWidgetItem(session.notes));
        row++;
    }
    m_sessionTable->resizeColumnsToContents();
    m_sessionTable->horizontalHeader()->setStretchLastSection(true);
}
