#include "FakeClock.h"
#include "RecordingNotifier.h"
#include "core/SessionController.h"
#include "db/DatabaseManager.h"
#include "db/SessionRepository.h"

#include <QSignalSpy>
#include <QTemporaryDir>
#include <QtTest>
#include <memory>

using State = SessionController::State;

class TestSessionController : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void remainingRightAfterStart_data();
    void remainingRightAfterStart();
    void rejectsNonPositiveDuration_data();
    void rejectsNonPositiveDuration();
    void rejectsNonIntegerText_data();
    void rejectsNonIntegerText();
    void acceptsIntegerText();
    void secondStartFailsAndKeepsFirstTimer();
    void expiryThenNoteWritesOneRecord();
    void expiryNotifiesExactlyOnce();
    void cancelNeverPersists();
    void cancelOnlyWhileRunning();
    void submitNoteOnlyWhileAwaitingNote();
    void storageFailureKeepsSessionForRetry();
    void notifierFailureDoesNotBlockCompletion();
    void throwingNotifierDoesNotBlockCompletion();
    void unknownNotifierFailureDoesNotBlockCompletion();
    void emptyTagAndNoteAreStoredAsNull();
    void historyReturnsMostRecentFirst();
    void terminalControllerRejectsFurtherCalls();
    void stateChangesAreSignalled();
    void deepWorkScenario();

private:
    std::unique_ptr<SessionController> makeController();
    void expire(SessionController& controller);

    QTemporaryDir m_tempDir;
    int m_counter = 0;
    FakeClock m_clock;
    RecordingNotifier m_notifier;
    std::unique_ptr<DatabaseManager> m_db;
    std::unique_ptr<SessionRepository> m_repository;
};

void TestSessionController::initTestCase() {
    QVERIFY(m_tempDir.isValid());
}

void TestSessionController::init() {
    ++m_counter;
    m_clock = FakeClock();
    m_notifier = RecordingNotifier();
    m_db = std::make_unique<DatabaseManager>(QString("controller-%1").arg(m_counter));
    QVERIFY(m_db->connect(m_tempDir.filePath(QString("controller_%1.sqlite").arg(m_counter))));
    m_repository = std::make_unique<SessionRepository>(*m_db);
}

void TestSessionController::cleanup() {
    m_repository.reset();
    m_db.reset();
}

std::unique_ptr<SessionController> TestSessionController::makeController() {
    return std::make_unique<SessionController>(*m_repository, m_notifier, m_clock);
}

void TestSessionController::expire(SessionController& controller) {
    m_clock.advanceMinutes(controller.durationMinutes());
    controller.poll();
}

void TestSessionController::remainingRightAfterStart_data() {
    QTest::addColumn<int>("minutes");
    QTest::newRow("1") << 1;
    QTest::newRow("25") << 25;
    QTest::newRow("240") << 240;
}

void TestSessionController::remainingRightAfterStart() {
    QFETCH(int, minutes);
    SystemClock clock;
    SessionController controller(*m_repository, m_notifier, clock);

    QVERIFY(controller.start(minutes, "focus").ok());
    const qint64 full = qint64(minutes) * 60 * 1000;
    const qint64 left = controller.remaining().count();
    QVERIFY(left <= full);
    QVERIFY(left > full - 1000);
    QCOMPARE(controller.state(), State::Running);
}

void TestSessionController::rejectsNonPositiveDuration_data() {
    QTest::addColumn<int>("minutes");
    QTest::newRow("zero") << 0;
    QTest::newRow("negative") << -5;
}

void TestSessionController::rejectsNonPositiveDuration() {
    QFETCH(int, minutes);
    auto controller = makeController();
    QSignalSpy stateSpy(controller.get(), &SessionController::stateChanged);

    const Result result = controller->start(minutes, "tag");
    QCOMPARE(result.error, SessionError::InvalidDuration);
    QVERIFY(!result.message.isEmpty());
    QCOMPARE(controller->state(), State::Configuring);
    QCOMPARE(stateSpy.count(), 0);

    // The rejected request leaves the controller usable.
    QVERIFY(controller->start(5, "tag").ok());
    QCOMPARE(controller->state(), State::Running);
}

void TestSessionController::rejectsNonIntegerText_data() {
    QTest::addColumn<QString>("text");
    QTest::newRow("fraction") << "2.5";
    QTest::newRow("word") << "abc";
    QTest::newRow("empty") << "";
    QTest::newRow("unit") << "25min";
}

void TestSessionController::rejectsNonIntegerText() {
    QFETCH(QString, text);
    auto controller = makeController();

    QCOMPARE(controller->start(text, QString()).error, SessionError::InvalidDuration);
    QCOMPARE(controller->state(), State::Configuring);
}

void TestSessionController::acceptsIntegerText() {
    auto controller = makeController();

    QCOMPARE(controller->start(QString("-1"), QString()).error, SessionError::InvalidDuration);
    QVERIFY(controller->start(QString(" 15 "), QString("reading")).ok());
    QCOMPARE(controller->durationMinutes(), 15);
    QCOMPARE(controller->tag(), QString("reading"));
}

void TestSessionController::secondStartFailsAndKeepsFirstTimer() {
    auto controller = makeController();
    QVERIFY(controller->start(10, "first").ok());
    m_clock.advanceMinutes(1);

    const Result second = controller->start(5, "second");
    QCOMPARE(second.error, SessionError::InvalidState);
    QCOMPARE(controller->state(), State::Running);
    QCOMPARE(controller->durationMinutes(), 10);
    QCOMPARE(controller->tag(), QString("first"));
    QCOMPARE(qint64(controller->remaining().count()), qint64(9) * 60 * 1000);

    // Still not due after the rejected five-minute session would have ended.
    m_clock.advanceMinutes(5);
    controller->poll();
    QCOMPARE(controller->state(), State::Running);
}

void TestSessionController::expiryThenNoteWritesOneRecord() {
    auto controller = makeController();
    QVERIFY(controller->start(30, "writing").ok());
    const QDateTime startedAt = controller->startTime();

    expire(*controller);
    QCOMPARE(controller->state(), State::AwaitingNote);
    QCOMPARE(qint64(controller->remaining().count()), qint64(0));

    // Time spent on the note does not change the record.
    m_clock.advanceMinutes(7);
    QVERIFY(controller->submitNote("did X").ok());
    QCOMPARE(controller->state(), State::Completed);
    QVERIFY(controller->recordId().has_value());

    const QList<SessionRecord> sessions = m_repository->recentSessions(10);
    QCOMPARE(sessions.size(), 1);
    QCOMPARE(sessions.at(0).id, *controller->recordId());
    QCOMPARE(sessions.at(0).durationMinutes, 30);
    QCOMPARE(sessions.at(0).tag, QString("writing"));
    QCOMPARE(sessions.at(0).notes, QString("did X"));
    QCOMPARE(sessions.at(0).startTime, startedAt);
}

void TestSessionController::expiryNotifiesExactlyOnce() {
    auto controller = makeController();
    QSignalSpy stateSpy(controller.get(), &SessionController::stateChanged);
    QVERIFY(controller->start(1).ok());

    m_clock.advanceSeconds(59);
    controller->poll();
    QCOMPARE(controller->state(), State::Running);
    QCOMPARE(m_notifier.playCount(), 0);

    m_clock.advanceSeconds(1);
    controller->poll();
    controller->poll();
    m_clock.advanceMinutes(3);
    controller->poll();

    QCOMPARE(m_notifier.playCount(), 1);
    QCOMPARE(controller->state(), State::AwaitingNote);
    QCOMPARE(stateSpy.count(), 2); // Running, AwaitingNote
}

void TestSessionController::cancelNeverPersists() {
    auto controller = makeController();
    QVERIFY(controller->start(20, "meeting prep").ok());
    m_clock.advanceMinutes(4);

    QVERIFY(controller->cancel().ok());
    QCOMPARE(controller->state(), State::Cancelled);
    QCOMPARE(qint64(controller->remaining().count()), qint64(0));

    // No stale expiry after the deadline passes.
    m_clock.advanceMinutes(30);
    controller->poll();
    QCOMPARE(controller->state(), State::Cancelled);
    QCOMPARE(m_notifier.playCount(), 0);

    QCOMPARE(controller->submitNote("should not land").error, SessionError::InvalidState);
    QCOMPARE(m_repository->sessionCount(), 0);
    QVERIFY(controller->history(10).isEmpty());
}

void TestSessionController::cancelOnlyWhileRunning() {
    auto controller = makeController();
    QCOMPARE(controller->cancel().error, SessionError::InvalidState);
    QCOMPARE(controller->state(), State::Configuring);

    QVERIFY(controller->start(1).ok());
    expire(*controller);
    QCOMPARE(controller->cancel().error, SessionError::InvalidState);
    QCOMPARE(controller->state(), State::AwaitingNote);
}

void TestSessionController::submitNoteOnlyWhileAwaitingNote() {
    auto controller = makeController();
    QCOMPARE(controller->submitNote("early").error, SessionError::InvalidState);

    QVERIFY(controller->start(5).ok());
    QCOMPARE(controller->submitNote("too early").error, SessionError::InvalidState);
    QCOMPARE(controller->state(), State::Running);
    QCOMPARE(m_repository->sessionCount(), 0);
}

void TestSessionController::storageFailureKeepsSessionForRetry() {
    auto controller = makeController();
    QVERIFY(controller->start(45, "refactor").ok());
    expire(*controller);

    QVERIFY(m_db->executeQuery("PRAGMA query_only = ON"));
    const Result failed = controller->submitNote("split the parser");
    QCOMPARE(failed.error, SessionError::Storage);
    QVERIFY(!failed.message.isEmpty());
    QCOMPARE(controller->state(), State::AwaitingNote);
    QVERIFY(!controller->recordId().has_value());
    QCOMPARE(m_repository->sessionCount(), 0);

    QVERIFY(m_db->executeQuery("PRAGMA query_only = OFF"));
    QVERIFY(controller->submitNote("split the parser").ok());
    QCOMPARE(controller->state(), State::Completed);

    // A further submission cannot produce a duplicate.
    QCOMPARE(controller->submitNote("split the parser").error, SessionError::InvalidState);
    const QList<SessionRecord> sessions = m_repository->recentSessions(10);
    QCOMPARE(sessions.size(), 1);
    QCOMPARE(sessions.at(0).durationMinutes, 45);
    QCOMPARE(sessions.at(0).tag, QString("refactor"));
    QCOMPARE(sessions.at(0).notes, QString("split the parser"));
}

void TestSessionController::notifierFailureDoesNotBlockCompletion() {
    m_notifier.setMode(RecordingNotifier::Mode::Fail);
    auto controller = makeController();
    QSignalSpy warningSpy(controller.get(), &SessionController::notificationWarning);

    QVERIFY(controller->start(2).ok());
    expire(*controller);

    QCOMPARE(m_notifier.playCount(), 1);
    QCOMPARE(warningSpy.count(), 1);
    QCOMPARE(warningSpy.at(0).at(0).toString(), QString("no audio device"));
    QCOMPARE(controller->state(), State::AwaitingNote);
    QVERIFY(controller->submitNote("quiet finish").ok());
    QCOMPARE(m_repository->sessionCount(), 1);
}

void TestSessionController::throwingNotifierDoesNotBlockCompletion() {
    m_notifier.setMode(RecordingNotifier::Mode::Throw);
    auto controller = makeController();
    QSignalSpy warningSpy(controller.get(), &SessionController::notificationWarning);

    QVERIFY(controller->start(2).ok());
    expire(*controller);

    QCOMPARE(warningSpy.count(), 1);
    QCOMPARE(warningSpy.at(0).at(0).toString(), QString("audio backend crashed"));
    QCOMPARE(controller->state(), State::AwaitingNote);
    QVERIFY(controller->submitNote(QString()).ok());
    QCOMPARE(m_repository->sessionCount(), 1);
}

void TestSessionController::unknownNotifierFailureDoesNotBlockCompletion() {
    m_notifier.setMode(RecordingNotifier::Mode::ThrowUnknown);
    auto controller = makeController();
    QSignalSpy warningSpy(controller.get(), &SessionController::notificationWarning);

    QVERIFY(controller->start(1).ok());
    expire(*controller);

    QCOMPARE(m_notifier.playCount(), 1);
    QCOMPARE(warningSpy.count(), 1);
    QCOMPARE(warningSpy.at(0).at(0).toString(), QString("The notifier failed with an unknown error."));
    QCOMPARE(controller->state(), State::AwaitingNote);
    QVERIFY(controller->submitNote("kept going").ok());
    QCOMPARE(m_repository->sessionCount(), 1);
}

void TestSessionController::emptyTagAndNoteAreStoredAsNull() {
    auto controller = makeController();
    QVERIFY(controller->start(10, "   ").ok());
    QVERIFY(controller->tag().isNull());
    expire(*controller);
    QVERIFY(controller->submitNote("  \n ").ok());

    const SessionRecord stored = m_repository->recentSessions(1).constFirst();
    QVERIFY(stored.tag.isNull());
    QVERIFY(stored.notes.isNull());
}

void TestSessionController::historyReturnsMostRecentFirst() {
    const QStringList tags = {"t1", "t2", "t3", "t4"};
    for (const QString& tag : tags) {
        auto controller = makeController();
        QVERIFY(controller->start(5, tag).ok());
        expire(*controller);
        QVERIFY(controller->submitNote(tag + " note").ok());
        m_clock.advanceMinutes(1);
    }

    auto controller = makeController();
    const QList<SessionRecord> history = controller->history(3);
    QCOMPARE(history.size(), 3);
    QCOMPARE(history.at(0).tag, QString("t4"));
    QCOMPARE(history.at(1).tag, QString("t3"));
    QCOMPARE(history.at(2).tag, QString("t2"));
    QVERIFY(history.at(0).startTime > history.at(1).startTime);
    QVERIFY(history.at(1).startTime > history.at(2).startTime);
}

void TestSessionController::terminalControllerRejectsFurtherCalls() {
    auto completed = makeController();
    QVERIFY(completed->start(1).ok());
    expire(*completed);
    QVERIFY(completed->submitNote("done").ok());
    QCOMPARE(completed->start(1).error, SessionError::InvalidState);
    QCOMPARE(completed->cancel().error, SessionError::InvalidState);
    QCOMPARE(completed->submitNote("again").error, SessionError::InvalidState);
    QCOMPARE(completed->state(), State::Completed);

    auto cancelled = makeController();
    QVERIFY(cancelled->start(1).ok());
    QVERIFY(cancelled->cancel().ok());
    QCOMPARE(cancelled->start(QString("3"), QString()).error, SessionError::InvalidState);
    QCOMPARE(cancelled->cancel().error, SessionError::InvalidState);
    QCOMPARE(cancelled->state(), State::Cancelled);

    QCOMPARE(m_repository->sessionCount(), 1);
}

void TestSessionController::stateChangesAreSignalled() {
    auto controller = makeController();
    QSignalSpy stateSpy(controller.get(), &SessionController::stateChanged);

    QVERIFY(controller->start(1, "signals").ok());
    expire(*controller);
    QVERIFY(controller->submitNote("ok").ok());

    QCOMPARE(stateSpy.count(), 3);
    QCOMPARE(stateSpy.at(0).at(0).value<SessionController::State>(), State::Running);
    QCOMPARE(stateSpy.at(1).at(0).value<SessionController::State>(), State::AwaitingNote);
    QCOMPARE(stateSpy.at(2).at(0).value<SessionController::State>(), State::Completed);
}

void TestSessionController::deepWorkScenario() {
    auto controller = makeController();
    QVERIFY(controller->start(25, "deep-work").ok());

    m_clock.advanceMinutes(12);
    controller->poll();
    QCOMPARE(controller->remainingSeconds(), 13 * 60);
    QCOMPARE(m_notifier.playCount(), 0);

    m_clock.advanceMinutes(13);
    controller->poll();
    QCOMPARE(m_notifier.playCount(), 1);
    QCOMPARE(controller->state(), State::AwaitingNote);

    QVERIFY(controller->submitNote("shipped feature").ok());
    QCOMPARE(m_notifier.playCount(), 1);

    const QList<SessionRecord> sessions = m_repository->recentSessions(10);
    QCOMPARE(sessions.size(), 1);
    QCOMPARE(sessions.at(0).durationMinutes, 25);
    QCOMPARE(sessions.at(0).tag, QString("deep-work"));
    QCOMPARE(sessions.at(0).notes, QString("shipped feature"));
}

QTEST_GUILESS_MAIN(TestSessionController)
#include "tst_sessioncontroller.moc"
