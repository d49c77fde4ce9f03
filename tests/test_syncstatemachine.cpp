/**
 * @file test_syncstatemachine.cpp
 * @brief Unit tests for SyncStateMachine and the phase weight table
 */

#include <QtTest/QtTest>
#include "sync/syncstatemachine.h"

using namespace PhoneSync;

class TestSyncStateMachine : public QObject
{
    Q_OBJECT

private slots:
    // ========== Lifecycle Tests ==========
    void testDefaultState();
    void testBeginClaimsRun();
    void testBeginRejectedWhileRunning();
    void testFinishReleasesRun();

    // ========== Transition Tests ==========
    void testFullPipelineTransitions();
    void testDecryptingSkipped();
    void testInvalidTransitionRejected();
    void testErrorReachableFromAnyActivePhase();
    void testCompleteFromWrongPhaseEndsInError();

    // ========== Cancel / Reset Tests ==========
    void testCancelFlag();
    void testResetInvalidatesRun();

    // ========== Phase Names / Weights ==========
    void testPhaseNames();
    void testPhaseFromName();
    void testDefaultWeights();
    void testOverallProgress();
};

// ========== Lifecycle Tests ==========

void TestSyncStateMachine::testDefaultState()
{
    SyncStateMachine state;
    QVERIFY(!state.isRunning());
    QVERIFY(!state.isCancelled());
    QCOMPARE(state.phase(), SyncPhase::Idle);
}

void TestSyncStateMachine::testBeginClaimsRun()
{
    SyncStateMachine state;
    quint64 runId = 0;
    QVERIFY(state.begin(&runId));
    QVERIFY(state.isRunning());
    QCOMPARE(runId, state.currentRunId());
}

void TestSyncStateMachine::testBeginRejectedWhileRunning()
{
    SyncStateMachine state;
    quint64 first = 0;
    QVERIFY(state.begin(&first));
    QVERIFY(state.transitionTo(SyncPhase::Backup, first));

    QVERIFY(!state.begin());
    QCOMPARE(state.phase(), SyncPhase::Backup);
    QCOMPARE(state.currentRunId(), first);
}

void TestSyncStateMachine::testFinishReleasesRun()
{
    SyncStateMachine state;
    quint64 runId = 0;
    QVERIFY(state.begin(&runId));
    state.finish(SyncPhase::Error, runId);

    QVERIFY(!state.isRunning());
    QCOMPARE(state.phase(), SyncPhase::Error);
    QVERIFY(state.begin());
    QCOMPARE(state.phase(), SyncPhase::Idle);
}

// ========== Transition Tests ==========

void TestSyncStateMachine::testFullPipelineTransitions()
{
    SyncStateMachine state;
    quint64 runId = 0;
    QVERIFY(state.begin(&runId));

    const QList<SyncPhase> phases = {
        SyncPhase::Backup, SyncPhase::Decrypting, SyncPhase::ParsingContacts,
        SyncPhase::ParsingMessages, SyncPhase::Resolving, SyncPhase::Cleanup
    };
    for (SyncPhase phase : phases) {
        QVERIFY2(state.transitionTo(phase, runId), qPrintable(phaseName(phase)));
        QCOMPARE(state.phase(), phase);
    }

    state.finish(SyncPhase::Complete, runId);
    QCOMPARE(state.phase(), SyncPhase::Complete);
    QVERIFY(!state.isRunning());
}

void TestSyncStateMachine::testDecryptingSkipped()
{
    QVERIFY(SyncStateMachine::isTransitionAllowed(SyncPhase::Backup, SyncPhase::ParsingContacts));
    QVERIFY(SyncStateMachine::isTransitionAllowed(SyncPhase::Idle, SyncPhase::ParsingContacts));
}

void TestSyncStateMachine::testInvalidTransitionRejected()
{
    SyncStateMachine state;
    quint64 runId = 0;
    QVERIFY(state.begin(&runId));
    QVERIFY(state.transitionTo(SyncPhase::Backup, runId));

    QVERIFY(!state.transitionTo(SyncPhase::Resolving, runId));
    QCOMPARE(state.phase(), SyncPhase::Backup);

    QVERIFY(!SyncStateMachine::isTransitionAllowed(SyncPhase::ParsingMessages, SyncPhase::Backup));
    QVERIFY(!SyncStateMachine::isTransitionAllowed(SyncPhase::Complete, SyncPhase::Backup));
    QVERIFY(SyncStateMachine::allowedTransitions(SyncPhase::Error).isEmpty());
}

void TestSyncStateMachine::testErrorReachableFromAnyActivePhase()
{
    const QList<SyncPhase> active = {
        SyncPhase::Idle, SyncPhase::Backup, SyncPhase::Decrypting, SyncPhase::ParsingContacts,
        SyncPhase::ParsingMessages, SyncPhase::Resolving, SyncPhase::Cleanup
    };
    for (SyncPhase phase : active) {
        QVERIFY2(SyncStateMachine::isTransitionAllowed(phase, SyncPhase::Error),
                 qPrintable(phaseName(phase)));
    }
}

void TestSyncStateMachine::testCompleteFromWrongPhaseEndsInError()
{
    SyncStateMachine state;
    quint64 runId = 0;
    QVERIFY(state.begin(&runId));
    QVERIFY(state.transitionTo(SyncPhase::Backup, runId));

    state.finish(SyncPhase::Complete, runId);
    QCOMPARE(state.phase(), SyncPhase::Error);
    QVERIFY(!state.isRunning());
}

// ========== Cancel / Reset Tests ==========

void TestSyncStateMachine::testCancelFlag()
{
    SyncStateMachine state;
    QVERIFY(state.begin());
    state.requestCancel();
    QVERIFY(state.isCancelled());

    state.reset();
    QVERIFY(!state.isCancelled());

    QVERIFY(state.begin());
    QVERIFY(!state.isCancelled());
}

void TestSyncStateMachine::testResetInvalidatesRun()
{
    SyncStateMachine state;
    quint64 stale = 0;
    QVERIFY(state.begin(&stale));
    QVERIFY(state.transitionTo(SyncPhase::Backup, stale));

    state.reset();
    QVERIFY(!state.isRunning());
    QCOMPARE(state.phase(), SyncPhase::Idle);

    quint64 fresh = 0;
    QVERIFY(state.begin(&fresh));
    QVERIFY(fresh != stale);

    // The stale run can no longer move or end the new one
    QVERIFY(!state.transitionTo(SyncPhase::Decrypting, stale));
    state.finish(SyncPhase::Error, stale);
    QVERIFY(state.isRunning());
    QCOMPARE(state.phase(), SyncPhase::Idle);
}

// ========== Phase Names / Weights ==========

void TestSyncStateMachine::testPhaseNames()
{
    QCOMPARE(phaseName(SyncPhase::Idle), QString("idle"));
    QCOMPARE(phaseName(SyncPhase::ParsingContacts), QString("parsing-contacts"));
    QCOMPARE(phaseName(SyncPhase::ParsingMessages), QString("parsing-messages"));
    QCOMPARE(phaseName(SyncPhase::Complete), QString("complete"));
}

void TestSyncStateMachine::testPhaseFromName()
{
    for (SyncPhase phase : allPhases()) {
        SyncPhase parsed = SyncPhase::Error;
        QVERIFY(phaseFromName(phaseName(phase), parsed));
        QCOMPARE(parsed, phase);
    }

    SyncPhase unused = SyncPhase::Idle;
    QVERIFY(!phaseFromName("downloading", unused));
}

void TestSyncStateMachine::testDefaultWeights()
{
    const PhaseWeightTable table = PhaseWeightTable::defaults();
    QCOMPARE(table.weight(SyncPhase::Backup).start, 0.0);
    QCOMPARE(table.weight(SyncPhase::Backup).weight, 60.0);
    QCOMPARE(table.weight(SyncPhase::Decrypting).start, 60.0);
    QCOMPARE(table.weight(SyncPhase::ParsingContacts).start, 70.0);
    QCOMPARE(table.weight(SyncPhase::ParsingMessages).weight, 15.0);
    QCOMPARE(table.weight(SyncPhase::Resolving).start, 90.0);
    QCOMPARE(table.weight(SyncPhase::Cleanup).start, 95.0);
    QCOMPARE(table.weight(SyncPhase::Complete).start, 100.0);
    QCOMPARE(table.weight(SyncPhase::Error).weight, 0.0);
}

void TestSyncStateMachine::testOverallProgress()
{
    const PhaseWeightTable table = PhaseWeightTable::defaults();
    QCOMPARE(table.overallProgress(SyncPhase::ParsingMessages, 50), 82.5);
    QCOMPARE(table.overallProgress(SyncPhase::Backup, 100), 60.0);
    QCOMPARE(table.overallProgress(SyncPhase::Cleanup, 0), 95.0);
    QCOMPARE(table.overallProgress(SyncPhase::Complete, 100), 100.0);
    QCOMPARE(table.overallProgress(SyncPhase::Error, 50), 0.0);
}

QTEST_MAIN(TestSyncStateMachine)
#include "test_syncstatemachine.moc"
