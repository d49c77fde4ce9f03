#include "syncstatemachine.h"

#include <QMutexLocker>
#include <QDebug>

namespace PhoneSync {

QList<SyncPhase> SyncStateMachine::allowedTransitions(SyncPhase from)
{
    switch (from) {
        case SyncPhase::Idle:
            return {SyncPhase::Backup, SyncPhase::Decrypting, SyncPhase::ParsingContacts,
                    SyncPhase::Complete, SyncPhase::Error};
        case SyncPhase::Backup:
            return {SyncPhase::Decrypting, SyncPhase::ParsingContacts, SyncPhase::Error};
        case SyncPhase::Decrypting:
            return {SyncPhase::ParsingContacts, SyncPhase::Error};
        case SyncPhase::ParsingContacts:
            return {SyncPhase::ParsingMessages, SyncPhase::Cleanup, SyncPhase::Error};
        case SyncPhase::ParsingMessages:
            return {SyncPhase::Resolving, SyncPhase::Cleanup, SyncPhase::Error};
        case SyncPhase::Resolving:
            return {SyncPhase::Cleanup, SyncPhase::Error};
        case SyncPhase::Cleanup:
            return {SyncPhase::Complete, SyncPhase::Error};
        case SyncPhase::Complete:
        case SyncPhase::Error:
            break;
    }
    return {};
}

bool SyncStateMachine::isTransitionAllowed(SyncPhase from, SyncPhase to)
{
    return allowedTransitions(from).contains(to);
}

bool SyncStateMachine::begin(quint64 *runId)
{
    QMutexLocker locker(&m_mutex);
    if (m_running) {
        return false;
    }
    m_running = true;
    m_cancelled = false;
    m_phase = SyncPhase::Idle;
    ++m_runId;
    if (runId) {
        *runId = m_runId;
    }
    return true;
}

bool SyncStateMachine::transitionTo(SyncPhase next, quint64 runId)
{
    QMutexLocker locker(&m_mutex);
    if (!m_running || runId != m_runId) {
        qWarning() << "[SyncStateMachine] Run" << runId << "is no longer current, ignoring"
                   << phaseName(next);
        return false;
    }
    if (!isTransitionAllowed(m_phase, next)) {
        qWarning() << "[SyncStateMachine] Rejected transition" << phaseName(m_phase)
                   << "->" << phaseName(next);
        return false;
    }
    m_phase = next;
    return true;
}

void SyncStateMachine::finish(SyncPhase terminal, quint64 runId)
{
    QMutexLocker locker(&m_mutex);
    if (!m_running || runId != m_runId) {
        return;
    }
    if (terminal == SyncPhase::Complete && isTransitionAllowed(m_phase, SyncPhase::Complete)) {
        m_phase = SyncPhase::Complete;
    } else {
        if (terminal != SyncPhase::Error) {
            qWarning() << "[SyncStateMachine] Cannot finish in" << phaseName(terminal)
                       << "from" << phaseName(m_phase) << "- ending in error";
        }
        m_phase = SyncPhase::Error;
    }
    m_running = false;
}

void SyncStateMachine::requestCancel()
{
    QMutexLocker locker(&m_mutex);
    m_cancelled = true;
}

bool SyncStateMachine::isCancelled() const
{
    QMutexLocker locker(&m_mutex);
    return m_cancelled;
}

bool SyncStateMachine::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_running;
}

SyncPhase SyncStateMachine::phase() const
{
    QMutexLocker locker(&m_mutex);
    return m_phase;
}

quint64 SyncStateMachine::currentRunId() const
{
    QMutexLocker locker(&m_mutex);
    return m_runId;
}

void SyncStateMachine::reset()
{
    QMutexLocker locker(&m_mutex);
    ++m_runId;
    m_running = false;
    m_cancelled = false;
    m_phase = SyncPhase::Idle;
}

} // namespace PhoneSync
