#ifndef SYNCSTATEMACHINE_H
#define SYNCSTATEMACHINE_H

#include <QMutex>
#include <QList>

#include "synctypes.h"

namespace PhoneSync {

/**
 * @brief Run state of a SyncOrchestrator
 *
 * Holds the running flag, cancel flag and current phase behind one
 * mutex so that status() and cancel() can be called from other
 * threads while a run is in progress.
 *
 * Phase changes are checked against a fixed transition table:
 *
 *   idle             -> backup, decrypting, parsing-contacts, complete
 *   backup           -> decrypting, parsing-contacts
 *   decrypting       -> parsing-contacts
 *   parsing-contacts -> parsing-messages, cleanup
 *   parsing-messages -> resolving, cleanup
 *   resolving        -> cleanup
 *   cleanup          -> complete
 *
 * Any non-terminal phase may move to error. complete and error only
 * leave through begin() or reset().
 *
 * Every run gets an id from begin(). reset() invalidates it, so a run
 * that is still unwinding after a reset can no longer change the
 * state of the machine.
 */
class SyncStateMachine
{
public:
    SyncStateMachine() = default;

    /**
     * @brief Claim the machine for a new run
     * @param runId Receives the id of the new run
     * @return false if a run is already active
     *
     * Clears the cancel flag and moves to idle.
     */
    bool begin(quint64 *runId = nullptr);

    /**
     * @brief Move to the next phase
     * @return false (and no change) if the transition is not allowed or
     *         @p runId is not the current run
     */
    bool transitionTo(SyncPhase next, quint64 runId);

    /**
     * @brief End the run in a terminal phase and release it
     *
     * Error is always reachable. Complete is only accepted where the
     * table allows it; otherwise the run ends in error. Ignored if
     * @p runId is not the current run.
     */
    void finish(SyncPhase terminal, quint64 runId);

    void requestCancel();
    bool isCancelled() const;

    bool isRunning() const;
    SyncPhase phase() const;
    quint64 currentRunId() const;

    /**
     * @brief Clear running and cancelled flags and return to idle
     */
    void reset();

    static bool isTransitionAllowed(SyncPhase from, SyncPhase to);
    static QList<SyncPhase> allowedTransitions(SyncPhase from);

private:
    mutable QMutex m_mutex;
    bool m_running = false;
    bool m_cancelled = false;
    SyncPhase m_phase = SyncPhase::Idle;
    quint64 m_runId = 0;
};

} // namespace PhoneSync

#endif // SYNCSTATEMACHINE_H
