#include "synctypes.h"

namespace PhoneSync {

QString phaseName(SyncPhase phase)
{
    switch (phase) {
        case SyncPhase::Idle: return QStringLiteral("idle");
        case SyncPhase::Backup: return QStringLiteral("backup");
        case SyncPhase::Decrypting: return QStringLiteral("decrypting");
        case SyncPhase::ParsingContacts: return QStringLiteral("parsing-contacts");
        case SyncPhase::ParsingMessages: return QStringLiteral("parsing-messages");
        case SyncPhase::Resolving: return QStringLiteral("resolving");
        case SyncPhase::Cleanup: return QStringLiteral("cleanup");
        case SyncPhase::Complete: return QStringLiteral("complete");
        case SyncPhase::Error: return QStringLiteral("error");
    }
    return QStringLiteral("unknown");
}

QList<SyncPhase> allPhases()
{
    return {
        SyncPhase::Idle,
        SyncPhase::Backup,
        SyncPhase::Decrypting,
        SyncPhase::ParsingContacts,
        SyncPhase::ParsingMessages,
        SyncPhase::Resolving,
        SyncPhase::Cleanup,
        SyncPhase::Complete,
        SyncPhase::Error
    };
}

bool phaseFromName(const QString &name, SyncPhase &phase)
{
    for (SyncPhase candidate : allPhases()) {
        if (phaseName(candidate) == name) {
            phase = candidate;
            return true;
        }
    }
    return false;
}

// ========== PhaseWeightTable ==========

PhaseWeightTable PhaseWeightTable::defaults()
{
    PhaseWeightTable table;
    table.set(SyncPhase::Idle, {0, 0});
    table.set(SyncPhase::Backup, {0, 60});
    table.set(SyncPhase::Decrypting, {60, 10});
    table.set(SyncPhase::ParsingContacts, {70, 5});
    table.set(SyncPhase::ParsingMessages, {75, 15});
    table.set(SyncPhase::Resolving, {90, 5});
    table.set(SyncPhase::Cleanup, {95, 5});
    table.set(SyncPhase::Complete, {100, 0});
    table.set(SyncPhase::Error, {0, 0});
    return table;
}

void PhaseWeightTable::set(SyncPhase phase, const PhaseWeight &weight)
{
    m_weights.insert(static_cast<int>(phase), weight);
}

PhaseWeight PhaseWeightTable::weight(SyncPhase phase) const
{
    return m_weights.value(static_cast<int>(phase));
}

double PhaseWeightTable::overallProgress(SyncPhase phase, double phasePercent) const
{
    const PhaseWeight w = weight(phase);
    return w.start + (phasePercent / 100.0) * w.weight;
}

} // namespace PhoneSync
