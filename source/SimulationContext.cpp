#include "SimulationContext.h"

const char *modeName(Mode mode)
{
    switch (mode)
    {
    case Mode::Surplus:
        return "Block Surplus";
    case Mode::Saturation:
        return "Block Saturation";
    case Mode::NapTime:
        return "Nap Time";
    default:
        return "Unknown";
    }
}

AuditCounters &AuditCounters::operator+=(const AuditCounters &other)
{
    blocksCollected += other.blocksCollected;
    contestsStarted += other.contestsStarted;
    snatches += other.snatches;
    blocksTransferred += other.blocksTransferred;
    bedsClaimed += other.bedsClaimed;
    return *this;
}
