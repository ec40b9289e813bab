#include "syncresult.h"

QString syncPhaseName(SyncPhase phase)
{
    switch (phase) {
        case SyncPhase::Idle:             return "Idle";
        case SyncPhase::CopyToTemp:       return "CopyToTemp";
        case SyncPhase::RenameToFinal:    return "RenameToFinal";
        case SyncPhase::WriteReadyMarker: return "WriteReadyMarker";
        case SyncPhase::UpdatePointer:    return "UpdatePointer";
        case SyncPhase::Locate:           return "Locate";
        case SyncPhase::WaitStable:       return "WaitStable";
        case SyncPhase::Backup:           return "Backup";
        case SyncPhase::StageTemp:        return "StageTemp";
        case SyncPhase::SwapOld:          return "SwapOld";
        case SyncPhase::RenameIn:         return "RenameIn";
        case SyncPhase::Done:             return "Done";
    }
    return "Unknown";
}

QString syncStatusName(SyncStatus status)
{
    switch (status) {
        case SyncStatus::Succeeded:        return "Succeeded";
        case SyncStatus::NothingToExport:  return "NothingToExport";
        case SyncStatus::NothingToImport:  return "NothingToImport";
        case SyncStatus::Disabled:         return "Disabled";
        case SyncStatus::Busy:             return "Busy";
        case SyncStatus::StabilityTimeout: return "StabilityTimeout";
        case SyncStatus::IOFailure:        return "IOFailure";
    }
    return "Unknown";
}
