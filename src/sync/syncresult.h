#pragma once

#include <QString>
#include <QMetaType>

// Named phases of the export and import sequences. A failed result carries
// the phase that failed so the log shows exactly how far the sequence got.
enum class SyncPhase {
    Idle,

    // Export
    CopyToTemp,
    RenameToFinal,
    WriteReadyMarker,
    UpdatePointer,

    // Import
    Locate,
    WaitStable,
    Backup,
    StageTemp,
    SwapOld,
    RenameIn,

    Done
};

enum class SyncStatus {
    Succeeded,
    NothingToExport,    // No local store yet
    NothingToImport,    // No complete snapshot in the export folder
    Disabled,           // Sync folder not configured or sync turned off
    Busy,               // Another sync operation is still running
    StabilityTimeout,   // Snapshot kept changing size for the whole retry budget
    IOFailure
};

/**
 * Outcome of a best-effort sync operation.
 *
 * Callers may log it but never have to act on it: the local store stays
 * authoritative whatever the result.
 */
struct SyncResult {
    SyncStatus status = SyncStatus::Succeeded;
    SyncPhase phase = SyncPhase::Idle;
    QString message;
    QString path;   // Snapshot written (export) or read (import)

    bool succeeded() const { return status == SyncStatus::Succeeded; }

    static SyncResult success(const QString& path) {
        return {SyncStatus::Succeeded, SyncPhase::Done, QString(), path};
    }
    static SyncResult skipped(SyncStatus status, const QString& message) {
        return {status, SyncPhase::Idle, message, QString()};
    }
    static SyncResult failure(SyncStatus status, SyncPhase phase, const QString& message,
                              const QString& path = QString()) {
        return {status, phase, message, path};
    }
};

QString syncPhaseName(SyncPhase phase);
QString syncStatusName(SyncStatus status);

Q_DECLARE_METATYPE(SyncResult)
