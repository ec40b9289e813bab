#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include "syncresult.h"

class Settings;
class RecordStorage;
class SyncClock;

/**
 * @brief Synchronizes the local record store through a cloud-drive folder.
 *
 * Export publishes a snapshot with a rename so a reader never sees a
 * half-written file:
 *   CopyToTemp -> RenameToFinal -> WriteReadyMarker -> UpdatePointer -> Done
 *
 *   <export>/DB_yyyy-MM-dd_HHmmss.tmp   copy in progress
 *   <export>/DB_yyyy-MM-dd_HHmmss.txt   published snapshot
 *   <export>/DB_yyyy-MM-dd_HHmmss.ready marker, content = stem
 *   <export>/LATEST                     pointer, content = snapshot file name
 *
 * Import takes the newest complete snapshot, waits until the cloud client has
 * finished writing it, backs up the live store and swaps the new content in:
 *   Locate -> WaitStable -> Backup -> StageTemp -> SwapOld -> RenameIn -> Done
 *
 * Every destructive step is preceded by a durable copy and every publish step
 * is a rename, so a crash leaves either the old or the new store on disk.
 *
 * Both operations are best-effort: failures are logged and returned as a
 * SyncResult, never propagated.
 */
class SyncManager : public QObject {
    Q_OBJECT

public:
    static constexpr const char* POINTER_FILE = "LATEST";
    static constexpr const char* SNAPSHOT_PREFIX = "DB_";
    static constexpr const char* BACKUP_PREFIX = "LocalBackup_";
    static constexpr const char* STAMP_FORMAT = "yyyy-MM-dd_HHmmss";

    /// @param clock Time source; nullptr uses the system clock. Not owned.
    explicit SyncManager(Settings* settings, RecordStorage* storage,
                         SyncClock* clock = nullptr, QObject* parent = nullptr);
    ~SyncManager();

    /// Publish the local store as a new snapshot
    SyncResult exportSnapshot();

    /// Replace the local store with the newest complete snapshot
    SyncResult importLatestSnapshot();

    /// Snapshot import would pick right now (empty if none). Does not wait for stability.
    QString locateLatestSnapshot() const;

    /// Sidecar holding the previous live store after an import swap
    QString previousStorePath() const;

    /// Temp file the import source is staged into, next to the live store
    QString stagingPath() const;

    bool isBusy() const { return m_inProgress; }

signals:
    void exportFinished(const SyncResult& result);
    void importFinished(const SyncResult& result);

private:
    SyncResult runExport();
    SyncResult runImport();

    bool checkEnabled(SyncResult& result) const;
    QString timestamp() const;
    QString uniqueBackupPath(const QString& backupDir) const;

    static bool replaceFile(const QString& source, const QString& target, QString& error);
    static bool writeTextFile(const QString& path, const QString& content, QString& error);
    static QString readTextFile(const QString& path);

    Settings* m_settings;
    RecordStorage* m_storage;
    SyncClock* m_clock;
    std::unique_ptr<SyncClock> m_ownedClock;
    bool m_inProgress = false;  // Refuse overlapping export/import
};
