#include "syncmanager.h"
#include "syncclock.h"
#include "stabilitywaiter.h"
#include "../core/settings.h"
#include "../history/recordstorage.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <exception>

SyncManager::SyncManager(Settings* settings, RecordStorage* storage, SyncClock* clock, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_storage(storage)
    , m_clock(clock)
{
    if (!m_clock) {
        m_ownedClock = std::make_unique<SystemSyncClock>();
        m_clock = m_ownedClock.get();
    }
}

SyncManager::~SyncManager() = default;

SyncResult SyncManager::exportSnapshot()
{
    if (m_inProgress) {
        qWarning() << "SyncManager: Sync already in progress, export skipped";
        return SyncResult::skipped(SyncStatus::Busy, "Sync already in progress");
    }

    m_inProgress = true;
    SyncResult result;
    try {
        result = runExport();
    } catch (const std::exception& e) {
        result = SyncResult::failure(SyncStatus::IOFailure, SyncPhase::Idle,
                                     QString("Exception during export: %1").arg(e.what()));
    }
    m_inProgress = false;

    if (result.succeeded()) {
        qInfo() << "SyncManager: Exported snapshot" << result.path;
    } else if (result.status == SyncStatus::IOFailure) {
        qWarning() << "SyncManager: Export failed in phase" << syncPhaseName(result.phase)
                   << "-" << result.message;
    } else {
        qDebug() << "SyncManager: Export skipped -" << syncStatusName(result.status) << result.message;
    }

    emit exportFinished(result);
    return result;
}

SyncResult SyncManager::importLatestSnapshot()
{
    if (m_inProgress) {
        qWarning() << "SyncManager: Sync already in progress, import skipped";
        return SyncResult::skipped(SyncStatus::Busy, "Sync already in progress");
    }

    m_inProgress = true;
    SyncResult result;
    try {
        result = runImport();
    } catch (const std::exception& e) {
        result = SyncResult::failure(SyncStatus::IOFailure, SyncPhase::Idle,
                                     QString("Exception during import: %1").arg(e.what()));
    }
    m_inProgress = false;

    if (result.succeeded()) {
        qInfo() << "SyncManager: Imported snapshot" << result.path;
    } else if (result.status == SyncStatus::IOFailure || result.status == SyncStatus::StabilityTimeout) {
        qWarning() << "SyncManager: Import failed in phase" << syncPhaseName(result.phase)
                   << "-" << result.message;
    } else {
        qDebug() << "SyncManager: Import skipped -" << syncStatusName(result.status) << result.message;
    }

    emit importFinished(result);
    return result;
}

bool SyncManager::checkEnabled(SyncResult& result) const
{
    if (!m_settings || !m_storage) {
        result = SyncResult::skipped(SyncStatus::Disabled, "Missing settings or storage");
        return false;
    }
    if (!m_settings->syncEnabled()) {
        result = SyncResult::skipped(SyncStatus::Disabled, "Sync is turned off");
        return false;
    }
    if (m_settings->exportFolder().isEmpty()) {
        result = SyncResult::skipped(SyncStatus::Disabled, "No sync folder configured");
        return false;
    }
    return true;
}

SyncResult SyncManager::runExport()
{
    SyncResult skipped;
    if (!checkEnabled(skipped)) {
        return skipped;
    }

    if (!m_storage->exists()) {
        return SyncResult::skipped(SyncStatus::NothingToExport, "No local store at " + m_storage->filePath());
    }

    QDir exportDir(m_settings->exportFolder());
    if (!exportDir.mkpath(".")) {
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::CopyToTemp,
                                   "Cannot create export folder " + exportDir.path());
    }

    const QString stem = QString(SNAPSHOT_PREFIX) + timestamp();
    const QString tmpPath = exportDir.filePath(stem + ".tmp");
    const QString finalPath = exportDir.filePath(stem + ".txt");
    const QString readyPath = exportDir.filePath(stem + ".ready");
    const QString pointerPath = exportDir.filePath(POINTER_FILE);

    // CopyToTemp
    if (QFile::exists(tmpPath) && !QFile::remove(tmpPath)) {
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::CopyToTemp,
                                   "Cannot remove stale temp file " + tmpPath);
    }
    if (!QFile::copy(m_storage->filePath(), tmpPath)) {
        QFile::remove(tmpPath);
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::CopyToTemp,
                                   "Cannot copy " + m_storage->filePath() + " to " + tmpPath);
    }

    // RenameToFinal
    QString error;
    if (!replaceFile(tmpPath, finalPath, error)) {
        QFile::remove(tmpPath);
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::RenameToFinal, error);
    }

    // WriteReadyMarker
    if (!writeTextFile(readyPath, stem, error)) {
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::WriteReadyMarker, error, finalPath);
    }

    // UpdatePointer
    if (!writeTextFile(pointerPath, stem + ".txt", error)) {
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::UpdatePointer, error, finalPath);
    }

    return SyncResult::success(finalPath);
}

SyncResult SyncManager::runImport()
{
    SyncResult skipped;
    if (!checkEnabled(skipped)) {
        return skipped;
    }

    // Locate
    const QString sourcePath = locateLatestSnapshot();
    if (sourcePath.isEmpty()) {
        return SyncResult::skipped(SyncStatus::NothingToImport,
                                   "No complete snapshot in " + m_settings->exportFolder());
    }
    qDebug() << "SyncManager: Import candidate" << sourcePath;

    // WaitStable
    StabilityWaiter waiter(m_clock,
                           m_settings->stabilityAttempts(),
                           m_settings->stabilitySampleDelayMs(),
                           m_settings->stabilityRetryDelayMs());
    if (!waiter.waitForStable(sourcePath)) {
        return SyncResult::failure(SyncStatus::StabilityTimeout, SyncPhase::WaitStable,
                                   QString("Snapshot did not stabilize after %1 attempts").arg(waiter.attemptsUsed()),
                                   sourcePath);
    }

    const QString livePath = m_storage->filePath();
    const bool liveExists = m_storage->exists();

    // Backup
    if (liveExists) {
        QDir backupDir(m_settings->backupFolder());
        if (!backupDir.mkpath(".")) {
            return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::Backup,
                                       "Cannot create backup folder " + backupDir.path(), sourcePath);
        }
        const QString backupPath = uniqueBackupPath(backupDir.path());
        if (!QFile::copy(livePath, backupPath)) {
            QFile::remove(backupPath);
            return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::Backup,
                                       "Cannot back up " + livePath + " to " + backupPath, sourcePath);
        }
        qDebug() << "SyncManager: Backed up local store to" << backupPath;
    }

    // StageTemp
    const QString tempPath = stagingPath();
    if (!QDir().mkpath(QFileInfo(livePath).absolutePath())) {
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::StageTemp,
                                   "Cannot create data directory for " + livePath, sourcePath);
    }
    if (QFile::exists(tempPath) && !QFile::remove(tempPath)) {
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::StageTemp,
                                   "Cannot remove stale staging file " + tempPath, sourcePath);
    }
    if (!QFile::copy(sourcePath, tempPath)) {
        QFile::remove(tempPath);
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::StageTemp,
                                   "Cannot stage " + sourcePath + " to " + tempPath, sourcePath);
    }

    // SwapOld
    QString error;
    if (liveExists && !replaceFile(livePath, previousStorePath(), error)) {
        QFile::remove(tempPath);
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::SwapOld, error, sourcePath);
    }

    // RenameIn - on failure the previous store stays recoverable from the sidecar
    if (!QFile::rename(tempPath, livePath)) {
        QFile::remove(tempPath);
        return SyncResult::failure(SyncStatus::IOFailure, SyncPhase::RenameIn,
                                   "Cannot move " + tempPath + " into place; previous store kept at "
                                   + previousStorePath(), sourcePath);
    }

    return SyncResult::success(sourcePath);
}

QString SyncManager::locateLatestSnapshot() const
{
    if (!m_settings) {
        return QString();
    }

    QString exportFolder = m_settings->exportFolder();
    if (exportFolder.isEmpty()) {
        return QString();
    }

    QDir dir(exportFolder);
    if (!dir.exists()) {
        return QString();
    }

    // Prefer the pointer file
    QString pointed = readTextFile(dir.filePath(POINTER_FILE)).trimmed();
    if (!pointed.isEmpty() && !pointed.contains('/') && !pointed.contains('\\')) {
        QString dataPath = dir.filePath(pointed);
        QString readyPath = dir.filePath(QFileInfo(pointed).completeBaseName() + ".ready");
        if (QFileInfo::exists(dataPath) && QFileInfo::exists(readyPath)) {
            return dataPath;
        }
        qDebug() << "SyncManager: Pointer names" << pointed << "but it is not complete, scanning markers";
    }

    // Fall back to the newest ready marker with a data file
    QStringList markers = dir.entryList(QStringList() << QString(SNAPSHOT_PREFIX) + "*.ready",
                                        QDir::Files, QDir::Name);
    for (auto it = markers.crbegin(); it != markers.crend(); ++it) {
        QString dataPath = dir.filePath(QFileInfo(*it).completeBaseName() + ".txt");
        if (QFileInfo::exists(dataPath)) {
            return dataPath;
        }
    }

    return QString();
}

QString SyncManager::previousStorePath() const
{
    return m_storage ? m_storage->filePath() + ".previous" : QString();
}

QString SyncManager::stagingPath() const
{
    return m_storage ? m_storage->filePath() + ".importing" : QString();
}

QString SyncManager::timestamp() const
{
    return m_clock->now().toString(QString::fromLatin1(STAMP_FORMAT));
}

QString SyncManager::uniqueBackupPath(const QString& backupDir) const
{
    const QString baseName = QString(BACKUP_PREFIX) + timestamp();
    QString path = QString("%1/%2.txt").arg(backupDir, baseName);
    int counter = 2;
    while (QFile::exists(path)) {
        path = QString("%1/%2_%3.txt").arg(backupDir, baseName).arg(counter);
        counter++;
    }
    return path;
}

bool SyncManager::replaceFile(const QString& source, const QString& target, QString& error)
{
    // QFile::rename refuses to overwrite, so clear the target first
    if (QFile::exists(target) && !QFile::remove(target)) {
        error = "Cannot remove existing " + target;
        return false;
    }

    QFile file(source);
    if (!file.rename(target)) {
        error = QString("Cannot rename %1 to %2: %3").arg(source, target, file.errorString());
        return false;
    }
    return true;
}

bool SyncManager::writeTextFile(const QString& path, const QString& content, QString& error)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        error = QString("Cannot open %1 for writing: %2").arg(path, file.errorString());
        return false;
    }

    QByteArray data = content.toUtf8();
    if (file.write(data) != data.size() || !file.flush()) {
        error = QString("Failed to write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

QString SyncManager::readTextFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}
