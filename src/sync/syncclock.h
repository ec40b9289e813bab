#pragma once

#include <QDateTime>
#include <QThread>

/**
 * Time source for the sync layer.
 *
 * SyncManager reads the wall clock to name snapshots and backups, and
 * StabilityWaiter sleeps between file-size samples. Tests substitute a
 * fake clock so neither depends on real time passing.
 */
class SyncClock {
public:
    virtual ~SyncClock() = default;

    virtual QDateTime now() const = 0;

    /// Suspend the calling thread for @p ms milliseconds.
    virtual void sleep(int ms) = 0;
};

class SystemSyncClock : public SyncClock {
public:
    QDateTime now() const override { return QDateTime::currentDateTime(); }
    void sleep(int ms) override { QThread::msleep(static_cast<unsigned long>(ms)); }
};
