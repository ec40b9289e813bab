#pragma once

#include <QObject>
#include <QString>
#include <QVector>
#include "../history/weightrecord.h"
#include "../analysis/trendanalyzer.h"
#include "../analysis/weightstatistics.h"
#include "../sync/syncresult.h"

class RecordStorage;
class SyncManager;

// Entry point for the user interface. Every user action goes through here,
// one at a time: store mutations are followed by an export, and startup()
// imports the latest snapshot before the first load.
class MainController : public QObject {
    Q_OBJECT

    Q_PROPERTY(int recordCount READ recordCount NOTIFY recordsChanged)
    Q_PROPERTY(QString averageLossText READ averageLossText NOTIFY recordsChanged)
    Q_PROPERTY(QString averageCaloriesText READ averageCaloriesText NOTIFY recordsChanged)

public:
    explicit MainController(RecordStorage* storage, SyncManager* sync, QObject* parent = nullptr);

    // Import at startup, then load. Returns true if a snapshot was imported.
    bool startup();

    WeightRecordList loadRecords();
    const WeightRecordList& records() const { return m_records; }

    // Store mutations. False means the edit did not persist (see lastError()).
    bool appendRecord(const WeightRecord& record);
    bool updateRecord(const QString& date, const QString& weight, const QString& calorie);
    bool deleteRecord(const QString& date);

    SyncResult exportSnapshot();
    bool importLatestSnapshot();

    WeightAverages computeAverages(const QVector<double>& weights, const QVector<double>& calories) const;
    QVector<double> computeTrend(const QVector<WeightPoint>& points) const;

    // Figures for the currently loaded records
    WeightAverages currentAverages() const;
    QVector<WeightPoint> chartPoints() const;

    int recordCount() const { return static_cast<int>(m_records.size()); }
    QString averageLossText() const;
    QString averageCaloriesText() const;

    QString lastError() const;

signals:
    void recordsChanged();
    void statusMessage(const QString& title, const QString& message);

private:
    bool afterMutation(bool stored);

    RecordStorage* m_storage;
    SyncManager* m_sync;
    WeightRecordList m_records;
};
