#include "maincontroller.h"
#include "../history/recordstorage.h"
#include "../sync/syncmanager.h"
#include <QDebug>

MainController::MainController(RecordStorage* storage, SyncManager* sync, QObject* parent)
    : QObject(parent)
    , m_storage(storage)
    , m_sync(sync)
{
}

bool MainController::startup()
{
    bool imported = importLatestSnapshot();
    if (imported) {
        emit statusMessage("Import", "Database imported from the sync folder successfully.");
    }
    loadRecords();
    return imported;
}

WeightRecordList MainController::loadRecords()
{
    m_records = m_storage ? m_storage->load() : WeightRecordList();
    qDebug() << "MainController: Loaded" << m_records.size() << "records";
    emit recordsChanged();
    return m_records;
}

bool MainController::appendRecord(const WeightRecord& record)
{
    if (!m_storage) return false;
    return afterMutation(m_storage->append(record));
}

bool MainController::updateRecord(const QString& date, const QString& weight, const QString& calorie)
{
    if (!m_storage) return false;
    return afterMutation(m_storage->update(date, weight, calorie));
}

bool MainController::deleteRecord(const QString& date)
{
    if (!m_storage) return false;
    return afterMutation(m_storage->remove(date));
}

bool MainController::afterMutation(bool stored)
{
    if (!stored) {
        emit statusMessage("Error", m_storage->lastError());
        return false;
    }

    loadRecords();

    // Export failure never undoes the edit; the local store stays authoritative
    exportSnapshot();
    return true;
}

SyncResult MainController::exportSnapshot()
{
    if (!m_sync) {
        return SyncResult::skipped(SyncStatus::Disabled, "Sync not available");
    }
    return m_sync->exportSnapshot();
}

bool MainController::importLatestSnapshot()
{
    if (!m_sync) {
        return false;
    }
    return m_sync->importLatestSnapshot().succeeded();
}

WeightAverages MainController::computeAverages(const QVector<double>& weights, const QVector<double>& calories) const
{
    return WeightStatistics::computeAverages(weights, calories);
}

QVector<double> MainController::computeTrend(const QVector<WeightPoint>& points) const
{
    return TrendAnalyzer::computeTrend(points);
}

WeightAverages MainController::currentAverages() const
{
    QVector<double> weights;
    QVector<double> calories;
    WeightStatistics::parseValues(m_records, weights, calories);
    return computeAverages(weights, calories);
}

QVector<WeightPoint> MainController::chartPoints() const
{
    return TrendAnalyzer::extractPoints(m_records);
}

QString MainController::averageLossText() const
{
    return WeightStatistics::formatAverageLoss(currentAverages().averageLoss);
}

QString MainController::averageCaloriesText() const
{
    return WeightStatistics::formatAverageCalories(currentAverages().averageCalories);
}

QString MainController::lastError() const
{
    return m_storage ? m_storage->lastError() : QString();
}
