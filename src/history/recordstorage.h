#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include "weightrecord.h"

/**
 * @brief Flat-file store for weight/calorie records.
 *
 * One record per line ("date,weight,calorie"), UTF-8, no header.
 * Mutations read the whole file, modify it in memory and write it back.
 *
 * Unlike the sync layer, mutations must succeed: they return false and emit
 * errorOccurred() when the file cannot be written, so the caller knows the
 * user's edit did not persist.
 */
class RecordStorage : public QObject {
    Q_OBJECT

public:
    /// @param filePath Live store path. Empty uses defaultFilePath().
    explicit RecordStorage(const QString& filePath = QString(), QObject* parent = nullptr);

    /// <AppLocalDataLocation>/WeightCalorie.txt
    static QString defaultFilePath();

    QString filePath() const { return m_filePath; }
    bool exists() const;

    /// Load every well-formed record. Lines without exactly 3 fields are dropped.
    /// A missing file yields an empty list.
    WeightRecordList load() const;

    /// Append one record at the end of the file.
    bool append(const WeightRecord& record);

    /// Rewrite the first record whose date equals @p date. No match leaves the file untouched.
    bool update(const QString& date, const QString& newWeight, const QString& newCalorie);

    /// Remove every record whose date equals @p date. No match leaves the file untouched.
    bool remove(const QString& date);

    /// Last I/O error message (empty after a successful mutation)
    QString lastError() const { return m_lastError; }

signals:
    void recordsChanged();
    void errorOccurred(const QString& error);

private:
    bool readLines(QStringList& lines);
    bool writeLines(const QStringList& lines);
    bool ensureDirectory();
    void fail(const QString& error);

    static QString dateField(const QString& line);

    QString m_filePath;
    QString m_lastError;
};
