#include "recordstorage.h"
#include <QStandardPaths>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QDebug>

RecordStorage::RecordStorage(const QString& filePath, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath.isEmpty() ? defaultFilePath() : filePath)
{
}

QString RecordStorage::defaultFilePath()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return dataDir + "/WeightCalorie.txt";
}

bool RecordStorage::exists() const
{
    return QFileInfo::exists(m_filePath);
}

QString RecordStorage::dateField(const QString& line)
{
    return line.section(',', 0, 0);
}

WeightRecordList RecordStorage::load() const
{
    WeightRecordList records;

    QFile file(m_filePath);
    if (!file.exists()) {
        return records;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "RecordStorage: Cannot open" << m_filePath << "for reading:" << file.errorString();
        return records;
    }

    QTextStream in(&file);
    int dropped = 0;
    while (!in.atEnd()) {
        QString line = in.readLine();
        WeightRecord record;
        if (WeightRecord::fromLine(line, record)) {
            records.append(record);
        } else {
            ++dropped;
        }
    }

    if (dropped > 0) {
        qDebug() << "RecordStorage: Skipped" << dropped << "malformed line(s) in" << m_filePath;
    }
    return records;
}

bool RecordStorage::append(const WeightRecord& record)
{
    if (!ensureDirectory()) {
        return false;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fail("Cannot open " + m_filePath + " for append: " + file.errorString());
        return false;
    }

    QTextStream out(&file);
    out << record.toLine() << "\n";
    out.flush();

    if (out.status() != QTextStream::Ok || file.error() != QFileDevice::NoError) {
        fail("Failed to append record to " + m_filePath + ": " + file.errorString());
        return false;
    }

    m_lastError.clear();
    qDebug() << "RecordStorage: Appended record for" << record.date;
    emit recordsChanged();
    return true;
}

bool RecordStorage::update(const QString& date, const QString& newWeight, const QString& newCalorie)
{
    QStringList lines;
    if (!readLines(lines)) {
        return false;
    }

    int index = -1;
    for (int i = 0; i < lines.size(); ++i) {
        if (dateField(lines[i]) == date) {
            index = i;
            break;
        }
    }

    if (index < 0) {
        qDebug() << "RecordStorage: No record for" << date << "- nothing to update";
        m_lastError.clear();
        return true;
    }

    lines[index] = WeightRecord{date, newWeight, newCalorie}.toLine();

    if (!writeLines(lines)) {
        return false;
    }

    m_lastError.clear();
    qDebug() << "RecordStorage: Updated record for" << date;
    emit recordsChanged();
    return true;
}

bool RecordStorage::remove(const QString& date)
{
    QStringList lines;
    if (!readLines(lines)) {
        return false;
    }

    qsizetype removed = lines.removeIf([&date](const QString& line) {
        return dateField(line) == date;
    });

    if (removed == 0) {
        qDebug() << "RecordStorage: No record for" << date << "- nothing to delete";
        m_lastError.clear();
        return true;
    }

    if (!writeLines(lines)) {
        return false;
    }

    m_lastError.clear();
    qDebug() << "RecordStorage: Deleted" << removed << "record(s) for" << date;
    emit recordsChanged();
    return true;
}

bool RecordStorage::readLines(QStringList& lines)
{
    lines.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return true;  // Empty store
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        fail("Cannot open " + m_filePath + " for reading: " + file.errorString());
        return false;
    }

    QTextStream in(&file);
    while (!in.atEnd()) {
        lines.append(in.readLine());
    }
    return true;
}

bool RecordStorage::writeLines(const QStringList& lines)
{
    if (!ensureDirectory()) {
        return false;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        fail("Cannot open " + m_filePath + " for writing: " + file.errorString());
        return false;
    }

    QTextStream out(&file);
    for (const QString& line : lines) {
        out << line << "\n";
    }
    out.flush();

    if (out.status() != QTextStream::Ok || file.error() != QFileDevice::NoError) {
        fail("Failed to write " + m_filePath + ": " + file.errorString());
        return false;
    }
    return true;
}

bool RecordStorage::ensureDirectory()
{
    QString dirPath = QFileInfo(m_filePath).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        fail("Cannot create data directory " + dirPath);
        return false;
    }
    return true;
}

void RecordStorage::fail(const QString& error)
{
    m_lastError = error;
    qWarning() << "RecordStorage:" << error;
    emit errorOccurred(error);
}
