#include "weightrecord.h"
#include <QStringList>

QString WeightRecord::toLine() const
{
    return date + ',' + weight + ',' + calorie;
}

bool WeightRecord::fromLine(const QString& line, WeightRecord& record)
{
    const QStringList parts = line.split(',');
    if (parts.size() != 3) {
        return false;
    }

    record.date = parts[0];
    record.weight = parts[1];
    record.calorie = parts[2];
    return true;
}
