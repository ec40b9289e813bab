#pragma once

#include <QString>
#include <QList>

// One daily entry. All three fields are kept as the text the user typed;
// parsing to numbers happens only where a value is needed (averages, charts).
// Field values must never contain the ',' delimiter.
struct WeightRecord {
    QString date;
    QString weight;
    QString calorie;

    // Serialized form: "date,weight,calorie"
    QString toLine() const;

    // Parses a stored line. Returns false unless the line splits into exactly 3 fields.
    static bool fromLine(const QString& line, WeightRecord& record);

    bool operator==(const WeightRecord& other) const {
        return date == other.date && weight == other.weight && calorie == other.calorie;
    }
    bool operator!=(const WeightRecord& other) const { return !(*this == other); }
};

using WeightRecordList = QList<WeightRecord>;
