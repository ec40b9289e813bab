#pragma once

#include <QVector>
#include <QString>
#include <optional>
#include "../history/weightrecord.h"

struct WeightAverages {
    std::optional<double> averageLoss;       // Needs at least 2 weights
    std::optional<double> averageCalories;   // Needs at least 1 calorie value
};

// Summary figures shown under the record list.
class WeightStatistics {
public:
    /**
     * Mean of consecutive differences weight[i-1] - weight[i].
     * This telescopes to (first - last) / (n - 1); positive means weight went down.
     */
    static std::optional<double> averageLoss(const QVector<double>& weights);

    static std::optional<double> averageCalories(const QVector<double>& calories);

    static WeightAverages computeAverages(const QVector<double>& weights, const QVector<double>& calories);

    /// Numeric weight and calorie columns in record order; unparseable values are skipped
    static void parseValues(const WeightRecordList& records, QVector<double>& weights, QVector<double>& calories);

    // Label text: " 2.00 lbs" / "Average Weight Loss: N/A"
    static QString formatAverageLoss(const std::optional<double>& value);
    // Label text: " 1850.00 cal" / "Average Calories: N/A"
    static QString formatAverageCalories(const std::optional<double>& value);
};
