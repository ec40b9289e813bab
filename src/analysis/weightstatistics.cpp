#include "weightstatistics.h"
#include "trendanalyzer.h"
#include <QtMath>

std::optional<double> WeightStatistics::averageLoss(const QVector<double>& weights)
{
    if (weights.size() < 2) {
        return std::nullopt;
    }

    double totalLoss = 0;
    for (qsizetype i = 1; i < weights.size(); ++i) {
        totalLoss += weights[i - 1] - weights[i];
    }
    return totalLoss / (weights.size() - 1);
}

std::optional<double> WeightStatistics::averageCalories(const QVector<double>& calories)
{
    if (calories.isEmpty()) {
        return std::nullopt;
    }

    double sum = 0;
    for (double calorie : calories) {
        sum += calorie;
    }
    return sum / calories.size();
}

WeightAverages WeightStatistics::computeAverages(const QVector<double>& weights, const QVector<double>& calories)
{
    return { averageLoss(weights), averageCalories(calories) };
}

void WeightStatistics::parseValues(const WeightRecordList& records, QVector<double>& weights, QVector<double>& calories)
{
    weights.clear();
    calories.clear();

    for (const WeightRecord& record : records) {
        double value = 0;
        if (TrendAnalyzer::parseWeight(record.weight, value) && qIsFinite(value)) {
            weights.append(value);
        }
        if (TrendAnalyzer::parseWeight(record.calorie, value) && qIsFinite(value)) {
            calories.append(value);
        }
    }
}

QString WeightStatistics::formatAverageLoss(const std::optional<double>& value)
{
    if (!value) {
        return "Average Weight Loss: N/A";
    }
    return QString(" %1 lbs").arg(*value, 0, 'f', 2);
}

QString WeightStatistics::formatAverageCalories(const std::optional<double>& value)
{
    if (!value) {
        return "Average Calories: N/A";
    }
    return QString(" %1 cal").arg(*value, 0, 'f', 2);
}
