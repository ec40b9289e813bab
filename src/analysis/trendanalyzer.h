#pragma once

#include <QDate>
#include <QVector>
#include <QString>
#include "../history/weightrecord.h"

struct WeightPoint {
    QDate date;
    double weight = 0;
};

/**
 * TrendAnalyzer builds the data behind the weight chart.
 *
 * The chart uses a category X axis: points are evenly spaced by index, not by
 * date. The trend line is therefore a least-squares fit of weight against the
 * point index 0..n-1.
 */
class TrendAnalyzer {
public:
    /**
     * Parse records into chartable points.
     * Records whose date or weight cannot be parsed (or whose weight is not
     * finite) are skipped. The result is sorted ascending by date and holds
     * one point per date: the last record entered for that day wins.
     */
    static QVector<WeightPoint> extractPoints(const WeightRecordList& records);

    /**
     * Least-squares trend over the point index.
     * @return one trend value per point, same order. Empty for no points;
     *         the single weight for one point.
     */
    static QVector<double> computeTrend(const QVector<WeightPoint>& points);
    static QVector<double> computeTrend(const QVector<double>& weights);

    /// A trend is drawn only if it matches the data length and every value is finite
    static bool isPlottable(const QVector<double>& trend, int pointCount);

    static bool parseDate(const QString& text, QDate& date);
    static bool parseWeight(const QString& text, double& value);
};
