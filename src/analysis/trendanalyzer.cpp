#include "trendanalyzer.h"
#include <QLocale>
#include <QtMath>
#include <algorithm>

namespace {

// Tried in order before falling back to locale formats
const char* const DATE_FORMATS[] = {
    "M/d/yyyy", "MM/dd/yyyy",
    "M/d/yy",   "MM/dd/yy",
    "yyyy-MM-dd",
    "yyyy/M/d", "yyyy/MM/dd"
};

bool isTwoDigitYearFormat(const QString& format)
{
    return format.contains("yy") && !format.contains("yyyy");
}

}  // namespace

bool TrendAnalyzer::parseDate(const QString& text, QDate& date)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return false;
    }

    for (const char* format : DATE_FORMATS) {
        QDate parsed = QDate::fromString(trimmed, QString::fromLatin1(format));
        if (!parsed.isValid()) {
            continue;
        }
        if (isTwoDigitYearFormat(QString::fromLatin1(format))) {
            // Qt maps two-digit years to 19xx; keep 00-49 in this century
            if (parsed.year() < 1950) {
                parsed = parsed.addYears(100);
            }
        } else if (parsed.year() < 100) {
            continue;  // "24" read as year 0024, let the yy formats take it
        }
        date = parsed;
        return true;
    }

    const QLocale locales[] = { QLocale::system(), QLocale::c() };
    for (const QLocale& locale : locales) {
        for (QLocale::FormatType type : { QLocale::ShortFormat, QLocale::LongFormat }) {
            QDate parsed = locale.toDate(trimmed, type);
            if (parsed.isValid()) {
                date = parsed;
                return true;
            }
        }
    }

    return false;
}

bool TrendAnalyzer::parseWeight(const QString& text, double& value)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return false;
    }

    // User input usually matches the system locale; stored files may not
    bool ok = false;
    double parsed = QLocale::system().toDouble(trimmed, &ok);
    if (!ok) {
        parsed = QLocale::c().toDouble(trimmed, &ok);
    }
    if (!ok) {
        return false;
    }

    value = parsed;
    return true;
}

QVector<WeightPoint> TrendAnalyzer::extractPoints(const WeightRecordList& records)
{
    QVector<WeightPoint> parsed;
    parsed.reserve(records.size());

    for (const WeightRecord& record : records) {
        WeightPoint point;
        if (!parseDate(record.date, point.date)) continue;
        if (!parseWeight(record.weight, point.weight)) continue;
        if (!qIsFinite(point.weight)) continue;
        parsed.append(point);
    }

    // Stable sort keeps entry order within a day, so the last entry wins below
    std::stable_sort(parsed.begin(), parsed.end(), [](const WeightPoint& a, const WeightPoint& b) {
        return a.date < b.date;
    });

    QVector<WeightPoint> points;
    points.reserve(parsed.size());
    for (const WeightPoint& point : parsed) {
        if (!points.isEmpty() && points.last().date == point.date) {
            points.last() = point;
        } else {
            points.append(point);
        }
    }
    return points;
}

QVector<double> TrendAnalyzer::computeTrend(const QVector<WeightPoint>& points)
{
    QVector<double> weights;
    weights.reserve(points.size());
    for (const WeightPoint& point : points) {
        weights.append(point.weight);
    }
    return computeTrend(weights);
}

QVector<double> TrendAnalyzer::computeTrend(const QVector<double>& weights)
{
    const qsizetype n = weights.size();
    if (n == 0) return {};
    if (n == 1) return { weights.first() };  // Flat line, avoids divide-by-zero

    // Least-squares linear regression: fits w = slope*i + intercept
    double sumX = 0, sumY = 0, sumXY = 0, sumX2 = 0;
    for (qsizetype i = 0; i < n; ++i) {
        double x = static_cast<double>(i);
        double y = weights[i];
        sumX += x;
        sumY += y;
        sumXY += x * y;
        sumX2 += x * x;
    }

    double denom = (n * sumX2) - (sumX * sumX);
    if (denom == 0) {
        return weights;
    }

    double slope = ((n * sumXY) - (sumX * sumY)) / denom;
    double intercept = (sumY - (slope * sumX)) / n;

    QVector<double> trend;
    trend.reserve(n);
    for (qsizetype i = 0; i < n; ++i) {
        trend.append((slope * i) + intercept);
    }
    return trend;
}

bool TrendAnalyzer::isPlottable(const QVector<double>& trend, int pointCount)
{
    if (trend.size() != pointCount) {
        return false;
    }
    return std::all_of(trend.cbegin(), trend.cend(), [](double v) { return qIsFinite(v); });
}
