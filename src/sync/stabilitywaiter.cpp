#include "stabilitywaiter.h"
#include "syncclock.h"
#include <QFileInfo>
#include <QDebug>

StabilityWaiter::StabilityWaiter(SyncClock* clock, int maxAttempts, int sampleDelayMs, int retryDelayMs)
    : m_clock(clock)
    , m_maxAttempts(qMax(1, maxAttempts))
    , m_sampleDelayMs(qMax(0, sampleDelayMs))
    , m_retryDelayMs(qMax(0, retryDelayMs))
{
}

qint64 StabilityWaiter::currentSize(const QString& filePath)
{
    QFileInfo info(filePath);
    info.setCaching(false);
    if (!info.exists()) {
        return -1;
    }
    return info.size();
}

bool StabilityWaiter::waitForStable(const QString& filePath)
{
    m_attemptsUsed = 0;

    for (int attempt = 1; attempt <= m_maxAttempts; ++attempt) {
        m_attemptsUsed = attempt;

        qint64 first = currentSize(filePath);
        m_clock->sleep(m_sampleDelayMs);
        qint64 second = currentSize(filePath);

        if (first > 0 && first == second) {
            if (attempt > 1) {
                qDebug() << "StabilityWaiter:" << filePath << "stable after" << attempt << "attempts"
                         << "(" << second << "bytes)";
            }
            return true;
        }

        qDebug() << "StabilityWaiter: Attempt" << attempt << "of" << m_maxAttempts
                 << "- size" << first << "->" << second << "for" << filePath;

        if (attempt < m_maxAttempts) {
            m_clock->sleep(m_retryDelayMs);
        }
    }

    qWarning() << "StabilityWaiter:" << filePath << "did not stabilize after" << m_maxAttempts << "attempts";
    return false;
}
