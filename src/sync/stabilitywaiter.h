#pragma once

#include <QString>

class SyncClock;

// Waits for a file written by an external sync client to stop growing.
//
// Each attempt samples the file size, sleeps sampleDelayMs and samples again.
// The file is stable when both samples exist, are non-zero and are equal.
// Failed attempts are separated by retryDelayMs, up to maxAttempts in total.
// A missing file counts as "not yet stable", never as an error.
class StabilityWaiter {
public:
    static constexpr int DEFAULT_ATTEMPTS = 30;
    static constexpr int DEFAULT_SAMPLE_DELAY_MS = 500;
    static constexpr int DEFAULT_RETRY_DELAY_MS = 2000;

    explicit StabilityWaiter(SyncClock* clock,
                             int maxAttempts = DEFAULT_ATTEMPTS,
                             int sampleDelayMs = DEFAULT_SAMPLE_DELAY_MS,
                             int retryDelayMs = DEFAULT_RETRY_DELAY_MS);

    /// @return true once stable, false when the retry budget is exhausted
    bool waitForStable(const QString& filePath);

    /// Attempts consumed by the last waitForStable() call
    int attemptsUsed() const { return m_attemptsUsed; }

    /// Size in bytes, or -1 if the file does not exist
    static qint64 currentSize(const QString& filePath);

private:
    SyncClock* m_clock;
    int m_maxAttempts;
    int m_sampleDelayMs;
    int m_retryDelayMs;
    int m_attemptsUsed = 0;
};
