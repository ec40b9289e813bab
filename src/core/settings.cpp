#include "settings.h"
#include "../sync/stabilitywaiter.h"
#include "../history/recordstorage.h"
#include <QDir>

Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings("WeighIn", "WeighIn")
{
}

Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
}

// Storage
QString Settings::dataFilePath() const {
    return value("storage/dataFile", RecordStorage::defaultFilePath()).toString();
}

void Settings::setDataFilePath(const QString& path) {
    if (storedValue("storage/dataFile", RecordStorage::defaultFilePath()).toString() != path) {
        if (store("storage/dataFile", path)) {
            emit dataFilePathChanged();
        }
    }
}

// Cloud-drive sync
bool Settings::syncEnabled() const {
    return value("sync/enabled", true).toBool();
}

void Settings::setSyncEnabled(bool enabled) {
    if (storedValue("sync/enabled", true).toBool() != enabled) {
        if (store("sync/enabled", enabled)) {
            emit syncEnabledChanged();
        }
    }
}

QString Settings::syncFolder() const {
    return value("sync/folder", defaultSyncFolder()).toString();
}

void Settings::setSyncFolder(const QString& folder) {
    if (storedValue("sync/folder", defaultSyncFolder()).toString() != folder) {
        if (store("sync/folder", folder)) {
            emit syncFolderChanged();
        }
    }
}

QString Settings::exportFolder() const {
    QString folder = syncFolder();
    return folder.isEmpty() ? QString() : QDir(folder).filePath("Export");
}

QString Settings::backupFolder() const {
    QString folder = syncFolder();
    return folder.isEmpty() ? QString() : QDir(folder).filePath("Backups");
}

int Settings::stabilityAttempts() const {
    return value("sync/stabilityAttempts", StabilityWaiter::DEFAULT_ATTEMPTS).toInt();
}

void Settings::setStabilityAttempts(int attempts) {
    if (storedValue("sync/stabilityAttempts", StabilityWaiter::DEFAULT_ATTEMPTS).toInt() != attempts) {
        if (store("sync/stabilityAttempts", attempts)) {
            emit stabilityChanged();
        }
    }
}

int Settings::stabilitySampleDelayMs() const {
    return value("sync/sampleDelayMs", StabilityWaiter::DEFAULT_SAMPLE_DELAY_MS).toInt();
}

void Settings::setStabilitySampleDelayMs(int ms) {
    if (storedValue("sync/sampleDelayMs", StabilityWaiter::DEFAULT_SAMPLE_DELAY_MS).toInt() != ms) {
        if (store("sync/sampleDelayMs", ms)) {
            emit stabilityChanged();
        }
    }
}

int Settings::stabilityRetryDelayMs() const {
    return value("sync/retryDelayMs", StabilityWaiter::DEFAULT_RETRY_DELAY_MS).toInt();
}

void Settings::setStabilityRetryDelayMs(int ms) {
    if (storedValue("sync/retryDelayMs", StabilityWaiter::DEFAULT_RETRY_DELAY_MS).toInt() != ms) {
        if (store("sync/retryDelayMs", ms)) {
            emit stabilityChanged();
        }
    }
}

QString Settings::defaultSyncFolder() {
    // The OneDrive client exports its root folder on Windows
    QString oneDrive = qEnvironmentVariable("OneDrive");
    if (oneDrive.isEmpty()) {
        oneDrive = QDir::homePath() + "/OneDrive";
    }
    return QDir(oneDrive).filePath("WeightCalorieMAUI");
}

QVariant Settings::value(const QString& key, const QVariant& defaultValue) const {
    auto it = m_overrides.constFind(key);
    if (it != m_overrides.constEnd()) {
        return it.value();
    }
    return m_settings.value(key, defaultValue);
}

void Settings::setValue(const QString& key, const QVariant& value) {
    m_settings.setValue(key, value);
    emit valueChanged(key);
}

QVariant Settings::storedValue(const QString& key, const QVariant& defaultValue) const {
    return m_settings.value(key, defaultValue);
}

bool Settings::store(const QString& key, const QVariant& value) {
    m_settings.setValue(key, value);
    // An active override keeps shadowing the stored value for this session
    return !m_overrides.contains(key);
}

void Settings::setOverride(const QString& key, const QVariant& value) {
    m_overrides.insert(key, value);
    emit valueChanged(key);
}
