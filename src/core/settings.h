#pragma once

#include <QObject>
#include <QSettings>
#include <QString>
#include <QHash>
#include <QVariant>

class Settings : public QObject {
    Q_OBJECT

    // Storage
    Q_PROPERTY(QString dataFilePath READ dataFilePath WRITE setDataFilePath NOTIFY dataFilePathChanged)

    // Cloud-drive sync
    Q_PROPERTY(bool syncEnabled READ syncEnabled WRITE setSyncEnabled NOTIFY syncEnabledChanged)
    Q_PROPERTY(QString syncFolder READ syncFolder WRITE setSyncFolder NOTIFY syncFolderChanged)
    Q_PROPERTY(int stabilityAttempts READ stabilityAttempts WRITE setStabilityAttempts NOTIFY stabilityChanged)
    Q_PROPERTY(int stabilitySampleDelayMs READ stabilitySampleDelayMs WRITE setStabilitySampleDelayMs NOTIFY stabilityChanged)
    Q_PROPERTY(int stabilityRetryDelayMs READ stabilityRetryDelayMs WRITE setStabilityRetryDelayMs NOTIFY stabilityChanged)

public:
    explicit Settings(QObject* parent = nullptr);

    // Backed by an INI file instead of the platform store (tests, --config)
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    // Storage
    QString dataFilePath() const;
    void setDataFilePath(const QString& path);

    // Cloud-drive sync
    bool syncEnabled() const;
    void setSyncEnabled(bool enabled);

    QString syncFolder() const;
    void setSyncFolder(const QString& folder);

    // Derived from syncFolder; empty when no sync folder is configured
    QString exportFolder() const;
    QString backupFolder() const;

    int stabilityAttempts() const;
    void setStabilityAttempts(int attempts);

    int stabilitySampleDelayMs() const;
    void setStabilitySampleDelayMs(int ms);

    int stabilityRetryDelayMs() const;
    void setStabilityRetryDelayMs(int ms);

    // Default cloud-drive folder: $OneDrive/WeightCalorieMAUI, else ~/OneDrive/WeightCalorieMAUI
    static QString defaultSyncFolder();

    // Generic settings access (for extensibility)
    Q_INVOKABLE QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const;
    Q_INVOKABLE void setValue(const QString& key, const QVariant& value);

    // Session-only value that shadows the stored one and is never written to disk.
    // Setters still persist while an override is active but do not signal a change,
    // since the getter keeps returning the override.
    void setOverride(const QString& key, const QVariant& value);

signals:
    void dataFilePathChanged();
    void syncEnabledChanged();
    void syncFolderChanged();
    void stabilityChanged();
    void valueChanged(const QString& key);

private:
    QVariant storedValue(const QString& key, const QVariant& defaultValue) const;
    bool store(const QString& key, const QVariant& value);

    QSettings m_settings;
    QHash<QString, QVariant> m_overrides;
};
