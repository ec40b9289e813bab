#include "logger.h"
#include <QDateTime>
#include <QTextStream>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

QFile* Logger::s_file = nullptr;
QMutex Logger::s_mutex;
QString Logger::s_filePath;
QtMessageHandler Logger::s_originalHandler = nullptr;
bool Logger::s_verbose = false;

void Logger::init(const QString& filePath, bool verbose)
{
    QMutexLocker lock(&s_mutex);

    if (s_file) {
        return; // Already initialized
    }

    s_filePath = filePath;
    s_verbose = verbose;

    // Ensure directory exists
    QFileInfo fi(filePath);
    QDir().mkpath(fi.absolutePath());

    s_file = new QFile(filePath);
    if (!s_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        delete s_file;
        s_file = nullptr;
        return;
    }

    // Write header
    QTextStream stream(s_file);
    stream << "\n========================================\n";
    stream << "Log started: " << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
    stream << "========================================\n";
    s_file->flush();

    // Install our message handler to capture all qDebug() etc.
    s_originalHandler = qInstallMessageHandler(messageHandler);
}

void Logger::shutdown()
{
    QMutexLocker lock(&s_mutex);

    if (s_file) {
        // Restore original handler; nullptr reinstates Qt's default one
        qInstallMessageHandler(s_originalHandler);
        s_originalHandler = nullptr;

        s_file->close();
        delete s_file;
        s_file = nullptr;
    }
}

QString Logger::logFilePath()
{
    return s_filePath;
}

QString Logger::defaultLogFilePath()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/weighin.log";
}

void Logger::setVerbose(bool verbose)
{
    QMutexLocker lock(&s_mutex);
    s_verbose = verbose;
}

bool Logger::shouldFilter(QtMsgType type)
{
    // Debug chatter (stability polling, per-record messages) only when asked for
    return type == QtDebugMsg && !s_verbose;
}

void Logger::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    // Format: [HH:mm:ss.zzz] LEVEL: message
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString level;
    switch (type) {
        case QtDebugMsg:    level = "DEBUG"; break;
        case QtInfoMsg:     level = "INFO"; break;
        case QtWarningMsg:  level = "WARN"; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }

    QString line = QString("[%1] %2: %3").arg(timestamp, level, msg);

    bool filtered = false;
    {
        QMutexLocker lock(&s_mutex);
        filtered = shouldFilter(type);
        if (!filtered && s_file && s_file->isOpen()) {
            QTextStream stream(s_file);
            stream << line << "\n";
            s_file->flush();
        }
    }

    // Also pass to original handler (console)
    if (!filtered && s_originalHandler) {
        s_originalHandler(type, context, msg);
    }
}
