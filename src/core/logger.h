#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>
#include <QMutex>

// Mirrors qDebug()/qWarning() output into a log file, by default
// defaultLogFilePath() under the app's local data folder.
class Logger
{
public:
    static void init(const QString& filePath, bool verbose = false);
    static void shutdown();
    static QString logFilePath();
    static QString defaultLogFilePath();

    static void setVerbose(bool verbose);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);
    static bool shouldFilter(QtMsgType type);

    static QFile* s_file;
    static QMutex s_mutex;
    static QString s_filePath;
    static QtMessageHandler s_originalHandler;
    static bool s_verbose;
};

#endif // LOGGER_H
