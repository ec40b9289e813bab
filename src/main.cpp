#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QDebug>
#include <algorithm>
#include <memory>

#include "core/settings.h"
#include "core/logger.h"
#include "history/recordstorage.h"
#include "sync/syncmanager.h"
#include "controllers/maincontroller.h"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFailed = 1,
    ExitUsage = 2
};

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

int usageError(QCommandLineParser& parser, const QString& message)
{
    err() << message << "\n\n" << parser.helpText();
    err().flush();
    return ExitUsage;
}

bool validField(const QString& value)
{
    return !value.trimmed().isEmpty() && !value.contains(',');
}

QJsonValue optionalJson(const std::optional<double>& value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

int runList(MainController& controller)
{
    const WeightRecordList records = controller.loadRecords();
    for (const WeightRecord& record : records) {
        out() << record.date << "\t" << record.weight << "\t" << record.calorie << "\n";
    }
    return ExitOk;
}

int runStats(MainController& controller, bool json)
{
    controller.loadRecords();
    WeightAverages averages = controller.currentAverages();

    if (json) {
        QJsonObject obj;
        obj["records"] = controller.recordCount();
        obj["averageLoss"] = optionalJson(averages.averageLoss);
        obj["averageCalories"] = optionalJson(averages.averageCalories);
        out() << QJsonDocument(obj).toJson(QJsonDocument::Indented);
    } else {
        out() << "Records:       " << controller.recordCount() << "\n";
        out() << "Average loss: " << controller.averageLossText() << "\n";
        out() << "Average cal:  " << controller.averageCaloriesText() << "\n";
    }
    return ExitOk;
}

int runTrend(MainController& controller, bool json)
{
    controller.loadRecords();
    const QVector<WeightPoint> points = controller.chartPoints();
    if (points.isEmpty()) {
        err() << "No valid weight/date records were found to chart.\n";
        return ExitFailed;
    }

    QVector<double> trend = controller.computeTrend(points);
    bool showTrend = points.size() >= 2 && TrendAnalyzer::isPlottable(trend, static_cast<int>(points.size()));

    if (json) {
        QJsonArray rows;
        for (qsizetype i = 0; i < points.size(); ++i) {
            QJsonObject row;
            row["date"] = points[i].date.toString(Qt::ISODate);
            row["weight"] = points[i].weight;
            row["trend"] = showTrend ? QJsonValue(trend[i]) : QJsonValue(QJsonValue::Null);
            rows.append(row);
        }
        out() << QJsonDocument(rows).toJson(QJsonDocument::Indented);
    } else {
        for (qsizetype i = 0; i < points.size(); ++i) {
            out() << points[i].date.toString("MM/dd/yyyy") << "\t"
                  << QString::number(points[i].weight, 'f', 1);
            if (showTrend) {
                out() << "\t" << QString::number(trend[i], 'f', 2);
            }
            out() << "\n";
        }
    }
    return ExitOk;
}

}  // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setOrganizationName("WeighIn");
    app.setApplicationName("WeighIn");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Personal weight and calorie tracker with cloud-drive sync.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Read settings from INI <file>.", "file");
    QCommandLineOption dataFileOption("data-file", "Use <path> as the record store for this run.", "path");
    QCommandLineOption syncFolderOption("sync-folder", "Use <folder> as the cloud-drive folder for this run.", "folder");
    QCommandLineOption noSyncOption("no-sync", "Skip the cloud-drive import and export for this run.");
    QCommandLineOption logFileOption("log-file", "Write the log to <path>.", "path");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Include debug messages in the log.");
    QCommandLineOption jsonOption("json", "Print stats/trend as JSON.");
    parser.addOptions({configOption, dataFileOption, syncFolderOption, noSyncOption,
                       logFileOption, verboseOption, jsonOption});

    parser.addPositionalArgument("command",
        "list | add DATE WEIGHT CALORIES | edit DATE WEIGHT CALORIES | delete DATE | "
        "stats | trend | export | import");

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usageError(parser, "Missing command.");
    }

    Logger::init(parser.isSet(logFileOption) ? parser.value(logFileOption) : Logger::defaultLogFilePath(),
                 parser.isSet(verboseOption));
    qInfo() << "WeighIn" << app.applicationVersion() << "command:" << args.join(' ');

    // Create core objects
    std::unique_ptr<Settings> settings = parser.isSet(configOption)
        ? std::make_unique<Settings>(parser.value(configOption))
        : std::make_unique<Settings>();
    if (parser.isSet(dataFileOption)) {
        settings->setOverride("storage/dataFile", parser.value(dataFileOption));
    }
    if (parser.isSet(syncFolderOption)) {
        settings->setOverride("sync/folder", parser.value(syncFolderOption));
    }
    if (parser.isSet(noSyncOption)) {
        settings->setOverride("sync/enabled", false);
    }

    RecordStorage storage(settings->dataFilePath());
    SyncManager syncManager(settings.get(), &storage);
    MainController controller(&storage, &syncManager);

    QObject::connect(&controller, &MainController::statusMessage,
                     [](const QString& title, const QString& message) {
        err() << title << ": " << message << "\n";
    });

    const QString command = args.first();
    const bool json = parser.isSet(jsonOption);
    int exitCode = ExitOk;

    if (command == "list") {
        exitCode = runList(controller);
    } else if (command == "add" || command == "edit") {
        if (args.size() != 4) {
            exitCode = usageError(parser, command + " expects DATE WEIGHT CALORIES.");
        } else if (!std::all_of(args.cbegin() + 1, args.cend(), validField)) {
            exitCode = usageError(parser, "Fields must be non-empty and must not contain ','.");
        } else {
            bool stored = command == "add"
                ? controller.appendRecord(WeightRecord{args[1], args[2], args[3]})
                : controller.updateRecord(args[1], args[2], args[3]);
            exitCode = stored ? ExitOk : ExitFailed;
        }
    } else if (command == "delete") {
        if (args.size() != 2) {
            exitCode = usageError(parser, "delete expects DATE.");
        } else {
            exitCode = controller.deleteRecord(args[1]) ? ExitOk : ExitFailed;
        }
    } else if (command == "stats") {
        exitCode = runStats(controller, json);
    } else if (command == "trend") {
        exitCode = runTrend(controller, json);
    } else if (command == "export") {
        SyncResult result = controller.exportSnapshot();
        if (result.succeeded()) {
            out() << "Database exported to " << result.path
                  << ". Allow ~30 seconds for the cloud drive to sync.\n";
        } else {
            err() << "Export: " << syncStatusName(result.status) << " " << result.message << "\n";
            exitCode = ExitFailed;
        }
    } else if (command == "import") {
        if (controller.startup()) {
            out() << "Imported " << controller.recordCount() << " records.\n";
        } else {
            err() << "Nothing imported.\n";
            exitCode = ExitFailed;
        }
    } else {
        exitCode = usageError(parser, "Unknown command: " + command);
    }

    out().flush();
    err().flush();
    Logger::shutdown();
    return exitCode;
}
