#include "tail/TailCli.hpp"

#include <iostream>

#include <QCommandLineParser>
#include <QDir>
#include <QEventLoop>
#include <QFileInfo>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/tfscope_version.hpp"
#include "ingest/ingestion_engine.hpp"
#include "ingest/source_registry.hpp"
#include "tail/TailConsole.hpp"

#include <nlohmann/json.hpp>

namespace tfscope {

QStringList TailCli::expandPaths(const QStringList &args) const
{
    QStringList paths;
    for (const QString &arg : args) {
        const QFileInfo info(arg);
        const QString pattern = info.fileName();
        if (!pattern.contains(QLatin1Char('*')) && !pattern.contains(QLatin1Char('?'))
            && !pattern.contains(QLatin1Char('['))) {
            paths.append(arg);
            continue;
        }

        const QDir dir(info.path());
        const QFileInfoList matches = dir.entryInfoList(QStringList{pattern},
                                                        QDir::Files | QDir::Dirs
                                                            | QDir::NoDotAndDotDot,
                                                        QDir::Name);
        if (matches.isEmpty()) {
            std::cerr << "No match for " << arg.toStdString() << std::endl;
        }
        for (const QFileInfo &match : matches) {
            paths.append(match.filePath());
        }
    }
    return paths;
}

int TailCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Tails event logs and record files and prints what gets indexed."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    QCommandLineOption preloadOption(QStringList() << "interactive-preload",
                                     "Stream tags and steps while the initial load runs.");
    QCommandLineOption intervalOption(QStringList() << "interval",
                                      "Poll interval in milliseconds.", "ms");
    QCommandLineOption onceOption(QStringList() << "once",
                                  "Exit after the initial load.");
    QCommandLineOption formatOption(QStringList() << "format",
                                    "Output format: text or json.", "format",
                                    QStringLiteral("text"));
    QCommandLineOption exportOption(QStringList() << "export",
                                    "Save the newest image of every image tag into DIR.", "dir");
    QCommandLineOption configOption(QStringList() << "config",
                                    "Path to the JSON configuration file.", "path");
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    parser.addOption(preloadOption);
    parser.addOption(intervalOption);
    parser.addOption(onceOption);
    parser.addOption(formatOption);
    parser.addOption(exportOption);
    parser.addOption(configOption);
    parser.addOption(traceOption);
    parser.addPositionalArgument("paths", "Event files, event directories or record files.",
                                 "paths...");

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << std::endl;
        return 1;
    }
    if (parser.isSet(helpOption)) {
        std::cout << parser.helpText().toStdString();
        return 0;
    }
    if (parser.isSet(versionOption)) {
        std::cout << "tfscope-tail " << TFSCOPE_VERSION << std::endl;
        return 0;
    }

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("TFSCOPE_TRACE") == 1;
    logging::initLogging(QStringLiteral("tfscope-tail"), trace);

    ScopeConfig config = loadConfig(parser.value(configOption));
    if (parser.isSet(intervalOption)) {
        bool ok = false;
        const int interval = parser.value(intervalOption).toInt(&ok);
        if (!ok || interval <= 0) {
            std::cerr << "Invalid --interval: " << parser.value(intervalOption).toStdString()
                      << std::endl;
            return 1;
        }
        config.pollIntervalMs = interval;
    }
    if (parser.isSet(preloadOption)) {
        config.interactivePreload = true;
    }
    if (trace) {
        config.traceLogging = true;
    }
    if (config.traceLogging != trace) {
        logging::initLogging(QStringLiteral("tfscope-tail"), config.traceLogging);
    }

    TailOptions options;
    const QString format = parser.value(formatOption);
    if (format == QLatin1String("json")) {
        options.format = TailOptions::Format::Json;
    } else if (format != QLatin1String("text")) {
        std::cerr << "Invalid --format: " << format.toStdString() << std::endl;
        return 1;
    }
    options.once = parser.isSet(onceOption);
    options.exportDir = parser.value(exportOption);

    const QStringList paths = expandPaths(parser.positionalArguments());
    if (paths.isEmpty()) {
        std::cerr << parser.helpText().toStdString();
        return 1;
    }

    TFS_LOG_INFO(QStringLiteral("TailCli"),
                 QStringLiteral("run"),
                 QStringLiteral("tail_starting"),
                 QStringLiteral("cli"),
                 QStringLiteral("ingestion_engine"),
                 logging::defaultWho(),
                 QString(),
                 nlohmann::json{{"version", TFSCOPE_VERSION},
                                {"paths", paths.size()},
                                {"config", configToJson(config)}});

    const SourceRegistry registry = SourceRegistry::withDefaultKinds();
    IngestionEngine engine(registry, config);
    TailConsole console(engine, options);
    QEventLoop loop;
    QObject::connect(&console, &TailConsole::finished, &loop, [&engine, &loop](int exitCode) {
        engine.stop();
        loop.exit(exitCode);
    });

    const QStringList unresolved = engine.start(paths);
    for (const QString &path : unresolved) {
        std::cerr << "Cannot load " << path.toStdString() << std::endl;
    }
    if (unresolved.size() == paths.size()) {
        engine.stop();
        return 1;
    }

    return loop.exec();
}

} // namespace tfscope
