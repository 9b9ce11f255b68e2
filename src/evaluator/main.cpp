#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/evaluator_config.hpp"
#include "common/logging.hpp"
#include "common/skyshield_version.hpp"
#include "evaluator/evaluator_daemon.hpp"
#include "evaluator/sqlite_track_store.hpp"

namespace {

QString resolveConfigPath(const QCommandLineParser &parser,
                          const QCommandLineOption &configOption)
{
    if (parser.isSet(configOption)) {
        return parser.value(configOption);
    }
    const QString fromEnv = qEnvironmentVariable("SKYSHIELD_CONFIG");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    const QString fallback = QString::fromStdString(skyshield::defaultConfigPath());
    if (QFileInfo::exists(fallback)) {
        return fallback;
    }
    return QString();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("skyshield-evaluator"));
    QCoreApplication::setApplicationVersion(QStringLiteral(SKYSHIELD_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Skyshield threat evaluation engine"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "Path to the evaluator JSON config.", "path");
    QCommandLineOption dbOption(QStringList() << "db",
                                "Path to the track database (overrides databasePath).",
                                "path");
    QCommandLineOption onceOption(QStringList() << "once",
                                  "Run a single evaluation cycle and exit.");
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    parser.addOption(configOption);
    parser.addOption(dbOption);
    parser.addOption(onceOption);
    parser.addOption(traceOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("SKYSHIELD_TRACE") == 1;
    skyshield::logging::initLogging(QStringLiteral("skyshield-evaluator"), trace);

    qInfo() << "Skyshield threat evaluator online (version" << SKYSHIELD_VERSION << ")";

    const QString configPath = resolveConfigPath(parser, configOption);
    skyshield::EvaluatorConfig config;
    try {
        config = configPath.isEmpty()
            ? skyshield::defaultConfig()
            : skyshield::loadConfigFile(configPath.toStdString());
        if (parser.isSet(dbOption)) {
            skyshield::applyDatabaseOverride(config, parser.value(dbOption).toStdString());
        }
    } catch (const skyshield::ConfigError &ex) {
        qCritical() << "Skyshield: invalid configuration:" << ex.what();
        SLOG_ERROR(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("config_invalid"),
                   QStringLiteral("config_error"),
                   QStringLiteral("exit_nonzero"),
                   skyshield::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", configPath.toStdString()},
                                  {"error", ex.what()}});
        return 1;
    }

    std::unique_ptr<skyshield::SqliteTrackStore> store;
    try {
        store = std::make_unique<skyshield::SqliteTrackStore>(config.databasePath);
        std::string integrityMessage;
        if (!store->integrityCheck(&integrityMessage)) {
            throw skyshield::StoreConnectionError("integrity check failed: "
                                                  + integrityMessage);
        }
    } catch (const skyshield::StoreConnectionError &ex) {
        qCritical() << "Skyshield: cannot open track store:" << ex.what();
        SLOG_ERROR(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("store_setup_failed"),
                   QStringLiteral("connection_failure"),
                   QStringLiteral("exit_nonzero"),
                   skyshield::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"databasePath", config.databasePath},
                                  {"error", ex.what()}});
        return 1;
    }

    // The daemon lives for the lifetime of the process.
    skyshield::EvaluatorDaemon daemon(config, std::move(store));
    if (parser.isSet(onceOption)) {
        daemon.setMaxCycles(1);
    }
    QObject::connect(&daemon, &skyshield::EvaluatorDaemon::stopped,
                     &app, [](int exitCode) { QCoreApplication::exit(exitCode); });
    daemon.start();

    return app.exec();
}
