#include <QCoreApplication>
#include <QDir>
#include <QTextStream>

#include <csignal>
#include <cstdio>

#include "config/hub_args.h"
#include "config/server_config.h"
#include "manager/multi_service_runner.h"
#include "mcphub/supervisor/port_pool.h"
#include "mcphub/supervisor/service_config.h"
#include "utils/process_env_utils.h"
#include "utils/server_logger.h"

using namespace mcphub_server;

namespace {

void requestQuitSignalHandler(int) {
    QMetaObject::invokeMethod(
        qApp,
        []() { QCoreApplication::quit(); },
        Qt::QueuedConnection);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("mcphub_hub");
    QCoreApplication::setApplicationVersion("0.1.0");

    const HubArgs args = HubArgs::parse(app.arguments());
    if (args.help) {
        QTextStream err(stderr);
        err << HubArgs::usage();
        err.flush();
        return 0;
    }
    if (args.version) {
        std::fprintf(stderr, "mcphub_hub 0.1.0\n");
        return 0;
    }
    if (!args.error.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(args.error));
        return 2;
    }

    const QString dataRoot = QDir(args.dataRoot).absolutePath();

    // config.json 提供项目根目录、端口范围与日志滚动参数
    QString cfgErr;
    const ServerConfig config = ServerConfig::loadFromFile(dataRoot + "/config.json", cfgErr);
    if (!cfgErr.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(cfgErr));
        return 2;
    }

    const QString logDir = dataRoot + "/logs";
    if (!QDir(logDir).mkpath(".")) {
        std::fprintf(stderr, "Error: cannot create %s\n", qUtf8Printable(logDir));
        return 1;
    }

    ServerLogger::Config logConfig;
    logConfig.logLevel = args.logLevel;
    logConfig.logDir = logDir;
    logConfig.fileName = "hub.log";
    logConfig.maxFileBytes = config.logMaxBytes;
    logConfig.maxFiles = config.logMaxFiles;
    QString logErr;
    if (!ServerLogger::init(logConfig, logErr)) {
        std::fprintf(stderr, "Warning: %s\n", qUtf8Printable(logErr));
    }

    const QString tablePath = args.resolvedConfigPath();
    QString tableErr;
    const QVector<mcphub::ServiceConfig> services = mcphub::ServiceTable::loadFromFile(
        tablePath, config.resolvedProjectsDir(dataRoot), tableErr);
    if (!tableErr.isEmpty()) {
        qCritical("Service table %s: %s", qUtf8Printable(tablePath), qUtf8Printable(tableErr));
        ServerLogger::shutdown();
        return 2;
    }

    mcphub::PortPool portPool(config.portRangeStart, config.portRangeEnd);

    MultiServiceRunner::Options options;
    options.backoff.maxRetries = args.maxRetries;
    options.backoff.baseMs = args.backoffBaseMs;
    options.backoff.capMs = args.backoffCapMs;
    options.shutdownTimeoutMs = args.shutdownTimeoutMs;
    options.startupTimeoutMs = config.startupTimeoutMs;
    options.graceMs = config.shutdownGraceMs;
    options.logDir = logDir;
    options.logMaxBytes = config.logMaxBytes;
    options.logMaxFiles = config.logMaxFiles;
    options.environment = childBaseEnvironment();
    options.portPool = &portPool;

    MultiServiceRunner runner(options);
    QString setupErr;
    if (!runner.setServices(services, setupErr)) {
        qCritical("Service setup failed: %s", qUtf8Printable(setupErr));
        ServerLogger::shutdown();
        return 1;
    }

    // 在启动任何子进程之前接管退出信号，启动期间收到也能走完 stopAll
    std::signal(SIGINT, requestQuitSignalHandler);
#ifdef SIGTERM
    std::signal(SIGTERM, requestQuitSignalHandler);
#endif

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        qInfo("Stopping all services");
        runner.stopAll();
    });

    qInfo("Starting %d service(s) from %s", runner.serviceCount(), qUtf8Printable(tablePath));
    const int launched = runner.startAll();
    qInfo("%d of %d service(s) launched", launched, runner.serviceCount());

    const int rc = app.exec();
    ServerLogger::shutdown();
    return rc;
}
