#include <QCoreApplication>
#include <QDir>
#include <QHostAddress>
#include <QHttpServer>
#include <QTcpServer>
#include <QTextStream>

#include <csignal>
#include <cstdio>

#include "config/server_args.h"
#include "config/server_config.h"
#include "http/api_router.h"
#include "server_manager.h"
#include "utils/server_logger.h"

using namespace mcphub_server;

namespace {

constexpr const char* kVersion = "0.1.0";

/// 日志器初始化之后的失败出口
int exitWithError(int code, const QString& message) {
    qCritical("%s", qUtf8Printable(message));
    ServerLogger::shutdown();
    return code;
}

void initLogging(const ServerConfig& config, const QString& logDir) {
    ServerLogger::Config logConfig;
    logConfig.logLevel = config.logLevel;
    logConfig.logDir = logDir;
    logConfig.fileName = "server.log";
    logConfig.maxFileBytes = config.logMaxBytes;
    logConfig.maxFiles = config.logMaxFiles;

    QString logErr;
    if (!ServerLogger::init(logConfig, logErr)) {
        // 文件日志不可用时仍然可以只写 stderr
        std::fprintf(stderr, "Warning: %s\n", qUtf8Printable(logErr));
    }
}

void requestQuitSignalHandler(int) {
    QMetaObject::invokeMethod(
        qApp,
        []() { QCoreApplication::quit(); },
        Qt::QueuedConnection);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("mcphub_server");
    QCoreApplication::setApplicationVersion(kVersion);

    const ServerArgs args = ServerArgs::parse(app.arguments());
    if (args.help) {
        QTextStream(stderr) << ServerArgs::usage();
        return 0;
    }
    if (args.version) {
        std::fprintf(stderr, "mcphub_server %s\n", kVersion);
        return 0;
    }
    if (!args.error.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(args.error));
        return 2;
    }

    const QString dataRoot = QDir(args.dataRoot).absolutePath();

    // 命令行覆盖 config.json
    QString cfgErr;
    ServerConfig config = ServerConfig::loadFromFile(dataRoot + "/config.json", cfgErr);
    if (!cfgErr.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(cfgErr));
        return 2;
    }
    config.applyArgs(args);

    const QString logDir = dataRoot + "/logs";
    if (!QDir(logDir).mkpath(".")) {
        std::fprintf(stderr, "Error: cannot create %s\n", qUtf8Printable(logDir));
        return 1;
    }
    initLogging(config, logDir);

    qInfo("mcphub_server %s, data root %s", kVersion, qUtf8Printable(dataRoot));
    qInfo("Call timeout %d ms, startup timeout %d ms, shutdown grace %d ms",
          config.callTimeoutMs, config.startupTimeoutMs, config.shutdownGraceMs);

    // initialize 负责创建项目目录
    ServerManager manager(dataRoot, config);
    QString initErr;
    if (!manager.initialize(initErr)) {
        return exitWithError(1, "Init error: " + initErr);
    }

    QHttpServer httpServer;
    ApiRouter router(&manager);
    router.registerRoutes(httpServer);
    manager.registerWebSocket(httpServer);

    QTcpServer tcpServer;
    if (!tcpServer.listen(QHostAddress(config.host), static_cast<quint16>(config.port))) {
        return exitWithError(1, QString("failed to listen on %1:%2: %3")
                                    .arg(config.host)
                                    .arg(config.port)
                                    .arg(tcpServer.errorString()));
    }
    if (!httpServer.bind(&tcpServer)) {
        return exitWithError(1, "failed to bind HTTP server");
    }
    qInfo("HTTP server listening on %s:%d", qUtf8Printable(config.host),
          static_cast<int>(tcpServer.serverPort()));

    std::signal(SIGINT, requestQuitSignalHandler);
#ifdef SIGTERM
    std::signal(SIGTERM, requestQuitSignalHandler);
#endif

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&manager]() {
        qInfo("Shutting down, stopping %d debug session(s)",
              manager.serverStatus().activeSessions);
        manager.shutdown();
    });

    const int rc = app.exec();
    ServerLogger::shutdown();
    return rc;
}
