#include "server_logger.h"

#include <QDir>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mcphub_server {

namespace {

spdlog::level::level_enum toSpdlogLevel(const QString& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

QtMessageHandler s_previousHandler = nullptr;

// 非 default 分类加上 "[category]" 前缀
std::string formatMessage(const QMessageLogContext& context, const QString& msg) {
    if (context.category && std::strcmp(context.category, "default") != 0) {
        return "[" + std::string(context.category) + "] " + msg.toStdString();
    }
    return msg.toStdString();
}

void qtToSpdlogHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    auto logger = spdlog::default_logger();
    const std::string text = formatMessage(context, msg);
    switch (type) {
    case QtDebugMsg:    logger->debug("{}", text); break;
    case QtInfoMsg:     logger->info("{}", text); break;
    case QtWarningMsg:  logger->warn("{}", text); break;
    case QtCriticalMsg: logger->error("{}", text); break;
    case QtFatalMsg:
        logger->critical("{}", text);
        logger->flush();
        std::abort();
    }
}

} // namespace

bool ServerLogger::init(const Config& config, QString& error) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (!config.logDir.isEmpty()) {
            if (!QDir().mkpath(config.logDir)) {
                error = "cannot create log directory: " + config.logDir;
                return false;
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                QDir(config.logDir).filePath(config.fileName).toStdString(),
                static_cast<size_t>(config.maxFileBytes),
                static_cast<size_t>(config.maxFiles)));
        }

        auto logger = std::make_shared<spdlog::logger>("mcphub", sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(config.logLevel));
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ [%L] %v", spdlog::pattern_time_type::utc);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        QtMessageHandler previous = qInstallMessageHandler(qtToSpdlogHandler);
        // 重复 init 时保留最初的处理器
        if (previous != qtToSpdlogHandler) {
            s_previousHandler = previous;
        }
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        error = QString("failed to initialize logger: %1").arg(ex.what());
        return false;
    }
}

void ServerLogger::setLevel(const QString& level) {
    spdlog::default_logger()->set_level(toSpdlogLevel(level));
}

void ServerLogger::shutdown() {
    qInstallMessageHandler(s_previousHandler);
    s_previousHandler = nullptr;
    spdlog::shutdown();
}

} // namespace mcphub_server
