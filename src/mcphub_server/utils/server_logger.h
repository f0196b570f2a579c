#pragma once

#include <QString>

namespace mcphub_server {

/**
 * 进程级日志：Qt 消息处理器转发到 spdlog（stderr 彩色 + 滚动文件）
 */
class ServerLogger {
public:
    struct Config {
        QString logLevel = "info";
        QString logDir;                    // 空：只输出到 stderr
        QString fileName = "server.log";   // hub 模式为 hub.log
        qint64 maxFileBytes = 10 * 1024 * 1024;
        int maxFiles = 3;
        bool console = true;
    };

    static bool init(const Config& config, QString& error);
    static void setLevel(const QString& level);
    static void shutdown();

private:
    ServerLogger() = delete;
};

} // namespace mcphub_server
