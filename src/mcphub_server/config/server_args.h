#pragma once

#include <QString>
#include <QStringList>

namespace mcphub_server {

bool isValidLogLevel(const QString& level);

/**
 * mcphub_server 命令行参数
 *
 * 形如 --key=value；未知参数作为错误返回（退出码 2）。
 */
struct ServerArgs {
    QString dataRoot = ".";
    int port = 8080;
    QString host = "127.0.0.1";
    QString logLevel = "info";
    QString projectsDir;

    bool hasPort = false;
    bool hasHost = false;
    bool hasLogLevel = false;
    bool hasProjectsDir = false;

    bool help = false;
    bool version = false;
    QString error;

    static ServerArgs parse(const QStringList& args);
    static QString usage();
};

} // namespace mcphub_server
