#pragma once

#include <QString>

#include "server_args.h"

namespace mcphub_server {

/**
 * <dataRoot>/config.json
 *
 * 文件不存在时使用默认值；未知字段、类型或范围错误视为加载失败。
 */
struct ServerConfig {
    int port = 8080;
    QString host = "127.0.0.1";
    QString logLevel = "info";
    QString projectsDir;               // 空：<dataRoot>/projects
    QString pythonCommand = "python3"; // 项目没有 .venv 时使用
    int callTimeoutMs = 30000;
    int startupTimeoutMs = 30000;
    int shutdownGraceMs = 5000;
    int portRangeStart = 3000;
    int portRangeEnd = 3999;
    qint64 logMaxBytes = 10 * 1024 * 1024; // 10MB
    int logMaxFiles = 3;

    static ServerConfig loadFromFile(const QString& filePath, QString& error);
    void applyArgs(const ServerArgs& args);

    /// projectsDir 为相对路径时相对 dataRoot 解析
    QString resolvedProjectsDir(const QString& dataRoot) const;
};

} // namespace mcphub_server
