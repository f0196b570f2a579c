#pragma once

#include <QString>
#include <QStringList>

namespace mcphub_server {

/**
 * mcphub_hub 命令行参数
 */
struct HubArgs {
    QString dataRoot = ".";
    QString configPath;          // 空：<dataRoot>/mcp_config.json
    QString logLevel = "info";
    int maxRetries = 10;         // -1 表示不限
    int backoffBaseMs = 1000;
    int backoffCapMs = 60000;
    int shutdownTimeoutMs = 15000;

    bool help = false;
    bool version = false;
    QString error;

    static HubArgs parse(const QStringList& args);
    static QString usage();

    QString resolvedConfigPath() const;
};

} // namespace mcphub_server
