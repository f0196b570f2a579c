#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QVector>

#include "mcphub/mcphub_export.h"
#include "mcphub/process/launch_spec.h"
#include "mcphub/transport/transport_client.h"

namespace mcphub {

/**
 * 服务表中的一项
 * 加载后不可变，修改需重启
 */
struct MCPHUB_API ServiceConfig {
    QString id;
    bool enabled = true;
    TransportKind transport = TransportKind::Stdio;
    QString host = QStringLiteral("localhost");
    int port = 0;                   // 0 表示未配置；sse/http 必填
    QString projectDir;             // 工作目录
    QString command;                // 为空时使用默认启动命令
    QStringList args;
    QString description;
    QMap<QString, QString> env;     // 透传给子进程的额外环境变量

    bool hasPort() const { return port > 0; }
    bool isNetwork() const { return transport != TransportKind::Stdio; }

    /**
     * 解析单项，error 非空表示失败
     * @param projectsRoot 相对 project_dir 的解析根目录
     */
    static ServiceConfig fromJson(const QString& id, const QJsonObject& obj,
                                  const QString& projectsRoot, QString& error);
    QJsonObject toJson() const;

    /**
     * 构造启动参数
     * 未配置 command 时为 uv run python server.py --transport <t> [--host <h> --port <p>]
     */
    LaunchSpec launchSpec(const QProcessEnvironment& base =
                              QProcessEnvironment::systemEnvironment()) const;

    /// sse/http 服务的 http://host:port
    QUrl baseUrl() const;
};

/**
 * 静态服务表（JSON 对象，键为服务 id）
 */
class MCPHUB_API ServiceTable {
public:
    static QVector<ServiceConfig> fromJson(const QJsonObject& root, const QString& projectsRoot,
                                           QString& error);
    static QVector<ServiceConfig> loadFromFile(const QString& filePath, const QString& projectsRoot,
                                               QString& error);

private:
    ServiceTable() = delete;
};

} // namespace mcphub
