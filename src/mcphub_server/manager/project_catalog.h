#pragma once

#include <QString>
#include <QStringList>

#include "mcphub/supervisor/service_config.h"

namespace mcphub_server {

/**
 * projectsDir/<projectId>/ 下的调试项目
 *
 * 启动命令优先取 project.json {command, args, env}；否则按
 * server.py、main.py、app.py、__main__.py 顺序找入口，用项目 .venv 的解释器，
 * 没有则用 pythonCommand。
 */
class ProjectCatalog {
public:
    enum class ResolveError {
        None,
        InvalidId,
        NotFound,
        Invalid  // project.json 无法解析，或没有入口文件
    };

    ProjectCatalog(const QString& projectsDir, const QString& pythonCommand = "python3");

    static bool isValidProjectId(const QString& id);
    static QStringList entryFileCandidates();

    QString projectsDir() const { return m_projectsDir; }
    QString pythonCommand() const { return m_pythonCommand; }

    bool exists(const QString& projectId) const;
    QStringList listProjects() const;
    QString projectDir(const QString& projectId) const;

    /**
     * 解析为 stdio 服务配置
     * @return 失败时返回错误类型，error 为说明
     */
    ResolveError resolve(const QString& projectId, mcphub::ServiceConfig& out,
                         QString& error) const;

private:
    bool loadProjectFile(const QString& path, mcphub::ServiceConfig& out, QString& error) const;
    QString interpreterFor(const QString& dir) const;

    QString m_projectsDir;
    QString m_pythonCommand;
};

} // namespace mcphub_server
