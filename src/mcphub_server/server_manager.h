#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>
#include <memory>

#include "config/server_config.h"
#include "mcphub/supervisor/port_pool.h"

class QHttpServer;

namespace mcphub_server {

class DebugSessionManager;
class DebugWsHandler;
class EventBus;
class ProjectCatalog;

/**
 * 调试平台的组装点：事件总线、项目目录、会话管理、WebSocket 与端口池
 */
class ServerManager : public QObject {
    Q_OBJECT
public:
    struct ServerStatus {
        QString version;
        QDateTime startedAt;
        qint64 uptimeMs = 0;
        QString host;
        int port = 0;
        QString dataRoot;
        QString projectsDir;

        int projectCount = 0;
        int activeSessions = 0;
        int wsConnections = 0;
        int portsClaimed = 0;
        int portRangeStart = 0;
        int portRangeEnd = 0;
    };

    ServerManager(const QString& dataRoot, const ServerConfig& config, QObject* parent = nullptr);
    ~ServerManager() override;

    bool initialize(QString& error);
    void registerWebSocket(QHttpServer& server);
    void shutdown();

    ServerStatus serverStatus() const;

    EventBus* eventBus() { return m_eventBus; }
    ProjectCatalog* catalog() { return m_catalog.get(); }
    DebugSessionManager* debugSessions() { return m_debugSessions; }
    DebugWsHandler* debugWsHandler() { return m_debugWsHandler; }
    mcphub::PortPool* portPool() { return &m_portPool; }

    QString dataRoot() const { return m_dataRoot; }
    const ServerConfig& config() const { return m_config; }

private:
    QString m_dataRoot;
    ServerConfig m_config;
    QDateTime m_startedAt;

    EventBus* m_eventBus = nullptr;
    std::unique_ptr<ProjectCatalog> m_catalog;
    DebugSessionManager* m_debugSessions = nullptr;
    DebugWsHandler* m_debugWsHandler = nullptr;
    mcphub::PortPool m_portPool;
    bool m_shutdown = false;
};

} // namespace mcphub_server
