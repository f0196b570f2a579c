#include "server_manager.h"

#include <QDir>

#include "http/debug_ws_handler.h"
#include "http/event_bus.h"
#include "manager/debug_session_manager.h"
#include "manager/project_catalog.h"
#include "utils/process_env_utils.h"

namespace mcphub_server {

ServerManager::ServerManager(const QString& dataRoot, const ServerConfig& config, QObject* parent)
    : QObject(parent)
    , m_dataRoot(dataRoot)
    , m_config(config)
    , m_portPool(config.portRangeStart, config.portRangeEnd) {
    m_eventBus = new EventBus(this);
    m_catalog = std::make_unique<ProjectCatalog>(config.resolvedProjectsDir(dataRoot),
                                                 config.pythonCommand);

    DebugSessionManager::Options options;
    options.callTimeoutMs = config.callTimeoutMs;
    options.startupTimeoutMs = config.startupTimeoutMs;
    options.graceMs = config.shutdownGraceMs;
    options.environment = childBaseEnvironment();
    m_debugSessions = new DebugSessionManager(m_catalog.get(), m_eventBus, options, this);

    m_debugWsHandler = new DebugWsHandler(m_debugSessions, m_eventBus, this);
}

ServerManager::~ServerManager() {
    shutdown();
}

bool ServerManager::initialize(QString& error) {
    QDir root(m_dataRoot);
    if (!root.exists()) {
        error = "data root does not exist: " + m_dataRoot;
        return false;
    }

    const QString projectsDir = m_catalog->projectsDir();
    if (!QDir().mkpath(projectsDir)) {
        error = "cannot create projects directory: " + projectsDir;
        return false;
    }

    const QStringList projects = m_catalog->listProjects();
    qInfo("Projects: %d found in %s", static_cast<int>(projects.size()),
          qUtf8Printable(projectsDir));
    qInfo("Port pool: %d-%d", m_portPool.firstPort(), m_portPool.lastPort());

    error.clear();
    m_startedAt = QDateTime::currentDateTimeUtc();
    return true;
}

void ServerManager::registerWebSocket(QHttpServer& server) {
    m_debugWsHandler->registerVerifier(server);
}

ServerManager::ServerStatus ServerManager::serverStatus() const {
    ServerStatus s;
    s.version = "0.1.0";
    s.startedAt = m_startedAt;
    s.uptimeMs = m_startedAt.msecsTo(QDateTime::currentDateTimeUtc());
    s.host = m_config.host;
    s.port = m_config.port;
    s.dataRoot = m_dataRoot;
    s.projectsDir = m_catalog->projectsDir();

    s.projectCount = m_catalog->listProjects().size();
    s.activeSessions = m_debugSessions->activeSessionCount();
    s.wsConnections = m_debugWsHandler->activeConnectionCount();
    s.portsClaimed = m_portPool.claimedCount();
    s.portRangeStart = m_portPool.firstPort();
    s.portRangeEnd = m_portPool.lastPort();
    return s;
}

void ServerManager::shutdown() {
    if (m_shutdown) {
        return;
    }
    m_shutdown = true;

    // 先断开 WebSocket，避免停止会话时再向连接推送事件
    m_debugWsHandler->closeAll();
    m_debugSessions->stopAll();
    // 子进程在宽限期内退出，超时后 kill
    m_debugSessions->waitForProcesses(m_debugSessions->options().graceMs + 1000);
}

} // namespace mcphub_server
