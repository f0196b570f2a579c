#include "debug_ws_handler.h"
#include "debug_ws_connection.h"

#include <QDateTime>
#include <QHttpServerWebSocketUpgradeResponse>
#include <QWebSocket>

#include "manager/debug_session_manager.h"
#include "manager/project_catalog.h"

namespace mcphub_server {

namespace {

const QString kPathPrefix = QStringLiteral("/api/debug/");
const QString kPathSuffix = QStringLiteral("/ws");

} // namespace

DebugWsHandler::DebugWsHandler(DebugSessionManager* manager, EventBus* bus, QObject* parent)
    : QObject(parent)
    , m_manager(manager)
    , m_bus(bus) {
    m_pingTimer.setInterval(kPingIntervalMs);
    connect(&m_pingTimer, &QTimer::timeout, this, &DebugWsHandler::onPingTick);
    m_pingTimer.start();
}

DebugWsHandler::~DebugWsHandler() {
    closeAll();
}

QString DebugWsHandler::parseProjectId(const QUrl& url) {
    const QString path = url.path();
    if (!path.startsWith(kPathPrefix) || !path.endsWith(kPathSuffix)) {
        return {};
    }
    const QString id =
        path.mid(kPathPrefix.size(), path.size() - kPathPrefix.size() - kPathSuffix.size());
    return ProjectCatalog::isValidProjectId(id) ? id : QString();
}

void DebugWsHandler::registerVerifier(QHttpServer& server) {
    m_server = &server;

    server.addWebSocketUpgradeVerifier(
        this,
        [this](const QHttpServerRequest& request) -> QHttpServerWebSocketUpgradeResponse {
            const QString path = request.url().path();
            if (!path.startsWith(kPathPrefix)) {
                return QHttpServerWebSocketUpgradeResponse::passToNext();
            }

            const QString projectId = parseProjectId(request.url());
            if (projectId.isEmpty()) {
                return QHttpServerWebSocketUpgradeResponse::deny(400, "invalid debug path");
            }
            if (!m_manager->catalog()->exists(projectId)) {
                return QHttpServerWebSocketUpgradeResponse::deny(404, "project not found");
            }
            if (m_connections.size() >= kMaxConnections) {
                return QHttpServerWebSocketUpgradeResponse::deny(429, "too many connections");
            }
            return QHttpServerWebSocketUpgradeResponse::accept();
        });

    connect(&server, &QHttpServer::newWebSocketConnection, this, [this]() {
        auto socket = std::unique_ptr<QWebSocket>(m_server->nextPendingWebSocketConnection());
        if (!socket) {
            return;
        }

        const QString projectId = parseProjectId(socket->requestUrl());
        if (projectId.isEmpty()) {
            socket->close(QWebSocketProtocol::CloseCodeBadOperation, "invalid request");
            return;
        }

        auto* conn = new DebugWsConnection(std::move(socket), projectId, m_manager, m_bus, this);
        connect(conn, &DebugWsConnection::closed, this, &DebugWsHandler::onConnectionClosed);
        m_connections.append(conn);

        // closeAll() 会停掉 ping 定时器
        if (!m_pingTimer.isActive()) {
            m_pingTimer.start();
        }
    });
}

int DebugWsHandler::activeConnectionCount() const {
    return m_connections.size();
}

void DebugWsHandler::closeAll() {
    m_pingTimer.stop();
    const auto connections = m_connections;
    m_connections.clear();
    for (auto* conn : connections) {
        delete conn;
    }
}

void DebugWsHandler::onConnectionClosed(DebugWsConnection* conn) {
    m_connections.removeOne(conn);
    conn->deleteLater();
}

void DebugWsHandler::onPingTick() {
    sweepDeadConnections();
    for (auto* conn : m_connections) {
        conn->sendPing();
    }
}

void DebugWsHandler::sweepDeadConnections() {
    const QDateTime now = QDateTime::currentDateTimeUtc();
    QVector<DebugWsConnection*> dead;
    for (auto* conn : m_connections) {
        if (conn->lastPongAt().msecsTo(now) > kPongTimeoutMs) {
            dead.append(conn);
        }
    }
    for (auto* conn : dead) {
        m_connections.removeOne(conn);
        conn->closeForPongTimeout();
        conn->deleteLater();
    }
}

void DebugWsHandler::setPingIntervalForTest(int ms) {
    m_pingTimer.setInterval(ms);
}

DebugWsConnection* DebugWsHandler::connectionAt(int index) const {
    if (index < 0 || index >= m_connections.size()) {
        return nullptr;
    }
    return m_connections.at(index);
}

} // namespace mcphub_server
