#include "debug_ws_connection.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTimer>

#include "manager/debug_session_manager.h"

namespace mcphub_server {

Q_LOGGING_CATEGORY(lcDebugWs, "mcphub.ws")

DebugWsConnection::DebugWsConnection(std::unique_ptr<QWebSocket> socket,
                                     const QString& projectId, DebugSessionManager* manager,
                                     EventBus* bus, QObject* parent)
    : QObject(parent),
      m_socket(std::move(socket)),
      m_projectId(projectId),
      m_manager(manager),
      m_lastPongAt(QDateTime::currentDateTimeUtc()) {
    connect(m_socket.get(), &QWebSocket::textMessageReceived, this,
            &DebugWsConnection::onTextMessageReceived);
    connect(m_socket.get(), &QWebSocket::disconnected, this,
            &DebugWsConnection::onSocketDisconnected);
    connect(m_socket.get(), &QWebSocket::pong, this, &DebugWsConnection::onPongReceived);
    if (bus) {
        connect(bus, &EventBus::eventPublished, this, &DebugWsConnection::onServerEvent);
    }
}

DebugWsConnection::~DebugWsConnection() {
    m_closing = true;
    if (m_socket) {
        m_socket->disconnect(this);
        if (m_socket->state() == QAbstractSocket::ConnectedState) {
            m_socket->close(QWebSocketProtocol::CloseCodeGoingAway, "server shutting down");
        }
    }
}

void DebugWsConnection::sendPing() {
    if (m_socket && m_socket->isValid()) {
        m_socket->ping();
    }
}

void DebugWsConnection::closeForPongTimeout() {
    m_closing = true;
    if (m_socket) {
        m_socket->disconnect(this);
        m_socket->close(QWebSocketProtocol::CloseCodeGoingAway, "pong timeout");
    }
}

void DebugWsConnection::onPongReceived(quint64, const QByteArray&) {
    m_lastPongAt = QDateTime::currentDateTimeUtc();
}

void DebugWsConnection::onServerEvent(const ServerEvent& event) {
    if (event.projectId != m_projectId) {
        return;
    }

    QJsonObject msg;
    if (event.type == "session.started") {
        msg["type"] = QStringLiteral("session_started");
        msg["tools"] = event.data.value("tools");
    } else if (event.type == "session.stopped") {
        msg["type"] = QStringLiteral("session_stopped");
    } else if (event.type == "session.failed") {
        msg["type"] = QStringLiteral("session_failed");
        msg["reason"] = event.data.value("reason");
    } else if (event.type == "session.notification") {
        msg["type"] = QStringLiteral("notification");
        msg["method"] = event.data.value("method");
        msg["params"] = event.data.value("params");
    } else {
        return;
    }
    msg["project_id"] = m_projectId;
    enqueue(msg);
}

void DebugWsConnection::onTextMessageReceived(const QString& message) {
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8());
    if (!doc.isObject()) {
        sendError(QStringLiteral("invalid JSON"));
        return;
    }

    const QJsonObject obj = doc.object();
    const QString type = obj.value("type").toString();

    if (type == "start_session") {
        handleStartSession();
    } else if (type == "stop_session") {
        handleStopSession();
    } else if (type == "execute_tool") {
        handleExecuteTool(obj);
    } else if (type == "get_tools") {
        handleGetTools();
    } else {
        sendError(QStringLiteral("unknown message type: ") + type, obj.value("requestId"));
    }
}

void DebugWsConnection::handleStartSession() {
    // 连接销毁后 manager 不再回调
    m_manager->startSessionAsync(m_projectId, this, [this](const StartSessionResult& result) {
        if (m_closing || result.ok) {
            // session_started 由事件总线广播给该项目的所有连接
            return;
        }

        QJsonObject msg;
        if (result.errorKind == DebugErrorKind::SessionAlreadyActive
            || result.errorKind == DebugErrorKind::ProjectNotFound) {
            msg["type"] = QStringLiteral("error");
            msg["message"] = result.message;
        } else {
            msg["type"] = QStringLiteral("session_failed");
            msg["reason"] = result.message;
        }
        msg["errorKind"] = debugErrorKindToString(result.errorKind);
        msg["project_id"] = m_projectId;
        enqueue(msg);
    });
}

void DebugWsConnection::handleStopSession() {
    if (!m_manager->hasActiveSession(m_projectId)) {
        // 没有会话也是成功，只回给请求方
        enqueue(QJsonObject{{"type", "session_stopped"}, {"project_id", m_projectId}});
        return;
    }
    m_manager->stopSession(m_projectId);
}

void DebugWsConnection::handleExecuteTool(const QJsonObject& msg) {
    const QJsonValue requestId = msg.value("requestId");
    const QJsonObject data = msg.value("data").toObject();
    const QString toolName = data.value("tool_name").toString();
    if (toolName.isEmpty()) {
        sendError(QStringLiteral("execute_tool requires data.tool_name"), requestId);
        return;
    }
    const QJsonValue params = data.value("parameters");
    if (!params.isUndefined() && !params.isNull() && !params.isObject()) {
        sendError(QStringLiteral("execute_tool data.parameters must be an object"), requestId);
        return;
    }

    m_manager->executeAsync(m_projectId, toolName, params.toObject(), this,
                            [this, requestId, toolName](const ExecuteResult& result) {
                                QJsonObject response = result.toJson();
                                response["type"] = QStringLiteral("tool_response");
                                response["requestId"] = requestId;
                                response["tool_name"] = toolName;
                                enqueue(response);
                            });
}

void DebugWsConnection::handleGetTools() {
    QJsonObject msg;
    msg["type"] = QStringLiteral("tools_list");
    msg["project_id"] = m_projectId;
    msg["tools"] = mcphub::toolListToJson(m_manager->getTools(m_projectId));
    enqueue(msg);
}

void DebugWsConnection::sendError(const QString& message, const QJsonValue& requestId) {
    QJsonObject err;
    err["type"] = QStringLiteral("error");
    err["message"] = message;
    if (!requestId.isUndefined() && !requestId.isNull()) {
        err["requestId"] = requestId;
    }
    enqueue(err);
}

void DebugWsConnection::enqueue(const QJsonObject& msg) {
    if (m_closing) {
        return;
    }
    if (m_outbound.size() >= kMaxQueuedMessages) {
        m_outbound.dequeue();
        ++m_dropped;
        qCWarning(lcDebugWs).noquote() << "outbound queue full for" << m_projectId
                                       << ", dropped oldest message";
    }
    m_outbound.enqueue(msg);

    if (!m_flushScheduled) {
        m_flushScheduled = true;
        QTimer::singleShot(0, this, &DebugWsConnection::flushQueue);
    }
}

void DebugWsConnection::flushQueue() {
    m_flushScheduled = false;
    if (!m_socket || !m_socket->isValid()) {
        m_outbound.clear();
        return;
    }
    while (!m_outbound.isEmpty()) {
        const QJsonObject msg = m_outbound.dequeue();
        m_socket->sendTextMessage(
            QString::fromUtf8(QJsonDocument(msg).toJson(QJsonDocument::Compact)));
    }
}

void DebugWsConnection::onSocketDisconnected() {
    m_closing = true;
    m_outbound.clear();
    emit closed(this);
}

} // namespace mcphub_server
