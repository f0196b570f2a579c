#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QQueue>
#include <QWebSocket>
#include <memory>

#include "http/event_bus.h"

namespace mcphub_server {

class DebugSessionManager;

/**
 * /api/debug/<projectId>/ws 上的一个调试连接
 *
 * 入站：start_session / stop_session / execute_tool / get_tools
 * 出站：session_started / session_stopped / session_failed / tool_response /
 *       tools_list / notification / error
 * 出站消息先进入本连接的队列，在事件循环中按序发送；队列满时丢弃最旧的消息。
 */
class DebugWsConnection : public QObject {
    Q_OBJECT
public:
    DebugWsConnection(std::unique_ptr<QWebSocket> socket, const QString& projectId,
                      DebugSessionManager* manager, EventBus* bus, QObject* parent = nullptr);
    ~DebugWsConnection() override;

    QString projectId() const { return m_projectId; }

    void sendPing();
    void closeForPongTimeout();
    QDateTime lastPongAt() const { return m_lastPongAt; }
    // Test-only helper, not for production use
    void setLastPongAtForTest(const QDateTime& dt) { m_lastPongAt = dt; }

    int queuedMessageCount() const { return m_outbound.size(); }
    qint64 droppedMessageCount() const { return m_dropped; }

    static constexpr int kMaxQueuedMessages = 1000;

signals:
    void closed(DebugWsConnection* conn);

private slots:
    void onTextMessageReceived(const QString& message);
    void onSocketDisconnected();
    void onPongReceived(quint64 elapsedTime, const QByteArray& payload);
    void onServerEvent(const mcphub_server::ServerEvent& event);

private:
    void handleStartSession();
    void handleStopSession();
    void handleExecuteTool(const QJsonObject& msg);
    void handleGetTools();

    void enqueue(const QJsonObject& msg);
    void flushQueue();
    void sendError(const QString& message, const QJsonValue& requestId = QJsonValue());

    std::unique_ptr<QWebSocket> m_socket;
    QString m_projectId;
    DebugSessionManager* m_manager;
    QQueue<QJsonObject> m_outbound;
    bool m_flushScheduled = false;
    bool m_closing = false;
    qint64 m_dropped = 0;
    QDateTime m_lastPongAt;
};

} // namespace mcphub_server
