#pragma once

#include <QElapsedTimer>
#include <QJsonObject>
#include <QObject>
#include <QPointer>
#include <QTimer>
#include <QVector>
#include <functional>
#include <map>
#include <memory>

#include "mcphub/mcphub_export.h"
#include "mcphub/protocol/jsonrpc_types.h"
#include "mcphub/protocol/tool_schema.h"
#include "mcphub/transport/transport_client.h"
#include "rpc_call.h"

namespace mcphub {

/**
 * 会话状态
 */
enum class SessionState {
    Uninitialized,
    Handshaking,
    Ready,
    Closing,
    Closed,
    Failed
};

MCPHUB_API QString sessionStateToString(SessionState state);

/**
 * MCP 协议会话
 *
 * 包装一个 TransportClient（不持有），完成 initialize 握手，按 id 配对响应，
 * 为每个调用设置独立超时。超时只取消对应调用，通道保持可用；迟到的响应被丢弃。
 */
class MCPHUB_API ProtocolSession : public QObject {
    Q_OBJECT
public:
    struct Options {
        int callTimeoutMs = 30000;
        QString clientName = QStringLiteral("mcphub");
        QString clientVersion = QStringLiteral("0.1.0");
    };

    explicit ProtocolSession(TransportClient* transport, QObject* parent = nullptr);
    ProtocolSession(TransportClient* transport, const Options& options, QObject* parent = nullptr);
    ~ProtocolSession() override;

    SessionState state() const { return m_state; }
    bool isReady() const { return m_state == SessionState::Ready; }
    const Options& options() const { return m_options; }

    /**
     * 发送 initialize；成功后发送 notifications/initialized 并进入 Ready
     * 只能调用一次，重复调用返回 InvalidState
     */
    RpcCall initialize();

    /**
     * tools/list；成功时刷新缓存，每次调用都会重新查询
     */
    RpcCall listTools();

    /**
     * tools/call {name, arguments}
     */
    RpcCall callTool(const QString& name, const QJsonObject& arguments,
                     int timeoutMs = -1);

    /**
     * 发送任意请求，timeoutMs < 0 时使用默认时限
     */
    RpcCall sendRequest(const QString& method, const QJsonObject& params,
                        int timeoutMs = -1);

    /**
     * 发送通知（无响应）
     */
    bool sendNotification(const QString& method, const QJsonObject& params = {});

    /**
     * 以 SessionClosed 结束所有未完成调用，然后关闭通道；可重复调用
     */
    void close();

    /**
     * 通道由所有者判定已断开（如网络服务的子进程退出）时调用：
     * 未完成调用以 TransportError 结束，会话进入 Failed
     */
    void transportLost(const QString& reason);

    const QVector<ToolDescriptor>& tools() const { return m_tools; }
    const ToolDescriptor* findTool(const QString& name) const;
    QJsonObject serverInfo() const { return m_serverInfo; }
    QString negotiatedProtocolVersion() const { return m_protocolVersion; }
    QString failureReason() const { return m_failureReason; }

    int pendingCount() const { return static_cast<int>(m_pending.size()); }
    int droppedMessageCount() const { return m_dropped; }

signals:
    void stateChanged(SessionState state);
    void notificationReceived(const QString& method, const QJsonValue& params);
    void failed(const QString& reason);

private:
    struct PendingCall {
        qint64 id = 0;
        QString method;
        QElapsedTimer issuedAt;
        std::shared_ptr<CallState> state;
        std::unique_ptr<QTimer> timer;
        std::function<void(CallOutcome&)> transform;
    };

    RpcCall issue(const QString& method, const QJsonObject& params, int timeoutMs,
                  std::function<void(CallOutcome&)> transform);
    void onMessage(const QJsonObject& message);
    void onResponse(const RpcMessage& msg);
    void onPeerRequest(const RpcMessage& msg);
    void onTransportFinished(bool clean, const QString& reason);
    void onCallTimeout(qint64 id);
    void finishCall(qint64 id, CallOutcome outcome);
    void failAllPending(CallErrorKind kind, const QString& message);
    void setState(SessionState state);
    void fail(const QString& reason);

    QPointer<TransportClient> m_transport;
    Options m_options;
    SessionState m_state = SessionState::Uninitialized;
    qint64 m_nextId = 1;
    std::map<qint64, PendingCall> m_pending;
    QVector<ToolDescriptor> m_tools;
    QJsonObject m_serverInfo;
    QString m_protocolVersion;
    QString m_failureReason;
    int m_dropped = 0;
};

} // namespace mcphub
