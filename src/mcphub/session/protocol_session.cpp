#include "protocol_session.h"

#include <QLoggingCategory>

#include "mcphub/protocol/jsonrpc_codec.h"

namespace mcphub {

Q_LOGGING_CATEGORY(lcSession, "mcphub.session")

QString sessionStateToString(SessionState state) {
    switch (state) {
    case SessionState::Uninitialized: return "uninitialized";
    case SessionState::Handshaking:   return "handshaking";
    case SessionState::Ready:         return "ready";
    case SessionState::Closing:       return "closing";
    case SessionState::Closed:        return "closed";
    case SessionState::Failed:        return "failed";
    }
    return "uninitialized";
}

ProtocolSession::ProtocolSession(TransportClient* transport, QObject* parent)
    : ProtocolSession(transport, Options{}, parent) {
}

ProtocolSession::ProtocolSession(TransportClient* transport, const Options& options,
                                 QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_options(options) {
    if (m_transport) {
        connect(m_transport, &TransportClient::messageReceived, this, &ProtocolSession::onMessage);
        connect(m_transport, &TransportClient::finished, this,
                &ProtocolSession::onTransportFinished);
    }
}

ProtocolSession::~ProtocolSession() {
    // 析构时不关闭通道，通道由所有者管理；只结束未完成调用
    if (m_transport) {
        m_transport->disconnect(this);
    }
    blockSignals(true);
    m_state = SessionState::Closed;
    failAllPending(CallErrorKind::SessionClosed, "session destroyed");
}

RpcCall ProtocolSession::initialize() {
    if (m_state != SessionState::Uninitialized) {
        return RpcCall::resolved(CallOutcome::failure(
            CallErrorKind::InvalidState,
            "initialize not allowed in state " + sessionStateToString(m_state)));
    }

    setState(SessionState::Handshaking);

    const QJsonObject params{
        {"protocolVersion", QString::fromLatin1(kProtocolVersion)},
        {"capabilities", QJsonObject{{"tools", QJsonObject{}}}},
        {"clientInfo", QJsonObject{{"name", m_options.clientName},
                                   {"version", m_options.clientVersion}}},
    };

    return issue("initialize", params, -1, [this](CallOutcome& outcome) {
        if (m_state != SessionState::Handshaking) {
            return;
        }
        if (!outcome.ok) {
            fail("initialize failed: " + outcome.message);
            return;
        }
        const QJsonObject result = outcome.result.toObject();
        m_serverInfo = result.value("serverInfo").toObject();
        m_protocolVersion = result.value("protocolVersion").toString();

        sendNotification("notifications/initialized");
        qCInfo(lcSession).noquote() << "session ready, server"
                                    << m_serverInfo.value("name").toString()
                                    << m_serverInfo.value("version").toString()
                                    << "protocol" << m_protocolVersion;
        setState(SessionState::Ready);
    });
}

RpcCall ProtocolSession::listTools() {
    if (m_state != SessionState::Ready) {
        return RpcCall::resolved(CallOutcome::failure(
            CallErrorKind::InvalidState,
            "tools/list not allowed in state " + sessionStateToString(m_state)));
    }

    return issue("tools/list", {}, -1, [this](CallOutcome& outcome) {
        if (!outcome.ok) {
            return;
        }
        QVector<ToolDescriptor> parsed;
        QString error;
        if (!parseToolList(outcome.result, parsed, error)) {
            outcome.ok = false;
            outcome.errorKind = CallErrorKind::InvalidResponse;
            outcome.message = error;
            return;
        }
        m_tools = std::move(parsed);
    });
}

RpcCall ProtocolSession::callTool(const QString& name, const QJsonObject& arguments,
                                  int timeoutMs) {
    if (m_state != SessionState::Ready) {
        return RpcCall::resolved(CallOutcome::failure(
            CallErrorKind::InvalidState,
            "tools/call not allowed in state " + sessionStateToString(m_state)));
    }
    return issue("tools/call", QJsonObject{{"name", name}, {"arguments", arguments}}, timeoutMs,
                 nullptr);
}

RpcCall ProtocolSession::sendRequest(const QString& method, const QJsonObject& params,
                                     int timeoutMs) {
    if (m_state != SessionState::Ready) {
        return RpcCall::resolved(CallOutcome::failure(
            CallErrorKind::InvalidState,
            method + " not allowed in state " + sessionStateToString(m_state)));
    }
    return issue(method, params, timeoutMs, nullptr);
}

bool ProtocolSession::sendNotification(const QString& method, const QJsonObject& params) {
    if (!m_transport) {
        return false;
    }
    const TransportResult sent = m_transport->send(makeNotification(method, params));
    if (!sent.ok) {
        qCWarning(lcSession).noquote() << "failed to send" << method << ":" << sent.message;
    }
    return sent.ok;
}

RpcCall ProtocolSession::issue(const QString& method, const QJsonObject& params, int timeoutMs,
                               std::function<void(CallOutcome&)> transform) {
    if (!m_transport) {
        CallOutcome outcome =
            CallOutcome::failure(CallErrorKind::TransportError, "transport released");
        if (transform) {
            transform(outcome);
        }
        return RpcCall::resolved(outcome);
    }

    const qint64 id = m_nextId++;
    auto state = std::make_shared<CallState>();

    PendingCall pending;
    pending.id = id;
    pending.method = method;
    pending.issuedAt.start();
    pending.state = state;
    pending.transform = std::move(transform);
    pending.timer = std::make_unique<QTimer>();
    pending.timer->setSingleShot(true);
    connect(pending.timer.get(), &QTimer::timeout, this, [this, id]() { onCallTimeout(id); });

    const int budget = timeoutMs >= 0 ? timeoutMs : m_options.callTimeoutMs;
    pending.timer->start(budget);

    // 先登记再发送：stdio 对端可能在 send 返回前就已应答
    m_pending.emplace(id, std::move(pending));

    const TransportResult sent = m_transport->send(makeRequest(id, method, params));
    if (!sent.ok) {
        finishCall(id, CallOutcome::failure(CallErrorKind::TransportError, sent.message));
    }
    return RpcCall(state);
}

void ProtocolSession::onMessage(const QJsonObject& message) {
    QString reason;
    const RpcMessage msg = classifyMessage(message, &reason);
    switch (msg.kind) {
    case RpcMessageKind::Response:
        onResponse(msg);
        break;
    case RpcMessageKind::Notification:
        emit notificationReceived(msg.method, msg.params);
        break;
    case RpcMessageKind::Request:
        onPeerRequest(msg);
        break;
    case RpcMessageKind::Invalid:
        ++m_dropped;
        qCWarning(lcSession).noquote() << "dropping invalid message:" << reason;
        break;
    }
}

void ProtocolSession::onResponse(const RpcMessage& msg) {
    const qint64 id = msg.numericId();
    if (m_pending.find(id) == m_pending.end()) {
        ++m_dropped;
        qCWarning(lcSession).noquote()
            << "dropping response with unmatched id" << msg.id.toVariant().toString();
        return;
    }

    if (msg.isError) {
        CallOutcome outcome = CallOutcome::failure(
            CallErrorKind::RemoteError,
            QString("remote error %1: %2").arg(msg.error.code).arg(msg.error.message));
        outcome.remoteError = msg.error;
        finishCall(id, outcome);
    } else {
        finishCall(id, CallOutcome::success(msg.result));
    }
}

void ProtocolSession::onPeerRequest(const RpcMessage& msg) {
    if (!m_transport) {
        return;
    }
    if (msg.method == QLatin1String("ping")) {
        m_transport->send(makeResult(msg.id, QJsonObject{}));
        return;
    }
    RpcError err;
    err.code = RpcErrorCode::MethodNotFound;
    err.message = "Method not found: " + msg.method;
    m_transport->send(makeError(msg.id, err));
}

void ProtocolSession::onTransportFinished(bool clean, const QString& reason) {
    if (m_state == SessionState::Closing || m_state == SessionState::Closed) {
        return;
    }
    const QString message = QString("transport %1: %2")
                                .arg(clean ? QStringLiteral("closed") : QStringLiteral("failed"),
                                     reason);
    failAllPending(CallErrorKind::TransportError, message);
    fail(message);
}

void ProtocolSession::onCallTimeout(qint64 id) {
    auto it = m_pending.find(id);
    if (it == m_pending.end()) {
        return;
    }
    const int budget = it->second.timer->interval();
    qCWarning(lcSession).noquote() << it->second.method << "id" << id << "timed out after"
                                   << budget << "ms";
    finishCall(id, CallOutcome::failure(
                       CallErrorKind::Timeout,
                       QString("%1 timed out after %2 ms").arg(it->second.method).arg(budget)));
}

void ProtocolSession::finishCall(qint64 id, CallOutcome outcome) {
    auto it = m_pending.find(id);
    if (it == m_pending.end()) {
        return;
    }
    PendingCall pending = std::move(it->second);
    m_pending.erase(it);
    pending.timer->stop();

    outcome.elapsedMs = pending.issuedAt.elapsed();
    if (pending.transform) {
        pending.transform(outcome);
    }
    pending.state->resolve(outcome);
}

void ProtocolSession::failAllPending(CallErrorKind kind, const QString& message) {
    std::vector<qint64> ids;
    ids.reserve(m_pending.size());
    for (const auto& entry : m_pending) {
        ids.push_back(entry.first);
    }
    for (qint64 id : ids) {
        finishCall(id, CallOutcome::failure(kind, message));
    }
}

void ProtocolSession::close() {
    if (m_state == SessionState::Closing || m_state == SessionState::Closed) {
        return;
    }
    setState(SessionState::Closing);
    failAllPending(CallErrorKind::SessionClosed, "session closed");
    if (m_transport) {
        m_transport->disconnect(this);
        m_transport->close();
    }
    setState(SessionState::Closed);
}

void ProtocolSession::transportLost(const QString& reason) {
    onTransportFinished(false, reason);
}

const ToolDescriptor* ProtocolSession::findTool(const QString& name) const {
    for (const auto& tool : m_tools) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

void ProtocolSession::setState(SessionState state) {
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void ProtocolSession::fail(const QString& reason) {
    if (m_state == SessionState::Failed || m_state == SessionState::Closed) {
        return;
    }
    m_failureReason = reason;
    m_tools.clear();
    qCWarning(lcSession).noquote() << "session failed:" << reason;
    setState(SessionState::Failed);
    emit failed(reason);
}

} // namespace mcphub
