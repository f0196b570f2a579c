#pragma once

#include <QJsonValue>
#include <QPointer>
#include <QString>
#include <functional>
#include <memory>
#include <vector>

#include "mcphub/mcphub_export.h"
#include "mcphub/protocol/jsonrpc_types.h"

class QEventLoop;

namespace mcphub {

/**
 * 调用失败类型
 */
enum class CallErrorKind {
    None,
    Timeout,         // 超出调用时限
    RemoteError,     // 对端返回 {code, message}
    TransportError,  // 调用过程中通道断开
    SessionClosed,   // 等待期间会话被关闭
    InvalidState,    // 会话不在可调用状态
    InvalidResponse  // 响应结构不合法（如 tools/list 缺少 tools）
};

MCPHUB_API QString callErrorKindToString(CallErrorKind kind);

/**
 * 一次调用的唯一结果
 */
struct CallOutcome {
    bool ok = false;
    CallErrorKind errorKind = CallErrorKind::None;
    QJsonValue result;
    RpcError remoteError;
    QString message;
    qint64 elapsedMs = 0;

    static CallOutcome success(const QJsonValue& result) {
        CallOutcome o;
        o.ok = true;
        o.result = result;
        return o;
    }

    static CallOutcome failure(CallErrorKind kind, const QString& message) {
        CallOutcome o;
        o.errorKind = kind;
        o.message = message;
        return o;
    }
};

/**
 * 调用共享状态，只能被写入一次
 */
struct CallState {
    using Callback = std::function<void(const CallOutcome&)>;

    bool resolved = false;
    CallOutcome outcome;
    std::vector<std::pair<QPointer<QObject>, Callback>> callbacks;
    std::vector<QEventLoop*> waiters;

    /// 第一次写入返回 true，之后的写入被忽略
    bool resolve(const CallOutcome& value);
};

/**
 * 调用句柄（Future 风格）
 */
class MCPHUB_API RpcCall {
public:
    RpcCall() = default;
    explicit RpcCall(std::shared_ptr<CallState> state);

    /// 直接构造一个已完成的句柄
    static RpcCall resolved(const CallOutcome& outcome);

    bool isValid() const { return m_st != nullptr; }
    bool isFinished() const;
    CallOutcome outcome() const;

    /**
     * 在局部事件循环中等待完成
     * @param timeoutMs 等待上限，-1 为不限（调用本身总会在会话时限内结束）
     * @return 已完成返回 true
     */
    bool wait(int timeoutMs = -1);

    /**
     * 完成回调；context 销毁后不再调用。已完成时回调排队到 context 的事件循环执行
     */
    void onFinished(QObject* context, CallState::Callback fn);

private:
    std::shared_ptr<CallState> m_st;
};

} // namespace mcphub
