#include "rpc_call.h"

#include <QEventLoop>
#include <QTimer>
#include <algorithm>

namespace mcphub {

QString callErrorKindToString(CallErrorKind kind) {
    switch (kind) {
    case CallErrorKind::None:            return "None";
    case CallErrorKind::Timeout:         return "Timeout";
    case CallErrorKind::RemoteError:     return "RemoteError";
    case CallErrorKind::TransportError:  return "TransportError";
    case CallErrorKind::SessionClosed:   return "SessionClosed";
    case CallErrorKind::InvalidState:    return "InvalidState";
    case CallErrorKind::InvalidResponse: return "InvalidResponse";
    }
    return "None";
}

bool CallState::resolve(const CallOutcome& value) {
    if (resolved) {
        return false;
    }
    resolved = true;
    outcome = value;

    for (QEventLoop* loop : waiters) {
        loop->quit();
    }

    // 回调可能再次注册或释放句柄，先取出
    auto pending = std::move(callbacks);
    callbacks.clear();
    for (auto& entry : pending) {
        if (entry.first) {
            entry.second(outcome);
        }
    }
    return true;
}

RpcCall::RpcCall(std::shared_ptr<CallState> state)
    : m_st(std::move(state)) {
}

RpcCall RpcCall::resolved(const CallOutcome& outcome) {
    auto st = std::make_shared<CallState>();
    st->resolve(outcome);
    return RpcCall(st);
}

bool RpcCall::isFinished() const {
    return !m_st || m_st->resolved;
}

CallOutcome RpcCall::outcome() const {
    if (!m_st) {
        return CallOutcome::failure(CallErrorKind::InvalidState, "invalid call handle");
    }
    return m_st->outcome;
}

bool RpcCall::wait(int timeoutMs) {
    if (isFinished()) {
        return true;
    }

    // 持有共享状态，防止等待期间句柄之外的引用全部释放
    auto st = m_st;
    QEventLoop loop;
    QTimer timer;
    st->waiters.push_back(&loop);
    if (timeoutMs >= 0) {
        timer.setSingleShot(true);
        QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        timer.start(timeoutMs);
    }

    loop.exec();

    auto& waiters = st->waiters;
    waiters.erase(std::remove(waiters.begin(), waiters.end(), &loop), waiters.end());
    return st->resolved;
}

void RpcCall::onFinished(QObject* context, CallState::Callback fn) {
    if (!m_st || !context) {
        return;
    }
    if (m_st->resolved) {
        const CallOutcome outcome = m_st->outcome;
        QMetaObject::invokeMethod(
            context, [fn = std::move(fn), outcome]() { fn(outcome); }, Qt::QueuedConnection);
        return;
    }
    m_st->callbacks.emplace_back(QPointer<QObject>(context), std::move(fn));
}

} // namespace mcphub
