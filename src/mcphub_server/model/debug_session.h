#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>
#include <memory>

#include "mcphub/protocol/tool_schema.h"
#include "mcphub/session/protocol_session.h"
#include "mcphub/supervisor/process_supervisor.h"

namespace mcphub_server {

enum class DebugSessionState {
    Starting,
    Ready,
    Stopping,
    Stopped,
    Failed
};

inline QString debugSessionStateToString(DebugSessionState state) {
    switch (state) {
    case DebugSessionState::Starting: return "starting";
    case DebugSessionState::Ready:    return "ready";
    case DebugSessionState::Stopping: return "stopping";
    case DebugSessionState::Stopped:  return "stopped";
    case DebugSessionState::Failed:   return "failed";
    }
    return "stopped";
}

/**
 * 一个项目的调试会话
 * supervisor 先于 session 声明，析构时 session 先释放
 */
struct DebugSession {
    QString projectId;
    DebugSessionState state = DebugSessionState::Starting;
    std::unique_ptr<mcphub::ProcessSupervisor> supervisor;
    std::unique_ptr<mcphub::ProtocolSession> session;
    QVector<mcphub::ToolDescriptor> tools;
    QDateTime createdAt;
    QDateTime lastActivity;
    QString failureReason;
    int executionCount = 0;
    bool starting = true; // 启动尚未完成（成功、失败或被 stopSession 打断）

    bool isTerminal() const {
        return state == DebugSessionState::Stopped || state == DebugSessionState::Failed;
    }
};

/**
 * 会话快照（对外查询用）
 */
struct DebugSessionInfo {
    QString projectId;
    DebugSessionState state = DebugSessionState::Stopped;
    QDateTime createdAt;
    QDateTime lastActivity;
    int toolCount = 0;
    int executionCount = 0;
    qint64 pid = 0;
    int pendingCalls = 0;
    QString failureReason;

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["project_id"] = projectId;
        obj["state"] = debugSessionStateToString(state);
        obj["created_at"] = createdAt.toString(Qt::ISODate);
        obj["last_activity"] = lastActivity.toString(Qt::ISODate);
        obj["tool_count"] = toolCount;
        obj["execution_count"] = executionCount;
        obj["pid"] = pid;
        obj["pending_calls"] = pendingCalls;
        if (!failureReason.isEmpty()) {
            obj["failure_reason"] = failureReason;
        }
        return obj;
    }
};

} // namespace mcphub_server
