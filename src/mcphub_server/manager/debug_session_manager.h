#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QProcessEnvironment>
#include <QStringList>
#include <QVector>
#include <functional>
#include <map>
#include <memory>

#include "model/debug_session.h"

namespace mcphub_server {

class EventBus;
class ProjectCatalog;

/**
 * 调试接口的错误类型
 */
enum class DebugErrorKind {
    None,
    SessionAlreadyActive,
    NoActiveSession,
    ProjectNotFound,
    UnknownTool,
    InvalidArguments,
    LaunchError,
    Timeout,
    RemoteError,
    ToolError,       // tools/call 返回 isError: true
    TransportError,
    SessionClosed,
    InvalidState,
    InvalidResponse
};

QString debugErrorKindToString(DebugErrorKind kind);

struct StartSessionResult {
    bool ok = false;
    DebugErrorKind errorKind = DebugErrorKind::None;
    QString message;
    QVector<mcphub::ToolDescriptor> tools;

    static StartSessionResult failure(DebugErrorKind kind, const QString& message) {
        StartSessionResult r;
        r.errorKind = kind;
        r.message = message;
        return r;
    }
};

struct ExecuteResult {
    bool success = false;
    QString result;        // 展平后的文本
    QJsonValue rawResult;  // 原始 result
    QString error;
    DebugErrorKind errorKind = DebugErrorKind::None;
    qint64 durationMs = 0;

    static ExecuteResult failure(DebugErrorKind kind, const QString& error) {
        ExecuteResult r;
        r.errorKind = kind;
        r.error = error;
        return r;
    }

    /// {success, result | error, errorKind, execution_time(秒)}
    QJsonObject toJson() const;
};

/**
 * 按项目管理调试会话
 *
 * 每个项目最多一个非终止会话。startSessionAsync 在任何 I/O 之前占住表项，
 * 失败时撤销已创建的一切。表只在查找/插入/删除时加锁，不跨 I/O 持有。
 * 会话内子进程崩溃不重启，会话进入 Failed。
 *
 * 所有操作都不阻塞事件循环：启动由 supervisor 的 started 信号和
 * initialize / tools/list 的完成回调逐步推进。
 */
class DebugSessionManager : public QObject {
    Q_OBJECT
public:
    using StartCallback = std::function<void(const StartSessionResult&)>;
    using ExecuteCallback = std::function<void(const ExecuteResult&)>;

    struct Options {
        int callTimeoutMs = 30000;
        int startupTimeoutMs = 30000;
        int settleMs = 300;
        int graceMs = 5000;
        QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    };

    DebugSessionManager(ProjectCatalog* catalog, EventBus* bus, const Options& options,
                        QObject* parent = nullptr);
    ~DebugSessionManager() override;

    /**
     * 启动子进程并完成 initialize + tools/list，结果（含工具列表）通过回调报告一次
     * 表项冲突等前置检查失败时回调立即执行；context 销毁后不再回调
     */
    void startSessionAsync(const QString& projectId, QObject* context, StartCallback callback);

    /**
     * 关闭会话（未完成调用以 SessionClosed 结束）并开始停止子进程，不等待退出；
     * 没有会话时直接返回。启动中的会话以 SessionClosed 结束启动
     */
    void stopSession(const QString& projectId);

    /**
     * 异步执行工具；前置检查失败时回调立即执行。context 销毁后不再回调
     */
    void executeAsync(const QString& projectId, const QString& toolName,
                      const QJsonObject& arguments, QObject* context, ExecuteCallback callback);

    /// 活动会话的缓存工具列表，没有会话时为空
    QVector<mcphub::ToolDescriptor> getTools(const QString& projectId) const;

    bool sessionInfo(const QString& projectId, DebugSessionInfo& out) const;
    bool hasActiveSession(const QString& projectId) const;
    int activeSessionCount() const;
    QStringList projectIds() const;
    ProjectCatalog* catalog() const { return m_catalog; }
    const Options& options() const { return m_options; }

    void stopAll();

    /**
     * 等待已停止会话的子进程退出，期间驱动事件循环；超时后 kill 剩余进程
     * 仅用于关闭流程
     */
    void waitForProcesses(int timeoutMs);

    /// 仍在宽限期内、尚未退出的子进程数
    int stoppingProcessCount() const { return m_stopping.size(); }

signals:
    void sessionStarted(const QString& projectId);
    void sessionStopped(const QString& projectId);
    void sessionFailed(const QString& projectId, const QString& reason);
    void notificationReceived(const QString& projectId, const QString& method,
                              const QJsonValue& params);

private:
    using SessionPtr = std::shared_ptr<DebugSession>;

    struct PendingStart {
        QPointer<QObject> context;
        bool hasContext = false;
        StartCallback callback;
    };

    SessionPtr findSession(const QString& projectId) const;
    void removeIfCurrent(const QString& projectId, const SessionPtr& entry);
    void teardown(const SessionPtr& entry, bool deferDelete);
    void retireSupervisor(mcphub::ProcessSupervisor* supervisor);
    void onSupervisorStarted(const std::weak_ptr<DebugSession>& weak);
    void onInitialized(const std::weak_ptr<DebugSession>& weak, const mcphub::CallOutcome& outcome);
    void onToolsListed(const std::weak_ptr<DebugSession>& weak, const mcphub::CallOutcome& outcome);
    void failStart(const SessionPtr& entry, DebugErrorKind kind, const QString& message);
    void finishStart(const DebugSession* entry, const StartSessionResult& result);
    void onProcessExited(const std::weak_ptr<DebugSession>& weak);
    void publish(const QString& type, const QString& projectId, const QJsonObject& data = {});

    static DebugErrorKind fromCallError(mcphub::CallErrorKind kind);

    ProjectCatalog* m_catalog;
    EventBus* m_bus;
    Options m_options;

    mutable QMutex m_mutex;
    std::map<QString, SessionPtr> m_sessions;
    std::map<const DebugSession*, PendingStart> m_pendingStarts;
    QList<mcphub::ProcessSupervisor*> m_stopping;
};

} // namespace mcphub_server
