#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QProcessEnvironment>
#include <QTimer>
#include <memory>

#include "backoff_policy.h"
#include "mcphub/mcphub_export.h"
#include "mcphub/process/child_process.h"
#include "mcphub/transport/health_probe.h"
#include "mcphub/transport/transport_client.h"
#include "service_config.h"

namespace mcphub {

/**
 * 监管状态
 */
enum class SupervisorState {
    Stopped,
    Starting,
    Running,
    Stopping,
    CrashBackoff, // 等待退避后重启
    Failed        // 重试次数耗尽，不再重启
};

MCPHUB_API QString supervisorStateToString(SupervisorState state);

/**
 * start() 结果
 */
struct StartResult {
    enum class Error {
        None,
        LaunchError,       // 可执行文件缺失或无法创建进程
        AlreadyInProgress  // 另一次 start/stop 尚未完成
    };

    bool ok = true;
    Error error = Error::None;
    QString message;

    static StartResult success() { return {}; }
    static StartResult launchError(const QString& msg) { return {false, Error::LaunchError, msg}; }
    static StartResult inProgress(const QString& msg) {
        return {false, Error::AlreadyInProgress, msg};
    }
};

/**
 * 单个服务子进程的生命周期监管
 *
 * stdio 服务由 StdioTransport 持有子进程；sse/http 服务由监管者持有子进程，
 * 健康检查通过后再建立 HttpTransport。运行期间子进程的任何退出都视为意外退出，
 * 按退避策略重启。
 *
 * start() 与 stop() 都不阻塞：启动结果通过 started() / startFailed() 报告，
 * 停止在子进程 exited 之后进入 Stopped。
 */
class MCPHUB_API ProcessSupervisor : public QObject {
    Q_OBJECT
public:
    struct Options {
        BackoffPolicy backoff;
        int settleMs = 300;            // stdio：存活这么久才算启动成功
        int startupTimeoutMs = 30000;  // sse/http：等待 /health 的总时长
        int healthIntervalMs = 250;
        int graceMs = ChildProcess::kDefaultGraceMs;
        bool retryFailedLaunch = false; // 启动失败也进入退避重试（常驻模式）
        QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    };

    ProcessSupervisor(const ServiceConfig& config, const Options& options,
                      QObject* parent = nullptr);
    ~ProcessSupervisor() override;

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * 发起启动并立即返回
     * 同步失败（可执行文件缺失、无法创建进程）直接返回错误；否则进入 Starting，
     * 就绪（stdio 存活过 settleMs；sse/http 健康检查通过）后发出 started()，
     * 之前失败则发出 startFailed()。已在运行时返回成功且不发信号
     */
    StartResult start();

    /**
     * 发送 terminate 并启动 graceMs 的 kill 定时器，进入 Stopping；
     * 子进程退出后进入 Stopped。取消待执行的重启。
     * 启动过程中调用会打断该次启动，并发出 startFailed("... aborted by stop")
     * @param graceMs 小于 0 时使用 Options::graceMs；Stopping 期间再次调用只会缩短宽限
     */
    void stop(int graceMs = -1);

    /// 立即 kill 当前子进程；Stopping 中的监管者随之进入 Stopped
    void kill();

    SupervisorState state() const { return m_state; }
    const ServiceConfig& config() const { return m_config; }
    const Options& options() const { return m_options; }
    QString id() const { return m_config.id; }

    qint64 pid() const;
    int consecutiveFailures() const { return m_failures; }
    int restartCount() const { return m_restarts; }
    QString lastError() const { return m_lastError; }
    qint64 uptimeMs() const;

    /// 当前通道；未运行时为 nullptr。重启后指向新的通道
    TransportClient* transport() const { return m_transport.get(); }

signals:
    void stateChanged(mcphub::SupervisorState oldState, mcphub::SupervisorState newState);
    void started(qint64 pid);
    /// 已返回成功的 start()（或退避后的重启）未能就绪
    void startFailed(const QString& reason);
    void processExited(int exitCode, bool crashed);
    void restartScheduled(int attempt, int delayMs);
    void gaveUp(int failures, const QString& reason);
    void stdoutData(const QByteArray& data);
    void stderrLine(const QString& line);

private:
    StartResult launch(bool fromRetry);
    StartResult launchStdio();
    StartResult launchNetwork();
    void onSettled();
    void onHealthy();
    void completeStart();
    void failStart(const QString& reason);
    void failLaunch(const QString& reason);
    void onStopExited();
    void finishStop();
    void onUnexpectedExit(int exitCode, bool crashed, const QString& reason);
    void handleFailure(const QString& reason);
    void onRetryTimer();
    void releaseResources(bool deferDelete, int graceMs = -1);
    ChildProcess* activeChild() const;
    void setState(SupervisorState state);

    ServiceConfig m_config;
    Options m_options;
    SupervisorState m_state = SupervisorState::Stopped;

    std::unique_ptr<TransportClient> m_transport;
    std::unique_ptr<ChildProcess> m_child; // 仅 sse/http

    QTimer m_retryTimer;
    QTimer m_settleTimer;
    std::unique_ptr<HealthProbe> m_health;
    QElapsedTimer m_runTimer;
    int m_failures = 0;
    int m_restarts = 0;
    QString m_lastError;
    bool m_launchFromRetry = false;
};

} // namespace mcphub

Q_DECLARE_METATYPE(mcphub::SupervisorState)
