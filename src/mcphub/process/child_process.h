#pragma once

#include <QObject>
#include <QProcess>
#include <QStringList>
#include <QTimer>
#include <memory>

#include "launch_spec.h"
#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * 单个子进程的所有者
 * 负责启动、stderr 分行、退出通知以及先 terminate 后 kill 的停止流程
 */
class MCPHUB_API ChildProcess : public QObject {
    Q_OBJECT
public:
    explicit ChildProcess(QObject* parent = nullptr);
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * 启动子进程并等待 started（最多 kStartWaitMs）
     * @param spec 启动参数
     * @param error 失败原因（可执行文件不存在、无法启动）
     * @return 进程已运行返回 true
     */
    bool start(const LaunchSpec& spec, QString& error);

    /**
     * 停止子进程：发送 terminate 并启动 graceMs 的 kill 定时器，立即返回
     * 进程结束时发出 exited。重复调用只会缩短剩余宽限时间
     */
    void stop(int graceMs = kDefaultGraceMs);

    /// 立即 kill，不等待
    void kill();

    /**
     * 阻塞等待进程结束，仅用于关闭流程
     * @return 进程已结束返回 true
     */
    bool waitForExit(int timeoutMs);

    /**
     * 交出所有权：断开所有外发信号，按 graceMs 停止，进程结束后自行 deleteLater
     */
    static void retire(std::unique_ptr<ChildProcess> child, int graceMs = kDefaultGraceMs);

    qint64 write(const QByteArray& data);

    bool isRunning() const;
    bool stopRequested() const { return m_stopRequested; }
    qint64 pid() const { return m_pid; }
    int exitCode() const;
    QProcess::ExitStatus exitStatus() const;
    QString exitContext() const;
    QStringList recentStderr() const { return m_stderrTail; }
    const LaunchSpec& spec() const { return m_spec; }

    static constexpr int kStartWaitMs = 3000;
    static constexpr int kDefaultGraceMs = 5000;
    static constexpr int kStderrTailLines = 20;

signals:
    void stdoutData(const QByteArray& data);
    void stderrLine(const QString& line);
    /// 进程结束（无论是否由 stop() 引起）
    void exited(int exitCode, QProcess::ExitStatus status);

private:
    void onStderrReady();
    void onFinished(int exitCode, QProcess::ExitStatus status);

    std::unique_ptr<QProcess> m_proc;
    QTimer m_killTimer;
    LaunchSpec m_spec;
    QByteArray m_stderrBuf;
    QStringList m_stderrTail;
    qint64 m_pid = 0;
    bool m_stopRequested = false;
    bool m_exitReported = false;

    static constexpr qint64 kMaxStderrBufferBytes = 1 * 1024 * 1024; // 1MB
};

} // namespace mcphub
