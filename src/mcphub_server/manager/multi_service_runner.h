#pragma once

#include <QJsonObject>
#include <QObject>
#include <QProcessEnvironment>
#include <QString>
#include <QVector>
#include <map>
#include <memory>

#include "mcphub/supervisor/backoff_policy.h"
#include "mcphub/supervisor/port_pool.h"
#include "mcphub/supervisor/process_supervisor.h"
#include "mcphub/supervisor/service_config.h"

namespace mcphub_server {

class ChildLogWriter;

/**
 * 常驻模式：服务表中每个 enabled 项一个 ProcessSupervisor
 *
 * 启动顺序无关，单项失败不影响其他项，并按退避策略重试。
 * stopAll() 同时向所有子进程发送 terminate，在总时限内等待退出，超时的直接 kill。
 */
class MultiServiceRunner : public QObject {
    Q_OBJECT
public:
    struct Options {
        mcphub::BackoffPolicy backoff = defaultBackoff();
        int shutdownTimeoutMs = 15000;
        int startupTimeoutMs = 30000;
        int settleMs = 300;
        int graceMs = 5000;
        QString logDir;            // 空：不写子进程日志
        qint64 logMaxBytes = 10 * 1024 * 1024;
        int logMaxFiles = 3;
        QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
        mcphub::PortPool* portPool = nullptr; // 非空时占用范围内的服务端口

        static mcphub::BackoffPolicy defaultBackoff() {
            mcphub::BackoffPolicy policy;
            policy.maxRetries = 10;
            return policy;
        }
    };

    struct ServiceStatus {
        QString id;
        mcphub::SupervisorState state = mcphub::SupervisorState::Stopped;
        qint64 pid = 0;
        int failures = 0;
        int restarts = 0;
        int port = 0;
        mcphub::TransportKind transport = mcphub::TransportKind::Stdio;
        qint64 uptimeMs = 0;
        QString lastError;

        QJsonObject toJson() const;
    };

    explicit MultiServiceRunner(const Options& options, QObject* parent = nullptr);
    ~MultiServiceRunner() override;

    /**
     * 载入服务表；disabled 项被忽略。运行中调用返回 false。
     * 配置了端口池时，范围内的 sse/http 端口先占用，重复占用视为错误
     */
    bool setServices(const QVector<mcphub::ServiceConfig>& services, QString& error);

    /**
     * 发起所有服务的启动，不等待就绪
     * @return 成功创建进程的服务数；就绪与否见 serviceStateChanged
     */
    int startAll();

    /**
     * 在 shutdownTimeoutMs 内停止所有服务；等待期间驱动事件循环，
     * 返回时没有子进程存活
     */
    void stopAll();

    QVector<ServiceStatus> serviceStatus() const;
    int runningCount() const;
    int serviceCount() const { return static_cast<int>(m_supervisors.size()); }
    mcphub::ProcessSupervisor* supervisor(const QString& id) const;
    bool isStarted() const { return m_started; }

signals:
    void serviceStateChanged(const QString& id, mcphub::SupervisorState state);
    void serviceGaveUp(const QString& id, const QString& reason);
    void allStopped();

private:
    struct Entry {
        std::unique_ptr<ChildLogWriter> log;
        std::unique_ptr<mcphub::ProcessSupervisor> supervisor;
    };

    void wire(const QString& id, Entry& entry);
    void releasePorts();
    bool anyStopping() const;

    Options m_options;
    std::map<QString, Entry> m_supervisors;
    QVector<int> m_claimedPorts;
    bool m_started = false;
};

} // namespace mcphub_server
