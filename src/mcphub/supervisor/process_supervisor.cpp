#include "process_supervisor.h"

#include <QLoggingCategory>

#include "mcphub/transport/http_transport.h"
#include "mcphub/transport/stdio_transport.h"

namespace mcphub {

Q_LOGGING_CATEGORY(lcSupervisor, "mcphub.supervisor")

QString supervisorStateToString(SupervisorState state) {
    switch (state) {
    case SupervisorState::Stopped:      return "stopped";
    case SupervisorState::Starting:     return "starting";
    case SupervisorState::Running:      return "running";
    case SupervisorState::Stopping:     return "stopping";
    case SupervisorState::CrashBackoff: return "crash_backoff";
    case SupervisorState::Failed:       return "failed";
    }
    return "stopped";
}

ProcessSupervisor::ProcessSupervisor(const ServiceConfig& config, const Options& options,
                                     QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_options(options) {
    qRegisterMetaType<mcphub::SupervisorState>();
    m_retryTimer.setSingleShot(true);
    connect(&m_retryTimer, &QTimer::timeout, this, &ProcessSupervisor::onRetryTimer);
    m_settleTimer.setSingleShot(true);
    connect(&m_settleTimer, &QTimer::timeout, this, &ProcessSupervisor::onSettled);
}

ProcessSupervisor::~ProcessSupervisor() {
    m_retryTimer.stop();
    m_settleTimer.stop();
    releaseResources(false);
}

StartResult ProcessSupervisor::start() {
    if (m_state == SupervisorState::Starting || m_state == SupervisorState::Stopping) {
        return StartResult::inProgress(
            QString("service '%1' is %2").arg(m_config.id, supervisorStateToString(m_state)));
    }
    if (m_state == SupervisorState::Running) {
        return StartResult::success();
    }

    m_retryTimer.stop();
    if (m_state != SupervisorState::CrashBackoff) {
        m_failures = 0;
    }
    return launch(false);
}

StartResult ProcessSupervisor::launch(bool fromRetry) {
    setState(SupervisorState::Starting);
    m_launchFromRetry = fromRetry;

    qCInfo(lcSupervisor).noquote() << "starting" << m_config.id << "("
                                   << transportKindToString(m_config.transport) << ")";

    const StartResult result = m_config.isNetwork() ? launchNetwork() : launchStdio();
    if (!result.ok) {
        failLaunch(result.message);
        // 重启没有调用方等待返回值
        if (fromRetry) {
            emit startFailed(result.message);
        }
    }
    return result;
}

StartResult ProcessSupervisor::launchStdio() {
    auto transport = std::make_unique<StdioTransport>(m_config.launchSpec(m_options.environment),
                                                      m_options.graceMs);
    StdioTransport* raw = transport.get();

    const TransportResult connected = raw->connectToPeer();
    if (!connected.ok) {
        return StartResult::launchError(connected.message);
    }

    connect(raw->process(), &ChildProcess::stderrLine, this, &ProcessSupervisor::stderrLine);
    connect(raw, &TransportClient::finished, this,
            [this, raw](bool, const QString& reason) {
                ChildProcess* child = raw->process();
                const int code = child ? child->exitCode() : -1;
                const bool crashed = !child || child->exitStatus() == QProcess::CrashExit;
                if (m_state == SupervisorState::Starting) {
                    failStart("process exited during startup: " + reason);
                } else if (m_state == SupervisorState::Running) {
                    onUnexpectedExit(code, crashed, reason);
                }
            });
    m_transport = std::move(transport);

    // settleMs 为 0 时也在下一轮事件循环才判定
    m_settleTimer.start(qMax(0, m_options.settleMs));
    return StartResult::success();
}

StartResult ProcessSupervisor::launchNetwork() {
    auto child = std::make_unique<ChildProcess>();
    connect(child.get(), &ChildProcess::stdoutData, this, &ProcessSupervisor::stdoutData);
    connect(child.get(), &ChildProcess::stderrLine, this, &ProcessSupervisor::stderrLine);
    connect(child.get(), &ChildProcess::exited, this,
            [this](int exitCode, QProcess::ExitStatus status) {
                const QString reason = m_child ? m_child->exitContext()
                                               : QString("exitCode=%1").arg(exitCode);
                if (m_state == SupervisorState::Starting) {
                    failStart("process exited during startup: " + reason);
                } else if (m_state == SupervisorState::Running) {
                    onUnexpectedExit(exitCode, status == QProcess::CrashExit, reason);
                }
            });

    QString error;
    if (!child->start(m_config.launchSpec(m_options.environment), error)) {
        return StartResult::launchError(error);
    }
    m_child = std::move(child);

    m_health = std::make_unique<HealthProbe>(m_config.baseUrl());
    connect(m_health.get(), &HealthProbe::healthy, this, &ProcessSupervisor::onHealthy);
    connect(m_health.get(), &HealthProbe::failed, this, &ProcessSupervisor::failStart);
    m_health->startPolling(m_options.startupTimeoutMs, m_options.healthIntervalMs);
    return StartResult::success();
}

void ProcessSupervisor::onSettled() {
    if (m_state != SupervisorState::Starting) {
        return;
    }
    if (!m_transport || !m_transport->isOpen()) {
        failStart("process exited during startup");
        return;
    }
    completeStart();
}

void ProcessSupervisor::onHealthy() {
    if (m_state != SupervisorState::Starting) {
        return;
    }
    auto transport = std::make_unique<HttpTransport>(m_config.transport, m_config.baseUrl());
    transport->attach();
    m_transport = std::move(transport);
    completeStart();
}

void ProcessSupervisor::completeStart() {
    m_lastError.clear();
    m_runTimer.start();
    setState(SupervisorState::Running);
    qCInfo(lcSupervisor).noquote() << m_config.id << "running, pid" << pid();
    emit started(pid());
}

void ProcessSupervisor::failStart(const QString& reason) {
    if (m_state != SupervisorState::Starting) {
        return;
    }
    m_settleTimer.stop();
    failLaunch(reason);
    emit startFailed(reason);
}

void ProcessSupervisor::failLaunch(const QString& reason) {
    releaseResources(true);
    m_lastError = reason;
    qCWarning(lcSupervisor).noquote() << "launch of" << m_config.id << "failed:" << reason;
    if (m_launchFromRetry || m_options.retryFailedLaunch) {
        handleFailure(reason);
    } else {
        setState(SupervisorState::Stopped);
    }
}

void ProcessSupervisor::stop(int graceMs) {
    const int grace = graceMs >= 0 ? graceMs : m_options.graceMs;
    switch (m_state) {
    case SupervisorState::Stopped:
        return;
    case SupervisorState::Stopping:
        if (ChildProcess* child = activeChild()) {
            child->stop(grace);
        }
        return;
    case SupervisorState::CrashBackoff:
    case SupervisorState::Failed:
        m_retryTimer.stop();
        setState(SupervisorState::Stopped);
        return;
    case SupervisorState::Starting:
    case SupervisorState::Running:
        break;
    }

    const bool aborting = m_state == SupervisorState::Starting;
    qCInfo(lcSupervisor).noquote() << "stopping" << m_config.id;
    m_retryTimer.stop();
    m_settleTimer.stop();
    if (m_health) {
        m_health->cancel();
    }
    setState(SupervisorState::Stopping);

    ChildProcess* child = activeChild();
    if (m_transport) {
        m_transport->disconnect(this);
    }
    if (child && child->isRunning()) {
        child->disconnect(this);
        connect(child, &ChildProcess::exited, this, &ProcessSupervisor::onStopExited);
        child->stop(grace);
        if (m_transport) {
            m_transport->close();
        }
    } else {
        finishStop();
    }

    if (aborting) {
        const QString reason = QString("start of '%1' aborted by stop").arg(m_config.id);
        m_lastError = reason;
        emit startFailed(reason);
    }
}

void ProcessSupervisor::kill() {
    if (ChildProcess* child = activeChild()) {
        child->kill();
    }
}

void ProcessSupervisor::onStopExited() {
    if (m_state != SupervisorState::Stopping) {
        return;
    }
    finishStop();
}

void ProcessSupervisor::finishStop() {
    releaseResources(true);
    m_failures = 0;
    setState(SupervisorState::Stopped);
    qCInfo(lcSupervisor).noquote() << m_config.id << "stopped";
}

ChildProcess* ProcessSupervisor::activeChild() const {
    if (m_child) {
        return m_child.get();
    }
    if (auto* stdio = qobject_cast<StdioTransport*>(m_transport.get())) {
        return stdio->process();
    }
    return nullptr;
}

qint64 ProcessSupervisor::pid() const {
    if (m_child) {
        return m_child->isRunning() ? m_child->pid() : 0;
    }
    if (m_transport && m_transport->isOpen()) {
        return m_transport->peerPid();
    }
    return 0;
}

qint64 ProcessSupervisor::uptimeMs() const {
    return m_state == SupervisorState::Running && m_runTimer.isValid() ? m_runTimer.elapsed() : 0;
}

void ProcessSupervisor::onUnexpectedExit(int exitCode, bool crashed, const QString& reason) {
    qCWarning(lcSupervisor).noquote() << m_config.id << "exited unexpectedly:" << reason;
    m_lastError = reason;
    emit processExited(exitCode, crashed);

    if (m_runTimer.isValid() && m_runTimer.elapsed() >= m_options.backoff.stableResetMs) {
        m_failures = 0;
    }
    releaseResources(true);
    handleFailure(reason);
}

void ProcessSupervisor::handleFailure(const QString& reason) {
    ++m_failures;
    if (!m_options.backoff.allowsRetry(m_failures)) {
        qCWarning(lcSupervisor).noquote() << m_config.id << "giving up after" << m_failures
                                          << "consecutive failures";
        setState(SupervisorState::Failed);
        emit gaveUp(m_failures, reason);
        return;
    }

    const int delay = m_options.backoff.delayForFailure(m_failures);
    qCInfo(lcSupervisor).noquote() << m_config.id << "restart attempt" << m_failures << "in"
                                   << delay << "ms";
    setState(SupervisorState::CrashBackoff);
    emit restartScheduled(m_failures, delay);
    m_retryTimer.start(delay);
}

void ProcessSupervisor::onRetryTimer() {
    if (m_state != SupervisorState::CrashBackoff) {
        return;
    }
    ++m_restarts;
    launch(true);
}

void ProcessSupervisor::releaseResources(bool deferDelete, int graceMs) {
    const int grace = graceMs >= 0 ? graceMs : m_options.graceMs;
    if (m_health) {
        m_health->disconnect(this);
        m_health->cancel();
        if (deferDelete) {
            m_health.release()->deleteLater();
        } else {
            m_health.reset();
        }
    }
    if (m_transport) {
        m_transport->disconnect(this);
        // stdio 通道的子进程按本次的宽限时间停止，close() 不会再延长
        if (auto* stdio = qobject_cast<StdioTransport*>(m_transport.get())) {
            if (ChildProcess* child = stdio->process()) {
                child->disconnect(this);
                child->stop(grace);
            }
        }
        m_transport->close();
        if (deferDelete) {
            m_transport.release()->deleteLater();
        } else {
            m_transport.reset();
        }
    }
    if (m_child) {
        m_child->disconnect(this);
        ChildProcess::retire(std::move(m_child), grace);
    }
}

void ProcessSupervisor::setState(SupervisorState state) {
    if (m_state == state) {
        return;
    }
    const SupervisorState old = m_state;
    m_state = state;
    emit stateChanged(old, state);
}

} // namespace mcphub
