#include "multi_service_runner.h"

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QLoggingCategory>
#include <algorithm>

#include "manager/child_log_writer.h"

using mcphub::ProcessSupervisor;
using mcphub::SupervisorState;

namespace mcphub_server {

Q_LOGGING_CATEGORY(lcHub, "mcphub.hub")

QJsonObject MultiServiceRunner::ServiceStatus::toJson() const {
    QJsonObject obj;
    obj["id"] = id;
    obj["state"] = mcphub::supervisorStateToString(state);
    obj["pid"] = pid;
    obj["failures"] = failures;
    obj["restarts"] = restarts;
    obj["transport"] = mcphub::transportKindToString(transport);
    if (port > 0) {
        obj["port"] = port;
    }
    obj["uptimeMs"] = uptimeMs;
    if (!lastError.isEmpty()) {
        obj["lastError"] = lastError;
    }
    return obj;
}

MultiServiceRunner::MultiServiceRunner(const Options& options, QObject* parent)
    : QObject(parent)
    , m_options(options) {
}

MultiServiceRunner::~MultiServiceRunner() {
    stopAll();
    releasePorts();
}

void MultiServiceRunner::releasePorts() {
    if (m_options.portPool) {
        for (int port : m_claimedPorts) {
            m_options.portPool->release(port);
        }
    }
    m_claimedPorts.clear();
}

bool MultiServiceRunner::setServices(const QVector<mcphub::ServiceConfig>& services,
                                     QString& error) {
    if (m_started) {
        error = "cannot change services while running";
        return false;
    }
    m_supervisors.clear();
    releasePorts();

    if (m_options.portPool) {
        mcphub::PortPool* pool = m_options.portPool;
        for (const auto& service : services) {
            if (!service.enabled || !service.isNetwork() || service.port < pool->firstPort()
                || service.port > pool->lastPort()) {
                continue;
            }
            if (!pool->claim(service.port)) {
                error = QString("port %1 of service '%2' is already claimed")
                            .arg(service.port)
                            .arg(service.id);
                releasePorts();
                return false;
            }
            m_claimedPorts.append(service.port);
        }
    }

    if (!m_options.logDir.isEmpty() && !QDir().mkpath(m_options.logDir)) {
        error = "cannot create log directory: " + m_options.logDir;
        releasePorts();
        return false;
    }

    ProcessSupervisor::Options supervisorOptions;
    supervisorOptions.backoff = m_options.backoff;
    supervisorOptions.startupTimeoutMs = m_options.startupTimeoutMs;
    supervisorOptions.settleMs = m_options.settleMs;
    supervisorOptions.graceMs = m_options.graceMs;
    supervisorOptions.retryFailedLaunch = true;
    supervisorOptions.environment = m_options.environment;

    for (const auto& service : services) {
        if (!service.enabled) {
            qCInfo(lcHub).noquote() << "skip disabled service" << service.id;
            continue;
        }
        Entry entry;
        if (!m_options.logDir.isEmpty()) {
            entry.log = std::make_unique<ChildLogWriter>(
                service.id, QDir(m_options.logDir).filePath(service.id + ".log"),
                m_options.logMaxBytes, m_options.logMaxFiles);
        }
        entry.supervisor = std::make_unique<ProcessSupervisor>(service, supervisorOptions);
        auto inserted = m_supervisors.emplace(service.id, std::move(entry));
        wire(service.id, inserted.first->second);
    }
    error.clear();
    return true;
}

void MultiServiceRunner::wire(const QString& id, Entry& entry) {
    ProcessSupervisor* supervisor = entry.supervisor.get();
    ChildLogWriter* log = entry.log.get();

    connect(supervisor, &ProcessSupervisor::stateChanged, this,
            [this, id](SupervisorState, SupervisorState state) {
                emit serviceStateChanged(id, state);
            });
    connect(supervisor, &ProcessSupervisor::gaveUp, this,
            [this, id, log](int failures, const QString& reason) {
                qCCritical(lcHub).noquote() << id << "gave up after" << failures
                                            << "failures:" << reason;
                if (log) {
                    log->appendEvent(QString("gave up after %1 failures: %2").arg(failures).arg(reason));
                }
                emit serviceGaveUp(id, reason);
            });

    if (!log) {
        return;
    }
    connect(supervisor, &ProcessSupervisor::stdoutData, this,
            [log](const QByteArray& data) { log->appendStdout(data); });
    connect(supervisor, &ProcessSupervisor::stderrLine, this,
            [log](const QString& line) { log->appendStderrLine(line); });
    connect(supervisor, &ProcessSupervisor::started, this,
            [log](qint64 pid) { log->appendEvent(QString("started, pid %1").arg(pid)); });
    connect(supervisor, &ProcessSupervisor::startFailed, this,
            [log](const QString& reason) { log->appendEvent("start failed: " + reason); });
    connect(supervisor, &ProcessSupervisor::processExited, this,
            [log](int exitCode, bool crashed) {
                log->appendEvent(QString("exited, code %1%2")
                                     .arg(exitCode)
                                     .arg(crashed ? QStringLiteral(" (crashed)") : QString()));
            });
    connect(supervisor, &ProcessSupervisor::restartScheduled, this,
            [log](int attempt, int delayMs) {
                log->appendEvent(
                    QString("restart attempt %1 in %2 ms").arg(attempt).arg(delayMs));
            });
}

int MultiServiceRunner::startAll() {
    m_started = true;
    int launched = 0;
    for (auto& item : m_supervisors) {
        const mcphub::StartResult result = item.second.supervisor->start();
        if (result.ok) {
            ++launched;
        } else {
            qCWarning(lcHub).noquote() << "service" << item.first
                                       << "failed to start:" << result.message;
        }
    }
    qCInfo(lcHub).noquote() << launched << "of" << m_supervisors.size()
                            << "services launched";
    return launched;
}

bool MultiServiceRunner::anyStopping() const {
    for (const auto& item : m_supervisors) {
        if (item.second.supervisor->state() == SupervisorState::Stopping) {
            return true;
        }
    }
    return false;
}

void MultiServiceRunner::stopAll() {
    if (!m_started) {
        return;
    }
    m_started = false;

    QElapsedTimer elapsed;
    elapsed.start();
    qCInfo(lcHub).noquote() << "stopping" << m_supervisors.size() << "services, deadline"
                            << m_options.shutdownTimeoutMs << "ms";

    const int grace = std::min(m_options.graceMs, m_options.shutdownTimeoutMs);
    for (auto& item : m_supervisors) {
        item.second.supervisor->stop(grace);
    }

    while (anyStopping() && elapsed.elapsed() < m_options.shutdownTimeoutMs) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    }

    for (auto& item : m_supervisors) {
        if (item.second.supervisor->state() == SupervisorState::Stopping) {
            qCWarning(lcHub).noquote() << item.first << "still running at deadline, killing";
            item.second.supervisor->kill();
        }
    }
    QElapsedTimer drain;
    drain.start();
    while (anyStopping() && drain.elapsed() < 1000) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    }

    for (auto& item : m_supervisors) {
        if (item.second.log) {
            item.second.log->appendEvent("stopped");
        }
    }

    qCInfo(lcHub).noquote() << "all services stopped in" << elapsed.elapsed() << "ms";
    emit allStopped();
}

QVector<MultiServiceRunner::ServiceStatus> MultiServiceRunner::serviceStatus() const {
    QVector<ServiceStatus> out;
    out.reserve(static_cast<int>(m_supervisors.size()));
    for (const auto& item : m_supervisors) {
        const ProcessSupervisor* supervisor = item.second.supervisor.get();
        ServiceStatus status;
        status.id = item.first;
        status.state = supervisor->state();
        status.pid = supervisor->pid();
        status.failures = supervisor->consecutiveFailures();
        status.restarts = supervisor->restartCount();
        status.port = supervisor->config().port;
        status.transport = supervisor->config().transport;
        status.uptimeMs = supervisor->uptimeMs();
        status.lastError = supervisor->lastError();
        out.append(status);
    }
    return out;
}

int MultiServiceRunner::runningCount() const {
    int count = 0;
    for (const auto& item : m_supervisors) {
        if (item.second.supervisor->state() == SupervisorState::Running) {
            ++count;
        }
    }
    return count;
}

ProcessSupervisor* MultiServiceRunner::supervisor(const QString& id) const {
    auto it = m_supervisors.find(id);
    return it == m_supervisors.end() ? nullptr : it->second.supervisor.get();
}

} // namespace mcphub_server
