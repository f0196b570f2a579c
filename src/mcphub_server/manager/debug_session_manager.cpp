#include "debug_session_manager.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QLoggingCategory>
#include <QMutexLocker>

#include "http/event_bus.h"
#include "manager/project_catalog.h"
#include "mcphub/protocol/schema_validator.h"
#include "mcphub/protocol/tool_result.h"

using mcphub::CallErrorKind;
using mcphub::CallOutcome;
using mcphub::ProcessSupervisor;
using mcphub::ProtocolSession;

namespace mcphub_server {

Q_LOGGING_CATEGORY(lcDebugSession, "mcphub.debug")

QString debugErrorKindToString(DebugErrorKind kind) {
    switch (kind) {
    case DebugErrorKind::None:                 return "None";
    case DebugErrorKind::SessionAlreadyActive: return "SessionAlreadyActive";
    case DebugErrorKind::NoActiveSession:      return "NoActiveSession";
    case DebugErrorKind::ProjectNotFound:      return "ProjectNotFound";
    case DebugErrorKind::UnknownTool:          return "UnknownTool";
    case DebugErrorKind::InvalidArguments:     return "InvalidArguments";
    case DebugErrorKind::LaunchError:          return "LaunchError";
    case DebugErrorKind::Timeout:              return "Timeout";
    case DebugErrorKind::RemoteError:          return "RemoteError";
    case DebugErrorKind::ToolError:            return "ToolError";
    case DebugErrorKind::TransportError:       return "TransportError";
    case DebugErrorKind::SessionClosed:        return "SessionClosed";
    case DebugErrorKind::InvalidState:         return "InvalidState";
    case DebugErrorKind::InvalidResponse:      return "InvalidResponse";
    }
    return "None";
}

QJsonObject ExecuteResult::toJson() const {
    QJsonObject obj;
    obj["success"] = success;
    if (success) {
        obj["result"] = result;
    } else {
        obj["error"] = error;
        obj["errorKind"] = debugErrorKindToString(errorKind);
        if (!result.isEmpty()) {
            obj["result"] = result;
        }
    }
    obj["execution_time"] = static_cast<double>(durationMs) / 1000.0;
    return obj;
}

DebugSessionManager::DebugSessionManager(ProjectCatalog* catalog, EventBus* bus,
                                         const Options& options, QObject* parent)
    : QObject(parent)
    , m_catalog(catalog)
    , m_bus(bus)
    , m_options(options) {
}

DebugSessionManager::~DebugSessionManager() {
    std::map<QString, SessionPtr> sessions;
    {
        QMutexLocker locker(&m_mutex);
        sessions.swap(m_sessions);
    }
    m_pendingStarts.clear();
    for (auto& entry : sessions) {
        teardown(entry.second, false);
    }
    // 析构 supervisor 会把仍在宽限期内的子进程交给 ChildProcess::retire
    const QList<ProcessSupervisor*> stopping = m_stopping;
    m_stopping.clear();
    for (ProcessSupervisor* supervisor : stopping) {
        supervisor->disconnect(this);
        delete supervisor;
    }
}

DebugErrorKind DebugSessionManager::fromCallError(CallErrorKind kind) {
    switch (kind) {
    case CallErrorKind::None:            return DebugErrorKind::None;
    case CallErrorKind::Timeout:         return DebugErrorKind::Timeout;
    case CallErrorKind::RemoteError:     return DebugErrorKind::RemoteError;
    case CallErrorKind::TransportError:  return DebugErrorKind::TransportError;
    case CallErrorKind::SessionClosed:   return DebugErrorKind::SessionClosed;
    case CallErrorKind::InvalidState:    return DebugErrorKind::InvalidState;
    case CallErrorKind::InvalidResponse: return DebugErrorKind::InvalidResponse;
    }
    return DebugErrorKind::TransportError;
}

void DebugSessionManager::startSessionAsync(const QString& projectId, QObject* context,
                                            StartCallback callback) {
    auto entry = std::make_shared<DebugSession>();
    entry->projectId = projectId;
    entry->createdAt = QDateTime::currentDateTimeUtc();
    entry->lastActivity = entry->createdAt;

    SessionPtr previous;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_sessions.find(projectId);
        if (it != m_sessions.end()) {
            if (!it->second->isTerminal() || it->second->starting) {
                locker.unlock();
                callback(StartSessionResult::failure(
                    DebugErrorKind::SessionAlreadyActive,
                    "a debug session is already active for project " + projectId));
                return;
            }
            previous = it->second;
        }
        m_sessions[projectId] = entry;
    }
    // 上一次失败会话的残留
    if (previous) {
        teardown(previous, true);
    }

    PendingStart pending;
    pending.context = context;
    pending.hasContext = context != nullptr;
    pending.callback = std::move(callback);
    m_pendingStarts[entry.get()] = std::move(pending);

    mcphub::ServiceConfig config;
    QString error;
    const auto resolved = m_catalog->resolve(projectId, config, error);
    if (resolved != ProjectCatalog::ResolveError::None) {
        failStart(entry,
                  resolved == ProjectCatalog::ResolveError::Invalid
                      ? DebugErrorKind::LaunchError
                      : DebugErrorKind::ProjectNotFound,
                  error);
        return;
    }

    ProcessSupervisor::Options supervisorOptions;
    supervisorOptions.backoff.maxRetries = 0;
    supervisorOptions.settleMs = m_options.settleMs;
    supervisorOptions.startupTimeoutMs = m_options.startupTimeoutMs;
    supervisorOptions.graceMs = m_options.graceMs;
    supervisorOptions.environment = m_options.environment;

    entry->supervisor = std::make_unique<ProcessSupervisor>(config, supervisorOptions);
    ProcessSupervisor* supervisor = entry->supervisor.get();
    connect(supervisor, &ProcessSupervisor::stderrLine, this, [projectId](const QString& line) {
        qCDebug(lcDebugSession).noquote() << projectId << "stderr:" << line;
    });
    const std::weak_ptr<DebugSession> weak = entry;
    connect(supervisor, &ProcessSupervisor::processExited, this,
            [this, weak](int, bool) { onProcessExited(weak); });
    connect(supervisor, &ProcessSupervisor::started, this,
            [this, weak](qint64) { onSupervisorStarted(weak); });
    connect(supervisor, &ProcessSupervisor::startFailed, this,
            [this, weak](const QString& reason) {
                const SessionPtr s = weak.lock();
                if (s && s->starting) {
                    failStart(s, DebugErrorKind::LaunchError, reason);
                }
            });

    qCInfo(lcDebugSession).noquote() << "starting debug session" << projectId << ":"
                                     << config.launchSpec().commandLine();

    const mcphub::StartResult started = supervisor->start();
    if (!started.ok) {
        failStart(entry, DebugErrorKind::LaunchError, started.message);
    }
}

void DebugSessionManager::onSupervisorStarted(const std::weak_ptr<DebugSession>& weak) {
    const SessionPtr entry = weak.lock();
    if (!entry || !entry->starting || !entry->supervisor) {
        return;
    }

    const QString projectId = entry->projectId;
    ProtocolSession::Options sessionOptions;
    sessionOptions.callTimeoutMs = m_options.callTimeoutMs;
    entry->session =
        std::make_unique<ProtocolSession>(entry->supervisor->transport(), sessionOptions);
    connect(entry->session.get(), &ProtocolSession::notificationReceived, this,
            [this, projectId](const QString& method, const QJsonValue& params) {
                publish("session.notification", projectId,
                        QJsonObject{{"method", method}, {"params", params}});
                emit notificationReceived(projectId, method, params);
            });

    entry->session->initialize().onFinished(
        this, [this, weak](const CallOutcome& outcome) { onInitialized(weak, outcome); });
}

void DebugSessionManager::onInitialized(const std::weak_ptr<DebugSession>& weak,
                                        const CallOutcome& outcome) {
    const SessionPtr entry = weak.lock();
    if (!entry || !entry->starting || !entry->session) {
        return;
    }
    if (!outcome.ok) {
        failStart(entry, fromCallError(outcome.errorKind),
                  "initialize failed: " + outcome.message);
        return;
    }
    entry->session->listTools().onFinished(
        this, [this, weak](const CallOutcome& listOutcome) { onToolsListed(weak, listOutcome); });
}

void DebugSessionManager::onToolsListed(const std::weak_ptr<DebugSession>& weak,
                                        const CallOutcome& outcome) {
    const SessionPtr entry = weak.lock();
    if (!entry || !entry->starting || !entry->session) {
        return;
    }
    if (!outcome.ok) {
        failStart(entry, fromCallError(outcome.errorKind),
                  "tools/list failed: " + outcome.message);
        return;
    }

    StartSessionResult result;
    {
        QMutexLocker locker(&m_mutex);
        entry->tools = entry->session->tools();
        entry->state = DebugSessionState::Ready;
        entry->starting = false;
        entry->lastActivity = QDateTime::currentDateTimeUtc();
        result.ok = true;
        result.tools = entry->tools;
    }

    qCInfo(lcDebugSession).noquote() << "debug session" << entry->projectId << "ready, pid"
                                     << entry->supervisor->pid() << "," << result.tools.size()
                                     << "tools";
    publish("session.started", entry->projectId,
            QJsonObject{{"tools", mcphub::toolListToJson(result.tools)}});
    emit sessionStarted(entry->projectId);
    finishStart(entry.get(), result);
}

void DebugSessionManager::failStart(const SessionPtr& entry, DebugErrorKind kind,
                                    const QString& message) {
    qCWarning(lcDebugSession).noquote() << "debug session" << entry->projectId
                                        << "failed to start:" << message;
    removeIfCurrent(entry->projectId, entry);
    teardown(entry, true);
    finishStart(entry.get(), StartSessionResult::failure(kind, message));
}

void DebugSessionManager::finishStart(const DebugSession* entry,
                                      const StartSessionResult& result) {
    auto it = m_pendingStarts.find(entry);
    if (it == m_pendingStarts.end()) {
        return;
    }
    PendingStart pending = std::move(it->second);
    m_pendingStarts.erase(it);
    if (pending.hasContext && pending.context.isNull()) {
        return;
    }
    if (pending.callback) {
        pending.callback(result);
    }
}

void DebugSessionManager::stopSession(const QString& projectId) {
    SessionPtr entry;
    bool starting = false;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_sessions.find(projectId);
        if (it == m_sessions.end()) {
            return;
        }
        entry = it->second;
        m_sessions.erase(it);
        starting = entry->starting;
    }

    teardown(entry, true);
    if (starting) {
        qCInfo(lcDebugSession).noquote() << "debug session" << projectId
                                         << "stopped during start";
        finishStart(entry.get(), StartSessionResult::failure(DebugErrorKind::SessionClosed,
                                                             "session stopped during start"));
    }

    qCInfo(lcDebugSession).noquote() << "debug session" << projectId << "stopped";
    publish("session.stopped", projectId);
    emit sessionStopped(projectId);
}

void DebugSessionManager::teardown(const SessionPtr& entry, bool deferDelete) {
    {
        QMutexLocker locker(&m_mutex);
        if (!entry->isTerminal()) {
            entry->state = DebugSessionState::Stopping;
        }
        entry->starting = false;
    }

    // 先关闭会话（结束未完成调用），再停止子进程
    if (entry->session) {
        entry->session->disconnect(this);
        entry->session->close();
    }
    if (entry->supervisor) {
        entry->supervisor->disconnect(this);
        entry->supervisor->stop();
    }

    {
        QMutexLocker locker(&m_mutex);
        if (entry->state != DebugSessionState::Failed) {
            entry->state = DebugSessionState::Stopped;
        }
        entry->tools.clear();
    }

    if (deferDelete) {
        if (entry->session) {
            entry->session.release()->deleteLater();
        }
        if (entry->supervisor) {
            retireSupervisor(entry->supervisor.release());
        }
    } else {
        entry->session.reset();
        entry->supervisor.reset();
    }
}

void DebugSessionManager::retireSupervisor(ProcessSupervisor* supervisor) {
    if (supervisor->state() == mcphub::SupervisorState::Stopped) {
        supervisor->deleteLater();
        return;
    }
    // 子进程退出（或宽限期满被 kill）后再释放
    m_stopping.append(supervisor);
    connect(supervisor, &ProcessSupervisor::stateChanged, this,
            [this, supervisor](mcphub::SupervisorState, mcphub::SupervisorState state) {
                if (state != mcphub::SupervisorState::Stopped) {
                    return;
                }
                supervisor->disconnect(this);
                m_stopping.removeOne(supervisor);
                supervisor->deleteLater();
            });
}

void DebugSessionManager::waitForProcesses(int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (!m_stopping.isEmpty() && timer.elapsed() < timeoutMs) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    }

    const QList<ProcessSupervisor*> remaining = m_stopping;
    for (ProcessSupervisor* supervisor : remaining) {
        qCWarning(lcDebugSession).noquote() << supervisor->id()
                                            << "still running after shutdown grace, killing";
        supervisor->kill();
    }

    QElapsedTimer drain;
    drain.start();
    while (!m_stopping.isEmpty() && drain.elapsed() < 1000) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    }
}

void DebugSessionManager::removeIfCurrent(const QString& projectId, const SessionPtr& entry) {
    QMutexLocker locker(&m_mutex);
    auto it = m_sessions.find(projectId);
    if (it != m_sessions.end() && it->second == entry) {
        m_sessions.erase(it);
    }
}

void DebugSessionManager::onProcessExited(const std::weak_ptr<DebugSession>& weak) {
    const SessionPtr entry = weak.lock();
    if (!entry) {
        return;
    }
    const QString reason = entry->supervisor ? entry->supervisor->lastError()
                                             : QStringLiteral("process exited");
    bool starting = false;
    {
        QMutexLocker locker(&m_mutex);
        if (entry->state == DebugSessionState::Stopping || entry->isTerminal()) {
            return;
        }
        starting = entry->starting;
        entry->state = DebugSessionState::Failed;
        entry->failureReason = reason;
        entry->tools.clear();
    }

    // 未完成调用以 TransportError 结束；会话内不重启子进程
    if (entry->session) {
        entry->session->transportLost("process exited: " + reason);
    }
    if (starting) {
        // 握手中的调用已失败，由其完成回调走 failStart
        return;
    }

    qCWarning(lcDebugSession).noquote() << "debug session" << entry->projectId
                                        << "failed:" << reason;
    publish("session.failed", entry->projectId, QJsonObject{{"reason", reason}});
    emit sessionFailed(entry->projectId, reason);
}

void DebugSessionManager::executeAsync(const QString& projectId, const QString& toolName,
                                       const QJsonObject& arguments, QObject* context,
                                       ExecuteCallback callback) {
    QElapsedTimer timer;
    timer.start();

    SessionPtr entry;
    mcphub::ToolDescriptor tool;
    bool toolFound = false;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_sessions.find(projectId);
        if (it != m_sessions.end() && it->second->state == DebugSessionState::Ready
            && it->second->session) {
            entry = it->second;
            for (const auto& t : entry->tools) {
                if (t.name == toolName) {
                    tool = t;
                    toolFound = true;
                    break;
                }
            }
        }
    }

    if (!entry) {
        callback(ExecuteResult::failure(DebugErrorKind::NoActiveSession,
                                        "no active debug session for project " + projectId));
        return;
    }
    if (!toolFound) {
        callback(ExecuteResult::failure(DebugErrorKind::UnknownTool, "unknown tool: " + toolName));
        return;
    }
    const mcphub::ValidationResult validation =
        mcphub::SchemaValidator::validateArguments(arguments, tool.inputSchema);
    if (!validation.valid) {
        callback(ExecuteResult::failure(DebugErrorKind::InvalidArguments,
                                        "invalid arguments: " + validation.toString()));
        return;
    }

    {
        QMutexLocker locker(&m_mutex);
        ++entry->executionCount;
        entry->lastActivity = QDateTime::currentDateTimeUtc();
    }

    qCDebug(lcDebugSession).noquote() << projectId << "tools/call" << toolName;
    mcphub::RpcCall call = entry->session->callTool(toolName, arguments, m_options.callTimeoutMs);
    const std::weak_ptr<DebugSession> weak = entry;
    call.onFinished(context, [this, weak, timer, callback](const CallOutcome& outcome) {
        ExecuteResult result;
        if (outcome.ok) {
            const mcphub::ToolResultText text = mcphub::flattenToolResult(outcome.result);
            result.rawResult = outcome.result;
            if (text.isError) {
                result.errorKind = DebugErrorKind::ToolError;
                result.error = text.text;
            } else {
                result.success = true;
                result.result = text.text;
            }
        } else {
            result.errorKind = fromCallError(outcome.errorKind);
            result.error = outcome.message;
        }
        result.durationMs = timer.elapsed();

        if (const SessionPtr s = weak.lock()) {
            QMutexLocker locker(&m_mutex);
            s->lastActivity = QDateTime::currentDateTimeUtc();
        }
        callback(result);
    });
}

QVector<mcphub::ToolDescriptor> DebugSessionManager::getTools(const QString& projectId) const {
    QMutexLocker locker(&m_mutex);
    auto it = m_sessions.find(projectId);
    if (it == m_sessions.end() || it->second->state != DebugSessionState::Ready) {
        return {};
    }
    return it->second->tools;
}

bool DebugSessionManager::sessionInfo(const QString& projectId, DebugSessionInfo& out) const {
    const SessionPtr entry = findSession(projectId);
    if (!entry) {
        return false;
    }
    QMutexLocker locker(&m_mutex);
    out.projectId = entry->projectId;
    out.state = entry->state;
    out.createdAt = entry->createdAt;
    out.lastActivity = entry->lastActivity;
    out.toolCount = entry->tools.size();
    out.executionCount = entry->executionCount;
    out.pid = entry->supervisor ? entry->supervisor->pid() : 0;
    out.pendingCalls = entry->session ? entry->session->pendingCount() : 0;
    out.failureReason = entry->failureReason;
    return true;
}

bool DebugSessionManager::hasActiveSession(const QString& projectId) const {
    const SessionPtr entry = findSession(projectId);
    return entry && !entry->isTerminal();
}

int DebugSessionManager::activeSessionCount() const {
    QMutexLocker locker(&m_mutex);
    int count = 0;
    for (const auto& entry : m_sessions) {
        if (!entry.second->isTerminal()) {
            ++count;
        }
    }
    return count;
}

QStringList DebugSessionManager::projectIds() const {
    QMutexLocker locker(&m_mutex);
    QStringList ids;
    for (const auto& entry : m_sessions) {
        ids.append(entry.first);
    }
    return ids;
}

void DebugSessionManager::stopAll() {
    const QStringList ids = projectIds();
    for (const QString& id : ids) {
        stopSession(id);
    }
}

DebugSessionManager::SessionPtr DebugSessionManager::findSession(const QString& projectId) const {
    QMutexLocker locker(&m_mutex);
    auto it = m_sessions.find(projectId);
    return it == m_sessions.end() ? nullptr : it->second;
}

void DebugSessionManager::publish(const QString& type, const QString& projectId,
                                  const QJsonObject& data) {
    if (m_bus) {
        m_bus->publish(type, projectId, data);
    }
}

} // namespace mcphub_server
