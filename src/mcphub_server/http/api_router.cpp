#include "api_router.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <memory>

#include "http_helpers.h"
#include "manager/debug_session_manager.h"
#include "manager/project_catalog.h"
#include "mcphub/protocol/tool_schema.h"
#include "server_manager.h"

using Method = QHttpServerRequest::Method;
using StatusCode = QHttpServerResponse::StatusCode;

namespace mcphub_server {

namespace {

bool parseJsonObjectBody(const QHttpServerRequest& req, QJsonObject& out, QString& error) {
    const QByteArray body = req.body();
    if (body.trimmed().isEmpty()) {
        out = QJsonObject();
        error.clear();
        return true;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        error = "request body must be a JSON object";
        return false;
    }

    out = doc.object();
    error.clear();
    return true;
}

StatusCode statusForError(DebugErrorKind kind) {
    switch (kind) {
    case DebugErrorKind::SessionAlreadyActive:
        return StatusCode::Conflict;
    case DebugErrorKind::NoActiveSession:
        return StatusCode::Conflict;
    case DebugErrorKind::ProjectNotFound:
    case DebugErrorKind::UnknownTool:
        return StatusCode::NotFound;
    case DebugErrorKind::InvalidArguments:
        return StatusCode::BadRequest;
    case DebugErrorKind::Timeout:
        return StatusCode::GatewayTimeout;
    default:
        return StatusCode::InternalServerError;
    }
}

} // namespace

ApiRouter::ApiRouter(ServerManager* manager, QObject* parent)
    : QObject(parent), m_manager(manager) {}

ApiRouter::~ApiRouter() = default;

void ApiRouter::registerRoutes(QHttpServer& server) {
    // /api/debug/sessions MUST be before /api/debug/<arg>/...
    server.route("/api/debug/sessions", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleDebugSessions(req); });
    server.route("/api/debug/<arg>/start", Method::Post,
                 [this](const QString& id, const QHttpServerRequest& req,
                        QHttpServerResponder& responder) {
                     handleDebugStart(id, req, responder);
                 });
    server.route("/api/debug/<arg>/stop", Method::Post,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleDebugStop(id, req);
                 });
    server.route("/api/debug/<arg>/execute", Method::Post,
                 [this](const QString& id, const QHttpServerRequest& req,
                        QHttpServerResponder& responder) {
                     handleDebugExecute(id, req, responder);
                 });
    server.route("/api/debug/<arg>/tools", Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleDebugTools(id, req);
                 });
    server.route("/api/debug/<arg>/status", Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleDebugStatus(id, req);
                 });

    server.route("/api/projects", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleProjectList(req); });

    server.route("/api/ports", Method::Get,
                 [this](const QHttpServerRequest& req) { return handlePortList(req); });
    server.route("/api/ports/claim", Method::Post,
                 [this](const QHttpServerRequest& req) { return handlePortClaim(req); });
    server.route("/api/ports/<arg>/release", Method::Post,
                 [this](const QString& port, const QHttpServerRequest& req) {
                     return handlePortRelease(port, req);
                 });

    server.route("/api/server/status", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleServerStatus(req); });

    server.setMissingHandler(
        this, [](const QHttpServerRequest&, QHttpServerResponder& responder) {
            const QByteArray body =
                QJsonDocument(QJsonObject{{"error", "not found"}}).toJson(QJsonDocument::Compact);
            QHttpHeaders headers;
            headers.append(QHttpHeaders::WellKnownHeader::ContentType, "application/json");
            responder.write(body, headers, QHttpServerResponder::StatusCode::NotFound);
        });
}

void ApiRouter::handleDebugStart(const QString& id, const QHttpServerRequest& req,
                                 QHttpServerResponder& responder) {
    Q_UNUSED(req);

    auto pending = std::make_shared<QHttpServerResponder>(std::move(responder));
    m_manager->debugSessions()->startSessionAsync(
        id, this, [id, pending](const StartSessionResult& result) {
            if (!result.ok) {
                pending->sendResponse(errorResponse(statusForError(result.errorKind),
                                                    result.message,
                                                    debugErrorKindToString(result.errorKind)));
                return;
            }

            QJsonObject out;
            out["message"] = "Debug session started";
            out["project_id"] = id;
            out["tools"] = mcphub::toolListToJson(result.tools);
            pending->sendResponse(jsonResponse(out));
        });
}

QHttpServerResponse ApiRouter::handleDebugStop(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);

    if (!m_manager->catalog()->exists(id) && !m_manager->debugSessions()->hasActiveSession(id)) {
        return errorResponse(StatusCode::NotFound, "project not found",
                             debugErrorKindToString(DebugErrorKind::ProjectNotFound));
    }

    // 没有会话时 stopSession 直接返回，stop 是幂等的
    m_manager->debugSessions()->stopSession(id);
    return jsonResponse(QJsonObject{{"message", "Debug session stopped"}, {"project_id", id}});
}

void ApiRouter::handleDebugExecute(const QString& id, const QHttpServerRequest& req,
                                   QHttpServerResponder& responder) {
    QJsonObject body;
    QString parseError;
    if (!parseJsonObjectBody(req, body, parseError)) {
        responder.sendResponse(errorResponse(StatusCode::BadRequest, parseError));
        return;
    }

    const QString toolName = body.value("tool_name").toString();
    if (toolName.isEmpty()) {
        responder.sendResponse(errorResponse(StatusCode::BadRequest, "tool_name is required"));
        return;
    }
    const QJsonValue params = body.value("parameters");
    if (!params.isUndefined() && !params.isNull() && !params.isObject()) {
        responder.sendResponse(
            errorResponse(StatusCode::BadRequest, "parameters must be an object"));
        return;
    }

    auto pending = std::make_shared<QHttpServerResponder>(std::move(responder));
    m_manager->debugSessions()->executeAsync(
        id, toolName, params.toObject(), this, [pending](const ExecuteResult& result) {
            // 工具本身的失败（RemoteError/ToolError/Timeout）按原样返回 200，由 success 区分
            switch (result.errorKind) {
            case DebugErrorKind::NoActiveSession:
            case DebugErrorKind::UnknownTool:
            case DebugErrorKind::InvalidArguments:
                pending->sendResponse(
                    jsonResponse(result.toJson(), statusForError(result.errorKind)));
                break;
            default:
                pending->sendResponse(jsonResponse(result.toJson()));
                break;
            }
        });
}

QHttpServerResponse ApiRouter::handleDebugTools(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);

    if (!m_manager->debugSessions()->hasActiveSession(id)) {
        return errorResponse(StatusCode::Conflict, "no active session",
                             debugErrorKindToString(DebugErrorKind::NoActiveSession));
    }
    return jsonResponse(
        QJsonObject{{"tools", mcphub::toolListToJson(m_manager->debugSessions()->getTools(id))}});
}

QHttpServerResponse ApiRouter::handleDebugStatus(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);

    DebugSessionInfo info;
    const bool known = m_manager->debugSessions()->sessionInfo(id, info);
    if (!known && !m_manager->catalog()->exists(id)) {
        return errorResponse(StatusCode::NotFound, "project not found");
    }

    QJsonObject out;
    out["project_id"] = id;
    out["active"] = known && info.state == DebugSessionState::Ready;
    if (known) {
        out["session"] = info.toJson();
    }
    return jsonResponse(out);
}

QHttpServerResponse ApiRouter::handleDebugSessions(const QHttpServerRequest& req) {
    Q_UNUSED(req);

    QJsonArray sessions;
    for (const QString& id : m_manager->debugSessions()->projectIds()) {
        DebugSessionInfo info;
        if (m_manager->debugSessions()->sessionInfo(id, info)) {
            sessions.append(info.toJson());
        }
    }
    return jsonResponse(QJsonObject{{"sessions", sessions}});
}

QHttpServerResponse ApiRouter::handleProjectList(const QHttpServerRequest& req) {
    Q_UNUSED(req);

    QJsonArray projects;
    for (const QString& id : m_manager->catalog()->listProjects()) {
        QJsonObject obj;
        obj["id"] = id;
        obj["path"] = m_manager->catalog()->projectDir(id);
        obj["debug_session_active"] = m_manager->debugSessions()->hasActiveSession(id);
        projects.append(obj);
    }
    return jsonResponse(QJsonObject{{"projects", projects}});
}

QHttpServerResponse ApiRouter::handlePortList(const QHttpServerRequest& req) {
    Q_UNUSED(req);

    const mcphub::PortPool* pool = m_manager->portPool();
    QJsonObject out;
    out["range_start"] = pool->firstPort();
    out["range_end"] = pool->lastPort();
    out["claimed"] = pool->claimedCount();
    return jsonResponse(out);
}

QHttpServerResponse ApiRouter::handlePortClaim(const QHttpServerRequest& req) {
    QJsonObject body;
    QString parseError;
    if (!parseJsonObjectBody(req, body, parseError)) {
        return errorResponse(StatusCode::BadRequest, parseError);
    }

    mcphub::PortPool* pool = m_manager->portPool();
    if (body.contains("port")) {
        if (!body.value("port").isDouble()) {
            return errorResponse(StatusCode::BadRequest, "port must be an integer");
        }
        const int port = body.value("port").toInt();
        if (port < pool->firstPort() || port > pool->lastPort()) {
            return errorResponse(StatusCode::BadRequest, "port out of range");
        }
        if (!pool->claim(port)) {
            return errorResponse(StatusCode::Conflict, "port already claimed");
        }
        return jsonResponse(QJsonObject{{"port", port}});
    }

    const int port = pool->claimAny();
    if (port < 0) {
        return errorResponse(StatusCode::ServiceUnavailable, "no free port in range");
    }
    return jsonResponse(QJsonObject{{"port", port}});
}

QHttpServerResponse ApiRouter::handlePortRelease(const QString& port,
                                                 const QHttpServerRequest& req) {
    Q_UNUSED(req);

    bool ok = false;
    const int value = port.toInt(&ok);
    if (!ok) {
        return errorResponse(StatusCode::BadRequest, "invalid port");
    }
    if (!m_manager->portPool()->release(value)) {
        return errorResponse(StatusCode::NotFound, "port not claimed");
    }
    return jsonResponse(QJsonObject{{"released", value}});
}

QHttpServerResponse ApiRouter::handleServerStatus(const QHttpServerRequest& req) {
    Q_UNUSED(req);

    const auto s = m_manager->serverStatus();

    QJsonObject counts;
    counts["projects"] = s.projectCount;
    counts["sessions"] = s.activeSessions;
    counts["wsConnections"] = s.wsConnections;
    counts["portsClaimed"] = s.portsClaimed;

    QJsonObject result;
    result["status"] = "ok";
    result["version"] = s.version;
    result["uptimeMs"] = s.uptimeMs;
    result["startedAt"] = s.startedAt.toString(Qt::ISODate);
    result["host"] = s.host;
    result["port"] = s.port;
    result["dataRoot"] = s.dataRoot;
    result["projectsDir"] = s.projectsDir;
    result["portRange"] = QJsonObject{{"start", s.portRangeStart}, {"end", s.portRangeEnd}};
    result["counts"] = counts;

    return jsonResponse(result);
}

} // namespace mcphub_server
