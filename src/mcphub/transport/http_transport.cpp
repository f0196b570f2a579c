#include "http_transport.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <memory>

#include "health_probe.h"
#include "mcphub/protocol/jsonrpc_codec.h"
#include "mcphub/protocol/sse_parser.h"

namespace mcphub {

namespace {

bool isConnectionLost(QNetworkReply::NetworkError err) {
    switch (err) {
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
        return true;
    default:
        return false;
    }
}

} // namespace

HttpTransport::HttpTransport(TransportKind kind, const QUrl& baseUrl, QObject* parent)
    : TransportClient(parent)
    , m_kind(kind == TransportKind::Stdio ? TransportKind::Http : kind)
    , m_baseUrl(baseUrl)
    , m_manager(new QNetworkAccessManager(this)) {
}

HttpTransport::~HttpTransport() {
    close();
}

QUrl HttpTransport::endpoint() const {
    QUrl url = m_baseUrl;
    url.setPath(m_kind == TransportKind::Sse ? "/sse" : "/mcp");
    return url;
}

TransportResult HttpTransport::connectToPeer() {
    if (m_open) {
        return TransportResult::success();
    }
    HealthProbe probe(m_baseUrl);
    QString error;
    if (!probe.check(m_connectTimeoutMs, error)) {
        return TransportResult::unavailable(
            QString("%1 unreachable: %2").arg(m_baseUrl.toString(), error));
    }
    attach();
    return TransportResult::success();
}

void HttpTransport::attach() {
    resetFinished();
    m_open = true;
}

TransportResult HttpTransport::send(const QJsonObject& message) {
    if (!m_open) {
        return TransportResult::closed(transportKindToString(m_kind) + " channel is closed");
    }

    QNetworkRequest request(endpoint());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setRawHeader("Accept", m_kind == TransportKind::Sse
                                       ? "text/event-stream"
                                       : "application/json, text/event-stream");

    const QJsonValue requestId = message.value("id");
    QNetworkReply* reply =
        m_manager->post(request, QJsonDocument(message).toJson(QJsonDocument::Compact));
    m_replies.insert(reply);

    if (m_kind == TransportKind::Sse) {
        auto parser = std::make_shared<SseParser>();
        connect(reply, &QNetworkReply::readyRead, this, [this, reply, parser]() {
            for (const SseEvent& ev : parser->feed(reply->readAll())) {
                if (ev.event != QLatin1String("message")) {
                    continue;
                }
                deliverBody(ev.data, QJsonValue());
            }
        });
        connect(reply, &QNetworkReply::finished, this, [this, reply, parser, requestId]() {
            for (const SseEvent& ev : parser->feed(reply->readAll())) {
                if (ev.event == QLatin1String("message")) {
                    deliverBody(ev.data, QJsonValue());
                }
            }
            for (const SseEvent& ev : parser->finish()) {
                if (ev.event == QLatin1String("message")) {
                    deliverBody(ev.data, QJsonValue());
                }
            }
            onReplyFinished(reply, requestId);
        });
    } else {
        connect(reply, &QNetworkReply::finished, this, [this, reply, requestId]() {
            if (reply->error() == QNetworkReply::NoError) {
                deliverBody(reply->readAll(), requestId);
            }
            onReplyFinished(reply, requestId);
        });
    }

    return TransportResult::success();
}

void HttpTransport::close() {
    m_open = false;
    const auto replies = m_replies;
    m_replies.clear();
    for (QNetworkReply* reply : replies) {
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }
}

void HttpTransport::deliverBody(const QByteArray& body, const QJsonValue& requestId) {
    if (body.trimmed().isEmpty()) {
        return;
    }

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError) {
        // 某些服务端对 /mcp 也返回事件流
        if (body.startsWith("event:") || body.startsWith("data:")) {
            SseParser parser;
            auto events = parser.feed(body);
            events += parser.finish();
            for (const SseEvent& ev : events) {
                deliverBody(ev.data, requestId);
            }
            return;
        }
        reportViolation("invalid JSON: " + err.errorString());
        return;
    }

    if (doc.isObject()) {
        deliverObject(doc.object());
    } else if (doc.isArray()) {
        for (const auto& item : doc.array()) {
            if (item.isObject()) {
                deliverObject(item.toObject());
            } else {
                reportViolation("batch entry is not an object");
            }
        }
    } else {
        reportViolation("JSON-RPC frame must be an object");
    }
}

void HttpTransport::deliverObject(const QJsonObject& obj) {
    emit messageReceived(obj);
}

void HttpTransport::onReplyFinished(QNetworkReply* reply, const QJsonValue& requestId) {
    if (!m_replies.remove(reply)) {
        return;
    }
    reply->deleteLater();

    const QNetworkReply::NetworkError err = reply->error();
    if (err == QNetworkReply::NoError || err == QNetworkReply::OperationCanceledError) {
        return;
    }

    if (isConnectionLost(err)) {
        m_open = false;
        reportFinished(false, QString("%1: %2").arg(endpoint().toString(), reply->errorString()));
        return;
    }

    // HTTP 层错误只影响这一次请求，按 JSON-RPC 错误响应回给调用方
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (!requestId.isUndefined() && !requestId.isNull()) {
        RpcError rpcErr;
        rpcErr.code = RpcErrorCode::InternalError;
        rpcErr.message = QString("HTTP %1: %2").arg(status).arg(reply->errorString());
        emit messageReceived(makeError(requestId, rpcErr));
    } else {
        reportViolation(QString("HTTP %1 for notification: %2").arg(status).arg(reply->errorString()));
    }
}

} // namespace mcphub
