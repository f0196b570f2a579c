#include "jsonrpc_codec.h"

#include <QJsonDocument>
#include <QJsonParseError>

namespace mcphub {

QJsonObject RpcError::toJson() const {
    QJsonObject obj{{"code", code}, {"message", message}};
    if (!data.isUndefined() && !data.isNull()) {
        obj["data"] = data;
    }
    return obj;
}

RpcError RpcError::fromJson(const QJsonObject& obj) {
    RpcError err;
    err.code = obj.value("code").toInt(RpcErrorCode::InternalError);
    err.message = obj.value("message").toString();
    err.data = obj.value("data");
    return err;
}

qint64 RpcMessage::numericId() const {
    if (!id.isDouble()) {
        return -1;
    }
    return id.toInteger(-1);
}

QJsonObject makeRequest(qint64 id, const QString& method, const QJsonObject& params) {
    return QJsonObject{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params},
    };
}

QJsonObject makeNotification(const QString& method, const QJsonObject& params) {
    QJsonObject obj{{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.isEmpty()) {
        obj["params"] = params;
    }
    return obj;
}

QJsonObject makeResult(const QJsonValue& id, const QJsonValue& result) {
    return QJsonObject{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

QJsonObject makeError(const QJsonValue& id, const RpcError& error) {
    return QJsonObject{{"jsonrpc", "2.0"}, {"id", id}, {"error", error.toJson()}};
}

QByteArray serializeLine(const QJsonObject& message) {
    QByteArray line = QJsonDocument(message).toJson(QJsonDocument::Compact);
    line.append('\n');
    return line;
}

RpcMessage classifyMessage(const QJsonObject& obj, QString* reason) {
    RpcMessage msg;
    auto invalid = [&](const QString& why) {
        if (reason) {
            *reason = why;
        }
        msg.kind = RpcMessageKind::Invalid;
        return msg;
    };

    if (obj.value("jsonrpc").toString() != QLatin1String("2.0")) {
        return invalid("missing or unsupported jsonrpc version");
    }

    const bool hasId = obj.contains("id") && !obj.value("id").isNull();
    const bool hasMethod = obj.contains("method");
    msg.id = hasId ? obj.value("id") : QJsonValue(QJsonValue::Undefined);

    if (hasMethod) {
        if (!obj.value("method").isString()) {
            return invalid("method must be a string");
        }
        msg.method = obj.value("method").toString();
        msg.params = obj.value("params");
        msg.kind = hasId ? RpcMessageKind::Request : RpcMessageKind::Notification;
        return msg;
    }

    if (!hasId) {
        return invalid("message has neither id nor method");
    }

    if (obj.contains("error")) {
        if (!obj.value("error").isObject()) {
            return invalid("error must be an object");
        }
        msg.isError = true;
        msg.error = RpcError::fromJson(obj.value("error").toObject());
    } else if (obj.contains("result")) {
        msg.result = obj.value("result");
    } else {
        return invalid("response has neither result nor error");
    }

    msg.kind = RpcMessageKind::Response;
    return msg;
}

bool parseObjectLine(const QByteArray& line, QJsonObject& out, QString& error) {
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(line, &err);
    if (err.error != QJsonParseError::NoError) {
        error = "invalid JSON: " + err.errorString();
        return false;
    }
    if (!doc.isObject()) {
        error = "JSON-RPC frame must be an object";
        return false;
    }
    out = doc.object();
    error.clear();
    return true;
}

} // namespace mcphub
