#pragma once

#include <QHttpServerResponse>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace mcphub_server {

inline QHttpServerResponse jsonResponse(
    const QJsonObject& obj,
    QHttpServerResponse::StatusCode code = QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json",
        QJsonDocument(obj).toJson(QJsonDocument::Compact),
        code);
}

inline QHttpServerResponse errorResponse(QHttpServerResponse::StatusCode code,
                                         const QString& message) {
    return jsonResponse(QJsonObject{{"error", message}}, code);
}

inline QHttpServerResponse errorResponse(QHttpServerResponse::StatusCode code,
                                         const QString& message, const QString& errorKind) {
    return jsonResponse(QJsonObject{{"error", message}, {"errorKind", errorKind}}, code);
}

} // namespace mcphub_server
