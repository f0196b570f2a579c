#include "transport_client.h"

#include <QLoggingCategory>

namespace mcphub {

Q_LOGGING_CATEGORY(lcTransport, "mcphub.transport")

QString transportKindToString(TransportKind kind) {
    switch (kind) {
    case TransportKind::Stdio: return "stdio";
    case TransportKind::Sse:   return "sse";
    case TransportKind::Http:  return "http";
    }
    return "stdio";
}

bool transportKindFromString(const QString& str, TransportKind& out) {
    const QString s = str.trimmed().toLower();
    if (s == "stdio") {
        out = TransportKind::Stdio;
    } else if (s == "sse") {
        out = TransportKind::Sse;
    } else if (s == "http" || s == "streamable-http") {
        out = TransportKind::Http;
    } else {
        return false;
    }
    return true;
}

TransportClient::TransportClient(QObject* parent)
    : QObject(parent) {
}

TransportClient::~TransportClient() = default;

void TransportClient::reportViolation(const QString& detail) {
    ++m_violations;
    qCWarning(lcTransport).noquote() << transportKindToString(kind()) << "protocol violation:" << detail;
    emit protocolViolation(detail);
}

void TransportClient::reportFinished(bool clean, const QString& reason) {
    if (m_finishedReported) {
        return;
    }
    m_finishedReported = true;
    if (clean) {
        qCInfo(lcTransport).noquote() << transportKindToString(kind()) << "peer closed:" << reason;
    } else {
        qCWarning(lcTransport).noquote() << transportKindToString(kind()) << "peer lost:" << reason;
    }
    emit finished(clean, reason);
}

} // namespace mcphub
