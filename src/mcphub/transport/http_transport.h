#pragma once

#include <QSet>
#include <QUrl>

#include "transport_client.h"

class QNetworkAccessManager;
class QNetworkReply;

namespace mcphub {

/**
 * HTTP / SSE 传输
 *
 * Http：每条消息 POST 到 /mcp，响应体为一个 JSON 对象（或批量数组，或 202 空体）。
 * Sse：每条消息 POST 到 /sse，响应为 text/event-stream，每个 data 帧是一条入站消息，
 *      最终响应之前的通知会随到随投。
 */
class MCPHUB_API HttpTransport : public TransportClient {
    Q_OBJECT
public:
    HttpTransport(TransportKind kind, const QUrl& baseUrl, QObject* parent = nullptr);
    ~HttpTransport() override;

    TransportKind kind() const override { return m_kind; }
    /// 单次 /health 检查通过后打开通道（阻塞，最多 connectTimeoutMs）
    TransportResult connectToPeer() override;

    /// 对端已由调用方确认可用时直接打开通道
    void attach();

    TransportResult send(const QJsonObject& message) override;
    void close() override;
    bool isOpen() const override { return m_open; }

    QUrl endpoint() const;
    int inFlightCount() const { return static_cast<int>(m_replies.size()); }

    void setConnectTimeoutMs(int ms) { m_connectTimeoutMs = ms; }

private:
    void deliverBody(const QByteArray& body, const QJsonValue& requestId);
    void deliverObject(const QJsonObject& obj);
    void onReplyFinished(QNetworkReply* reply, const QJsonValue& requestId);

    TransportKind m_kind;
    QUrl m_baseUrl;
    QNetworkAccessManager* m_manager;
    QSet<QNetworkReply*> m_replies;
    bool m_open = false;
    int m_connectTimeoutMs = 2000;
};

} // namespace mcphub
