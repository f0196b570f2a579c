#pragma once

#include <QHttpServer>
#include <QObject>
#include <QTimer>
#include <QVector>

namespace mcphub_server {

class DebugSessionManager;
class DebugWsConnection;
class EventBus;

class DebugWsHandler : public QObject {
    Q_OBJECT
public:
    DebugWsHandler(DebugSessionManager* manager, EventBus* bus, QObject* parent = nullptr);
    ~DebugWsHandler() override;

    void registerVerifier(QHttpServer& server);
    int activeConnectionCount() const;
    void closeAll();

    static constexpr int kMaxConnections = 10;
    static constexpr int kPingIntervalMs = 30000;
    static constexpr int kPongTimeoutMs  = kPingIntervalMs * 2;

    // Test-only helpers, not for production use
    void setPingIntervalForTest(int ms);
    DebugWsConnection* connectionAt(int index) const;

    /// /api/debug/<projectId>/ws → projectId；不匹配时为空
    static QString parseProjectId(const QUrl& url);

private slots:
    void onConnectionClosed(DebugWsConnection* conn);
    void onPingTick();

private:
    void sweepDeadConnections();

    DebugSessionManager* m_manager;
    EventBus* m_bus;
    QHttpServer* m_server = nullptr;
    QVector<DebugWsConnection*> m_connections;
    QTimer m_pingTimer;
};

} // namespace mcphub_server
