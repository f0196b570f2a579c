#pragma once

#include <QHttpServer>
#include <QHttpServerResponder>
#include <QObject>

namespace mcphub_server {

class ServerManager;

class ApiRouter : public QObject {
    Q_OBJECT
public:
    explicit ApiRouter(ServerManager* manager, QObject* parent = nullptr);
    ~ApiRouter() override;

    void registerRoutes(QHttpServer& server);

private:
    // start/execute 等待子进程，从完成回调中应答，不阻塞事件循环
    void handleDebugStart(const QString& id, const QHttpServerRequest& req,
                          QHttpServerResponder& responder);
    QHttpServerResponse handleDebugStop(const QString& id, const QHttpServerRequest& req);
    void handleDebugExecute(const QString& id, const QHttpServerRequest& req,
                            QHttpServerResponder& responder);
    QHttpServerResponse handleDebugTools(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleDebugStatus(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handleDebugSessions(const QHttpServerRequest& req);

    QHttpServerResponse handleProjectList(const QHttpServerRequest& req);

    QHttpServerResponse handlePortList(const QHttpServerRequest& req);
    QHttpServerResponse handlePortClaim(const QHttpServerRequest& req);
    QHttpServerResponse handlePortRelease(const QString& port, const QHttpServerRequest& req);

    QHttpServerResponse handleServerStatus(const QHttpServerRequest& req);

    ServerManager* m_manager;
};

} // namespace mcphub_server
